#pragma once

#include <ferry/fee/fee_oracle.hpp>
#include <cstdint>

namespace ferry::fee {

inline constexpr uint32_t kBasisPointsDenominator = 10'000;

/// Fee of `basis_points / 10000` of the principal, rounded down, but never
/// below `minimum_fee`.
class fixed_rate_fee_oracle final : public fee_oracle {
 public:
  fixed_rate_fee_oracle(const ferry::schema::account_id_t& id,
                        uint32_t basis_points,
                        ferry::schema::amount_t minimum_fee = 0);

  ferry::schema::amount_t define_fee(
      ferry::schema::chain_id_t chain_id,
      const ferry::schema::asset_id_t& token,
      const ferry::schema::account_id_t& account,
      const ferry::schema::amount_t& amount) const override;

  ferry::schema::account_id_t id() const override { return id_; }

 private:
  ferry::schema::account_id_t id_;
  uint32_t basis_points_{};
  ferry::schema::amount_t minimum_fee_;
};

}  // namespace ferry::fee
