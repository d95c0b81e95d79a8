#include <ferry/fee/fixed_rate_fee_oracle.hpp>
#include <algorithm>
#include <limits>
#include <utility>

namespace ferry::fee {

fixed_rate_fee_oracle::fixed_rate_fee_oracle(
    const ferry::schema::account_id_t& id,
    uint32_t basis_points,
    ferry::schema::amount_t minimum_fee)
    : id_{id}, basis_points_{basis_points}, minimum_fee_{std::move(minimum_fee)} {}

ferry::schema::amount_t fixed_rate_fee_oracle::define_fee(
    ferry::schema::chain_id_t,
    const ferry::schema::asset_id_t&,
    const ferry::schema::account_id_t&,
    const ferry::schema::amount_t& amount) const {
  // The product is taken in 512 bits and saturates at the amount range.
  const auto max = std::numeric_limits<ferry::schema::amount_t>::max();
  auto wide = boost::multiprecision::uint512_t{amount} * basis_points_ /
              kBasisPointsDenominator;
  auto fee = wide > boost::multiprecision::uint512_t{max}
                 ? max
                 : static_cast<ferry::schema::amount_t>(wide);
  return std::max(fee, minimum_fee_);
}

}  // namespace ferry::fee
