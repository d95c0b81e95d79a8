#pragma once

#include <ferry/schema/error_code.hpp>
#include <ferry/schema/event.hpp>
#include <ferry/schema/guard_validation_status.hpp>
#include <ferry/schema/primitives.hpp>
#include <ferry/schema/relocation_status.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: operation result.
// Bridge workflow: outcome of one ledger or guard entry point. `code` is an
// error_code_t value (0 on success); the optional fields carry the context
// of the failure that produced it.
namespace ferry::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<event_t> events;
  nonce_t nonce{};
  std::optional<relocation_status_t> status;
  std::optional<uint64_t> index;
  std::optional<guard_validation_status_t> guard_status;

  bool ok() const { return code == 0; }
  error_code_t error() const { return static_cast<error_code_t>(code); }
};

using operation_result_t = operation_result<1>;

}  // namespace ferry::schema
