#pragma once

#include <ferry/schema/event_attribute.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: event.
// Bridge workflow: emission describing one committed state change, consumed
// by relayers and indexers.
namespace ferry::schema {

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<event_attribute_t> attributes;

  /// Value of the first attribute with `key`, if present.
  std::optional<std::string> attribute(const std::string_view key) const {
    for (const auto& item : attributes) {
      if (item.key == key) {
        return item.value;
      }
    }
    return std::nullopt;
  }
};

using event_t = event<1>;

}  // namespace ferry::schema
