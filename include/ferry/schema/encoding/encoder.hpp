#pragma once
#include <ferry/schema/primitives.hpp>
#include <optional>

namespace ferry::schema::encoding {

/// Value codec selected by a library tag.
///
/// Storage, keys and the state root are written against this interface;
/// the specialization for a tag fixes the wire format. `decode` treats
/// malformed input as fatal, `try_decode` reports it as nullopt.
template <typename Library>
struct encoder;

}  // namespace ferry::schema::encoding
