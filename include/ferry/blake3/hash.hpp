#pragma once
#include <blake3.h>
#include <ferry/schema/primitives.hpp>

namespace ferry::blake3 {

/// Incremental BLAKE3 digest over several byte ranges.
class hasher final {
 public:
  hasher();

  hasher& update(const ferry::schema::bytes_view_t& bytes);
  hasher& update(const ferry::schema::hash32_t& value);

  /// Digest of everything fed so far; the hasher may keep being updated.
  ferry::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

}  // namespace ferry::blake3
