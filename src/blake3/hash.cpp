#include <ferry/blake3/hash.hpp>

namespace ferry::blake3 {

hasher::hasher() { blake3_hasher_init(&state_); }

hasher& hasher::update(const ferry::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const ferry::schema::hash32_t& value) {
  return update(ferry::schema::bytes_view_t{value.data(), value.size()});
}

ferry::schema::hash32_t hasher::finalize() const {
  auto output = ferry::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

}  // namespace ferry::blake3
