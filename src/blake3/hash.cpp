#include <blake3.h>
#include <registrar/blake3/hash.hpp>
#include <cstddef>
#include <tuple>

namespace registrar::blake3 {

namespace {

registrar::schema::hash32_t digest(const void* data, const std::size_t size) {
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<registrar::schema::hash32_t>);
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = registrar::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

registrar::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

registrar::schema::hash32_t hash(
    const registrar::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace registrar::blake3
