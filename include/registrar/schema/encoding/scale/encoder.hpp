#pragma once
#include <registrar/common/critical.hpp>
#include <registrar/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace registrar::schema::encoding {

struct scale_encoder_tag {};

// Schema structs are plain aggregates; the SCALE library encodes them field
// by field in declaration order, variants as a one byte index followed by the
// alternative, and optionals with a one byte presence flag.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  registrar::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, registrar::schema::bytes_t& out);

  /// Decode trusted bytes (our own storage). Failure is a critical fault.
  template <typename T>
  T decode(const registrar::schema::bytes_view_t& bytes);

  /// Decode untrusted bytes (network input). Failure yields std::nullopt.
  template <typename T>
  std::optional<T> try_decode(const registrar::schema::bytes_view_t& bytes);
};

template <typename T>
registrar::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    registrar::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        registrar::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const registrar::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    registrar::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const registrar::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace registrar::schema::encoding
