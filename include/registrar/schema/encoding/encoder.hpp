#pragma once
#include <registrar/schema/primitives.hpp>
#include <optional>
#include <span>

namespace registrar::schema::encoding {

// Codec selection is a build time choice; every call site names the library
// tag explicitly, e.g. encoder<scale_encoder_tag>.
template <typename Library>
struct encoder {
  template <typename T>
  registrar::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, registrar::schema::bytes_t& out);

  template <typename T>
  T decode(const registrar::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const registrar::schema::bytes_view_t& bytes);
};

}  // namespace registrar::schema::encoding
