#pragma once
#include <registrar/schema/primitives.hpp>
#include <string_view>

namespace registrar::blake3 {

registrar::schema::hash32_t hash(const std::string_view& str);
registrar::schema::hash32_t hash(const registrar::schema::bytes_view_t& bytes);

}  // namespace registrar::blake3
