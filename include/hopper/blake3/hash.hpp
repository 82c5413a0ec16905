#pragma once
#include <hopper/schema/primitives.hpp>
#include <string_view>

namespace hopper::blake3 {

hopper::schema::hash32_t hash(const std::string_view& str);
hopper::schema::hash32_t hash(const hopper::schema::bytes_view_t& bytes);

}  // namespace hopper::blake3
