#pragma once

#include <hopper/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace hopper::schema {

enum class confirmation_status_t : uint8_t {
  pending = 0,
  confirmed = 1,
  failed = 2
};

inline constexpr auto kConfirmationStatusMappings = std::array{
    std::pair<std::string_view, confirmation_status_t>{
        "PENDING", confirmation_status_t::pending},
    std::pair<std::string_view, confirmation_status_t>{
        "CONFIRMED", confirmation_status_t::confirmed},
    std::pair<std::string_view, confirmation_status_t>{
        "FAILED", confirmation_status_t::failed}};

template <>
inline std::optional<confirmation_status_t>
try_from_string<confirmation_status_t>(const std::string_view value) {
  return from_string(value, kConfirmationStatusMappings);
}

inline constexpr std::string_view to_string(const confirmation_status_t value) {
  return to_string(value, kConfirmationStatusMappings).value_or("UNKNOWN");
}

}  // namespace hopper::schema
