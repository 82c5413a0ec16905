#pragma once

#include <hopper/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transfer state.
// Relay lifecycle: init -> funding -> funded -> forwarding -> forwarded ->
// recovering -> recovered, with failed reachable only during funding.
namespace hopper::schema {

enum class transfer_state_t : uint8_t {
  init = 0,
  funding = 1,
  funded = 2,
  forwarding = 3,
  forwarded = 4,
  recovering = 5,
  recovered = 6,
  failed = 7
};

inline constexpr auto kTransferStateMappings = std::array{
    std::pair<std::string_view, transfer_state_t>{"INIT",
                                                  transfer_state_t::init},
    std::pair<std::string_view, transfer_state_t>{"FUNDING",
                                                  transfer_state_t::funding},
    std::pair<std::string_view, transfer_state_t>{"FUNDED",
                                                  transfer_state_t::funded},
    std::pair<std::string_view, transfer_state_t>{
        "FORWARDING", transfer_state_t::forwarding},
    std::pair<std::string_view, transfer_state_t>{"FORWARDED",
                                                  transfer_state_t::forwarded},
    std::pair<std::string_view, transfer_state_t>{
        "RECOVERING", transfer_state_t::recovering},
    std::pair<std::string_view, transfer_state_t>{"RECOVERED",
                                                  transfer_state_t::recovered},
    std::pair<std::string_view, transfer_state_t>{"FAILED",
                                                  transfer_state_t::failed}};

template <>
inline std::optional<transfer_state_t> try_from_string<transfer_state_t>(
    const std::string_view value) {
  return from_string(value, kTransferStateMappings);
}

inline constexpr std::string_view to_string(const transfer_state_t value) {
  return to_string(value, kTransferStateMappings).value_or("UNKNOWN");
}

inline constexpr bool is_terminal(const transfer_state_t value) {
  return value == transfer_state_t::recovered ||
         value == transfer_state_t::failed;
}

/// True once a funding transaction may have credited the hop account, i.e.
/// from FUNDED onward. FAILED is never entered from these states.
inline constexpr bool funds_in_hop(const transfer_state_t value) {
  return value == transfer_state_t::funded ||
         value == transfer_state_t::forwarding ||
         value == transfer_state_t::forwarded ||
         value == transfer_state_t::recovering;
}

}  // namespace hopper::schema
