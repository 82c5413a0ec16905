#pragma once

#include <hopper/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transfer step.
// The three ledger transfers of a relay: sender->hop, hop->recipient,
// hop->sender.
namespace hopper::schema {

enum class transfer_step_t : uint8_t { fund = 0, forward = 1, recover = 2 };

inline constexpr auto kTransferStepMappings = std::array{
    std::pair<std::string_view, transfer_step_t>{"FUND",
                                                 transfer_step_t::fund},
    std::pair<std::string_view, transfer_step_t>{"FORWARD",
                                                 transfer_step_t::forward},
    std::pair<std::string_view, transfer_step_t>{"RECOVER",
                                                 transfer_step_t::recover}};

template <>
inline std::optional<transfer_step_t> try_from_string<transfer_step_t>(
    const std::string_view value) {
  return from_string(value, kTransferStepMappings);
}

inline constexpr std::string_view to_string(const transfer_step_t value) {
  return to_string(value, kTransferStepMappings).value_or("UNKNOWN");
}

}  // namespace hopper::schema
