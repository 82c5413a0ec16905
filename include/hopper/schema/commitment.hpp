#pragma once

#include <hopper/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: commitment.
// How final a ledger observation must be before it is trusted. Ordered, so
// a status reached at `finalized` also satisfies `confirmed`.
namespace hopper::schema {

enum class commitment_t : uint8_t {
  processed = 0,
  confirmed = 1,
  finalized = 2
};

inline constexpr auto kCommitmentMappings = std::array{
    std::pair<std::string_view, commitment_t>{"processed",
                                              commitment_t::processed},
    std::pair<std::string_view, commitment_t>{"confirmed",
                                              commitment_t::confirmed},
    std::pair<std::string_view, commitment_t>{"finalized",
                                              commitment_t::finalized}};

template <>
inline std::optional<commitment_t> try_from_string<commitment_t>(
    const std::string_view value) {
  return from_string(value, kCommitmentMappings);
}

inline constexpr std::string_view to_string(const commitment_t value) {
  return to_string(value, kCommitmentMappings).value_or("unknown");
}

inline constexpr bool satisfies(const commitment_t reached,
                                const commitment_t required) {
  return static_cast<uint8_t>(reached) >= static_cast<uint8_t>(required);
}

}  // namespace hopper::schema
