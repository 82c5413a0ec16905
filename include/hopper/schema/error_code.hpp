#pragma once

#include <hopper/schema/enum_string.hpp>
#include <hopper/schema/transfer_step.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hopper::schema {

enum class error_code_t : uint32_t {
  none = 0,
  insufficient_sender_funds = 1,
  rpc_error = 2,
  confirmation_timeout = 3,
  key_corrupted = 4,
  underfunded_recovery = 5,
  transaction_rejected = 6,
  retry_exhausted = 7,
  key_unavailable = 8,
  plan_mismatch = 9,
  invalid_request = 10,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code_t>{"none", error_code_t::none},
    std::pair<std::string_view, error_code_t>{
        "insufficient_sender_funds", error_code_t::insufficient_sender_funds},
    std::pair<std::string_view, error_code_t>{"rpc_error",
                                              error_code_t::rpc_error},
    std::pair<std::string_view, error_code_t>{
        "confirmation_timeout", error_code_t::confirmation_timeout},
    std::pair<std::string_view, error_code_t>{"key_corrupted",
                                              error_code_t::key_corrupted},
    std::pair<std::string_view, error_code_t>{
        "underfunded_recovery", error_code_t::underfunded_recovery},
    std::pair<std::string_view, error_code_t>{
        "transaction_rejected", error_code_t::transaction_rejected},
    std::pair<std::string_view, error_code_t>{"retry_exhausted",
                                              error_code_t::retry_exhausted},
    std::pair<std::string_view, error_code_t>{"key_unavailable",
                                              error_code_t::key_unavailable},
    std::pair<std::string_view, error_code_t>{"plan_mismatch",
                                              error_code_t::plan_mismatch},
    std::pair<std::string_view, error_code_t>{"invalid_request",
                                              error_code_t::invalid_request}};

template <>
inline std::optional<error_code_t> try_from_string<error_code_t>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code_t value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

/// Error with the step it happened in; `step` is meaningless for errors that
/// precede any ledger work (vault, config, plan resolution).
struct failure_t final {
  error_code_t code{error_code_t::none};
  transfer_step_t step{transfer_step_t::fund};
  std::string message;
};

inline bool has_failure(const failure_t& failure) {
  return failure.code != error_code_t::none;
}

}  // namespace hopper::schema
