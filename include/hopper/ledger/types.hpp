#pragma once
#include <hopper/schema/commitment.hpp>
#include <hopper/schema/confirmation_status.hpp>
#include <hopper/schema/enum_string.hpp>
#include <hopper/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace hopper::ledger {

enum class rpc_error_kind_t : uint8_t {
  unavailable = 0,
  timeout = 1,
  rate_limited = 2,
  blockhash_expired = 3,
  confirmation_timeout = 4,
  internal = 5,
  rejected = 6,
  insufficient_funds = 7,
  invalid_signature = 8,
  malformed = 9
};

inline constexpr auto kRpcErrorKindMappings = std::array{
    std::pair<std::string_view, rpc_error_kind_t>{
        "unavailable", rpc_error_kind_t::unavailable},
    std::pair<std::string_view, rpc_error_kind_t>{"timeout",
                                                  rpc_error_kind_t::timeout},
    std::pair<std::string_view, rpc_error_kind_t>{
        "rate_limited", rpc_error_kind_t::rate_limited},
    std::pair<std::string_view, rpc_error_kind_t>{
        "blockhash_expired", rpc_error_kind_t::blockhash_expired},
    std::pair<std::string_view, rpc_error_kind_t>{
        "confirmation_timeout", rpc_error_kind_t::confirmation_timeout},
    std::pair<std::string_view, rpc_error_kind_t>{"internal",
                                                  rpc_error_kind_t::internal},
    std::pair<std::string_view, rpc_error_kind_t>{"rejected",
                                                  rpc_error_kind_t::rejected},
    std::pair<std::string_view, rpc_error_kind_t>{
        "insufficient_funds", rpc_error_kind_t::insufficient_funds},
    std::pair<std::string_view, rpc_error_kind_t>{
        "invalid_signature", rpc_error_kind_t::invalid_signature},
    std::pair<std::string_view, rpc_error_kind_t>{"malformed",
                                                  rpc_error_kind_t::malformed}};

inline constexpr std::string_view to_string(const rpc_error_kind_t value) {
  return hopper::schema::to_string(value, kRpcErrorKindMappings)
      .value_or("unknown");
}

/// Transient faults worth another attempt. The ledger's explicit verdicts on
/// a transaction (rejection, funds, signature, encoding) are final.
inline constexpr bool retryable(const rpc_error_kind_t kind) {
  switch (kind) {
    case rpc_error_kind_t::unavailable:
    case rpc_error_kind_t::timeout:
    case rpc_error_kind_t::rate_limited:
    case rpc_error_kind_t::blockhash_expired:
    case rpc_error_kind_t::confirmation_timeout:
    case rpc_error_kind_t::internal:
      return true;
    case rpc_error_kind_t::rejected:
    case rpc_error_kind_t::insufficient_funds:
    case rpc_error_kind_t::invalid_signature:
    case rpc_error_kind_t::malformed:
      return false;
  }
  return false;
}

struct rpc_error_t final {
  rpc_error_kind_t kind{rpc_error_kind_t::internal};
  std::string message;
};

inline bool retryable(const rpc_error_t& error) {
  return retryable(error.kind);
}

template <typename T>
using rpc_result_t = std::variant<T, rpc_error_t>;

template <typename T>
bool is_error(const rpc_result_t<T>& result) {
  return std::holds_alternative<rpc_error_t>(result);
}

struct latest_blockhash_t final {
  hopper::schema::blockhash_t blockhash{};
  uint64_t last_valid_block_height{};
};

/// What the ledger knows about a transaction id. `found` is false when the
/// ledger has never seen the signature (or has forgotten it).
struct signature_status_t final {
  bool found{false};
  std::optional<hopper::schema::commitment_t> commitment;
  // Set when the transaction landed but its execution failed.
  std::optional<std::string> error;
};

struct confirmation_t final {
  hopper::schema::confirmation_status_t status{
      hopper::schema::confirmation_status_t::pending};
  std::string detail;
};

}  // namespace hopper::ledger
