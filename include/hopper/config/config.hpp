#pragma once
#include <hopper/retry/policy.hpp>
#include <hopper/schema/commitment.hpp>
#include <hopper/schema/error_code.hpp>
#include <hopper/schema/primitives.hpp>
#include <hopper/transfer/fee_estimator.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace hopper::config {

inline constexpr std::string_view kEnvironmentPrefix{"HOPPER_"};

enum class command_t : uint8_t { transfer, resume, status, balance, keygen };

struct config final {
  command_t command{command_t::transfer};
  bool help{false};
  bool verbose{false};

  std::string rpc_url{"127.0.0.1:50051"};
  std::chrono::milliseconds rpc_deadline{10000};
  bool skip_preflight{false};
  hopper::schema::commitment_t commitment{
      hopper::schema::commitment_t::finalized};
  hopper::retry::retry_policy retry{};
  hopper::transfer::fee_options fees{};

  std::filesystem::path state_dir{"hopper-state"};
  std::filesystem::path hop_key{"hop_key.txt"};
  std::filesystem::path log_file{"hopper.log"};

  // Command arguments; which ones are required depends on the command.
  std::filesystem::path sender_key;
  std::optional<hopper::schema::public_key_t> recipient;
  hopper::schema::lamports_t amount{};
  std::optional<hopper::schema::public_key_t> address;
  std::filesystem::path out;
};

/// Resolve the configuration from the command line, then `HOPPER_*`
/// environment variables, then the `--config` file; the first source that
/// sets an option wins. Failures are reported as `invalid_request`.
std::optional<config> load(int argc,
                           const char* const argv[],
                           hopper::schema::failure_t& error);

/// Help text listing every option with its default.
std::string usage();

/// `HOPPER_RPC_URL` -> `rpc-url`; empty for variables that are not options.
std::string environment_to_option(const std::string& variable);

}  // namespace hopper::config
