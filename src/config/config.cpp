#include <hopper/config/config.hpp>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <sstream>
#include <utility>

namespace hopper::config {

namespace po = boost::program_options;

namespace {

constexpr auto kCommandMappings = std::array{
    std::pair<std::string_view, command_t>{"transfer", command_t::transfer},
    std::pair<std::string_view, command_t>{"resume", command_t::resume},
    std::pair<std::string_view, command_t>{"status", command_t::status},
    std::pair<std::string_view, command_t>{"balance", command_t::balance},
    std::pair<std::string_view, command_t>{"keygen", command_t::keygen}};

po::options_description make_generic_options() {
  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable debug logging")(
      "config,c", po::value<std::string>(), "INI file with further options");
  return generic;
}

// Options that may come from any source.
po::options_description make_shared_options() {
  auto shared = po::options_description{"Hopper"};
  shared.add_options()(
      "rpc-url", po::value<std::string>()->default_value("127.0.0.1:50051"),
      "Ledger gateway gRPC endpoint")(
      "commitment", po::value<std::string>()->default_value("finalized"),
      "processed, confirmed or finalized")(
      "max-attempts", po::value<uint32_t>()->default_value(5),
      "Retryable failures allowed per step")(
      "base-delay-ms", po::value<uint64_t>()->default_value(500),
      "Backoff base delay")(
      "max-delay-ms", po::value<uint64_t>()->default_value(16000),
      "Backoff delay cap")(
      "confirm-timeout-ms", po::value<uint64_t>()->default_value(60000),
      "Wait for one attempt before re-querying the ledger")(
      "step-timeout-ms", po::value<uint64_t>()->default_value(300000),
      "Overall time budget per step")(
      "poll-interval-ms", po::value<uint64_t>()->default_value(1000),
      "Confirmation polling interval")(
      "rpc-deadline-ms", po::value<uint64_t>()->default_value(10000),
      "Deadline of a single gateway call")(
      "fee-per-signature", po::value<uint64_t>(),
      "Fee override in lamports; queried from the ledger when absent")(
      "fee-margin-bps", po::value<uint32_t>()->default_value(0),
      "Extra cushion in basis points")(
      "compute-unit-price", po::value<uint64_t>()->default_value(0),
      "Priority fee in micro-lamports per compute unit")(
      "compute-unit-limit", po::value<uint32_t>()->default_value(0),
      "Compute unit limit")(
      "skip-preflight", po::value<bool>()->default_value(false),
      "Ask the gateway to skip simulation before submission")(
      "state-dir", po::value<std::string>()->default_value("hopper-state"),
      "Directory of the plan database")(
      "hop-key", po::value<std::string>()->default_value("hop_key.txt"),
      "Hop key file, created when absent")(
      "log-file", po::value<std::string>()->default_value("hopper.log"),
      "Log file")(
      "sender-key", po::value<std::string>(), "Sender key file")(
      "recipient", po::value<std::string>(), "Recipient address (base58)")(
      "amount", po::value<std::string>(), "Lamports to deliver")(
      "address", po::value<std::string>(), "Address for `balance`")(
      "out", po::value<std::string>(), "Key file for `keygen`");
  return shared;
}

po::options_description make_command_line_options() {
  auto all = po::options_description{};
  all.add(make_generic_options()).add(make_shared_options());
  all.add_options()("command", po::value<std::string>(),
                    "transfer, resume, status, balance or keygen");
  return all;
}

std::optional<hopper::schema::lamports_t> parse_amount(
    const std::string& text) {
  auto value = hopper::schema::lamports_t{};
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                   value);
  if (ec != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<hopper::schema::public_key_t> parse_address(
    const po::variables_map& vm,
    const std::string& name,
    hopper::schema::failure_t& error) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  auto text = vm[name].as<std::string>();
  auto address = hopper::schema::try_make_public_key(text);
  if (!address) {
    error = hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::invalid_request,
        .message = "--" + name + " '" + text +
                   "' is not a base58 32-byte address"};
  }
  return address;
}

bool require(const po::variables_map& vm,
             const std::string_view command,
             const std::string& name,
             hopper::schema::failure_t& error) {
  if (vm.contains(name)) {
    return true;
  }
  error = hopper::schema::failure_t{
      .code = hopper::schema::error_code_t::invalid_request,
      .message = std::string{command} + " requires --" + name};
  return false;
}

std::chrono::milliseconds milliseconds(const po::variables_map& vm,
                                       const std::string& name) {
  return std::chrono::milliseconds{vm[name].as<uint64_t>()};
}

std::optional<config> make_config(const po::variables_map& vm,
                                  hopper::schema::failure_t& error) {
  auto out = config{};
  auto invalid = [&](std::string message) {
    error = hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::invalid_request,
        .message = std::move(message)};
    return std::nullopt;
  };

  out.help = vm.contains("help");
  out.verbose = vm.contains("verbose");
  if (out.help) {
    return out;
  }

  if (!vm.contains("command")) {
    return invalid("missing command");
  }
  auto command_name = vm["command"].as<std::string>();
  auto command = hopper::schema::from_string(command_name, kCommandMappings);
  if (!command) {
    return invalid("unknown command '" + command_name + "'");
  }
  out.command = *command;

  auto commitment_name = vm["commitment"].as<std::string>();
  auto commitment =
      hopper::schema::try_from_string<hopper::schema::commitment_t>(
          commitment_name);
  if (!commitment) {
    return invalid("unknown commitment '" + commitment_name + "'");
  }
  out.commitment = *commitment;

  out.rpc_url = vm["rpc-url"].as<std::string>();
  out.rpc_deadline = milliseconds(vm, "rpc-deadline-ms");
  out.skip_preflight = vm["skip-preflight"].as<bool>();
  out.retry.max_attempts = vm["max-attempts"].as<uint32_t>();
  out.retry.base_delay = milliseconds(vm, "base-delay-ms");
  out.retry.max_delay = milliseconds(vm, "max-delay-ms");
  out.retry.confirmation_timeout = milliseconds(vm, "confirm-timeout-ms");
  out.retry.step_timeout = milliseconds(vm, "step-timeout-ms");
  out.retry.poll_interval = milliseconds(vm, "poll-interval-ms");
  if (out.retry.max_attempts == 0) {
    return invalid("--max-attempts must be at least 1");
  }
  if (out.retry.base_delay > out.retry.max_delay) {
    return invalid("--base-delay-ms must not exceed --max-delay-ms");
  }

  if (vm.contains("fee-per-signature")) {
    out.fees.fee_per_signature = vm["fee-per-signature"].as<uint64_t>();
  }
  out.fees.margin_bps = vm["fee-margin-bps"].as<uint32_t>();
  out.fees.compute_unit_price = vm["compute-unit-price"].as<uint64_t>();
  out.fees.compute_unit_limit = vm["compute-unit-limit"].as<uint32_t>();

  out.state_dir = vm["state-dir"].as<std::string>();
  out.hop_key = vm["hop-key"].as<std::string>();
  out.log_file = vm["log-file"].as<std::string>();
  if (vm.contains("sender-key")) {
    out.sender_key = vm["sender-key"].as<std::string>();
  }
  if (vm.contains("out")) {
    out.out = vm["out"].as<std::string>();
  }

  out.recipient = parse_address(vm, "recipient", error);
  out.address = parse_address(vm, "address", error);
  if (hopper::schema::has_failure(error)) {
    return std::nullopt;
  }
  if (vm.contains("amount")) {
    auto text = vm["amount"].as<std::string>();
    auto amount = parse_amount(text);
    if (!amount || *amount == 0) {
      return invalid("--amount '" + text +
                     "' must be a positive integer number of lamports");
    }
    out.amount = *amount;
  }

  auto ok = true;
  switch (out.command) {
    case command_t::transfer:
      ok = require(vm, command_name, "sender-key", error) &&
           require(vm, command_name, "recipient", error) &&
           require(vm, command_name, "amount", error);
      break;
    case command_t::resume:
      ok = require(vm, command_name, "sender-key", error);
      break;
    case command_t::status:
      break;
    case command_t::balance:
      ok = require(vm, command_name, "address", error);
      break;
    case command_t::keygen:
      ok = require(vm, command_name, "out", error);
      break;
  }
  if (!ok) {
    return std::nullopt;
  }
  return out;
}

}  // namespace

std::string environment_to_option(const std::string& variable) {
  if (!variable.starts_with(kEnvironmentPrefix)) {
    return {};
  }
  auto name = variable.substr(kEnvironmentPrefix.size());
  std::ranges::transform(name, std::begin(name), [](const char c) {
    return c == '_' ? '-'
                    : static_cast<char>(
                          std::tolower(static_cast<unsigned char>(c)));
  });
  auto shared = make_shared_options();
  if (shared.find_nothrow(name, false) == nullptr) {
    return {};
  }
  return name;
}

std::optional<config> load(const int argc,
                           const char* const argv[],
                           hopper::schema::failure_t& error) {
  error = hopper::schema::failure_t{};
  auto vm = po::variables_map{};
  try {
    auto positional = po::positional_options_description{};
    positional.add("command", 1);
    po::store(po::command_line_parser(argc, argv)
                  .options(make_command_line_options())
                  .positional(positional)
                  .run(),
              vm);
    po::store(po::parse_environment(make_shared_options(),
                                    environment_to_option),
              vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      po::store(po::parse_config_file<char>(path.c_str(), make_shared_options(),
                                            false),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    error = hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::invalid_request,
        .message = e.what()};
    return std::nullopt;
  }
  return make_config(vm, error);
}

std::string usage() {
  auto stream = std::ostringstream{};
  stream << "Usage: hopper <transfer|resume|status|balance|keygen> [options]\n"
         << make_generic_options() << make_shared_options();
  return stream.str();
}

}  // namespace hopper::config
