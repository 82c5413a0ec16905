#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <hopper/common/clock.hpp>
#include <hopper/config/config.hpp>
#include <hopper/crypto/ed25519.hpp>
#include <hopper/ledger/grpc/gateway.hpp>
#include <hopper/retry/controller.hpp>
#include <hopper/storage/rocksdb/storage.hpp>
#include <hopper/transfer/orchestrator.hpp>
#include <hopper/transfer/plan.hpp>
#include <hopper/transfer/plan_store.hpp>
#include <hopper/transfer/report.hpp>
#include <hopper/transfer/scheduler.hpp>
#include <hopper/vault/key_vault.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace {

using gateway_t = hopper::ledger::grpc_gateway_t;

void setup_logging(const hopper::config::config& config) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config.log_file.string(), false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "hopper", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(config.verbose ? spdlog::level::debug
                                   : spdlog::level::info);
  // Critical lines (underfunded hop) must reach disk even if the process is
  // killed right after.
  spdlog::flush_on(spdlog::level::critical);
}

int finish(const int code) {
  spdlog::shutdown();
  return code;
}

int report_failure(const hopper::schema::failure_t& error) {
  spdlog::error("{}: {}", hopper::schema::to_string(error.code),
                error.message);
  return finish(hopper::transfer::kExitUsage);
}

gateway_t make_gateway(const hopper::config::config& config) {
  return gateway_t{hopper::ledger::grpc_gateway_options{
      .endpoint = config.rpc_url,
      .rpc_deadline = config.rpc_deadline,
      .skip_preflight = config.skip_preflight}};
}

hopper::transfer::orchestrator_options make_orchestrator_options(
    const hopper::config::config& config) {
  return hopper::transfer::orchestrator_options{.commitment = config.commitment,
                                                .retry = config.retry,
                                                .fees = config.fees};
}

int run_plan(const hopper::config::config& config,
             const hopper::transfer::plan_store& store,
             const hopper::vault::key_vault& hop,
             const hopper::vault::key_vault& sender,
             hopper::schema::transfer_plan_t plan) {
  auto gateway = make_gateway(config);
  auto orchestrator = hopper::transfer::orchestrator<hopper::ledger::grpc_gateway_tag>{
      gateway,
      store,
      hop,
      sender,
      make_orchestrator_options(config),
      hopper::common::steady_clock(),
      std::move(plan)};
  auto scheduler = hopper::transfer::scheduler<hopper::ledger::grpc_gateway_tag>{
      hopper::common::steady_clock(), hopper::common::thread_sleeper()};
  scheduler.add(orchestrator);
  auto reports = scheduler.run();

  const auto& report = reports.front();
  std::cout << hopper::transfer::format_report(report);
  return finish(hopper::transfer::exit_code(report.plan));
}

std::optional<hopper::vault::key_vault> open_vault(
    const std::filesystem::path& path,
    const bool create_if_missing,
    hopper::schema::failure_t& error) {
  auto vault = hopper::vault::key_vault{hopper::vault::vault_options{
      .path = path, .create_if_missing = create_if_missing}};
  if (!vault.load_or_create(error)) {
    return std::nullopt;
  }
  return vault;
}

int transfer(const hopper::config::config& config) {
  auto error = hopper::schema::failure_t{};
  auto hop = open_vault(config.hop_key, true, error);
  if (!hop) {
    return report_failure(error);
  }
  auto sender = open_vault(config.sender_key, false, error);
  if (!sender) {
    return report_failure(error);
  }

  auto storage = hopper::storage::make_storage<hopper::storage::rocksdb_storage_tag>(
      config.state_dir.string());
  auto store = hopper::transfer::plan_store{storage};
  auto terms = hopper::schema::transfer_terms_t{
      .sender = sender->account().address,
      .recipient = *config.recipient,
      .hop = hop->account().address,
      .amount = config.amount};
  auto resolved = hopper::transfer::resolve_plan(store, terms, error);
  if (!resolved) {
    return report_failure(error);
  }
  return run_plan(config, store, *hop, *sender, std::move(resolved->plan));
}

int resume(const hopper::config::config& config) {
  auto error = hopper::schema::failure_t{};
  auto hop = open_vault(config.hop_key, false, error);
  if (!hop) {
    return report_failure(error);
  }
  auto sender = open_vault(config.sender_key, false, error);
  if (!sender) {
    return report_failure(error);
  }

  auto storage = hopper::storage::make_storage<hopper::storage::rocksdb_storage_tag>(
      config.state_dir.string());
  auto store = hopper::transfer::plan_store{storage};
  auto plan = store.active_plan(hop->account().address);
  if (!plan) {
    auto plans = store.plans(hop->account().address);
    if (plans.empty()) {
      return report_failure(hopper::schema::failure_t{
          .code = hopper::schema::error_code_t::invalid_request,
          .message = "no plan recorded for hop " +
                     hopper::schema::to_base58(hop->account().address)});
    }
    spdlog::info("Latest plan for this hop already finished");
    std::cout << hopper::transfer::format_report(
        hopper::transfer::transfer_report_t{.plan = plans.back()});
    return finish(hopper::transfer::exit_code(plans.back()));
  }
  if (plan->terms.sender != sender->account().address) {
    return report_failure(hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::key_unavailable,
        .message = "sender key does not belong to plan sender " +
                   hopper::schema::to_base58(plan->terms.sender)});
  }
  return run_plan(config, store, *hop, *sender, std::move(*plan));
}

int status(const hopper::config::config& config) {
  auto error = hopper::schema::failure_t{};
  auto hop = open_vault(config.hop_key, false, error);
  if (!hop) {
    return report_failure(error);
  }
  auto storage = hopper::storage::make_storage<hopper::storage::rocksdb_storage_tag>(
      config.state_dir.string());
  auto store = hopper::transfer::plan_store{storage};
  auto plans = store.plans(hop->account().address);
  if (plans.empty()) {
    std::cout << "no plans for hop "
              << hopper::schema::to_base58(hop->account().address) << "\n";
    return finish(0);
  }
  for (const auto& plan : plans) {
    std::cout << hopper::transfer::format_status(plan,
                                                 store.attempts(plan.plan_id))
              << "\n";
  }
  return finish(hopper::transfer::exit_code(plans.back()));
}

int balance(const hopper::config::config& config) {
  auto gateway = make_gateway(config);
  auto retry = hopper::retry::retry_controller{config.retry,
                                               hopper::common::steady_clock()};
  auto result = retry.run(
      "get_balance",
      [&] { return gateway.get_balance(*config.address, config.commitment); },
      hopper::common::thread_sleeper());
  if (auto* error = std::get_if<hopper::ledger::rpc_error_t>(&result)) {
    spdlog::error("Balance lookup failed: {}", error->message);
    return finish(hopper::transfer::kExitFailed);
  }
  std::cout << hopper::schema::to_base58(*config.address) << " "
            << std::get<hopper::schema::lamports_t>(result) << "\n";
  return finish(0);
}

int keygen(const hopper::config::config& config) {
  auto error = hopper::schema::failure_t{};
  auto vault = open_vault(config.out, true, error);
  if (!vault) {
    return report_failure(error);
  }
  std::cout << hopper::schema::to_base58(vault->account().address) << "\n";
  return finish(0);
}

}  // namespace

int main(int argc, char* argv[]) {
  auto error = hopper::schema::failure_t{};
  auto config = hopper::config::load(argc, argv, error);
  if (!config) {
    std::cerr << "hopper: " << error.message << "\n\n"
              << hopper::config::usage();
    return hopper::transfer::kExitUsage;
  }
  if (config->help) {
    std::cout << hopper::config::usage();
    return 0;
  }

  setup_logging(*config);
  if (!hopper::crypto::available()) {
    return report_failure(hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::key_unavailable,
        .message = "the linked OpenSSL does not provide Ed25519"});
  }

  switch (config->command) {
    case hopper::config::command_t::transfer:
      return transfer(*config);
    case hopper::config::command_t::resume:
      return resume(*config);
    case hopper::config::command_t::status:
      return status(*config);
    case hopper::config::command_t::balance:
      return balance(*config);
    case hopper::config::command_t::keygen:
      return keygen(*config);
  }
  return finish(hopper::transfer::kExitUsage);
}
