#pragma once

#include <hopper/storage/rocksdb/storage.hpp>
#include <hopper/testing/common.hpp>
#include <hopper/testing/manual_clock.hpp>
#include <hopper/testing/simulated_ledger.hpp>
#include <hopper/transfer/orchestrator.hpp>
#include <hopper/transfer/plan.hpp>
#include <hopper/transfer/plan_store.hpp>
#include <hopper/vault/key_vault.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hopper::testing {

using orchestrator_t =
    hopper::transfer::orchestrator<hopper::ledger::simulated_ledger_tag>;

inline constexpr hopper::schema::lamports_t kSenderBalance = 10'000'000;

/// Retry budget scaled down so a test drives a plan through every timeout in
/// a few dozen simulated seconds.
inline hopper::retry::retry_policy fast_retry_policy() {
  return hopper::retry::retry_policy{
      .max_attempts = 4,
      .base_delay = std::chrono::milliseconds{100},
      .max_delay = std::chrono::milliseconds{1000},
      .confirmation_timeout = std::chrono::milliseconds{5000},
      .step_timeout = std::chrono::milliseconds{120000},
      .poll_interval = std::chrono::milliseconds{1000}};
}

/// Temp state directory, sender and hop vaults, a funded simulated ledger
/// and a manual clock: everything an orchestrator needs.
class transfer_fixture final {
 public:
  explicit transfer_fixture(const std::string_view prefix)
      : root_{make_db_path(prefix)},
        sender_{open_vault("sender.key")},
        hop_{open_vault("hop.key")},
        recipient_{make_public_key(0x70)} {
    open_store();
    ledger_.set_balance(sender_.account().address, kSenderBalance);
    options_.retry = fast_retry_policy();
  }

  transfer_fixture(const transfer_fixture&) = delete;
  transfer_fixture& operator=(const transfer_fixture&) = delete;
  transfer_fixture(transfer_fixture&&) = delete;
  transfer_fixture& operator=(transfer_fixture&&) = delete;

  ~transfer_fixture() {
    store_.reset();
    storage_.reset();
    remove_path(root_);
  }

  hopper::ledger::simulated_ledger_t& ledger() { return ledger_; }
  manual_clock& clock() { return clock_; }
  hopper::transfer::plan_store& store() { return *store_; }
  hopper::transfer::orchestrator_options& options() { return options_; }

  const hopper::vault::key_vault& sender_vault() const { return sender_; }
  const hopper::vault::key_vault& hop_vault() const { return hop_; }

  const hopper::schema::public_key_t& sender() const {
    return sender_.account().address;
  }
  const hopper::schema::public_key_t& hop() const {
    return hop_.account().address;
  }
  const hopper::schema::public_key_t& recipient() const { return recipient_; }

  const std::string& root() const { return root_; }

  hopper::schema::transfer_terms_t terms(
      const hopper::schema::lamports_t amount) const {
    return hopper::schema::transfer_terms_t{.sender = sender(),
                                            .recipient = recipient_,
                                            .hop = hop(),
                                            .amount = amount};
  }

  /// Resolve a plan for `amount`, throwing when resolution is refused.
  hopper::schema::transfer_plan_t plan(const hopper::schema::lamports_t amount) {
    auto error = hopper::schema::failure_t{};
    auto resolved = hopper::transfer::resolve_plan(*store_, terms(amount), error);
    if (!resolved) {
      throw std::runtime_error{"plan resolution failed: " + error.message};
    }
    return std::move(resolved->plan);
  }

  std::unique_ptr<orchestrator_t> make_orchestrator(
      hopper::schema::transfer_plan_t plan) {
    return std::make_unique<orchestrator_t>(ledger_, *store_, hop_, sender_,
                                            options_, clock_.source(),
                                            std::move(plan));
  }

  /// The stored version of the hop's latest plan.
  hopper::schema::transfer_plan_t latest_plan() const {
    auto plans = store_->plans(hop());
    if (plans.empty()) {
      throw std::runtime_error{"no plan stored"};
    }
    return plans.back();
  }

  /// Step `orchestrator` until `predicate` holds or it comes to rest,
  /// advancing the clock over every suspension. True if `predicate` held.
  bool step_until(orchestrator_t& orchestrator,
                  const std::function<bool(const orchestrator_t&)>& predicate,
                  const std::size_t max_steps = 10'000) {
    for (auto i = std::size_t{0}; i < max_steps; ++i) {
      if (predicate(orchestrator)) {
        return true;
      }
      auto result = orchestrator.step();
      if (result.done) {
        return predicate(orchestrator);
      }
      clock_.advance(result.suspend);
    }
    return false;
  }

  /// Close and reopen the state database, as a process restart would. No
  /// orchestrator may be alive across the call.
  void restart() {
    store_.reset();
    storage_.reset();
    open_store();
  }

 private:
  hopper::vault::key_vault open_vault(const std::string& name) const {
    auto vault = hopper::vault::key_vault{hopper::vault::vault_options{
        .path = std::filesystem::path{root_} / "keys" / name,
        .create_if_missing = true}};
    auto error = hopper::schema::failure_t{};
    if (!vault.load_or_create(error)) {
      throw std::runtime_error{"vault setup failed: " + error.message};
    }
    return vault;
  }

  void open_store() {
    storage_.emplace(
        hopper::storage::make_storage<hopper::storage::rocksdb_storage_tag>(
            (std::filesystem::path{root_} / "state").string()));
    store_.emplace(*storage_);
  }

  std::string root_;
  hopper::vault::key_vault sender_;
  hopper::vault::key_vault hop_;
  hopper::schema::public_key_t recipient_{};
  hopper::ledger::simulated_ledger_t ledger_;
  manual_clock clock_;
  hopper::transfer::orchestrator_options options_;
  std::optional<hopper::storage::rocksdb_storage_t> storage_;
  std::optional<hopper::transfer::plan_store> store_;
};

}  // namespace hopper::testing
