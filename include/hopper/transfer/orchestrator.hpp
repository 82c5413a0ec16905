#pragma once
#include <hopper/common/clock.hpp>
#include <hopper/ledger/gateway.hpp>
#include <hopper/retry/controller.hpp>
#include <hopper/schema/commitment.hpp>
#include <hopper/schema/transaction_attempt.hpp>
#include <hopper/schema/transfer_plan.hpp>
#include <hopper/transfer/fee_estimator.hpp>
#include <hopper/transfer/plan_store.hpp>
#include <hopper/transfer/report.hpp>
#include <hopper/transfer/transaction.hpp>
#include <hopper/vault/key_vault.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace hopper::transfer {

struct orchestrator_options final {
  hopper::schema::commitment_t commitment{
      hopper::schema::commitment_t::finalized};
  hopper::retry::retry_policy retry{};
  fee_options fees{};
};

/// Outcome of one `orchestrator::step`: either the plan reached a resting
/// point (terminal or stuck) or it wants to be stepped again after `suspend`.
struct step_result_t final {
  bool done{false};
  std::chrono::milliseconds suspend{};
};

/// Drives one transfer plan through fund, forward and recover.
///
/// Each `step` performs at most one state transition or one round of ledger
/// calls and never sleeps; waiting is expressed as the returned suspension
/// so a scheduler can interleave many plans on one thread. Progress is
/// persisted before it is acted on: an attempt record (whose signature is
/// the transaction id) is written before the transaction is submitted, and a
/// confirmation is written together with the state it unlocks. A fresh
/// orchestrator over the same plan therefore picks up the unresolved attempt
/// and settles it against the ledger before ever submitting another one.
template <typename Library>
class orchestrator final {
 public:
  using gateway_t = hopper::ledger::gateway<Library>;

  orchestrator(gateway_t& gateway,
               const plan_store& store,
               const hopper::vault::key_vault& hop,
               const hopper::vault::key_vault& sender,
               orchestrator_options options,
               hopper::common::clock_source_t clock,
               hopper::schema::transfer_plan_t plan);

  orchestrator(const orchestrator&) = delete;
  orchestrator& operator=(const orchestrator&) = delete;

  step_result_t step();

  /// Step until the plan is terminal or stuck, sleeping between steps.
  transfer_report_t run(const hopper::common::sleeper_t& sleeper);

  bool done() const;
  const hopper::schema::transfer_plan_t& plan() const;
  transfer_report_t report() const;

 private:
  step_result_t begin();
  step_result_t preflight();
  step_result_t verify_hop_funded();
  step_result_t plan_recovery();
  step_result_t drive(hopper::schema::transfer_step_t step);
  step_result_t submit(hopper::schema::transfer_step_t step);
  step_result_t poll(hopper::schema::transfer_step_t step);
  step_result_t requery(hopper::schema::transfer_step_t step);
  step_result_t confirmed(hopper::schema::transfer_step_t step);
  step_result_t rejected(hopper::schema::transfer_step_t step,
                         const hopper::ledger::rpc_error_t& error);
  step_result_t retry_or_give_up(hopper::schema::transfer_step_t step,
                                 const hopper::ledger::rpc_error_t& error,
                                 hopper::schema::error_code_t code);
  step_result_t give_up(hopper::schema::failure_t failure);

  void transition(hopper::schema::transfer_state_t next);
  void resolve_pending(hopper::schema::confirmation_status_t status,
                       hopper::schema::failure_t error = {});
  bool funding_may_have_landed() const;

  const hopper::vault::key_vault& signer(
      hopper::schema::transfer_step_t step) const;
  hopper::schema::transfer_message_t make_message(
      hopper::schema::transfer_step_t step,
      const hopper::schema::blockhash_t& blockhash) const;

  step_result_t again(std::chrono::milliseconds delay = {}) const;
  step_result_t finished() const;
  std::string tag() const;

  gateway_t& gateway_;
  const plan_store& store_;
  const hopper::vault::key_vault& hop_;
  const hopper::vault::key_vault& sender_;
  orchestrator_options options_;
  fee_estimator fees_;
  hopper::retry::retry_controller retry_;
  hopper::common::clock_source_t clock_;
  hopper::schema::transfer_plan_t plan_;
  std::optional<hopper::schema::transaction_attempt_t> pending_;
  hopper::common::time_point_t awaiting_since_{};
  hopper::common::time_point_t step_started_{};
  std::vector<step_timing_t> timings_;
  bool started_{false};
  // Whether `plan_.recovered` was derived from the hop balance in this run.
  bool recovery_priced_{false};
};

/// The step whose transaction a state is waiting on, if any.
inline std::optional<hopper::schema::transfer_step_t> active_step(
    const hopper::schema::transfer_state_t state) {
  switch (state) {
    case hopper::schema::transfer_state_t::funding:
      return hopper::schema::transfer_step_t::fund;
    case hopper::schema::transfer_state_t::forwarding:
      return hopper::schema::transfer_step_t::forward;
    case hopper::schema::transfer_state_t::recovering:
      return hopper::schema::transfer_step_t::recover;
    default:
      return std::nullopt;
  }
}

template <typename Library>
orchestrator<Library>::orchestrator(gateway_t& gateway,
                                    const plan_store& store,
                                    const hopper::vault::key_vault& hop,
                                    const hopper::vault::key_vault& sender,
                                    orchestrator_options options,
                                    hopper::common::clock_source_t clock,
                                    hopper::schema::transfer_plan_t plan)
    : gateway_{gateway},
      store_{store},
      hop_{hop},
      sender_{sender},
      options_{std::move(options)},
      fees_{options_.fees},
      retry_{options_.retry, clock},
      clock_{std::move(clock)},
      plan_{std::move(plan)} {}

template <typename Library>
step_result_t orchestrator<Library>::step() {
  if (!started_) {
    return begin();
  }
  if (done()) {
    return finished();
  }
  if (pending_) {
    return poll(pending_->step);
  }

  switch (plan_.state) {
    case hopper::schema::transfer_state_t::init:
      return preflight();
    case hopper::schema::transfer_state_t::funding:
      return drive(hopper::schema::transfer_step_t::fund);
    case hopper::schema::transfer_state_t::funded:
      return verify_hop_funded();
    case hopper::schema::transfer_state_t::forwarding:
      return drive(hopper::schema::transfer_step_t::forward);
    case hopper::schema::transfer_state_t::forwarded:
      return plan_recovery();
    case hopper::schema::transfer_state_t::recovering:
      return drive(hopper::schema::transfer_step_t::recover);
    case hopper::schema::transfer_state_t::recovered:
    case hopper::schema::transfer_state_t::failed:
      break;
  }
  return finished();
}

template <typename Library>
transfer_report_t orchestrator<Library>::run(
    const hopper::common::sleeper_t& sleeper) {
  while (true) {
    auto result = step();
    if (result.done) {
      return report();
    }
    if (result.suspend.count() > 0) {
      sleeper(result.suspend);
    }
  }
}

template <typename Library>
bool orchestrator<Library>::done() const {
  return hopper::schema::is_terminal(plan_.state) || plan_.stuck;
}

template <typename Library>
const hopper::schema::transfer_plan_t& orchestrator<Library>::plan() const {
  return plan_;
}

template <typename Library>
transfer_report_t orchestrator<Library>::report() const {
  return transfer_report_t{.plan = plan_, .timings = timings_};
}

template <typename Library>
step_result_t orchestrator<Library>::begin() {
  started_ = true;
  step_started_ = clock_();
  retry_.reset();
  if (hopper::schema::is_terminal(plan_.state)) {
    return finished();
  }
  if (hop_.account().address != plan_.terms.hop ||
      sender_.account().address != plan_.terms.sender) {
    // Nothing can be signed for this plan; leave it untouched.
    spdlog::error("{} Loaded keys do not match the plan's accounts", tag());
    plan_.last_error = hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::key_unavailable,
        .step = active_step(plan_.state).value_or(
            hopper::schema::transfer_step_t::fund),
        .message = "loaded keys do not match the plan's accounts"};
    plan_.stuck = true;
    return finished();
  }

  if (plan_.stuck) {
    spdlog::info("{} Resuming stuck plan in {} (last error {} during {}: {})",
                 tag(), hopper::schema::to_string(plan_.state),
                 hopper::schema::to_string(plan_.last_error.code),
                 hopper::schema::to_string(plan_.last_error.step),
                 plan_.last_error.message);
    plan_.stuck = false;
    plan_.updated_at = hopper::schema::now_milliseconds();
    store_.save(plan_);
  }

  if (auto step = active_step(plan_.state)) {
    auto attempts = store_.attempts(plan_.plan_id);
    for (auto it = attempts.rbegin(); it != attempts.rend(); ++it) {
      if (it->step == *step &&
          it->status == hopper::schema::confirmation_status_t::pending) {
        pending_ = *it;
        break;
      }
    }
    if (pending_) {
      // The attempt may have been outstanding for a long time; settle it
      // against the ledger on the first unconfirmed poll.
      awaiting_since_ = clock_() - options_.retry.confirmation_timeout;
      spdlog::info("{} Re-checking unresolved {} attempt {} ({})", tag(),
                   hopper::schema::to_string(pending_->step),
                   pending_->sequence,
                   hopper::schema::to_base58(pending_->signature));
    }
  }
  return again();
}

template <typename Library>
step_result_t orchestrator<Library>::preflight() {
  auto fee_per_signature = hopper::schema::lamports_t{};
  if (options_.fees.fee_per_signature) {
    fee_per_signature = *options_.fees.fee_per_signature;
  } else {
    auto fee = gateway_.get_fee_per_signature();
    if (auto* error = std::get_if<hopper::ledger::rpc_error_t>(&fee)) {
      return retry_or_give_up(hopper::schema::transfer_step_t::fund, *error,
                              hopper::schema::error_code_t::rpc_error);
    }
    fee_per_signature = std::get<hopper::schema::lamports_t>(fee);
  }
  auto quote = fees_.quote(fee_per_signature);

  auto balance = gateway_.get_balance(plan_.terms.sender, options_.commitment);
  if (auto* error = std::get_if<hopper::ledger::rpc_error_t>(&balance)) {
    return retry_or_give_up(hopper::schema::transfer_step_t::fund, *error,
                            hopper::schema::error_code_t::rpc_error);
  }
  auto available = std::get<hopper::schema::lamports_t>(balance);

  constexpr auto kMax = std::numeric_limits<hopper::schema::lamports_t>::max();
  if (quote.cushion > kMax - quote.fee_per_transaction ||
      plan_.terms.amount > kMax - quote.cushion - quote.fee_per_transaction) {
    return give_up(hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::invalid_request,
        .step = hopper::schema::transfer_step_t::fund,
        .message = "amount plus fees overflows the ledger's integer range"});
  }
  auto required =
      plan_.terms.amount + quote.cushion + quote.fee_per_transaction;
  if (available < required) {
    return give_up(hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::insufficient_sender_funds,
        .step = hopper::schema::transfer_step_t::fund,
        .message = "sender holds " + std::to_string(available) +
                   " lamports, needs " + std::to_string(required) +
                   " (amount " + std::to_string(plan_.terms.amount) +
                   " + cushion " + std::to_string(quote.cushion) + " + fee " +
                   std::to_string(quote.fee_per_transaction) + ")"});
  }

  plan_.fees = quote;
  spdlog::info("{} Fee {} per transaction, cushion {}; funding hop with {}",
               tag(), quote.fee_per_transaction, quote.cushion,
               plan_.terms.amount + quote.cushion);
  transition(hopper::schema::transfer_state_t::funding);
  retry_.reset();
  return again();
}

template <typename Library>
step_result_t orchestrator<Library>::verify_hop_funded() {
  auto balance = gateway_.get_balance(plan_.terms.hop, options_.commitment);
  if (auto* error = std::get_if<hopper::ledger::rpc_error_t>(&balance)) {
    return retry_or_give_up(hopper::schema::transfer_step_t::forward, *error,
                            hopper::schema::error_code_t::rpc_error);
  }
  auto available = std::get<hopper::schema::lamports_t>(balance);
  auto required = plan_.terms.amount + plan_.fees.fee_per_transaction;
  if (available >= required) {
    transition(hopper::schema::transfer_state_t::forwarding);
    retry_.reset();
    return again();
  }

  auto shortfall = "hop holds " + std::to_string(available) +
                   " lamports, forward needs " + std::to_string(required);
  auto decision = retry_.on_failure(hopper::ledger::rpc_error_t{
      .kind = hopper::ledger::rpc_error_kind_t::confirmation_timeout,
      .message = shortfall});
  if (decision.verdict == hopper::retry::verdict_t::retry) {
    spdlog::warn("{} {}; re-checking in {}ms", tag(), shortfall,
                 decision.delay.count());
    return again(decision.delay);
  }
  spdlog::critical("{} underfunded_recovery: {}; top up the hop account and "
                   "resume",
                   tag(), shortfall);
  return give_up(hopper::schema::failure_t{
      .code = hopper::schema::error_code_t::underfunded_recovery,
      .step = hopper::schema::transfer_step_t::forward,
      .message = shortfall});
}

template <typename Library>
step_result_t orchestrator<Library>::plan_recovery() {
  auto balance = gateway_.get_balance(plan_.terms.hop, options_.commitment);
  if (auto* error = std::get_if<hopper::ledger::rpc_error_t>(&balance)) {
    return retry_or_give_up(hopper::schema::transfer_step_t::recover, *error,
                            hopper::schema::error_code_t::rpc_error);
  }
  auto residual = std::get<hopper::schema::lamports_t>(balance);
  auto fee = plan_.fees.fee_per_transaction;
  recovery_priced_ = true;
  if (residual <= fee) {
    spdlog::info("{} Residual {} does not exceed the recovery fee {}; "
                 "skipping recovery",
                 tag(), residual, fee);
    plan_.recovered = 0;
    transition(hopper::schema::transfer_state_t::recovered);
    return finished();
  }
  plan_.recovered = residual - fee;
  spdlog::info("{} Recovering {} of residual {} to the sender", tag(),
               plan_.recovered, residual);
  if (plan_.state == hopper::schema::transfer_state_t::recovering) {
    plan_.updated_at = hopper::schema::now_milliseconds();
    store_.save(plan_);
  } else {
    transition(hopper::schema::transfer_state_t::recovering);
  }
  retry_.reset();
  return again();
}

template <typename Library>
step_result_t orchestrator<Library>::drive(
    const hopper::schema::transfer_step_t step) {
  if (pending_) {
    return poll(step);
  }
  if (step == hopper::schema::transfer_step_t::recover && !recovery_priced_) {
    // A previous run may have stopped on a stale amount; the hop balance is
    // the only truth for what is left to recover.
    return plan_recovery();
  }
  return submit(step);
}

template <typename Library>
step_result_t orchestrator<Library>::submit(
    const hopper::schema::transfer_step_t step) {
  auto latest = gateway_.get_latest_blockhash(options_.commitment);
  if (auto* error = std::get_if<hopper::ledger::rpc_error_t>(&latest)) {
    return retry_or_give_up(step, *error,
                            hopper::schema::error_code_t::rpc_error);
  }
  auto blockhash = std::get<hopper::ledger::latest_blockhash_t>(latest).blockhash;
  auto message = make_message(step, blockhash);
  auto signed_payload = sign_transfer(signer(step), message);
  if (!signed_payload) {
    return give_up(hopper::schema::failure_t{
        .code = hopper::schema::error_code_t::key_unavailable,
        .step = step,
        .message = "could not sign the " +
                   std::string{hopper::schema::to_string(step)} +
                   " transfer"});
  }

  auto now = hopper::schema::now_milliseconds();
  auto attempt = hopper::schema::transaction_attempt_t{};
  attempt.plan_id = plan_.plan_id;
  attempt.sequence = plan_.next_attempt++;
  attempt.step = step;
  attempt.attempt = retry_.failures() + 1;
  attempt.signature = signed_payload->signature;
  attempt.recent_blockhash = blockhash;
  attempt.lamports = message.lamports;
  attempt.created_at = now;
  attempt.updated_at = now;
  plan_.updated_at = now;
  store_.save(plan_, attempt);
  pending_ = attempt;
  awaiting_since_ = clock_();

  auto submitted = gateway_.submit_transaction(
      hopper::schema::make_bytes_view(signed_payload->payload));
  auto* error = std::get_if<hopper::ledger::rpc_error_t>(&submitted);
  if (error == nullptr) {
    pending_->submitted = true;
    pending_->updated_at = hopper::schema::now_milliseconds();
    store_.save(plan_, *pending_);
    spdlog::info("{} Submitted {} transfer of {} (attempt {}): {}", tag(),
                 hopper::schema::to_string(step), message.lamports,
                 attempt.attempt, hopper::schema::to_base58(attempt.signature));
    return again();
  }

  if (!hopper::ledger::retryable(*error)) {
    resolve_pending(hopper::schema::confirmation_status_t::failed,
                    hopper::schema::failure_t{
                        .code = hopper::schema::error_code_t::transaction_rejected,
                        .step = step,
                        .message = error->message});
    return rejected(step, *error);
  }
  if (error->kind == hopper::ledger::rpc_error_kind_t::unavailable ||
      error->kind == hopper::ledger::rpc_error_kind_t::blockhash_expired) {
    // Definitely not accepted: the attempt is closed and the next one gets
    // a fresh blockhash.
    resolve_pending(hopper::schema::confirmation_status_t::failed,
                    hopper::schema::failure_t{
                        .code = hopper::schema::error_code_t::rpc_error,
                        .step = step,
                        .message = error->message});
  } else {
    spdlog::warn("{} Submission of {} attempt {} is ambiguous ({}); it stays "
                 "pending until the ledger says otherwise",
                 tag(), hopper::schema::to_string(step), attempt.sequence,
                 error->message);
  }
  return retry_or_give_up(step, *error, hopper::schema::error_code_t::rpc_error);
}

template <typename Library>
step_result_t orchestrator<Library>::poll(
    const hopper::schema::transfer_step_t step) {
  auto confirmation = gateway_.await_confirmation(
      pending_->signature, options_.commitment, std::chrono::milliseconds{0});
  switch (confirmation.status) {
    case hopper::schema::confirmation_status_t::confirmed:
      return confirmed(step);
    case hopper::schema::confirmation_status_t::failed: {
      auto error = hopper::ledger::rpc_error_t{
          .kind = hopper::ledger::rpc_error_kind_t::rejected,
          .message = "transaction failed on the ledger: " + confirmation.detail};
      resolve_pending(hopper::schema::confirmation_status_t::failed,
                      hopper::schema::failure_t{
                          .code = hopper::schema::error_code_t::transaction_rejected,
                          .step = step,
                          .message = error.message});
      return rejected(step, error);
    }
    case hopper::schema::confirmation_status_t::pending:
      break;
  }

  if (clock_() - awaiting_since_ < options_.retry.confirmation_timeout) {
    return again(options_.retry.poll_interval);
  }
  return requery(step);
}

template <typename Library>
step_result_t orchestrator<Library>::requery(
    const hopper::schema::transfer_step_t step) {
  auto valid = gateway_.is_blockhash_valid(pending_->recent_blockhash,
                                           options_.commitment);
  if (auto* error = std::get_if<hopper::ledger::rpc_error_t>(&valid)) {
    return retry_or_give_up(step, *error,
                            hopper::schema::error_code_t::confirmation_timeout);
  }

  if (std::get<bool>(valid)) {
    // Still able to land; resubmitting now could land twice.
    awaiting_since_ = clock_();
    return retry_or_give_up(
        step,
        hopper::ledger::rpc_error_t{
            .kind = hopper::ledger::rpc_error_kind_t::confirmation_timeout,
            .message = "attempt " + std::to_string(pending_->sequence) +
                       " unconfirmed, blockhash still valid"},
        hopper::schema::error_code_t::confirmation_timeout);
  }

  // The blockhash expired, so the ledger's answer about this signature is
  // now final.
  auto status = gateway_.get_signature_status(pending_->signature);
  if (auto* error = std::get_if<hopper::ledger::rpc_error_t>(&status)) {
    return retry_or_give_up(step, *error,
                            hopper::schema::error_code_t::confirmation_timeout);
  }
  auto& found = std::get<hopper::ledger::signature_status_t>(status);
  if (found.found && found.error) {
    auto error = hopper::ledger::rpc_error_t{
        .kind = hopper::ledger::rpc_error_kind_t::rejected,
        .message = "transaction failed on the ledger: " + *found.error};
    resolve_pending(hopper::schema::confirmation_status_t::failed,
                    hopper::schema::failure_t{
                        .code = hopper::schema::error_code_t::transaction_rejected,
                        .step = step,
                        .message = error.message});
    return rejected(step, error);
  }
  if (found.found && found.commitment &&
      hopper::schema::satisfies(*found.commitment, options_.commitment)) {
    return confirmed(step);
  }
  if (found.found) {
    // Landed but not yet at the required commitment; it will get there.
    awaiting_since_ = clock_();
    return retry_or_give_up(
        step,
        hopper::ledger::rpc_error_t{
            .kind = hopper::ledger::rpc_error_kind_t::confirmation_timeout,
            .message = "attempt " + std::to_string(pending_->sequence) +
                       " landed below the required commitment"},
        hopper::schema::error_code_t::confirmation_timeout);
  }

  auto dropped = hopper::ledger::rpc_error_t{
      .kind = hopper::ledger::rpc_error_kind_t::blockhash_expired,
      .message = "attempt " + std::to_string(pending_->sequence) +
                 " expired without landing"};
  spdlog::warn("{} {} {}; resubmitting", tag(),
               hopper::schema::to_string(step), dropped.message);
  resolve_pending(hopper::schema::confirmation_status_t::failed,
                  hopper::schema::failure_t{
                      .code = hopper::schema::error_code_t::confirmation_timeout,
                      .step = step,
                      .message = dropped.message});
  return retry_or_give_up(step, dropped,
                          hopper::schema::error_code_t::confirmation_timeout);
}

template <typename Library>
step_result_t orchestrator<Library>::confirmed(
    const hopper::schema::transfer_step_t step) {
  auto signature = pending_->signature;
  auto next = plan_.state;
  switch (step) {
    case hopper::schema::transfer_step_t::fund:
      plan_.receipts.fund = signature;
      next = hopper::schema::transfer_state_t::funded;
      break;
    case hopper::schema::transfer_step_t::forward:
      plan_.receipts.forward = signature;
      next = hopper::schema::transfer_state_t::forwarded;
      break;
    case hopper::schema::transfer_step_t::recover:
      plan_.receipts.recover = signature;
      next = hopper::schema::transfer_state_t::recovered;
      break;
  }
  spdlog::info("{} {} confirmed: {}", tag(), hopper::schema::to_string(step),
               hopper::schema::to_base58(signature));
  spdlog::info("{} {} -> {}", tag(), hopper::schema::to_string(plan_.state),
               hopper::schema::to_string(next));

  auto now = clock_();
  timings_.push_back(step_timing_t{
      .step = step,
      .elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          now - step_started_)});
  step_started_ = now;

  plan_.state = next;
  plan_.last_error = hopper::schema::failure_t{};
  plan_.updated_at = hopper::schema::now_milliseconds();
  pending_->status = hopper::schema::confirmation_status_t::confirmed;
  pending_->updated_at = plan_.updated_at;
  store_.save(plan_, *pending_);
  pending_.reset();
  retry_.reset();
  return done() ? finished() : again();
}

template <typename Library>
step_result_t orchestrator<Library>::rejected(
    const hopper::schema::transfer_step_t step,
    const hopper::ledger::rpc_error_t& error) {
  auto code = hopper::schema::error_code_t::transaction_rejected;
  if (error.kind == hopper::ledger::rpc_error_kind_t::insufficient_funds) {
    if (step == hopper::schema::transfer_step_t::fund) {
      code = hopper::schema::error_code_t::insufficient_sender_funds;
    } else {
      // The cushion no longer covers a hop-paid transfer.
      code = hopper::schema::error_code_t::underfunded_recovery;
      spdlog::critical("{} underfunded_recovery: hop cannot pay the {} "
                       "transfer ({}); top up the hop account and resume",
                       tag(), hopper::schema::to_string(step), error.message);
    }
  }
  return give_up(hopper::schema::failure_t{
      .code = code,
      .step = step,
      .message = std::string{hopper::ledger::to_string(error.kind)} + ": " +
                 error.message});
}

template <typename Library>
step_result_t orchestrator<Library>::retry_or_give_up(
    const hopper::schema::transfer_step_t step,
    const hopper::ledger::rpc_error_t& error,
    const hopper::schema::error_code_t code) {
  auto decision = retry_.on_failure(error);
  switch (decision.verdict) {
    case hopper::retry::verdict_t::retry:
      spdlog::warn("{} {} failed ({}: {}); retry {}/{} in {}ms", tag(),
                   hopper::schema::to_string(step),
                   hopper::ledger::to_string(error.kind), error.message,
                   retry_.failures(), options_.retry.max_attempts,
                   decision.delay.count());
      return again(decision.delay);
    case hopper::retry::verdict_t::exhausted:
      return give_up(hopper::schema::failure_t{
          .code = code == hopper::schema::error_code_t::rpc_error
                      ? hopper::schema::error_code_t::retry_exhausted
                      : code,
          .step = step,
          .message = "retries exhausted after " +
                     std::to_string(retry_.failures()) + " failure(s), last: " +
                     std::string{hopper::ledger::to_string(error.kind)} + ": " +
                     error.message});
    case hopper::retry::verdict_t::terminal:
      break;
  }
  return give_up(hopper::schema::failure_t{
      .code = code,
      .step = step,
      .message = std::string{hopper::ledger::to_string(error.kind)} + ": " +
                 error.message});
}

template <typename Library>
step_result_t orchestrator<Library>::give_up(
    hopper::schema::failure_t failure) {
  auto may_fail =
      plan_.state == hopper::schema::transfer_state_t::init ||
      (plan_.state == hopper::schema::transfer_state_t::funding &&
       !funding_may_have_landed());
  plan_.last_error = std::move(failure);
  if (may_fail) {
    spdlog::error("{} Transfer failed during {}: {} ({}); no funds left the "
                  "sender",
                  tag(), hopper::schema::to_string(plan_.last_error.step),
                  plan_.last_error.message,
                  hopper::schema::to_string(plan_.last_error.code));
    transition(hopper::schema::transfer_state_t::failed);
    return finished();
  }

  plan_.stuck = true;
  plan_.updated_at = hopper::schema::now_milliseconds();
  store_.save(plan_);
  spdlog::error("{} Plan stuck in {} at step {}: {} ({}); run resume to "
                "continue",
                tag(), hopper::schema::to_string(plan_.state),
                hopper::schema::to_string(plan_.last_error.step),
                plan_.last_error.message,
                hopper::schema::to_string(plan_.last_error.code));
  return finished();
}

template <typename Library>
void orchestrator<Library>::transition(
    const hopper::schema::transfer_state_t next) {
  spdlog::info("{} {} -> {}", tag(), hopper::schema::to_string(plan_.state),
               hopper::schema::to_string(next));
  plan_.state = next;
  plan_.updated_at = hopper::schema::now_milliseconds();
  store_.save(plan_);
}

template <typename Library>
void orchestrator<Library>::resolve_pending(
    const hopper::schema::confirmation_status_t status,
    hopper::schema::failure_t error) {
  pending_->status = status;
  pending_->error = std::move(error);
  pending_->updated_at = hopper::schema::now_milliseconds();
  plan_.updated_at = pending_->updated_at;
  store_.save(plan_, *pending_);
  pending_.reset();
}

template <typename Library>
bool orchestrator<Library>::funding_may_have_landed() const {
  if (pending_ && pending_->step == hopper::schema::transfer_step_t::fund) {
    return true;
  }
  for (const auto& attempt : store_.attempts(plan_.plan_id)) {
    if (attempt.step == hopper::schema::transfer_step_t::fund &&
        attempt.status != hopper::schema::confirmation_status_t::failed) {
      return true;
    }
  }
  return false;
}

template <typename Library>
const hopper::vault::key_vault& orchestrator<Library>::signer(
    const hopper::schema::transfer_step_t step) const {
  return step == hopper::schema::transfer_step_t::fund ? sender_ : hop_;
}

template <typename Library>
hopper::schema::transfer_message_t orchestrator<Library>::make_message(
    const hopper::schema::transfer_step_t step,
    const hopper::schema::blockhash_t& blockhash) const {
  auto message = hopper::schema::transfer_message_t{};
  message.recent_blockhash = blockhash;
  message.compute_unit_price = plan_.fees.compute_unit_price;
  message.compute_unit_limit = plan_.fees.compute_unit_limit;
  switch (step) {
    case hopper::schema::transfer_step_t::fund:
      message.from = plan_.terms.sender;
      message.to = plan_.terms.hop;
      message.lamports = plan_.terms.amount + plan_.fees.cushion;
      break;
    case hopper::schema::transfer_step_t::forward:
      message.from = plan_.terms.hop;
      message.to = plan_.terms.recipient;
      message.lamports = plan_.terms.amount;
      break;
    case hopper::schema::transfer_step_t::recover:
      message.from = plan_.terms.hop;
      message.to = plan_.terms.sender;
      message.lamports = plan_.recovered;
      break;
  }
  return message;
}

template <typename Library>
step_result_t orchestrator<Library>::again(
    const std::chrono::milliseconds delay) const {
  return step_result_t{.done = false, .suspend = delay};
}

template <typename Library>
step_result_t orchestrator<Library>::finished() const {
  return step_result_t{.done = true};
}

template <typename Library>
std::string orchestrator<Library>::tag() const {
  return "[" + hopper::schema::short_id(plan_.plan_id) + "]";
}

}  // namespace hopper::transfer
