#include <gtest/gtest.h>
#include <hopper/testing/transfer_fixture.hpp>
#include <hopper/transfer/report.hpp>

#include <algorithm>

namespace {

using hopper::schema::confirmation_status_t;
using hopper::schema::transfer_state_t;
using hopper::schema::transfer_step_t;

constexpr auto kAmount = hopper::schema::lamports_t{1'000'000};
constexpr auto kFee = hopper::schema::lamports_t{5'000};

class orchestrator_test : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!hopper::crypto::available()) {
      GTEST_SKIP() << "OpenSSL backend does not expose Ed25519";
    }
    fixture_.emplace("hopper_orchestrator");
  }

  hopper::testing::transfer_fixture& fixture() { return *fixture_; }
  hopper::ledger::simulated_ledger_t& ledger() { return fixture_->ledger(); }

  hopper::transfer::transfer_report_t run(
      hopper::testing::orchestrator_t& orchestrator) {
    return orchestrator.run(fixture().clock().sleeper());
  }

  /// Run a fresh orchestrator over the stored plan, as `hopper resume` does.
  hopper::transfer::transfer_report_t resume() {
    auto orchestrator = fixture().make_orchestrator(fixture().latest_plan());
    return run(*orchestrator);
  }

  std::size_t attempts_for(const hopper::schema::hash32_t& plan_id,
                           const transfer_step_t step) {
    auto attempts = fixture().store().attempts(plan_id);
    return static_cast<std::size_t>(
        std::count_if(attempts.begin(), attempts.end(),
                      [&](const auto& attempt) { return attempt.step == step; }));
  }

  static auto in_state(const transfer_state_t state) {
    return [state](const hopper::testing::orchestrator_t& orchestrator) {
      return orchestrator.plan().state == state;
    };
  }

  std::optional<hopper::testing::transfer_fixture> fixture_;
};

}  // namespace

TEST_F(orchestrator_test, relays_the_amount_and_skips_recovery_of_the_fee) {
  auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
  auto report = run(*orchestrator);

  EXPECT_EQ(report.plan.state, transfer_state_t::recovered);
  EXPECT_FALSE(report.plan.stuck);
  EXPECT_EQ(report.plan.fees.fee_per_transaction, kFee);
  EXPECT_EQ(report.plan.fees.cushion, 2 * kFee);
  EXPECT_EQ(report.plan.recovered, 0u);
  EXPECT_TRUE(report.plan.receipts.fund.has_value());
  EXPECT_TRUE(report.plan.receipts.forward.has_value());
  EXPECT_FALSE(report.plan.receipts.recover.has_value());
  EXPECT_EQ(hopper::transfer::exit_code(report.plan),
            hopper::transfer::kExitRecovered);
  ASSERT_EQ(report.timings.size(), 2u);
  EXPECT_EQ(report.timings[0].step, transfer_step_t::fund);
  EXPECT_EQ(report.timings[1].step, transfer_step_t::forward);

  EXPECT_EQ(ledger().balance(fixture().recipient()), kAmount);
  EXPECT_EQ(ledger().balance(fixture().hop()), kFee);
  EXPECT_EQ(ledger().balance(fixture().sender()),
            hopper::testing::kSenderBalance - kAmount - 2 * kFee - kFee);

  auto landed = ledger().landed();
  ASSERT_EQ(landed.size(), 2u);
  EXPECT_EQ(landed[0].message.lamports, kAmount + 2 * kFee);
  EXPECT_EQ(landed[0].signature, *report.plan.receipts.fund);
  EXPECT_EQ(landed[1].message.lamports, kAmount);

  auto stored = fixture().latest_plan();
  EXPECT_EQ(stored.state, transfer_state_t::recovered);
  for (const auto& attempt : fixture().store().attempts(stored.plan_id)) {
    EXPECT_EQ(attempt.status, confirmation_status_t::confirmed);
    EXPECT_TRUE(attempt.submitted);
  }
}

TEST_F(orchestrator_test, recovers_a_residual_larger_than_the_fee) {
  fixture().options().fees.margin_bps = 5'000;
  auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
  auto report = run(*orchestrator);

  // Cushion 15000: the forward leaves 10000, recovery returns 10000 - 5000.
  EXPECT_EQ(report.plan.state, transfer_state_t::recovered);
  EXPECT_EQ(report.plan.fees.cushion, 15'000u);
  EXPECT_EQ(report.plan.recovered, 5'000u);
  EXPECT_TRUE(report.plan.receipts.recover.has_value());
  EXPECT_EQ(ledger().transfers(fixture().hop(), fixture().sender()), 1u);
  EXPECT_EQ(ledger().balance(fixture().hop()), 0u);
  EXPECT_EQ(ledger().balance(fixture().recipient()), kAmount);
  EXPECT_EQ(ledger().balance(fixture().sender()),
            hopper::testing::kSenderBalance - (kAmount + 15'000) - kFee +
                5'000);
}

TEST_F(orchestrator_test, insufficient_sender_balance_fails_before_funding) {
  ledger().set_balance(fixture().sender(), kAmount);
  auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
  auto report = run(*orchestrator);

  EXPECT_EQ(report.plan.state, transfer_state_t::failed);
  EXPECT_EQ(report.plan.last_error.code,
            hopper::schema::error_code_t::insufficient_sender_funds);
  EXPECT_EQ(hopper::transfer::exit_code(report.plan),
            hopper::transfer::kExitFailed);
  EXPECT_EQ(ledger().submissions(), 0u);
  EXPECT_EQ(ledger().balance(fixture().sender()), kAmount);
  EXPECT_EQ(fixture().latest_plan().state, transfer_state_t::failed);
}

TEST_F(orchestrator_test, ledger_refusing_the_funding_fee_fails_the_plan) {
  // A stale fee override passes preflight but the ledger charges more.
  fixture().options().fees.fee_per_signature = 1;
  ledger().set_balance(fixture().sender(), kAmount + 3);
  auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
  auto report = run(*orchestrator);

  EXPECT_EQ(report.plan.state, transfer_state_t::failed);
  EXPECT_EQ(report.plan.last_error.code,
            hopper::schema::error_code_t::insufficient_sender_funds);
  EXPECT_EQ(report.plan.last_error.step, transfer_step_t::fund);
  EXPECT_EQ(ledger().balance(fixture().sender()), kAmount + 3);
}

TEST_F(orchestrator_test, unreachable_gateway_fails_funding_without_moving_funds) {
  ledger().fail_submissions(100, hopper::ledger::rpc_error_kind_t::unavailable);
  auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
  auto report = run(*orchestrator);

  EXPECT_EQ(report.plan.state, transfer_state_t::failed);
  EXPECT_EQ(report.plan.last_error.code,
            hopper::schema::error_code_t::retry_exhausted);
  EXPECT_EQ(ledger().submissions(),
            hopper::testing::fast_retry_policy().max_attempts);
  EXPECT_TRUE(ledger().landed().empty());
  EXPECT_EQ(ledger().balance(fixture().sender()),
            hopper::testing::kSenderBalance);

  for (const auto& attempt :
       fixture().store().attempts(report.plan.plan_id)) {
    EXPECT_EQ(attempt.status, confirmation_status_t::failed);
  }
}

TEST_F(orchestrator_test, rejected_funding_is_terminal) {
  ledger().fail_submissions(1, hopper::ledger::rpc_error_kind_t::rejected);
  auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
  auto report = run(*orchestrator);

  EXPECT_EQ(report.plan.state, transfer_state_t::failed);
  EXPECT_EQ(report.plan.last_error.code,
            hopper::schema::error_code_t::transaction_rejected);
  EXPECT_EQ(ledger().submissions(), 1u);
}

TEST_F(orchestrator_test, resumes_after_funding_with_a_single_forward) {
  {
    auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
    ASSERT_TRUE(fixture().step_until(*orchestrator,
                                     in_state(transfer_state_t::funded)));
  }
  fixture().restart();
  EXPECT_EQ(fixture().latest_plan().state, transfer_state_t::funded);

  auto report = resume();
  EXPECT_EQ(report.plan.state, transfer_state_t::recovered);
  EXPECT_EQ(ledger().transfers(fixture().sender(), fixture().hop()), 1u);
  EXPECT_EQ(ledger().transfers(fixture().hop(), fixture().recipient()), 1u);
  EXPECT_EQ(ledger().balance(fixture().recipient()), kAmount);
}

TEST_F(orchestrator_test, crash_after_ambiguous_forward_never_sends_it_twice) {
  auto plan_id = hopper::schema::hash32_t{};
  {
    auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
    plan_id = orchestrator->plan().plan_id;
    ASSERT_TRUE(fixture().step_until(*orchestrator,
                                     in_state(transfer_state_t::forwarding)));
    // The forward reaches the ledger but its response is lost; the process
    // dies before learning the outcome.
    ledger().lose_responses(1);
    orchestrator->step();
  }
  ASSERT_EQ(attempts_for(plan_id, transfer_step_t::forward), 1u);
  EXPECT_EQ(fixture().store().attempts(plan_id).back().status,
            confirmation_status_t::pending);

  fixture().restart();
  auto report = resume();
  EXPECT_EQ(report.plan.state, transfer_state_t::recovered);
  EXPECT_EQ(ledger().transfers(fixture().hop(), fixture().recipient()), 1u);
  EXPECT_EQ(attempts_for(plan_id, transfer_step_t::forward), 1u);
  EXPECT_EQ(ledger().balance(fixture().recipient()), kAmount);
}

TEST_F(orchestrator_test, ambiguous_submission_is_confirmed_without_resubmitting) {
  ledger().lose_responses(1);
  auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
  auto report = run(*orchestrator);

  EXPECT_EQ(report.plan.state, transfer_state_t::recovered);
  EXPECT_EQ(attempts_for(report.plan.plan_id, transfer_step_t::fund), 1u);
  EXPECT_EQ(ledger().transfers(fixture().sender(), fixture().hop()), 1u);
}

TEST_F(orchestrator_test, dropped_transaction_is_resubmitted_after_expiry) {
  ledger().blockhash_lifetime = 3;
  ledger().drop_submissions(1);
  auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
  auto report = run(*orchestrator);

  EXPECT_EQ(report.plan.state, transfer_state_t::recovered);
  EXPECT_EQ(ledger().transfers(fixture().sender(), fixture().hop()), 1u);

  auto attempts = fixture().store().attempts(report.plan.plan_id);
  ASSERT_GE(attempts.size(), 2u);
  EXPECT_EQ(attempts[0].step, transfer_step_t::fund);
  EXPECT_EQ(attempts[0].status, confirmation_status_t::failed);
  EXPECT_EQ(attempts[1].step, transfer_step_t::fund);
  EXPECT_EQ(attempts[1].status, confirmation_status_t::confirmed);
  EXPECT_NE(attempts[0].recent_blockhash, attempts[1].recent_blockhash);
  EXPECT_NE(attempts[0].signature, attempts[1].signature);
}

TEST_F(orchestrator_test, exhausted_forward_leaves_the_plan_stuck_until_resumed) {
  auto plan_id = hopper::schema::hash32_t{};
  {
    auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
    plan_id = orchestrator->plan().plan_id;
    ASSERT_TRUE(fixture().step_until(*orchestrator,
                                     in_state(transfer_state_t::forwarding)));
    ledger().fail_submissions(100,
                              hopper::ledger::rpc_error_kind_t::unavailable);
    auto report = run(*orchestrator);
    EXPECT_EQ(report.plan.state, transfer_state_t::forwarding);
    EXPECT_TRUE(report.plan.stuck);
    EXPECT_EQ(report.plan.last_error.code,
              hopper::schema::error_code_t::retry_exhausted);
    EXPECT_EQ(report.plan.last_error.step, transfer_step_t::forward);
    EXPECT_EQ(hopper::transfer::exit_code(report.plan),
              hopper::transfer::kExitStuck);
  }
  auto stored = fixture().latest_plan();
  EXPECT_TRUE(stored.stuck);
  EXPECT_EQ(stored.state, transfer_state_t::forwarding);
  EXPECT_EQ(ledger().balance(fixture().recipient()), 0u);

  ledger().fail_submissions(0, hopper::ledger::rpc_error_kind_t::unavailable);
  auto report = resume();
  EXPECT_EQ(report.plan.state, transfer_state_t::recovered);
  EXPECT_FALSE(report.plan.stuck);
  EXPECT_EQ(ledger().transfers(fixture().hop(), fixture().recipient()), 1u);
  EXPECT_FALSE(fixture().latest_plan().stuck);
}

TEST_F(orchestrator_test, drained_hop_is_reported_as_underfunded) {
  {
    auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
    ASSERT_TRUE(fixture().step_until(*orchestrator,
                                     in_state(transfer_state_t::funded)));
    ledger().set_balance(fixture().hop(), 100);
    auto report = run(*orchestrator);
    EXPECT_EQ(report.plan.state, transfer_state_t::funded);
    EXPECT_TRUE(report.plan.stuck);
    EXPECT_EQ(report.plan.last_error.code,
              hopper::schema::error_code_t::underfunded_recovery);
  }
  EXPECT_EQ(ledger().transfers(fixture().hop(), fixture().recipient()), 0u);

  ledger().set_balance(fixture().hop(), kAmount + 2 * kFee);
  auto report = resume();
  EXPECT_EQ(report.plan.state, transfer_state_t::recovered);
  EXPECT_EQ(ledger().balance(fixture().recipient()), kAmount);
}

TEST_F(orchestrator_test, exhausted_recovery_leaves_the_plan_stuck_until_resumed) {
  fixture().options().fees.margin_bps = 5'000;
  {
    auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
    ASSERT_TRUE(fixture().step_until(*orchestrator,
                                     in_state(transfer_state_t::recovering)));
    ledger().fail_submissions(100,
                              hopper::ledger::rpc_error_kind_t::unavailable);
    auto report = run(*orchestrator);
    EXPECT_EQ(report.plan.state, transfer_state_t::recovering);
    EXPECT_TRUE(report.plan.stuck);
    EXPECT_EQ(report.plan.last_error.code,
              hopper::schema::error_code_t::retry_exhausted);
    EXPECT_EQ(hopper::transfer::exit_code(report.plan),
              hopper::transfer::kExitStuck);
  }
  fixture().restart();
  auto stored = fixture().latest_plan();
  EXPECT_EQ(stored.state, transfer_state_t::recovering);
  EXPECT_TRUE(stored.stuck);
  EXPECT_EQ(stored.last_error.step, transfer_step_t::recover);
  EXPECT_EQ(ledger().balance(fixture().recipient()), kAmount);
  EXPECT_EQ(ledger().balance(fixture().hop()), 10'000u);

  // Someone tops up the hop while it is parked; the resumed run recovers
  // what is actually there rather than the amount priced before.
  ledger().fail_submissions(0, hopper::ledger::rpc_error_kind_t::unavailable);
  ledger().set_balance(fixture().hop(), 30'000);
  auto report = resume();
  EXPECT_EQ(report.plan.state, transfer_state_t::recovered);
  EXPECT_FALSE(report.plan.stuck);
  EXPECT_EQ(report.plan.recovered, 25'000u);
  EXPECT_EQ(ledger().transfers(fixture().hop(), fixture().sender()), 1u);
  EXPECT_EQ(ledger().balance(fixture().hop()), 0u);
  EXPECT_EQ(hopper::transfer::exit_code(report.plan),
            hopper::transfer::kExitRecovered);
}

TEST_F(orchestrator_test, drained_hop_during_recovery_is_underfunded_then_repriced) {
  fixture().options().fees.margin_bps = 5'000;
  {
    auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
    ASSERT_TRUE(fixture().step_until(*orchestrator,
                                     in_state(transfer_state_t::recovering)));
    // Recovery was priced for a 10000 residual.
    ledger().set_balance(fixture().hop(), 6'000);
    auto report = run(*orchestrator);
    EXPECT_EQ(report.plan.state, transfer_state_t::recovering);
    EXPECT_TRUE(report.plan.stuck);
    EXPECT_EQ(report.plan.last_error.code,
              hopper::schema::error_code_t::underfunded_recovery);
    EXPECT_EQ(report.plan.last_error.step, transfer_step_t::recover);
  }
  EXPECT_EQ(ledger().transfers(fixture().hop(), fixture().sender()), 0u);

  auto report = resume();
  EXPECT_EQ(report.plan.state, transfer_state_t::recovered);
  EXPECT_EQ(report.plan.recovered, 1'000u);
  EXPECT_EQ(ledger().balance(fixture().hop()), 0u);
}

TEST_F(orchestrator_test, resumed_plan_keeps_the_priority_fee_it_was_funded_with) {
  fixture().options().fees.margin_bps = 5'000;
  {
    auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
    ASSERT_TRUE(fixture().step_until(*orchestrator,
                                     in_state(transfer_state_t::funded)));
  }
  fixture().restart();

  // 200000 micro-lamports over 10000 units would add 2000 per transfer.
  fixture().options().fees.compute_unit_price = 200'000;
  fixture().options().fees.compute_unit_limit = 10'000;
  auto report = resume();

  EXPECT_EQ(report.plan.state, transfer_state_t::recovered);
  EXPECT_EQ(report.plan.fees.compute_unit_price, 0u);
  EXPECT_EQ(report.plan.recovered, 5'000u);
  EXPECT_EQ(ledger().balance(fixture().hop()), 0u);
  EXPECT_EQ(ledger().balance(fixture().recipient()), kAmount);
  for (const auto& landed : ledger().landed()) {
    EXPECT_EQ(landed.message.compute_unit_price, 0u);
    EXPECT_EQ(landed.message.compute_unit_limit, 0u);
    EXPECT_EQ(landed.fee, kFee);
  }
}

TEST_F(orchestrator_test, finished_plan_is_not_driven_again) {
  {
    auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
    ASSERT_EQ(run(*orchestrator).plan.state, transfer_state_t::recovered);
  }
  auto submissions = ledger().submissions();
  auto report = resume();
  EXPECT_EQ(report.plan.state, transfer_state_t::recovered);
  EXPECT_EQ(ledger().submissions(), submissions);
}

TEST_F(orchestrator_test, transient_query_failures_are_retried) {
  ledger().fail_queries(2, hopper::ledger::rpc_error_kind_t::rate_limited);
  auto orchestrator = fixture().make_orchestrator(fixture().plan(kAmount));
  auto report = run(*orchestrator);
  EXPECT_EQ(report.plan.state, transfer_state_t::recovered);
  EXPECT_EQ(ledger().balance(fixture().recipient()), kAmount);
}
