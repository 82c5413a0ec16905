#include <gtest/gtest.h>
#include <hopper/config/config.hpp>
#include <hopper/testing/common.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

class config_test : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const auto& name : environment_) {
      ::unsetenv(name.c_str());
    }
    if (!config_file_.empty()) {
      hopper::testing::remove_path(config_file_);
    }
  }

  std::optional<hopper::config::config> load(
      std::vector<std::string> arguments,
      hopper::schema::failure_t& error) {
    arguments.insert(arguments.begin(), "hopper");
    auto argv = std::vector<const char*>{};
    for (const auto& argument : arguments) {
      argv.push_back(argument.c_str());
    }
    return hopper::config::load(static_cast<int>(argv.size()), argv.data(),
                                error);
  }

  void set_environment(const std::string& name, const std::string& value) {
    ::setenv(name.c_str(), value.c_str(), 1);
    environment_.push_back(name);
  }

  std::string write_config_file(const std::string& content) {
    config_file_ = hopper::testing::make_db_path("hopper_config") + ".ini";
    auto out = std::ofstream{config_file_};
    out << content;
    return config_file_;
  }

  static std::string address(const uint8_t seed) {
    return hopper::schema::to_base58(hopper::testing::make_public_key(seed));
  }

  std::vector<std::string> transfer_arguments() const {
    return {"transfer", "--sender-key", "sender.key", "--recipient", address(1),
            "--amount", "1000000"};
  }

  std::vector<std::string> environment_;
  std::string config_file_;
};

}  // namespace

TEST_F(config_test, transfer_defaults) {
  auto error = hopper::schema::failure_t{};
  auto config = load(transfer_arguments(), error);
  ASSERT_TRUE(config.has_value()) << error.message;
  EXPECT_EQ(config->command, hopper::config::command_t::transfer);
  EXPECT_EQ(config->amount, 1'000'000u);
  ASSERT_TRUE(config->recipient.has_value());
  EXPECT_EQ(*config->recipient, hopper::testing::make_public_key(1));
  EXPECT_EQ(config->sender_key, std::filesystem::path{"sender.key"});
  EXPECT_EQ(config->commitment, hopper::schema::commitment_t::finalized);
  EXPECT_EQ(config->retry.max_attempts, 5u);
  EXPECT_EQ(config->retry.base_delay, std::chrono::milliseconds{500});
  EXPECT_EQ(config->retry.confirmation_timeout, std::chrono::milliseconds{60000});
  EXPECT_FALSE(config->fees.fee_per_signature.has_value());
  EXPECT_EQ(config->fees.margin_bps, 0u);
  EXPECT_EQ(config->state_dir, std::filesystem::path{"hopper-state"});
  EXPECT_EQ(config->hop_key, std::filesystem::path{"hop_key.txt"});
}

TEST_F(config_test, environment_fills_unset_options) {
  set_environment("HOPPER_MAX_ATTEMPTS", "7");
  set_environment("HOPPER_COMMITMENT", "confirmed");
  set_environment("HOPPER_FEE_PER_SIGNATURE", "6000");
  auto error = hopper::schema::failure_t{};
  auto config = load(transfer_arguments(), error);
  ASSERT_TRUE(config.has_value()) << error.message;
  EXPECT_EQ(config->retry.max_attempts, 7u);
  EXPECT_EQ(config->commitment, hopper::schema::commitment_t::confirmed);
  EXPECT_EQ(config->fees.fee_per_signature, 6000u);
}

TEST_F(config_test, command_line_beats_environment_beats_file) {
  set_environment("HOPPER_MAX_ATTEMPTS", "7");
  set_environment("HOPPER_FEE_MARGIN_BPS", "250");
  auto path = write_config_file(
      "max-attempts = 3\nfee-margin-bps = 100\nstate-dir = /var/lib/hopper\n");
  auto arguments = transfer_arguments();
  arguments.insert(arguments.end(),
                   {"--max-attempts", "9", "--config", path});
  auto error = hopper::schema::failure_t{};
  auto config = load(arguments, error);
  ASSERT_TRUE(config.has_value()) << error.message;
  EXPECT_EQ(config->retry.max_attempts, 9u);
  EXPECT_EQ(config->fees.margin_bps, 250u);
  EXPECT_EQ(config->state_dir, std::filesystem::path{"/var/lib/hopper"});
}

TEST_F(config_test, environment_names_map_to_options) {
  EXPECT_EQ(hopper::config::environment_to_option("HOPPER_RPC_URL"), "rpc-url");
  EXPECT_EQ(hopper::config::environment_to_option("HOPPER_CONFIRM_TIMEOUT_MS"),
            "confirm-timeout-ms");
  EXPECT_EQ(hopper::config::environment_to_option("HOPPER_NOT_AN_OPTION"), "");
  EXPECT_EQ(hopper::config::environment_to_option("PATH"), "");
}

TEST_F(config_test, rejects_missing_and_unknown_commands) {
  auto error = hopper::schema::failure_t{};
  EXPECT_FALSE(load({}, error).has_value());
  EXPECT_EQ(error.code, hopper::schema::error_code_t::invalid_request);
  EXPECT_FALSE(load({"teleport"}, error).has_value());
  EXPECT_EQ(error.code, hopper::schema::error_code_t::invalid_request);
}

TEST_F(config_test, transfer_requires_its_arguments) {
  auto error = hopper::schema::failure_t{};
  EXPECT_FALSE(load({"transfer", "--sender-key", "sender.key"}, error)
                   .has_value());
  EXPECT_NE(error.message.find("--recipient"), std::string::npos);
}

TEST_F(config_test, rejects_invalid_values) {
  auto error = hopper::schema::failure_t{};

  auto bad_amount = transfer_arguments();
  bad_amount.back() = "0";
  EXPECT_FALSE(load(bad_amount, error).has_value());
  EXPECT_EQ(error.code, hopper::schema::error_code_t::invalid_request);

  bad_amount.back() = "12abc";
  EXPECT_FALSE(load(bad_amount, error).has_value());

  auto bad_recipient = transfer_arguments();
  bad_recipient[4] = "not-an-address";
  EXPECT_FALSE(load(bad_recipient, error).has_value());

  auto bad_commitment = transfer_arguments();
  bad_commitment.insert(bad_commitment.end(), {"--commitment", "eventually"});
  EXPECT_FALSE(load(bad_commitment, error).has_value());

  auto zero_attempts = transfer_arguments();
  zero_attempts.insert(zero_attempts.end(), {"--max-attempts", "0"});
  EXPECT_FALSE(load(zero_attempts, error).has_value());

  auto inverted_delays = transfer_arguments();
  inverted_delays.insert(inverted_delays.end(),
                         {"--base-delay-ms", "5000", "--max-delay-ms", "100"});
  EXPECT_FALSE(load(inverted_delays, error).has_value());

  auto unknown_option = transfer_arguments();
  unknown_option.push_back("--no-such-flag");
  EXPECT_FALSE(load(unknown_option, error).has_value());
}

TEST_F(config_test, balance_and_keygen_arguments) {
  auto error = hopper::schema::failure_t{};
  auto balance = load({"balance", "--address", address(5)}, error);
  ASSERT_TRUE(balance.has_value()) << error.message;
  EXPECT_EQ(balance->command, hopper::config::command_t::balance);
  ASSERT_TRUE(balance->address.has_value());
  EXPECT_EQ(*balance->address, hopper::testing::make_public_key(5));

  auto keygen = load({"keygen", "--out", "new.key"}, error);
  ASSERT_TRUE(keygen.has_value()) << error.message;
  EXPECT_EQ(keygen->out, std::filesystem::path{"new.key"});

  EXPECT_FALSE(load({"keygen"}, error).has_value());
}

TEST_F(config_test, help_needs_no_command_arguments) {
  auto error = hopper::schema::failure_t{};
  auto config = load({"transfer", "--help"}, error);
  ASSERT_TRUE(config.has_value()) << error.message;
  EXPECT_TRUE(config->help);
  EXPECT_NE(hopper::config::usage().find("--rpc-url"), std::string::npos);
}
