#pragma once
#include <hopper/ledger/types.hpp>
#include <hopper/schema/commitment.hpp>
#include <hopper/schema/primitives.hpp>

#include <chrono>

namespace hopper::ledger {

// The ledger backend is a build time choice made by tag, like the storage
// and encoder backends.
template <typename Library>
struct gateway {
  /// Balance of an account as seen at the requested commitment level.
  rpc_result_t<hopper::schema::lamports_t> get_balance(
      const hopper::schema::public_key_t& address,
      hopper::schema::commitment_t commitment);

  /// Base fee charged per transaction signature.
  rpc_result_t<hopper::schema::lamports_t> get_fee_per_signature();

  rpc_result_t<latest_blockhash_t> get_latest_blockhash(
      hopper::schema::commitment_t commitment);

  /// False once no transaction referencing the blockhash can land anymore.
  rpc_result_t<bool> is_blockhash_valid(
      const hopper::schema::blockhash_t& blockhash,
      hopper::schema::commitment_t commitment);

  /// Hand a signed transfer to the network. An `unavailable` error means
  /// the payload did not leave this process; any other error leaves the
  /// outcome unknown.
  rpc_result_t<hopper::schema::signature_t> submit_transaction(
      const hopper::schema::bytes_view_t& payload);

  rpc_result_t<signature_status_t> get_signature_status(
      const hopper::schema::signature_t& signature);

  /// Wait up to `timeout` for the transaction to reach `commitment`.
  /// Transport failures are reported as pending, never as failed.
  confirmation_t await_confirmation(const hopper::schema::signature_t& signature,
                                    hopper::schema::commitment_t commitment,
                                    std::chrono::milliseconds timeout);
};

}  // namespace hopper::ledger
