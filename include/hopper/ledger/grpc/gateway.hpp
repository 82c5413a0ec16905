#pragma once
#include <grpcpp/grpcpp.h>
#include <hopper/ledger/gateway.hpp>
#include <hopper/ledger/v1/ledger.grpc.pb.h>

#include <chrono>
#include <memory>
#include <string>

namespace hopper::ledger {

struct grpc_gateway_tag {};

struct grpc_gateway_options final {
  std::string endpoint{"127.0.0.1:50051"};
  std::chrono::milliseconds rpc_deadline{10000};
  bool skip_preflight{false};
};

/// Ledger node reached over gRPC (`hopper.ledger.v1.Ledger`).
///
/// Transport faults surface as the gRPC status of the call; explicit
/// verdicts on a submitted transaction come back in the response body. A
/// submission whose transport failed is always reported as ambiguous, since
/// the request may have reached the node before the connection broke.
template <>
struct gateway<grpc_gateway_tag> final {
  explicit gateway(grpc_gateway_options options);
  gateway(grpc_gateway_options options, std::shared_ptr<grpc::Channel> channel);

  rpc_result_t<hopper::schema::lamports_t> get_balance(
      const hopper::schema::public_key_t& address,
      hopper::schema::commitment_t commitment);

  rpc_result_t<hopper::schema::lamports_t> get_fee_per_signature();

  rpc_result_t<latest_blockhash_t> get_latest_blockhash(
      hopper::schema::commitment_t commitment);

  rpc_result_t<bool> is_blockhash_valid(
      const hopper::schema::blockhash_t& blockhash,
      hopper::schema::commitment_t commitment);

  rpc_result_t<hopper::schema::signature_t> submit_transaction(
      const hopper::schema::bytes_view_t& payload);

  rpc_result_t<signature_status_t> get_signature_status(
      const hopper::schema::signature_t& signature);

  confirmation_t await_confirmation(const hopper::schema::signature_t& signature,
                                    hopper::schema::commitment_t commitment,
                                    std::chrono::milliseconds timeout);

 private:
  void prepare(grpc::ClientContext& context,
               std::chrono::milliseconds extra = {}) const;

  grpc_gateway_options options_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<hopper::ledger::v1::Ledger::Stub> stub_;
};

using grpc_gateway_t = gateway<grpc_gateway_tag>;

/// Map a failed gRPC status onto the ledger error vocabulary.
rpc_error_t make_rpc_error(const grpc::Status& status);

}  // namespace hopper::ledger
