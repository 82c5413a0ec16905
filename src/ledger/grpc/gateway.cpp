#include <hopper/ledger/grpc/gateway.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include <string>

namespace hopper::ledger {

namespace {

namespace pb = hopper::ledger::v1;

pb::Commitment to_proto(const hopper::schema::commitment_t commitment) {
  using enum hopper::schema::commitment_t;
  switch (commitment) {
    case processed:
      return pb::COMMITMENT_PROCESSED;
    case confirmed:
      return pb::COMMITMENT_CONFIRMED;
    case finalized:
    default:
      return pb::COMMITMENT_FINALIZED;
  }
}

hopper::schema::commitment_t from_proto(const pb::Commitment commitment) {
  switch (commitment) {
    case pb::COMMITMENT_PROCESSED:
      return hopper::schema::commitment_t::processed;
    case pb::COMMITMENT_CONFIRMED:
      return hopper::schema::commitment_t::confirmed;
    case pb::COMMITMENT_FINALIZED:
    default:
      return hopper::schema::commitment_t::finalized;
  }
}

std::optional<rpc_error_kind_t> from_proto(const pb::RejectReason reason) {
  switch (reason) {
    case pb::REJECT_REASON_NONE:
      return std::nullopt;
    case pb::REJECT_REASON_INSUFFICIENT_FUNDS:
      return rpc_error_kind_t::insufficient_funds;
    case pb::REJECT_REASON_INVALID_SIGNATURE:
      return rpc_error_kind_t::invalid_signature;
    case pb::REJECT_REASON_MALFORMED:
      return rpc_error_kind_t::malformed;
    case pb::REJECT_REASON_BLOCKHASH_NOT_FOUND:
      return rpc_error_kind_t::blockhash_expired;
    case pb::REJECT_REASON_REJECTED:
    default:
      return rpc_error_kind_t::rejected;
  }
}

std::string to_wire(const hopper::schema::bytes_view_t& bytes) {
  return hopper::schema::make_string(bytes);
}

template <std::size_t N>
std::string to_wire(const std::array<uint8_t, N>& value) {
  return to_wire(hopper::schema::bytes_view_t{value.data(), value.size()});
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> from_wire(const std::string& value) {
  if (value.size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy_n(std::begin(value), N, std::begin(out));
  return out;
}

}  // namespace

rpc_error_t make_rpc_error(const grpc::Status& status) {
  auto kind = rpc_error_kind_t::internal;
  switch (status.error_code()) {
    case grpc::StatusCode::UNAVAILABLE:
      kind = rpc_error_kind_t::unavailable;
      break;
    case grpc::StatusCode::DEADLINE_EXCEEDED:
      kind = rpc_error_kind_t::timeout;
      break;
    case grpc::StatusCode::RESOURCE_EXHAUSTED:
      kind = rpc_error_kind_t::rate_limited;
      break;
    case grpc::StatusCode::INVALID_ARGUMENT:
      kind = rpc_error_kind_t::malformed;
      break;
    default:
      break;
  }
  return rpc_error_t{.kind = kind,
                     .message = "grpc status " +
                                std::to_string(static_cast<int>(
                                    status.error_code())) +
                                ": " + status.error_message()};
}

gateway<grpc_gateway_tag>::gateway(grpc_gateway_options options)
    : gateway(options,
              grpc::CreateChannel(options.endpoint,
                                  grpc::InsecureChannelCredentials())) {}

gateway<grpc_gateway_tag>::gateway(grpc_gateway_options options,
                                   std::shared_ptr<grpc::Channel> channel)
    : options_{std::move(options)},
      channel_{std::move(channel)},
      stub_{pb::Ledger::NewStub(channel_)} {
  spdlog::debug("Ledger gateway targeting {}", options_.endpoint);
}

void gateway<grpc_gateway_tag>::prepare(
    grpc::ClientContext& context,
    const std::chrono::milliseconds extra) const {
  context.set_deadline(std::chrono::system_clock::now() +
                       options_.rpc_deadline + extra);
}

rpc_result_t<hopper::schema::lamports_t> gateway<grpc_gateway_tag>::get_balance(
    const hopper::schema::public_key_t& address,
    const hopper::schema::commitment_t commitment) {
  auto context = grpc::ClientContext{};
  prepare(context);
  auto request = pb::GetBalanceRequest{};
  request.set_address(to_wire(address));
  request.set_commitment(to_proto(commitment));
  auto response = pb::GetBalanceResponse{};
  auto status = stub_->GetBalance(&context, request, &response);
  if (!status.ok()) {
    return make_rpc_error(status);
  }
  return hopper::schema::lamports_t{response.lamports()};
}

rpc_result_t<hopper::schema::lamports_t>
gateway<grpc_gateway_tag>::get_fee_per_signature() {
  auto context = grpc::ClientContext{};
  prepare(context);
  auto response = pb::GetFeeRateResponse{};
  auto status =
      stub_->GetFeeRate(&context, pb::GetFeeRateRequest{}, &response);
  if (!status.ok()) {
    return make_rpc_error(status);
  }
  return hopper::schema::lamports_t{response.lamports_per_signature()};
}

rpc_result_t<latest_blockhash_t> gateway<grpc_gateway_tag>::get_latest_blockhash(
    const hopper::schema::commitment_t commitment) {
  auto context = grpc::ClientContext{};
  prepare(context);
  auto request = pb::GetLatestBlockhashRequest{};
  request.set_commitment(to_proto(commitment));
  auto response = pb::GetLatestBlockhashResponse{};
  auto status = stub_->GetLatestBlockhash(&context, request, &response);
  if (!status.ok()) {
    return make_rpc_error(status);
  }
  auto blockhash =
      from_wire<std::tuple_size_v<hopper::schema::blockhash_t>>(
          response.blockhash());
  if (!blockhash) {
    return rpc_error_t{.kind = rpc_error_kind_t::internal,
                       .message = "node returned a malformed blockhash"};
  }
  return latest_blockhash_t{
      .blockhash = *blockhash,
      .last_valid_block_height = response.last_valid_block_height()};
}

rpc_result_t<bool> gateway<grpc_gateway_tag>::is_blockhash_valid(
    const hopper::schema::blockhash_t& blockhash,
    const hopper::schema::commitment_t commitment) {
  auto context = grpc::ClientContext{};
  prepare(context);
  auto request = pb::IsBlockhashValidRequest{};
  request.set_blockhash(to_wire(blockhash));
  request.set_commitment(to_proto(commitment));
  auto response = pb::IsBlockhashValidResponse{};
  auto status = stub_->IsBlockhashValid(&context, request, &response);
  if (!status.ok()) {
    return make_rpc_error(status);
  }
  return response.valid();
}

rpc_result_t<hopper::schema::signature_t>
gateway<grpc_gateway_tag>::submit_transaction(
    const hopper::schema::bytes_view_t& payload) {
  auto context = grpc::ClientContext{};
  prepare(context);
  auto request = pb::SubmitTransactionRequest{};
  request.set_payload(to_wire(payload));
  request.set_skip_preflight(options_.skip_preflight);
  auto response = pb::SubmitTransactionResponse{};
  auto status = stub_->SubmitTransaction(&context, request, &response);
  if (!status.ok()) {
    auto error = make_rpc_error(status);
    if (error.kind == rpc_error_kind_t::unavailable) {
      error.kind = rpc_error_kind_t::internal;
    }
    return error;
  }
  if (auto rejected = from_proto(response.reject_reason())) {
    return rpc_error_t{.kind = *rejected, .message = response.detail()};
  }
  auto signature =
      from_wire<std::tuple_size_v<hopper::schema::signature_t>>(
          response.signature());
  if (!signature) {
    return rpc_error_t{.kind = rpc_error_kind_t::internal,
                       .message = "node returned a malformed signature"};
  }
  return *signature;
}

rpc_result_t<signature_status_t>
gateway<grpc_gateway_tag>::get_signature_status(
    const hopper::schema::signature_t& signature) {
  auto context = grpc::ClientContext{};
  prepare(context);
  auto request = pb::GetSignatureStatusRequest{};
  request.set_signature(to_wire(signature));
  auto response = pb::GetSignatureStatusResponse{};
  auto status = stub_->GetSignatureStatus(&context, request, &response);
  if (!status.ok()) {
    return make_rpc_error(status);
  }
  auto result = signature_status_t{.found = response.found()};
  if (response.found()) {
    result.commitment = from_proto(response.commitment());
    if (!response.error().empty()) {
      result.error = response.error();
    }
  }
  return result;
}

confirmation_t gateway<grpc_gateway_tag>::await_confirmation(
    const hopper::schema::signature_t& signature,
    const hopper::schema::commitment_t commitment,
    const std::chrono::milliseconds timeout) {
  auto context = grpc::ClientContext{};
  prepare(context, timeout);
  auto request = pb::AwaitConfirmationRequest{};
  request.set_signature(to_wire(signature));
  request.set_commitment(to_proto(commitment));
  request.set_timeout_ms(static_cast<uint64_t>(timeout.count()));
  auto response = pb::AwaitConfirmationResponse{};
  auto status = stub_->AwaitConfirmation(&context, request, &response);
  if (!status.ok()) {
    auto error = make_rpc_error(status);
    spdlog::debug("AwaitConfirmation transport failure: {}", error.message);
    return confirmation_t{.status = hopper::schema::confirmation_status_t::pending,
                          .detail = error.message};
  }
  switch (response.status()) {
    case pb::CONFIRMATION_STATUS_CONFIRMED:
      return confirmation_t{
          .status = hopper::schema::confirmation_status_t::confirmed,
          .detail = response.detail()};
    case pb::CONFIRMATION_STATUS_FAILED:
      return confirmation_t{.status = hopper::schema::confirmation_status_t::failed,
                            .detail = response.detail()};
    case pb::CONFIRMATION_STATUS_PENDING:
    default:
      return confirmation_t{
          .status = hopper::schema::confirmation_status_t::pending,
          .detail = response.detail()};
  }
}

}  // namespace hopper::ledger
