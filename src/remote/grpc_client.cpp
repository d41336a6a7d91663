#include <spdlog/spdlog.h>
#include <converge/remote/convert.hpp>
#include <converge/remote/grpc_client.hpp>

#include <chrono>
#include <stop_token>

namespace converge::remote {

namespace {

/// Invoke one unary call with deadline and cancellation taken from context.
template <typename Call>
::grpc::Status invoke(const common::context& context, Call&& call) {
  auto client_context = ::grpc::ClientContext{};
  if (context.deadline().has_value()) {
    auto remaining = *context.deadline() - common::context::clock_t::now();
    client_context.set_deadline(
        std::chrono::system_clock::now() +
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            remaining));
  }
  auto on_stop = std::stop_callback{context.stop_token(), [&client_context] {
                                      client_context.TryCancel();
                                    }};
  return call(&client_context);
}

}  // namespace

remote_error map_status(const ::grpc::Status& status) {
  auto code = remote_error_code_t::internal;
  switch (status.error_code()) {
    case ::grpc::StatusCode::NOT_FOUND:
      code = remote_error_code_t::not_found;
      break;
    case ::grpc::StatusCode::CANCELLED:
      code = remote_error_code_t::cancelled;
      break;
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      code = remote_error_code_t::deadline_exceeded;
      break;
    case ::grpc::StatusCode::UNAVAILABLE:
      code = remote_error_code_t::unavailable;
      break;
    case ::grpc::StatusCode::INVALID_ARGUMENT:
    case ::grpc::StatusCode::ALREADY_EXISTS:
    case ::grpc::StatusCode::FAILED_PRECONDITION:
      code = remote_error_code_t::rejected;
      break;
    default:
      break;
  }
  return remote_error{.code = code, .message = status.error_message()};
}

grpc_client::grpc_client(std::shared_ptr<::grpc::Channel> channel)
    : channel_{std::move(channel)},
      stub_{v1::AccessPolicyService::NewStub(channel_)} {}

std::unique_ptr<grpc_client> grpc_client::connect(const std::string& target) {
  spdlog::debug("Connecting to access policy service at {}", target);
  return std::make_unique<grpc_client>(
      ::grpc::CreateChannel(target, ::grpc::InsecureChannelCredentials()));
}

remote_result_t<schema::access_policy> grpc_client::create_access_policy(
    const common::context& context,
    const schema::access_policy& policy) {
  auto request = v1::CreateAccessPolicyRequest{};
  to_proto(policy, request.mutable_policy());
  auto response = v1::AccessPolicy{};
  auto status = invoke(context, [&](::grpc::ClientContext* client_context) {
    return stub_->Create(client_context, request, &response);
  });
  if (!status.ok()) {
    return outcome::failure(map_status(status));
  }
  return from_proto(response);
}

remote_result_t<schema::access_policy> grpc_client::get_access_policy(
    const common::context& context,
    const schema::identity_t& identity) {
  auto request = v1::GetAccessPolicyRequest{};
  request.set_id(identity);
  auto response = v1::AccessPolicy{};
  auto status = invoke(context, [&](::grpc::ClientContext* client_context) {
    return stub_->Get(client_context, request, &response);
  });
  if (!status.ok()) {
    return outcome::failure(map_status(status));
  }
  return from_proto(response);
}

remote_result_t<void> grpc_client::delete_access_policy(
    const common::context& context,
    const schema::identity_t& identity) {
  auto request = v1::DeleteAccessPolicyRequest{};
  request.set_id(identity);
  auto response = v1::DeleteAccessPolicyResponse{};
  auto status = invoke(context, [&](::grpc::ClientContext* client_context) {
    return stub_->Delete(client_context, request, &response);
  });
  if (!status.ok()) {
    return outcome::failure(map_status(status));
  }
  return outcome::success();
}

}  // namespace converge::remote
