#pragma once

#include <grpcpp/grpcpp.h>
#include <converge/remote/client.hpp>
#include <converge/remote/v1/access_policy.grpc.pb.h>

#include <memory>
#include <string>

namespace converge::remote {

/// Remote client over the AccessPolicyService gRPC API.
///
/// The context deadline becomes the call deadline and a stop request cancels
/// the call in flight. gRPC status codes map onto remote_error_code_t;
/// the status message is passed through unchanged. Safe to share between
/// threads.
class grpc_client final : public client {
 public:
  explicit grpc_client(std::shared_ptr<::grpc::Channel> channel);

  /// Insecure channel to `target` (host:port).
  static std::unique_ptr<grpc_client> connect(const std::string& target);

  remote_result_t<schema::access_policy> create_access_policy(
      const common::context& context,
      const schema::access_policy& policy) override;

  remote_result_t<schema::access_policy> get_access_policy(
      const common::context& context,
      const schema::identity_t& identity) override;

  remote_result_t<void> delete_access_policy(
      const common::context& context,
      const schema::identity_t& identity) override;

 private:
  std::shared_ptr<::grpc::Channel> channel_;
  std::unique_ptr<v1::AccessPolicyService::Stub> stub_;
};

/// gRPC status to remote error.
remote_error map_status(const ::grpc::Status& status);

}  // namespace converge::remote
