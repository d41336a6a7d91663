#pragma once

#include <grpcpp/grpcpp.h>
#include <converge/remote/v1/access_policy.grpc.pb.h>
#include <converge/schema/access_policy.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace converge::remote {

/// In-memory AccessPolicyService standing in for the vendor management API.
///
/// Quick reference:
/// - Create: rejects empty or duplicate names and unknown actions, assigns
///   identities to the policy and its default action, fills server defaults
///   (types, action BLOCK).
/// - Get: NOT_FOUND for unknown identities.
/// - Delete: succeeds for unknown identities.
class loopback_service final
    : public v1::AccessPolicyService::CallbackService {
 public:
  ::grpc::ServerUnaryReactor* Create(
      ::grpc::CallbackServerContext* context,
      const v1::CreateAccessPolicyRequest* request,
      v1::AccessPolicy* response) override;

  ::grpc::ServerUnaryReactor* Get(::grpc::CallbackServerContext* context,
                                  const v1::GetAccessPolicyRequest* request,
                                  v1::AccessPolicy* response) override;

  ::grpc::ServerUnaryReactor* Delete(
      ::grpc::CallbackServerContext* context,
      const v1::DeleteAccessPolicyRequest* request,
      v1::DeleteAccessPolicyResponse* response) override;

  std::size_t size() const;

 private:
  std::string next_identity();

  mutable std::mutex mutex_;
  std::map<std::string, schema::access_policy> policies_;
  uint64_t next_sequence_{1};
};

}  // namespace converge::remote
