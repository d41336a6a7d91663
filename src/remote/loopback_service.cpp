#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <converge/remote/convert.hpp>
#include <converge/remote/loopback_service.hpp>
#include <converge/schema/default_action.hpp>
#include <converge/schema/object_kind.hpp>

#include <algorithm>
#include <iterator>

namespace converge::remote {

namespace {

::grpc::ServerUnaryReactor* finish(::grpc::CallbackServerContext* context,
                                   const ::grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

}  // namespace

std::string loopback_service::next_identity() {
  return fmt::format("00000000-0000-0ed3-0000-{:012}", next_sequence_++);
}

::grpc::ServerUnaryReactor* loopback_service::Create(
    ::grpc::CallbackServerContext* context,
    const v1::CreateAccessPolicyRequest* request,
    v1::AccessPolicy* response) {
  auto policy = from_proto(request->policy());
  if (policy.name.empty()) {
    return finish(context, ::grpc::Status{::grpc::StatusCode::INVALID_ARGUMENT,
                                          "name is required"});
  }

  auto& action = policy.default_action.action;
  if (action.empty()) {
    action = std::string{schema::to_string(schema::default_action_t::block)};
  }
  if (!schema::try_from_string<schema::default_action_t>(action)) {
    return finish(context,
                  ::grpc::Status{::grpc::StatusCode::INVALID_ARGUMENT,
                                 fmt::format("unknown action '{}'", action)});
  }

  auto lock = std::scoped_lock{mutex_};
  auto duplicate = std::ranges::any_of(policies_, [&](const auto& entry) {
    return entry.second.name == policy.name;
  });
  if (duplicate) {
    return finish(
        context,
        ::grpc::Status{::grpc::StatusCode::ALREADY_EXISTS,
                       fmt::format("access policy named '{}' already exists",
                                   policy.name)});
  }

  policy.id = next_identity();
  policy.type =
      std::string{schema::wire_type(schema::object_kind_t::access_policy)};
  policy.default_action.id = next_identity();
  policy.default_action.type =
      std::string{schema::wire_type(schema::object_kind_t::default_action)};
  spdlog::info("Loopback created access policy '{}' as {}", policy.name,
               *policy.id);

  to_proto(policy, response);
  policies_.emplace(*policy.id, std::move(policy));
  return finish(context, ::grpc::Status::OK);
}

::grpc::ServerUnaryReactor* loopback_service::Get(
    ::grpc::CallbackServerContext* context,
    const v1::GetAccessPolicyRequest* request,
    v1::AccessPolicy* response) {
  auto lock = std::scoped_lock{mutex_};
  auto it = policies_.find(request->id());
  if (it == std::end(policies_)) {
    return finish(context,
                  ::grpc::Status{::grpc::StatusCode::NOT_FOUND,
                                 fmt::format("access policy {} not found",
                                             request->id())});
  }
  to_proto(it->second, response);
  return finish(context, ::grpc::Status::OK);
}

::grpc::ServerUnaryReactor* loopback_service::Delete(
    ::grpc::CallbackServerContext* context,
    const v1::DeleteAccessPolicyRequest* request,
    v1::DeleteAccessPolicyResponse* /*response*/) {
  auto lock = std::scoped_lock{mutex_};
  if (policies_.erase(request->id()) == 0) {
    spdlog::debug("Loopback delete of unknown access policy {}",
                  request->id());
  } else {
    spdlog::info("Loopback deleted access policy {}", request->id());
  }
  return finish(context, ::grpc::Status::OK);
}

std::size_t loopback_service::size() const {
  auto lock = std::scoped_lock{mutex_};
  return policies_.size();
}

}  // namespace converge::remote
