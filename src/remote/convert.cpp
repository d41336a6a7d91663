#include <converge/remote/convert.hpp>

#include <optional>
#include <string>

namespace converge::remote {

namespace {

void to_proto(const schema::object_reference& reference,
              v1::ObjectReference* out) {
  out->set_id(reference.id);
  out->set_type(reference.type);
}

std::optional<schema::object_reference> from_proto(
    const bool present,
    const v1::ObjectReference& reference) {
  if (!present || reference.id().empty()) {
    return std::nullopt;
  }
  return schema::object_reference{.id = reference.id(),
                                  .type = reference.type()};
}

std::optional<std::string> non_empty(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

void to_proto(const schema::access_policy& policy, v1::AccessPolicy* out) {
  out->set_id(policy.id.value_or(""));
  out->set_name(policy.name);
  out->set_description(policy.description);
  out->set_type(policy.type);

  const auto& action = policy.default_action;
  auto* default_action = out->mutable_default_action();
  default_action->set_id(action.id.value_or(""));
  default_action->set_type(action.type);
  default_action->set_action(action.action);
  if (action.intrusion_policy.has_value()) {
    to_proto(*action.intrusion_policy,
             default_action->mutable_intrusion_policy());
  }
  if (action.syslog_config.has_value()) {
    to_proto(*action.syslog_config, default_action->mutable_syslog_config());
  }
  if (action.send_events_to_fmc.has_value()) {
    default_action->set_send_events_to_fmc(*action.send_events_to_fmc);
  }
  if (action.log_begin.has_value()) {
    default_action->set_log_begin(*action.log_begin);
  }
  if (action.log_end.has_value()) {
    default_action->set_log_end(*action.log_end);
  }
}

schema::access_policy from_proto(const v1::AccessPolicy& policy) {
  const auto& action = policy.default_action();
  auto out = schema::access_policy{
      .id = non_empty(policy.id()),
      .name = policy.name(),
      .description = policy.description(),
      .type = policy.type(),
      .default_action = schema::access_policy_default_action{
          .id = non_empty(action.id()),
          .type = action.type(),
          .action = action.action(),
          .intrusion_policy = from_proto(action.has_intrusion_policy(),
                                         action.intrusion_policy()),
          .syslog_config =
              from_proto(action.has_syslog_config(), action.syslog_config()),
          .send_events_to_fmc = std::nullopt,
          .log_begin = std::nullopt,
          .log_end = std::nullopt}};
  if (action.has_send_events_to_fmc()) {
    out.default_action.send_events_to_fmc = action.send_events_to_fmc();
  }
  if (action.has_log_begin()) {
    out.default_action.log_begin = action.log_begin();
  }
  if (action.has_log_end()) {
    out.default_action.log_end = action.log_end();
  }
  return out;
}

}  // namespace converge::remote
