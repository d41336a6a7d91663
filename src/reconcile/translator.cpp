#include <converge/reconcile/translator.hpp>
#include <converge/schema/object_kind.hpp>
#include <spdlog/fmt/fmt.h>

#include <optional>
#include <string>
#include <string_view>

namespace converge::reconcile {

namespace {

constexpr auto kTranslateSummary = std::string_view{"invalid access policy"};

std::optional<schema::object_reference> make_reference(
    const std::optional<schema::identity_t>& identity,
    const schema::object_kind_t kind,
    const std::string_view attribute,
    schema::diagnostics_t& diagnostics) {
  if (!identity.has_value()) {
    return std::nullopt;
  }
  if (!schema::is_well_formed_identity(*identity)) {
    diagnostics.push_back(schema::make_error(
        std::string{kTranslateSummary},
        fmt::format("\"{}\" is not a well-formed identity: \"{}\"", attribute,
                    *identity)));
    return std::nullopt;
  }
  return schema::object_reference{.id = *identity,
                                  .type = std::string{schema::wire_type(kind)}};
}

}  // namespace

result_t<schema::access_policy> translate(
    const schema::access_policy_declaration_t& declaration) {
  const auto& declared_action = declaration.default_action;
  auto diagnostics = schema::diagnostics_t{};

  auto intrusion_policy = make_reference(
      declared_action.base_intrusion_policy_id,
      schema::object_kind_t::intrusion_policy,
      "default_action_base_intrusion_policy_id", diagnostics);
  auto syslog_config = make_reference(
      declared_action.syslog_config_id, schema::object_kind_t::syslog_alert,
      "default_action_syslog_config_id", diagnostics);
  if (!diagnostics.empty()) {
    return outcome::failure(std::move(diagnostics));
  }

  auto action = std::string{};
  if (declared_action.action.has_value()) {
    action = std::string{schema::to_string(*declared_action.action)};
  }

  return schema::access_policy{
      .id = std::nullopt,
      .name = declaration.name,
      .description = declaration.description.value_or(""),
      .type =
          std::string{schema::wire_type(schema::object_kind_t::access_policy)},
      .default_action = schema::access_policy_default_action{
          .id = std::nullopt,
          .type = std::string{schema::wire_type(
              schema::object_kind_t::default_action)},
          .action = std::move(action),
          .intrusion_policy = std::move(intrusion_policy),
          .syslog_config = std::move(syslog_config),
          .send_events_to_fmc = declared_action.send_events_to_fmc,
          .log_begin = declared_action.log_begin,
          .log_end = declared_action.log_end}};
}

}  // namespace converge::reconcile
