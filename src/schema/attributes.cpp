#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <converge/schema/attributes.hpp>
#include <converge/schema/default_action.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace converge::schema {

namespace {

constexpr auto kInvalidSummary = std::string_view{"invalid access policy"};

std::optional<std::string> lookup(const attribute_map_t& attributes,
                                  const std::string_view key) {
  auto it = attributes.find(std::string{key});
  if (it == std::end(attributes) || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<bool> parse_flag(const attribute_map_t& attributes,
                               const std::string_view key,
                               diagnostics_t& diagnostics) {
  auto value = lookup(attributes, key);
  if (!value.has_value()) {
    return std::nullopt;
  }
  auto flag = try_parse_flag(*value);
  if (!flag.has_value()) {
    diagnostics.push_back(make_error(
        std::string{kInvalidSummary},
        fmt::format("\"{}\" must be \"true\" or \"false\", got: \"{}\"", key,
                    *value)));
  }
  return flag;
}

std::optional<default_action_t> parse_action(const attribute_map_t& attributes,
                                             diagnostics_t& diagnostics) {
  auto value = lookup(attributes, "default_action");
  if (!value.has_value()) {
    return std::nullopt;
  }
  auto normalized = to_upper(*value);
  auto action = try_from_string<default_action_t>(normalized);
  if (!action.has_value()) {
    auto allowed = std::vector<std::string_view>{};
    for (const auto& [name, _] : kDefaultActionMappings) {
      allowed.push_back(name);
    }
    diagnostics.push_back(make_error(
        std::string{kInvalidSummary},
        fmt::format("\"default_action\" must be in [{}], got: \"{}\"",
                    fmt::join(allowed, " "), normalized)));
  }
  return action;
}

void put(attribute_map_t& out,
         const std::string_view key,
         const std::optional<std::string>& value) {
  if (value.has_value()) {
    out.emplace(std::string{key}, *value);
  }
}

void put(attribute_map_t& out,
         const std::string_view key,
         const std::optional<bool>& value) {
  if (value.has_value()) {
    out.emplace(std::string{key}, std::string{flag_to_string(*value)});
  }
}

}  // namespace

const attribute_definition* find_attribute(const std::string_view key) {
  auto it = std::ranges::find(kAccessPolicyAttributes, key,
                              &attribute_definition::key);
  if (it == std::end(kAccessPolicyAttributes)) {
    return nullptr;
  }
  return &*it;
}

result_t<access_policy_declaration_t> parse_declaration(
    const attribute_map_t& attributes) {
  auto diagnostics = diagnostics_t{};

  for (const auto& [key, value] : attributes) {
    const auto* definition = find_attribute(key);
    if (definition == nullptr) {
      diagnostics.push_back(make_error(
          std::string{kInvalidSummary},
          fmt::format("unsupported attribute \"{}\"", key)));
    } else if (definition->kind == attribute_kind_t::computed) {
      diagnostics.push_back(make_error(
          std::string{kInvalidSummary},
          fmt::format("\"{}\" is computed and can not be set", key)));
    }
  }

  auto name = lookup(attributes, "name");
  if (!name.has_value()) {
    diagnostics.push_back(make_error(std::string{kInvalidSummary},
                                     "\"name\" is required"));
  }

  auto declaration = access_policy_declaration_t{
      .version = 1,
      .name = name.value_or(""),
      .description = lookup(attributes, "description"),
      .default_action = default_action_declaration_t{
          .version = 1,
          .action = parse_action(attributes, diagnostics),
          .base_intrusion_policy_id =
              lookup(attributes, "default_action_base_intrusion_policy_id"),
          .syslog_config_id =
              lookup(attributes, "default_action_syslog_config_id"),
          .send_events_to_fmc = parse_flag(
              attributes, "default_action_send_events_to_fmc", diagnostics),
          .log_begin =
              parse_flag(attributes, "default_action_log_begin", diagnostics),
          .log_end =
              parse_flag(attributes, "default_action_log_end", diagnostics)}};

  if (!diagnostics.empty()) {
    return outcome::failure(std::move(diagnostics));
  }
  return declaration;
}

attribute_map_t render_attributes(const resource_state_t& state) {
  const auto& declaration = state.declaration;
  const auto& action = declaration.default_action;

  auto out = attribute_map_t{};
  if (!state.identity.empty()) {
    out.emplace("id", state.identity);
  }
  out.emplace("name", declaration.name);
  put(out, "description", declaration.description);
  if (action.action.has_value()) {
    out.emplace("default_action", std::string{to_string(*action.action)});
  }
  put(out, "default_action_base_intrusion_policy_id",
      action.base_intrusion_policy_id);
  put(out, "default_action_syslog_config_id", action.syslog_config_id);
  put(out, "default_action_send_events_to_fmc", action.send_events_to_fmc);
  put(out, "default_action_log_begin", action.log_begin);
  put(out, "default_action_log_end", action.log_end);
  put(out, "type", state.type);
  put(out, "default_action_type", state.default_action_type);
  put(out, "default_action_id", state.default_action_id);
  return out;
}

}  // namespace converge::schema
