#pragma once

#include <converge/common/result.hpp>
#include <converge/schema/access_policy_declaration.hpp>
#include <converge/schema/primitives.hpp>
#include <converge/schema/resource_state.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Flat attribute surface of the access policy resource. This is the only
// place untyped user input is validated; everything past it works on
// access_policy_declaration_t.
namespace converge::schema {

enum class attribute_kind_t : uint8_t {
  required = 0,
  optional = 1,
  computed = 2,
};

struct attribute_definition final {
  std::string_view key;
  attribute_kind_t kind;
  bool force_new;
  std::string_view description;
};

inline constexpr auto kAccessPolicyAttributes = std::array{
    attribute_definition{"name", attribute_kind_t::required, true,
                   "The name of this resource"},
    attribute_definition{"description", attribute_kind_t::optional, true,
                   "The description of this resource"},
    attribute_definition{"type", attribute_kind_t::computed, false,
                   "The type of this resource"},
    attribute_definition{"default_action", attribute_kind_t::optional, true,
                   "Default action for this resource, \"BLOCK\", \"TRUST\", "
                   "\"PERMIT\", \"NETWORK_DISCOVERY\" or "
                   "\"INHERIT_FROM_PARENT\""},
    attribute_definition{"default_action_base_intrusion_policy_id",
                   attribute_kind_t::optional, true,
                   "Default action base policy ID to inherit from for this "
                   "resource"},
    attribute_definition{"default_action_send_events_to_fmc",
                   attribute_kind_t::optional, true,
                   "Enable sending events to FMC for this resource, \"true\" "
                   "or \"false\""},
    attribute_definition{"default_action_log_begin", attribute_kind_t::optional,
                   true,
                   "Enable logging at the beginning of the connection for "
                   "this resource, \"true\" or \"false\""},
    attribute_definition{"default_action_log_end", attribute_kind_t::optional, true,
                   "Enable logging at the end of the connection for this "
                   "resource, \"true\" or \"false\""},
    attribute_definition{"default_action_syslog_config_id",
                   attribute_kind_t::optional, true,
                   "Syslog configuration ID for this resource"},
    attribute_definition{"default_action_type", attribute_kind_t::computed, false,
                   "The type of default action of this resource"},
    attribute_definition{"default_action_id", attribute_kind_t::computed, false,
                   "The ID of the default action of this resource"},
};

const attribute_definition* find_attribute(std::string_view key);

/// Validate a flat attribute map into a declaration.
///
/// Every offending attribute yields its own error diagnostic; the call fails
/// if there is at least one. Empty values count as unset.
result_t<access_policy_declaration_t> parse_declaration(
    const attribute_map_t& attributes);

/// Flat view of persisted state, computed attributes and `id` included.
/// Unset optional attributes are omitted.
attribute_map_t render_attributes(const resource_state_t& state);

}  // namespace converge::schema
