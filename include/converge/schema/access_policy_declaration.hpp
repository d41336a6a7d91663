#pragma once
#include <converge/schema/default_action.hpp>
#include <converge/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: access policy declaration.
// Desired state authored by the user. Every field is force-new: a change is a
// destroy followed by a create, never an in-place update.
namespace converge::schema {

template <uint16_t Version>
struct default_action_declaration;

template <>
struct default_action_declaration<1> final {
  uint16_t version{1};
  std::optional<default_action_t> action;
  std::optional<identity_t> base_intrusion_policy_id;
  std::optional<identity_t> syslog_config_id;
  std::optional<bool> send_events_to_fmc;
  std::optional<bool> log_begin;
  std::optional<bool> log_end;

  bool operator==(const default_action_declaration&) const = default;
};

using default_action_declaration_t = default_action_declaration<1>;

template <uint16_t Version>
struct access_policy_declaration;

template <>
struct access_policy_declaration<1> final {
  uint16_t version{1};
  std::string name;
  std::optional<std::string> description;
  default_action_declaration_t default_action;

  bool operator==(const access_policy_declaration&) const = default;
};

using access_policy_declaration_t = access_policy_declaration<1>;

}  // namespace converge::schema
