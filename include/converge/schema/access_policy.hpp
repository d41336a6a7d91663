#pragma once
#include <converge/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: access policy (wire shape).
// Nested form exchanged with the remote system. Built from a declaration by
// the translator for create calls and returned by the remote on create/get.
// Never persisted on its own.
namespace converge::schema {

/// Cross-reference to another remote object by identity.
struct object_reference final {
  identity_t id;
  std::string type;

  bool operator==(const object_reference&) const = default;
};

struct access_policy_default_action final {
  std::optional<identity_t> id;  // assigned by the remote
  std::string type;
  std::string action;
  std::optional<object_reference> intrusion_policy;
  std::optional<object_reference> syslog_config;
  std::optional<bool> send_events_to_fmc;
  std::optional<bool> log_begin;
  std::optional<bool> log_end;

  bool operator==(const access_policy_default_action&) const = default;
};

struct access_policy final {
  std::optional<identity_t> id;  // absent on create requests
  std::string name;
  std::string description;
  std::string type;
  access_policy_default_action default_action;

  bool operator==(const access_policy&) const = default;
};

}  // namespace converge::schema
