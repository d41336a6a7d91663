#pragma once
#include <converge/schema/access_policy_declaration.hpp>
#include <converge/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: resource state.
// What the lifecycle persists for one managed access policy between calls:
// the remote identity, the declaration as last confirmed, and the computed
// fields mirrored from the remote.
namespace converge::schema {

template <uint16_t Version>
struct resource_state;

template <>
struct resource_state<1> final {
  uint16_t version{1};
  identity_t identity;  // empty when the remote object does not exist
  access_policy_declaration_t declaration;
  std::optional<std::string> type;
  std::optional<std::string> default_action_type;
  std::optional<identity_t> default_action_id;

  bool operator==(const resource_state&) const = default;
};

using resource_state_t = resource_state<1>;

}  // namespace converge::schema
