#pragma once

#include <converge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: default action.
// Access control workflow: verdict applied to traffic that matches no rule of
// the access policy. Wire form is the uppercase name.
namespace converge::schema {

enum class default_action_t : uint8_t {
  block = 0,
  trust = 1,
  permit = 2,
  network_discovery = 3,
  inherit_from_parent = 4,
};

inline constexpr auto kDefaultActionMappings = std::array{
    std::pair<std::string_view, default_action_t>{"BLOCK",
                                                  default_action_t::block},
    std::pair<std::string_view, default_action_t>{"TRUST",
                                                  default_action_t::trust},
    std::pair<std::string_view, default_action_t>{"PERMIT",
                                                  default_action_t::permit},
    std::pair<std::string_view, default_action_t>{
        "NETWORK_DISCOVERY", default_action_t::network_discovery},
    std::pair<std::string_view, default_action_t>{
        "INHERIT_FROM_PARENT", default_action_t::inherit_from_parent},
};

/// Exact match on the canonical (uppercase) wire name.
template <>
inline std::optional<default_action_t> try_from_string<default_action_t>(
    const std::string_view value) {
  return from_string(value, kDefaultActionMappings);
}

inline constexpr std::string_view to_string(const default_action_t value) {
  return to_string(value, kDefaultActionMappings).value_or("unknown");
}

}  // namespace converge::schema
