#pragma once

#include <converge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: object kind.
// Wire protocol: every nested object sent to the remote carries a "type"
// discriminator so polymorphic sub-objects can be told apart. The table below
// is the single source of those tags.
namespace converge::schema {

enum class object_kind_t : uint8_t {
  access_policy = 0,
  default_action = 1,
  intrusion_policy = 2,
  syslog_alert = 3,
};

inline constexpr auto kObjectKindMappings = std::array{
    std::pair<std::string_view, object_kind_t>{"AccessPolicy",
                                               object_kind_t::access_policy},
    std::pair<std::string_view, object_kind_t>{"AccessPolicyDefaultAction",
                                               object_kind_t::default_action},
    std::pair<std::string_view, object_kind_t>{
        "IntrusionPolicy", object_kind_t::intrusion_policy},
    std::pair<std::string_view, object_kind_t>{"SyslogAlert",
                                               object_kind_t::syslog_alert},
};

template <>
inline std::optional<object_kind_t> try_from_string<object_kind_t>(
    const std::string_view value) {
  return from_string(value, kObjectKindMappings);
}

/// Discriminator tag for a kind; every enumerator has an entry.
inline constexpr std::string_view wire_type(const object_kind_t value) {
  return to_string(value, kObjectKindMappings).value_or("unknown");
}

}  // namespace converge::schema
