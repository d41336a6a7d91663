#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace converge::schema {

/// Opaque handle assigned by the remote system on creation. Empty means the
/// resource does not exist (never created, or deleted).
using identity_t = std::string;

/// Flat declared-attribute view, keyed by attribute name.
using attribute_map_t = std::map<std::string, std::string>;

/// Remote identities are opaque but structurally constrained: non-empty,
/// at most 128 characters of [A-Za-z0-9-_].
inline constexpr auto kMaxIdentityLength = std::size_t{128};

bool is_well_formed_identity(std::string_view value);

std::string to_upper(std::string_view value);
std::string to_lower(std::string_view value);

/// Accepts "true"/"false" in any case.
std::optional<bool> try_parse_flag(std::string_view value);
std::string_view flag_to_string(bool value);

}  // namespace converge::schema
