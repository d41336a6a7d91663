#pragma once

#include <converge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace converge::reconcile {

/// What a read does when the remote reports the identity as not found.
enum class not_found_policy_t : uint8_t {
  fail = 0,    // fatal diagnostic, identity kept
  forget = 1,  // identity cleared, warning diagnostic
};

inline constexpr auto kNotFoundPolicyMappings = std::array{
    std::pair<std::string_view, not_found_policy_t>{"fail",
                                                    not_found_policy_t::fail},
    std::pair<std::string_view, not_found_policy_t>{
        "forget", not_found_policy_t::forget},
};

inline std::optional<not_found_policy_t> try_parse_not_found_policy(
    const std::string_view value) {
  return schema::from_string(value, kNotFoundPolicyMappings);
}

inline constexpr std::string_view to_string(const not_found_policy_t value) {
  return schema::to_string(value, kNotFoundPolicyMappings).value_or("unknown");
}

struct reconcile_options final {
  not_found_policy_t not_found_policy{not_found_policy_t::fail};
};

}  // namespace converge::reconcile
