#pragma once

#include <converge/schema/enum_string.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: diagnostic.
// Structured (severity, summary, detail) record produced by one
// reconciliation call. Errors are fatal for the call; warnings are not.
namespace converge::schema {

enum class severity_t : uint8_t {
  warning = 0,
  error = 1,
};

inline constexpr auto kSeverityMappings = std::array{
    std::pair<std::string_view, severity_t>{"warning", severity_t::warning},
    std::pair<std::string_view, severity_t>{"error", severity_t::error},
};

inline constexpr std::string_view to_string(const severity_t value) {
  return to_string(value, kSeverityMappings).value_or("unknown");
}

struct diagnostic final {
  severity_t severity{severity_t::error};
  std::string summary;
  std::string detail;

  bool operator==(const diagnostic&) const = default;
};

using diagnostics_t = std::vector<diagnostic>;

inline diagnostic make_error(std::string summary, std::string detail) {
  return diagnostic{.severity = severity_t::error,
                    .summary = std::move(summary),
                    .detail = std::move(detail)};
}

inline diagnostic make_warning(std::string summary, std::string detail) {
  return diagnostic{.severity = severity_t::warning,
                    .summary = std::move(summary),
                    .detail = std::move(detail)};
}

inline bool has_error(const diagnostics_t& diagnostics) {
  return std::ranges::any_of(diagnostics, [](const diagnostic& d) {
    return d.severity == severity_t::error;
  });
}

}  // namespace converge::schema
