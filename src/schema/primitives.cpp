#include <converge/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace converge::schema {

bool is_well_formed_identity(const std::string_view value) {
  if (value.empty() || value.size() > kMaxIdentityLength) {
    return false;
  }
  return std::ranges::all_of(value, [](const char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '-' || c == '_';
  });
}

std::string to_upper(const std::string_view value) {
  auto out = std::string{};
  out.reserve(value.size());
  std::ranges::transform(value, std::back_inserter(out), [](const char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  return out;
}

std::string to_lower(const std::string_view value) {
  auto out = std::string{};
  out.reserve(value.size());
  std::ranges::transform(value, std::back_inserter(out), [](const char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return out;
}

std::optional<bool> try_parse_flag(const std::string_view value) {
  auto lowered = to_lower(value);
  if (lowered == "true") {
    return true;
  }
  if (lowered == "false") {
    return false;
  }
  return std::nullopt;
}

std::string_view flag_to_string(const bool value) {
  return value ? "true" : "false";
}

}  // namespace converge::schema
