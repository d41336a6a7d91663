#pragma once

#include <converge/schema/access_policy_declaration.hpp>
#include <converge/schema/default_action.hpp>
#include <converge/schema/resource_state.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace converge::testing {

inline converge::schema::access_policy_declaration_t make_declaration(
    const std::string_view name = "Terraform Access Policy") {
  auto declaration = converge::schema::access_policy_declaration_t{};
  declaration.name = std::string{name};
  declaration.description = "managed by converge";
  declaration.default_action.action = converge::schema::default_action_t::permit;
  return declaration;
}

inline converge::schema::resource_state_t make_state(
    const std::string_view name = "Terraform Access Policy") {
  auto state = converge::schema::resource_state_t{};
  state.declaration = make_declaration(name);
  return state;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace converge::testing
