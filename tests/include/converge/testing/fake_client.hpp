#pragma once

#include <converge/remote/client.hpp>
#include <converge/schema/object_kind.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace converge::testing {

/// Scripted in-memory remote. Holds created policies by identity, counts
/// calls and lets a test inject one error per operation.
class fake_client final : public converge::remote::client {
 public:
  std::size_t create_calls{};
  std::size_t get_calls{};
  std::size_t delete_calls{};

  std::optional<converge::schema::access_policy> last_created;
  std::string last_identity;

  std::optional<converge::remote::remote_error> create_error;
  std::optional<converge::remote::remote_error> get_error;
  std::optional<converge::remote::remote_error> delete_error;

  /// Identity handed out by the next create. Empty makes create succeed
  /// without an identity.
  std::string next_identity{"abc123"};

  /// Runs on every get after the stored copy is fetched.
  std::function<void(converge::schema::access_policy&)> on_get;

  std::map<std::string, converge::schema::access_policy> policies;

  converge::remote::remote_result_t<converge::schema::access_policy>
  create_access_policy(const converge::common::context& /*context*/,
                       const converge::schema::access_policy& policy) override {
    ++create_calls;
    last_created = policy;
    if (create_error.has_value()) {
      return converge::remote::outcome::failure(*create_error);
    }
    auto stored = policy;
    if (!next_identity.empty()) {
      stored.id = next_identity;
      stored.default_action.id = next_identity + "-action";
    }
    if (stored.default_action.action.empty()) {
      stored.default_action.action = "BLOCK";
    }
    if (stored.id.has_value()) {
      policies[*stored.id] = stored;
    }
    return stored;
  }

  converge::remote::remote_result_t<converge::schema::access_policy>
  get_access_policy(const converge::common::context& /*context*/,
                    const converge::schema::identity_t& identity) override {
    ++get_calls;
    last_identity = identity;
    if (get_error.has_value()) {
      return converge::remote::outcome::failure(*get_error);
    }
    auto it = policies.find(identity);
    if (it == std::end(policies)) {
      return converge::remote::outcome::failure(converge::remote::remote_error{
          .code = converge::remote::remote_error_code_t::not_found,
          .message = "access policy " + identity + " not found"});
    }
    auto fetched = it->second;
    if (on_get) {
      on_get(fetched);
    }
    return fetched;
  }

  converge::remote::remote_result_t<void> delete_access_policy(
      const converge::common::context& /*context*/,
      const converge::schema::identity_t& identity) override {
    ++delete_calls;
    last_identity = identity;
    if (delete_error.has_value()) {
      return converge::remote::outcome::failure(*delete_error);
    }
    policies.erase(identity);
    return converge::remote::outcome::success();
  }
};

}  // namespace converge::testing
