#pragma once

#include <boost/outcome/result.hpp>
#include <converge/common/context.hpp>
#include <converge/schema/access_policy.hpp>
#include <converge/schema/enum_string.hpp>
#include <converge/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace converge::remote {

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

enum class remote_error_code_t : uint8_t {
  not_found = 0,
  cancelled = 1,
  deadline_exceeded = 2,
  unavailable = 3,
  rejected = 4,
  internal = 5,
};

inline constexpr auto kRemoteErrorCodeMappings = std::array{
    std::pair<std::string_view, remote_error_code_t>{
        "not_found", remote_error_code_t::not_found},
    std::pair<std::string_view, remote_error_code_t>{
        "cancelled", remote_error_code_t::cancelled},
    std::pair<std::string_view, remote_error_code_t>{
        "deadline_exceeded", remote_error_code_t::deadline_exceeded},
    std::pair<std::string_view, remote_error_code_t>{
        "unavailable", remote_error_code_t::unavailable},
    std::pair<std::string_view, remote_error_code_t>{
        "rejected", remote_error_code_t::rejected},
    std::pair<std::string_view, remote_error_code_t>{
        "internal", remote_error_code_t::internal},
};

inline constexpr std::string_view to_string(const remote_error_code_t value) {
  return schema::to_string(value, kRemoteErrorCodeMappings)
      .value_or("unknown");
}

/// Transport/API failure as reported by the remote. `message` is surfaced
/// verbatim in diagnostics.
struct remote_error final {
  remote_error_code_t code{remote_error_code_t::internal};
  std::string message;
};

template <typename T>
using remote_result_t =
    outcome::result<T, remote_error, outcome::policy::terminate>;

/// Typed access-policy API of the remote system.
///
/// Each call is one atomic remote transaction. Create is not assumed to be
/// idempotent; the reconciler calls it at most once per lifecycle call.
/// Retries, if any, belong to implementations of this interface.
class client {
 public:
  virtual ~client() = default;

  /// Create the object and return it as stored, including the new identity.
  virtual remote_result_t<schema::access_policy> create_access_policy(
      const common::context& context,
      const schema::access_policy& policy) = 0;

  virtual remote_result_t<schema::access_policy> get_access_policy(
      const common::context& context,
      const schema::identity_t& identity) = 0;

  /// Deleting an identity the remote no longer knows is the
  /// implementation's call; the loopback service treats it as success.
  virtual remote_result_t<void> delete_access_policy(
      const common::context& context,
      const schema::identity_t& identity) = 0;
};

}  // namespace converge::remote
