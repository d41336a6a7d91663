#pragma once

#include <converge/common/context.hpp>
#include <converge/common/result.hpp>
#include <converge/remote/client.hpp>
#include <converge/schema/access_policy.hpp>
#include <converge/schema/primitives.hpp>

#include <optional>
#include <string>

namespace converge::reconcile {

inline constexpr auto kCreateSummary = "unable to create access policy";
inline constexpr auto kReadSummary = "unable to read access policy";
inline constexpr auto kDeleteSummary = "unable to delete access policy";

/// Outcome of a fetch. `policy` is empty when the remote reported the
/// identity as not found; `not_found_detail` then holds the remote message.
struct read_outcome final {
  std::optional<schema::access_policy> policy;
  std::string not_found_detail;
};

/// Issues exactly one remote operation per call and turns remote errors into
/// diagnostics carrying the remote message verbatim.
///
/// Holds no state besides the client reference; the identity lives in the
/// caller's state accessor. Nothing is retried.
class executor final {
 public:
  explicit executor(remote::client& client);

  /// Create the object; the value is the new, non-empty identity.
  result_t<schema::identity_t> create(const common::context& context,
                                      const schema::access_policy& policy);

  /// Fetch the object. Not found is not an error here; what it implies is
  /// the caller's decision. An empty identity is rejected without contacting
  /// the remote.
  result_t<read_outcome> read(
      const common::context& context,
      const schema::identity_t& identity);

  /// Delete the object. An empty identity is rejected without contacting the
  /// remote.
  result_t<void> remove(const common::context& context,
                        const schema::identity_t& identity);

 private:
  remote::client& client_;
};

}  // namespace converge::reconcile
