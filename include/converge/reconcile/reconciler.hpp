#pragma once

#include <converge/common/context.hpp>
#include <converge/reconcile/executor.hpp>
#include <converge/reconcile/options.hpp>
#include <converge/reconcile/state_accessor.hpp>
#include <converge/remote/client.hpp>
#include <converge/schema/diagnostic.hpp>

namespace converge::reconcile {

/// Create/read/delete lifecycle for one access policy.
///
/// Every call is synchronous and works only on the state accessor it is
/// given, so distinct resources may be reconciled from different threads
/// against a thread-safe client. There is no update: a changed declaration is
/// a delete followed by a create. Each call returns its diagnostics; an empty
/// sequence is success, and any error entry means the call stopped at that
/// point without undoing earlier remote or local changes.
class reconciler final {
 public:
  explicit reconciler(remote::client& client, reconcile_options options = {});

  /// Translate, create (at most once), store the identity, then read back so
  /// state reflects server-side defaults. Refused when the state already has
  /// an identity.
  schema::diagnostics_t reconcile_create(const common::context& context,
                                         state_accessor& state);

  /// Refresh state from the remote. An empty identity fails locally without
  /// a remote call. A not-found result is handled per `not_found_policy`.
  schema::diagnostics_t reconcile_read(const common::context& context,
                                       state_accessor& state);

  /// Delete remotely, then clear the identity.
  schema::diagnostics_t reconcile_delete(const common::context& context,
                                         state_accessor& state);

  const reconcile_options& options() const { return options_; }

 private:
  executor executor_;
  reconcile_options options_;
};

}  // namespace converge::reconcile
