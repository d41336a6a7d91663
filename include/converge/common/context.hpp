#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <stop_token>

namespace converge::common {

/// Cancellation and deadline carried through one reconciliation call.
///
/// A stop request or an expired deadline only prevents the next remote call
/// from starting. A remote call already in flight may still complete on the
/// server, so callers must re-read after a cancelled create or delete.
class context final {
 public:
  using clock_t = std::chrono::steady_clock;

  /// Longest accepted timeout; longer ones are clamped to it.
  static constexpr auto kMaxTimeout =
      std::chrono::milliseconds{std::chrono::hours{24}};

  context() = default;

  explicit context(std::stop_token stop_token,
                   std::optional<clock_t::time_point> deadline = std::nullopt)
      : stop_token_{std::move(stop_token)}, deadline_{deadline} {}

  static context with_timeout(const std::chrono::milliseconds timeout,
                              std::stop_token stop_token = {}) {
    return context{std::move(stop_token),
                   clock_t::now() + std::min(timeout, kMaxTimeout)};
  }

  const std::stop_token& stop_token() const { return stop_token_; }
  const std::optional<clock_t::time_point>& deadline() const {
    return deadline_;
  }

  bool stop_requested() const { return stop_token_.stop_requested(); }

  bool deadline_exceeded() const {
    return deadline_.has_value() && clock_t::now() >= *deadline_;
  }

 private:
  std::stop_token stop_token_;
  std::optional<clock_t::time_point> deadline_;
};

}  // namespace converge::common
