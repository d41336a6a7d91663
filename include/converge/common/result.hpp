#pragma once

#include <boost/outcome/result.hpp>
#include <converge/schema/diagnostic.hpp>

#include <string>
#include <utility>

namespace converge {

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

/// Value or a non-empty diagnostic sequence. The failing step's error
/// diagnostic is last; warnings gathered before it may precede it.
template <typename T>
using result_t =
    outcome::result<T, schema::diagnostics_t, outcome::policy::terminate>;

/// Failure carrying a single error diagnostic.
inline auto fail(std::string summary, std::string detail) {
  return outcome::failure(schema::diagnostics_t{
      schema::make_error(std::move(summary), std::move(detail))});
}

}  // namespace converge
