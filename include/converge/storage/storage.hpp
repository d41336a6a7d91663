#pragma once
#include <converge/schema/resource_state.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace converge::storage {

/// Persistent home of resource state between lifecycle calls, keyed by the
/// resource address the user gave the resource.
template <typename Library>
struct storage {
  /// Return the state stored at address, or std::nullopt when missing.
  std::optional<schema::resource_state_t> load_resource_state(
      std::string_view address) const;

  /// Replace the state stored at address.
  void save_resource_state(std::string_view address,
                           const schema::resource_state_t& state) const;

  /// Remove the state at address. Returns false when nothing was stored.
  bool erase_resource_state(std::string_view address) const;

  /// All addresses with stored state, in key order.
  std::vector<std::string> list_resource_addresses() const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace converge::storage
