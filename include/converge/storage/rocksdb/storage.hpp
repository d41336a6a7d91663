#pragma once
#include <rocksdb/db.h>
#include <converge/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace converge::storage {

namespace detail {

inline constexpr auto kResourceStatePrefix =
    std::string_view{"STATE|RESOURCE|"};

inline std::string make_resource_state_key(const std::string_view address) {
  auto key = std::string{kResourceStatePrefix};
  key.append(address);
  return key;
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<schema::resource_state_t> load_resource_state(
      std::string_view address) const;
  void save_resource_state(std::string_view address,
                           const schema::resource_state_t& state) const;
  bool erase_resource_state(std::string_view address) const;
  std::vector<std::string> list_resource_addresses() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace converge::storage
