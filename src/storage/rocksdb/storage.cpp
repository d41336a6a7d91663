#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <converge/common/critical.hpp>
#include <converge/schema/encoding/scale/encoder.hpp>
#include <converge/storage/rocksdb/storage.hpp>

namespace converge::storage {

namespace {

using encoder_t = converge::schema::encoding::encoder<
    converge::schema::encoding::scale_encoder_tag>;

void require_open(const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    converge::common::critical("RocksDB database is not initialized");
  }
}

}  // namespace

std::optional<schema::resource_state_t>
storage<rocksdb_storage_tag>::load_resource_state(
    const std::string_view address) const {
  require_open(database);
  auto key = detail::make_resource_state_key(address);
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              ROCKSDB_NAMESPACE::Slice{key}, &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    converge::common::critical("Failed to get value from RocksDB");
  }

  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<schema::resource_state_t>(
      schema::encoding::bytes_view_t{
          reinterpret_cast<const uint8_t*>(value.data()), value.size()});
  if (!decoded.has_value()) {
    spdlog::error("Stored state for '{}' can not be decoded", address);
    converge::common::critical("Corrupt resource state in RocksDB");
  }
  return decoded;
}

void storage<rocksdb_storage_tag>::save_resource_state(
    const std::string_view address,
    const schema::resource_state_t& state) const {
  require_open(database);
  auto key = detail::make_resource_state_key(address);
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(state);
  auto value_slice = ROCKSDB_NAMESPACE::Slice{
      reinterpret_cast<const char*>(encoded.data()), encoded.size()};
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              ROCKSDB_NAMESPACE::Slice{key}, value_slice);
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    converge::common::critical("Failed to put value into RocksDB");
  }
  spdlog::debug("Saved state for '{}' ({} bytes)", address, encoded.size());
}

bool storage<rocksdb_storage_tag>::erase_resource_state(
    const std::string_view address) const {
  require_open(database);
  auto key = detail::make_resource_state_key(address);
  auto existing = std::string{};
  auto found = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                             ROCKSDB_NAMESPACE::Slice{key}, &existing);
  if (found.IsNotFound()) {
    return false;
  }
  if (!found.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", found.ToString());
    converge::common::critical("Failed to get value from RocksDB");
  }
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 ROCKSDB_NAMESPACE::Slice{key});
  if (!status.ok()) {
    spdlog::error("Failed to delete value from RocksDB: {}",
                  status.ToString());
    converge::common::critical("Failed to delete value from RocksDB");
  }
  spdlog::debug("Erased state for '{}'", address);
  return true;
}

std::vector<std::string>
storage<rocksdb_storage_tag>::list_resource_addresses() const {
  require_open(database);
  auto prefix = ROCKSDB_NAMESPACE::Slice{detail::kResourceStatePrefix.data(),
                                         detail::kResourceStatePrefix.size()};
  auto addresses = std::vector<std::string>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix);
       iterator->Valid() && iterator->key().starts_with(prefix);
       iterator->Next()) {
    auto key = iterator->key();
    key.remove_prefix(prefix.size());
    addresses.push_back(key.ToString());
  }
  if (!iterator->status().ok()) {
    spdlog::error("Failed to iterate RocksDB: {}",
                  iterator->status().ToString());
    converge::common::critical("Failed to iterate RocksDB");
  }
  return addresses;
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    converge::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace converge::storage
