#include <converge/schema/encoding/scale/encoder.hpp>
#include <converge/storage/rocksdb/storage.hpp>
#include <converge/storage/storage.hpp>
#include <converge/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

using encoder_t = converge::schema::encoding::encoder<
    converge::schema::encoding::scale_encoder_tag>;

converge::schema::resource_state_t make_tracked_state() {
  auto state = converge::testing::make_state();
  state.identity = "abc123";
  state.declaration.default_action.base_intrusion_policy_id = "ips-1";
  state.declaration.default_action.log_begin = true;
  state.declaration.default_action.log_end = false;
  state.type = "AccessPolicy";
  state.default_action_type = "AccessPolicyDefaultAction";
  state.default_action_id = "abc123-action";
  return state;
}

}  // namespace

TEST(storage, resource_state_key_is_prefixed) {
  EXPECT_EQ(converge::storage::detail::make_resource_state_key("policy.main"),
            "STATE|RESOURCE|policy.main");
}

TEST(storage, scale_codec_preserves_unset_optionals) {
  auto state = converge::testing::make_state();
  state.declaration.description.reset();
  state.declaration.default_action.action.reset();

  auto encoder = encoder_t{};
  auto encoded = encoder.encode(state);
  auto decoded = encoder.try_decode<converge::schema::resource_state_t>(
      converge::schema::encoding::bytes_view_t{encoded});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, state);
}

TEST(storage, missing_state_loads_as_nullopt) {
  auto db = converge::testing::make_db_path("converge_storage_missing");
  {
    auto storage = converge::storage::make_storage<
        converge::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_resource_state("nothing.here").has_value());
    EXPECT_FALSE(storage.erase_resource_state("nothing.here"));
  }
  converge::testing::remove_path(db);
}

TEST(storage, resource_state_survives_reopen) {
  auto db = converge::testing::make_db_path("converge_storage_reopen");
  auto state = make_tracked_state();
  {
    auto storage = converge::storage::make_storage<
        converge::storage::rocksdb_storage_tag>(db);
    storage.save_resource_state("policy.main", state);
  }
  {
    auto storage = converge::storage::make_storage<
        converge::storage::rocksdb_storage_tag>(db);
    auto loaded = storage.load_resource_state("policy.main");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, state);
  }
  converge::testing::remove_path(db);
}

TEST(storage, erase_and_list_addresses) {
  auto db = converge::testing::make_db_path("converge_storage_list");
  {
    auto storage = converge::storage::make_storage<
        converge::storage::rocksdb_storage_tag>(db);
    storage.save_resource_state("b.policy", make_tracked_state());
    storage.save_resource_state("a.policy", make_tracked_state());

    EXPECT_EQ(storage.list_resource_addresses(),
              (std::vector<std::string>{"a.policy", "b.policy"}));

    EXPECT_TRUE(storage.erase_resource_state("a.policy"));
    EXPECT_FALSE(storage.load_resource_state("a.policy").has_value());
    EXPECT_EQ(storage.list_resource_addresses(),
              (std::vector<std::string>{"b.policy"}));
  }
  converge::testing::remove_path(db);
}

TEST(storage, corrupt_state_can_be_erased) {
  auto db = converge::testing::make_db_path("converge_storage_corrupt");
  {
    auto storage = converge::storage::make_storage<
        converge::storage::rocksdb_storage_tag>(db);
    auto key = converge::storage::detail::make_resource_state_key("broken");
    auto status = storage.database->Put(ROCKSDB_NAMESPACE::WriteOptions{}, key,
                                        std::string{"\xff\xff\xff"});
    ASSERT_TRUE(status.ok());

    EXPECT_TRUE(storage.erase_resource_state("broken"));
    EXPECT_TRUE(storage.list_resource_addresses().empty());
  }
  converge::testing::remove_path(db);
}
