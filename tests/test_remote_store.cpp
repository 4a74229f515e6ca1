#include <gtest/gtest.h>
#include <storage/local_store.hpp>
#include <storage/remote_store.hpp>
#include "fake_backend.hpp"
#include "test_helpers.hpp"

class RemoteStoreTest : public ::testing::Test {
protected:
    FakeBackend backend_;
    LocalStore fallback_;

    void SetUp() override {
        make_test_config();
    }
};

TEST_F(RemoteStoreTest, UsesAvailablePrimary) {
    RemoteStore store(&backend_, fallback_, 1000);
    EXPECT_FALSE(store.is_fallback());
    EXPECT_EQ(store.storage_type(), "remote");

    ASSERT_TRUE(store.set("k", "v").is_ok());
    EXPECT_EQ(backend_.peek("k").value_or(""), "v");
    EXPECT_FALSE(fallback_.get("k").has_value());
}

TEST_F(RemoteStoreTest, FallsBackWhenPrimaryUnavailable) {
    FakeBackend offline(1500, false);
    RemoteStore store(&offline, fallback_, 1000);
    EXPECT_TRUE(store.is_fallback());
    EXPECT_EQ(store.storage_type(), "local");

    ASSERT_TRUE(store.set("k", "v").is_ok());
    EXPECT_EQ(fallback_.get("k").value_or(""), "v");
    EXPECT_EQ(offline.op_count(), 0u);
}

TEST_F(RemoteStoreTest, FallsBackWithoutPrimary) {
    RemoteStore store(nullptr, fallback_, 1000);
    EXPECT_TRUE(store.is_fallback());
    auto r = store.get("missing");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.has_value());
}

TEST_F(RemoteStoreTest, GetMissingIsOkEmpty) {
    RemoteStore store(&backend_, fallback_, 1000);
    auto r = store.get("missing");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.has_value());
}

TEST_F(RemoteStoreTest, HungBackendTimesOut) {
    RemoteStore store(&backend_, fallback_, 50);
    backend_.hold_completions(true);

    auto set = store.set("k", "v");
    ASSERT_TRUE(set.is_err());
    EXPECT_EQ(set.kind, ErrorKind::Timeout);

    auto get = store.get("k");
    ASSERT_TRUE(get.is_err());
    EXPECT_EQ(get.kind, ErrorKind::Timeout);

    auto remove = store.remove("k");
    ASSERT_TRUE(remove.is_err());
    EXPECT_EQ(remove.kind, ErrorKind::Timeout);

    // Late completions after the deadline are discarded
    backend_.hold_completions(false);
    backend_.release_held();
    EXPECT_TRUE(store.set("k", "v").is_ok());
}

TEST_F(RemoteStoreTest, BackendErrorPropagates) {
    RemoteStore store(&backend_, fallback_, 1000);
    backend_.fail_key("bad");

    auto set = store.set("bad", "v");
    ASSERT_TRUE(set.is_err());
    EXPECT_EQ(set.kind, ErrorKind::Backend);
    EXPECT_NE(set.error.find("injected failure"), std::string::npos);

    EXPECT_TRUE(store.get("bad").is_err());
    EXPECT_TRUE(store.remove("bad").is_err());
}

TEST_F(RemoteStoreTest, OversizeValueRejectedBeforeBackend) {
    RemoteStore store(&backend_, fallback_, 1000);
    EXPECT_EQ(store.max_value_size(), 1500u);

    auto r = store.set("k", std::string(1501, 'x'));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(backend_.op_count(), 0u);

    EXPECT_TRUE(store.set("k", std::string(1500, 'x')).is_ok());
}

TEST_F(RemoteStoreTest, RemoveAbsentKeyIsOk) {
    RemoteStore store(&backend_, fallback_, 1000);
    EXPECT_TRUE(store.remove("never_written").is_ok());
}

TEST_F(RemoteStoreTest, ClearRemovesEverything) {
    RemoteStore store(&backend_, fallback_, 1000);
    backend_.put("a", "1");
    backend_.put("b", "2");
    backend_.put("c", "3");

    auto r = store.clear();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, 3u);
    EXPECT_EQ(backend_.size(), 0u);
}

TEST_F(RemoteStoreTest, ClearIsBestEffort) {
    RemoteStore store(&backend_, fallback_, 1000);
    backend_.put("a", "1");
    backend_.put("b", "2");
    backend_.fail_key("a");

    auto r = store.clear();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, 1u);
    EXPECT_TRUE(backend_.has("a"));
    EXPECT_FALSE(backend_.has("b"));
}
