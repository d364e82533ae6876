#include <gtest/gtest.h>
#include <cerrno>
#include <optional>
#include "kvstore/KVStore.hpp"
#include "kvstore/StoreErrors.hpp"
#include "../TempDir.hpp"

class KVStoreTest : public TempDirTest {};

TEST_F(KVStoreTest, Get_ReturnsValue_WhenKeyExists) {
    KVStore store(pathFor("data.db"));
    const std::string test_key = "Alice";
    const std::string test_value = "5";

    store.Set(test_key, test_value);

    std::optional<std::string> result = store.Get(test_key);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), test_value);
}

TEST_F(KVStoreTest, Get_ReturnsNullOpt_WhenKeyMissing) {
    KVStore store(pathFor("data.db")); // empty store

    std::optional<std::string> result = store.Get("missing");
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(result, std::nullopt);
}

TEST_F(KVStoreTest, LastWriteWins) {
    KVStore store(pathFor("data.db"));

    store.Set("a", "1");
    store.Set("a", "2");

    EXPECT_EQ(store.Get("a").value(), "2");
}

TEST_F(KVStoreTest, HistoryKeepsShadowedWrites) {
    KVStore store(pathFor("data.db"));

    store.Set("k", "v1");
    store.Set("k", "v2");
    store.Set("k", "v1");

    EXPECT_EQ(store.Get("k").value(), "v1");
    EXPECT_EQ(store.size(), 3u);
    EXPECT_EQ(TempDirTest::readRaw(pathFor("data.db")), "SET k v1\nSET k v2\nSET k v1\n");
}

TEST_F(KVStoreTest, EmptyKeyRejected) {
    KVStore store(pathFor("data.db"));

    EXPECT_THROW(store.Set("", "v"), InvalidArgument);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(TempDirTest::readRaw(pathFor("data.db")), "");
}

TEST_F(KVStoreTest, EmptyValueRejected) {
    KVStore store(pathFor("data.db"));

    EXPECT_THROW(store.Set("k", ""), InvalidArgument);
    EXPECT_FALSE(store.Get("k").has_value());
}

TEST_F(KVStoreTest, NewlineRejected) {
    KVStore store(pathFor("data.db"));

    EXPECT_THROW(store.Set("k\n", "v"), InvalidArgument);
    EXPECT_THROW(store.Set("k", "v\nSET x y"), InvalidArgument);
    EXPECT_EQ(TempDirTest::readRaw(pathFor("data.db")), "");
}

TEST_F(KVStoreTest, WhitespaceRejected) {
    KVStore store(pathFor("data.db"));

    EXPECT_THROW(store.Set("a b", "v"), InvalidArgument);
    EXPECT_THROW(store.Set("k", "two words"), InvalidArgument);
    EXPECT_THROW(store.Set("k", "tab\there"), InvalidArgument);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(KVStoreTest, RejectedSetLeavesExistingValue) {
    KVStore store(pathFor("data.db"));
    store.Set("k", "good");

    EXPECT_THROW(store.Set("k", ""), InvalidArgument);

    EXPECT_EQ(store.Get("k").value(), "good");
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(KVStoreTest, InvalidUtf8InputIsNormalised) {
    KVStore store(pathFor("data.db"));

    store.Set("bad", "\xff");

    EXPECT_EQ(store.Get("bad").value(), "\xEF\xBF\xBD");
    EXPECT_EQ(TempDirTest::readRaw(pathFor("data.db")), "SET bad \xEF\xBF\xBD\n");
}

TEST_F(KVStoreTest, KeysAreCaseSensitive) {
    KVStore store(pathFor("data.db"));
    store.Set("Key", "upper");

    EXPECT_FALSE(store.Get("key").has_value());
    EXPECT_EQ(store.Get("Key").value(), "upper");
}

TEST_F(KVStoreTest, OpenOnDirectoryFails) {
    EXPECT_THROW(KVStore store(dir.string()), IOFailure);
}

TEST_F(KVStoreTest, OpenInMissingDirectoryFails) {
    try {
        KVStore store(pathFor("no/such/dir/data.db"));
        FAIL() << "expected IOFailure";
    } catch (const IOFailure& e) {
        EXPECT_EQ(e.code(), ENOENT);
    }
}

TEST_F(KVStoreTest, GetNormalisesKeyLikeSet) {
    KVStore store(pathFor("data.db"));

    store.Set("k\xff", "v");

    ASSERT_TRUE(store.Get("k\xff").has_value());
    EXPECT_EQ(store.Get("k\xff").value(), "v");
    EXPECT_EQ(store.Get("k\xEF\xBF\xBD").value(), "v");
}

TEST_F(KVStoreTest, InvalidUtf8KeyReadableAfterReopen) {
    const std::string path = pathFor("data.db");
    {
        KVStore store(path);
        store.Set("\xc3" "key", "v");
    }

    KVStore store(path);
    EXPECT_EQ(store.Get("\xc3" "key").value(), "v");
}
