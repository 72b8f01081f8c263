#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "crypto/cipher.hpp"
#include "store/file_byte_store.hpp"
#include "store/key_vault.hpp"
#include "store/memory_byte_store.hpp"
#include "test_utils.hpp"

using namespace quloud;
using namespace quloud::store;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::SizeIs;

class MockByteStore : public ByteStore {
public:
    MOCK_METHOD(void, put, (const std::string& id, const Bytes& data), (override));
    MOCK_METHOD(std::optional<Bytes>, get, (const std::string& id), (const, override));
    MOCK_METHOD(bool, remove, (const std::string& id), (override));
    MOCK_METHOD(bool, overwrite, (const std::string& id, const Bytes& data), (override));
    MOCK_METHOD(bool, exists, (const std::string& id), (const, override));
};

class KeyVaultTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::init_test_logging();
        key = cipher.generate_key();
    }

    crypto::AesGcmCipher cipher;
    MemoryByteStore backend;
    KeyVault vault{backend};
    Bytes key;
};

TEST_F(KeyVaultTest, StoreAndRetrieveKey) {
    vault.store_key("b1", key);
    EXPECT_TRUE(vault.has_key("b1"));
    EXPECT_EQ(*vault.retrieve_key("b1"), key);
}

TEST_F(KeyVaultTest, StoreReplacesPreviousKey) {
    vault.store_key("b1", key);
    Bytes replacement = cipher.generate_key();
    vault.store_key("b1", replacement);
    EXPECT_EQ(*vault.retrieve_key("b1"), replacement);
}

TEST_F(KeyVaultTest, RejectsWrongKeyLength) {
    EXPECT_THROW(vault.store_key("b1", Bytes(16, 0x01)), crypto::KeyLengthError);
    EXPECT_THROW(vault.store_key("b1", Bytes{}), crypto::KeyLengthError);
    EXPECT_FALSE(vault.has_key("b1"));
}

TEST_F(KeyVaultTest, MissingKey) {
    EXPECT_FALSE(vault.retrieve_key("nope").has_value());
    EXPECT_FALSE(vault.has_key("nope"));
}

TEST_F(KeyVaultTest, DeleteRemovesKeyAndLeavesNoCopy) {
    vault.store_key("b1", key);
    vault.store_key("b2", cipher.generate_key());

    vault.delete_key("b1");

    EXPECT_FALSE(vault.has_key("b1"));
    EXPECT_FALSE(vault.retrieve_key("b1").has_value());
    for (const auto& record : backend.snapshot()) {
        EXPECT_NE(record.second, key) << "Shredded key still present under " << record.first;
    }
    EXPECT_TRUE(vault.has_key("b2"));
}

TEST_F(KeyVaultTest, DeleteOfMissingKeyIsNoop) {
    EXPECT_NO_THROW(vault.delete_key("never-stored"));
    vault.store_key("b1", key);
    vault.delete_key("b1");
    EXPECT_NO_THROW(vault.delete_key("b1"));
}

TEST(KeyVaultShreddingTest, OverwritesWithSameLengthBeforeRemoving) {
    test::init_test_logging();
    MockByteStore backend;
    KeyVault vault(backend);
    Bytes key(32, 0x42);

    {
        InSequence order;
        EXPECT_CALL(backend, get("b1")).WillOnce(Return(std::optional<Bytes>(key)));
        EXPECT_CALL(backend, overwrite("b1", SizeIs(32))).WillOnce(Return(true));
        EXPECT_CALL(backend, remove("b1")).WillOnce(Return(true));
    }

    vault.delete_key("b1");
}

TEST(KeyVaultShreddingTest, NoiseDiffersFromKey) {
    test::init_test_logging();
    MockByteStore backend;
    KeyVault vault(backend);
    Bytes key(32, 0x42);
    Bytes written;

    EXPECT_CALL(backend, get("b1")).WillOnce(Return(std::optional<Bytes>(key)));
    EXPECT_CALL(backend, overwrite("b1", _))
        .WillOnce([&written](const std::string&, const Bytes& data) {
            written = data;
            return true;
        });
    EXPECT_CALL(backend, remove("b1")).WillOnce(Return(true));

    vault.delete_key("b1");
    EXPECT_EQ(written.size(), key.size());
    EXPECT_NE(written, key);
}

TEST(KeyVaultShreddingTest, FailedOverwriteKeepsRecordAndPropagates) {
    test::init_test_logging();
    MockByteStore backend;
    KeyVault vault(backend);

    EXPECT_CALL(backend, get("b1")).WillOnce(Return(std::optional<Bytes>(Bytes(32, 0x42))));
    EXPECT_CALL(backend, overwrite("b1", _)).WillOnce([](const std::string&, const Bytes&) -> bool {
        throw StoreError("disk full");
    });
    EXPECT_CALL(backend, remove(_)).Times(0);

    EXPECT_THROW(vault.delete_key("b1"), StoreError);
}

TEST(KeyVaultShreddingTest, MissingKeyTouchesNothing) {
    test::init_test_logging();
    MockByteStore backend;
    KeyVault vault(backend);

    EXPECT_CALL(backend, get("b1")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(backend, overwrite(_, _)).Times(0);
    EXPECT_CALL(backend, remove(_)).Times(0);

    vault.delete_key("b1");
}

TEST(KeyVaultFileTest, ShreddedKeyFileIsGone) {
    test::init_test_logging();
    test::TempDir dir("key_vault_test");
    FileByteStore backend(dir.path());
    KeyVault vault(backend);
    crypto::AesGcmCipher cipher;

    vault.store_key("b1", cipher.generate_key());
    auto key_file = backend.path_for("b1");
    ASSERT_TRUE(std::filesystem::exists(key_file));

    vault.delete_key("b1");
    EXPECT_FALSE(std::filesystem::exists(key_file));
    EXPECT_FALSE(vault.has_key("b1"));
}
