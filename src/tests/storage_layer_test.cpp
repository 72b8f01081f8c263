#include <gtest/gtest.h>
#include <fstream>
#include "crypto/digest.hpp"
#include "node/key_mode.hpp"
#include "node/storage_layer.hpp"
#include "store/memory_byte_store.hpp"
#include "test_utils.hpp"

using namespace quloud;
using namespace quloud::node;

class StorageLayerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::init_test_logging();
        owner_key = cipher.generate_key();
        owner_layer = cipher.encrypt(owner_key, test::bytes_of("hello"));
    }

    crypto::AesGcmCipher cipher;
    store::MemoryByteStore blob_backend;
    store::MemoryByteStore key_backend;
    store::BlobStore blobs{blob_backend};
    store::KeyVault vault{key_backend};
    Bytes owner_key;
    Bytes owner_layer;
};

TEST_F(StorageLayerTest, PersistsOnlyItsOwnCiphertext) {
    StorageLayer layer(cipher, blobs, vault, NodeKeys::per_document());
    layer.seal("b1", owner_layer);

    auto persisted = blob_backend.raw("b1");
    ASSERT_TRUE(persisted.has_value());
    EXPECT_NE(*persisted, owner_layer);
    EXPECT_EQ(persisted->size(), owner_layer.size() + crypto::AesGcmCipher::OVERHEAD);
    EXPECT_TRUE(vault.has_key("b1"));
}

TEST_F(StorageLayerTest, OpenReturnsBytesAsReceived) {
    StorageLayer layer(cipher, blobs, vault, NodeKeys::per_document());
    layer.seal("b1", owner_layer);

    auto opened = layer.open("b1");
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, owner_layer);
    EXPECT_EQ(cipher.decrypt(owner_key, *opened), test::bytes_of("hello"));
}

TEST_F(StorageLayerTest, NodeNeverSeesOwnerKey) {
    StorageLayer layer(cipher, blobs, vault, NodeKeys::per_document());
    layer.seal("b1", owner_layer);

    for (const auto& record : key_backend.snapshot()) {
        EXPECT_NE(record.second, owner_key);
    }
    EXPECT_THROW(cipher.decrypt(*vault.retrieve_key("b1"), owner_layer), crypto::AuthenticationError);
}

TEST_F(StorageLayerTest, PerDocumentKeysDiffer) {
    StorageLayer layer(cipher, blobs, vault, NodeKeys::per_document());
    layer.seal("b1", owner_layer);
    layer.seal("b2", owner_layer);
    EXPECT_NE(*vault.retrieve_key("b1"), *vault.retrieve_key("b2"));
}

TEST_F(StorageLayerTest, MissingBlobOrKeyOpensToNothing) {
    StorageLayer layer(cipher, blobs, vault, NodeKeys::per_document());
    EXPECT_FALSE(layer.open("absent").has_value());

    layer.seal("b1", owner_layer);
    key_backend.remove("b1");
    EXPECT_FALSE(layer.open("b1").has_value());
    EXPECT_TRUE(layer.holds("b1"));
}

TEST_F(StorageLayerTest, CorruptLocalDataRaises) {
    StorageLayer layer(cipher, blobs, vault, NodeKeys::per_document());
    layer.seal("b1", owner_layer);

    Bytes corrupted = *blob_backend.raw("b1");
    corrupted[crypto::AesGcmCipher::NONCE_SIZE] ^= 0x01;
    blob_backend.put("b1", corrupted);

    EXPECT_THROW(layer.open("b1"), crypto::AuthenticationError);
}

TEST_F(StorageLayerTest, EraseShredsKeyAndData) {
    StorageLayer layer(cipher, blobs, vault, NodeKeys::per_document());
    layer.seal("b3", owner_layer);
    Bytes node_key = *vault.retrieve_key("b3");

    EXPECT_TRUE(layer.erase("b3"));
    EXPECT_FALSE(layer.holds("b3"));
    EXPECT_FALSE(vault.has_key("b3"));
    EXPECT_FALSE(layer.open("b3").has_value());
    for (const auto& record : key_backend.snapshot()) {
        EXPECT_NE(record.second, node_key);
    }

    EXPECT_NO_THROW(EXPECT_FALSE(layer.erase("b3")));
}

TEST_F(StorageLayerTest, NodeKeyedModeUsesNoVault) {
    Bytes node_key = cipher.generate_key();
    StorageLayer layer(cipher, blobs, vault, NodeKeys::node_keyed(node_key));
    EXPECT_EQ(layer.mode(), KeyMode::NodeKeyed);

    layer.seal("b1", owner_layer);
    EXPECT_EQ(key_backend.size(), 0u);
    EXPECT_EQ(cipher.decrypt(node_key, *blob_backend.raw("b1")), owner_layer);
    EXPECT_EQ(*layer.open("b1"), owner_layer);

    EXPECT_TRUE(layer.erase("b1"));
    EXPECT_FALSE(layer.open("b1").has_value());
}

TEST_F(StorageLayerTest, NodeKeyedModeRequiresKey) {
    NodeKeys keys;
    keys.mode = KeyMode::NodeKeyed;
    EXPECT_THROW(StorageLayer(cipher, blobs, vault, keys), std::invalid_argument);
}


// ---- Key mode and node key file ----

TEST(KeyModeTest, ParseAndPrint) {
    EXPECT_EQ(parse_key_mode("per-document"), KeyMode::PerDocument);
    EXPECT_EQ(parse_key_mode("node-keyed"), KeyMode::NodeKeyed);
    EXPECT_EQ(to_string(KeyMode::PerDocument), "per-document");
    EXPECT_EQ(to_string(KeyMode::NodeKeyed), "node-keyed");
    EXPECT_THROW(parse_key_mode("hybrid"), std::invalid_argument);
}

TEST(NodeKeyFileTest, CreatedOnceThenReloaded) {
    test::init_test_logging();
    test::TempDir dir("node_key_test");
    crypto::AesGcmCipher cipher;
    auto path = dir.path() / "node.key";

    Bytes created = load_or_create_node_key(path, cipher);
    EXPECT_EQ(created.size(), crypto::AesGcmCipher::KEY_SIZE);
    ASSERT_TRUE(std::filesystem::exists(path));

    auto perms = std::filesystem::status(path).permissions();
    EXPECT_EQ(perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
              std::filesystem::perms::none);

    EXPECT_EQ(load_or_create_node_key(path, cipher), created);
}

TEST(NodeKeyFileTest, WrongSizeFileRejected) {
    test::init_test_logging();
    test::TempDir dir("node_key_test");
    crypto::AesGcmCipher cipher;
    auto path = dir.path() / "node.key";
    {
        std::ofstream out(path, std::ios::binary);
        out << "too short";
    }
    EXPECT_THROW(load_or_create_node_key(path, cipher), crypto::KeyLengthError);
}
