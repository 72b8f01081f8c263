#include <gtest/gtest.h>
#include "bus/local_bus.hpp"
#include "client/owner_client.hpp"
#include "crypto/digest.hpp"
#include "node/request_handlers.hpp"
#include "node/storage_node.hpp"
#include "store/memory_byte_store.hpp"
#include "test_utils.hpp"

using namespace quloud;
using namespace quloud::protocol;

namespace {

constexpr auto WAIT = std::chrono::seconds(5);

// Storage node over in-memory stores so tests can inspect every byte it keeps
struct MemoryNode {
    MemoryNode(const std::string& id, bus::MessageBus& bus, node::KeyMode mode = node::KeyMode::PerDocument)
        : node_id(id)
        , layer(cipher, blobs, vault,
                mode == node::KeyMode::NodeKeyed ? node::NodeKeys::node_keyed(cipher.generate_key())
                                                 : node::NodeKeys::per_document())
        , store_handler(layer, id, bus)
        , retrieve_handler(layer, id, bus)
        , proof_handler(engine, id, bus)
        , delete_handler(layer, id, bus) {
        bus::Destinations destinations;
        bus.subscribe(destinations.store_requests, [this](const Bytes& raw) { store_handler.handle(raw); });
        bus.subscribe(destinations.retrieve_requests, [this](const Bytes& raw) { retrieve_handler.handle(raw); });
        bus.subscribe(destinations.proof_requests, [this](const Bytes& raw) { proof_handler.handle(raw); });
        bus.subscribe(destinations.delete_requests, [this](const Bytes& raw) { delete_handler.handle(raw); });
    }

    std::string node_id;
    crypto::AesGcmCipher cipher;
    store::MemoryByteStore blob_backend;
    store::MemoryByteStore key_backend;
    store::BlobStore blobs{blob_backend};
    store::KeyVault vault{key_backend};
    node::StorageLayer layer;
    proof::ProofEngine engine{[this](const std::string& id) { return layer.open(id); }};
    node::StoreRequestHandler store_handler;
    node::RetrieveRequestHandler retrieve_handler;
    node::ProofRequestHandler proof_handler;
    node::DeleteRequestHandler delete_handler;
};

} // namespace

class OwnerClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::init_test_logging();
        node_a = std::make_unique<MemoryNode>("node-a", bus);
        node_b = std::make_unique<MemoryNode>("node-b", bus);
        owner = std::make_unique<client::OwnerClient>(cipher, owner_blobs, owner_vault, bus);
    }

    void TearDown() override {
        bus.stop();
    }

    // Stores and waits for every acknowledgement
    std::vector<StoreResponse> store_and_wait(const std::string& blob_id, const std::string& text,
                                              std::size_t replicas) {
        std::vector<StoreResponse> acks;
        for (auto& future : owner->store_blob(blob_id, test::bytes_of(text), replicas)) {
            EXPECT_EQ(future.wait_for(WAIT), std::future_status::ready);
            acks.push_back(future.get());
        }
        return acks;
    }

    bus::LocalBus bus;
    crypto::AesGcmCipher cipher;
    store::MemoryByteStore owner_blob_backend;
    store::MemoryByteStore owner_key_backend;
    store::BlobStore owner_blobs{owner_blob_backend};
    store::KeyVault owner_vault{owner_key_backend};
    std::unique_ptr<MemoryNode> node_a;
    std::unique_ptr<MemoryNode> node_b;
    std::unique_ptr<client::OwnerClient> owner;
};

TEST_F(OwnerClientTest, StoreAndReadBack) {
    auto acks = store_and_wait("b1", "hello", 1);
    ASSERT_EQ(acks.size(), 1u);
    EXPECT_TRUE(acks[0].stored);
    EXPECT_EQ(acks[0].blob_id, "b1");

    auto local = owner->retrieve_blob("b1");
    EXPECT_TRUE(local.found);
    EXPECT_TRUE(local.node_id.empty());
    EXPECT_EQ(*local.data, test::bytes_of("hello"));
}

TEST_F(OwnerClientTest, OwnerKeepsOnlyCiphertext) {
    store_and_wait("b1", "hello", 1);

    Bytes owner_layer = *owner_blob_backend.raw("b1");
    EXPECT_NE(owner_layer, test::bytes_of("hello"));
    EXPECT_EQ(cipher.decrypt(*owner_vault.retrieve_key("b1"), owner_layer), test::bytes_of("hello"));
}

TEST_F(OwnerClientTest, ReplicasReachDistinctNodes) {
    auto acks = store_and_wait("b1", "hello", 2);
    ASSERT_EQ(acks.size(), 2u);
    EXPECT_NE(acks[0].node_id, acks[1].node_id);
    EXPECT_TRUE(node_a->layer.holds("b1"));
    EXPECT_TRUE(node_b->layer.holds("b1"));
}

TEST_F(OwnerClientTest, NodesStoreDoublyEncryptedBytes) {
    store_and_wait("b1", "hello", 2);

    Bytes owner_layer = *owner_blob_backend.raw("b1");
    Bytes plaintext = test::bytes_of("hello");
    for (auto* node : {node_a.get(), node_b.get()}) {
        for (const auto& record : node->blob_backend.snapshot()) {
            EXPECT_NE(record.second, plaintext);
            EXPECT_NE(record.second, owner_layer);
        }
        for (const auto& record : node->key_backend.snapshot()) {
            EXPECT_NE(record.second, *owner_vault.retrieve_key("b1"));
        }
    }
    // Each node used its own key
    EXPECT_NE(*node_a->blob_backend.raw("b1"), *node_b->blob_backend.raw("b1"));
}

TEST_F(OwnerClientTest, ZeroReplicasStoresLocallyOnly) {
    auto acks = owner->store_blob("local-only", test::bytes_of("data"), 0);
    EXPECT_TRUE(acks.empty());
    ASSERT_TRUE(bus.wait_idle(WAIT));
    EXPECT_TRUE(owner->retrieve_blob("local-only").found);
    EXPECT_FALSE(node_a->layer.holds("local-only"));
    EXPECT_FALSE(node_b->layer.holds("local-only"));
}

TEST_F(OwnerClientTest, RetrieveMissingBlob) {
    auto response = owner->retrieve_blob("nope");
    EXPECT_FALSE(response.found);
    EXPECT_FALSE(response.data.has_value());
}

TEST_F(OwnerClientTest, FetchRemoteReturnsOwnerLayer) {
    store_and_wait("b1", "hello", 1);

    auto future = owner->fetch_remote("b1");
    ASSERT_EQ(future.wait_for(WAIT), std::future_status::ready);
    auto response = future.get();
    EXPECT_TRUE(response.found);
    EXPECT_FALSE(response.node_id.empty());
    EXPECT_EQ(*response.data, *owner_blob_backend.raw("b1"));
}

TEST_F(OwnerClientTest, RestoreRepairsLostLocalCopy) {
    store_and_wait("b1", "hello", 2);
    owner_blobs.remove("b1");
    EXPECT_FALSE(owner->retrieve_blob("b1").found);

    EXPECT_TRUE(owner->restore_blob("b1", WAIT));
    EXPECT_EQ(*owner->retrieve_blob("b1").data, test::bytes_of("hello"));
}

TEST_F(OwnerClientTest, RestoreOfUnknownBlobFails) {
    EXPECT_FALSE(owner->restore_blob("never-stored", WAIT));
}

TEST_F(OwnerClientTest, ProofOfStorageVerifies) {
    store_and_wait("b2", "secret", 1);
    Bytes seed = test::bytes_of("xyz");

    auto future = owner->request_proof("b2", seed);
    ASSERT_EQ(future.wait_for(WAIT), std::future_status::ready);
    auto response = future.get();

    EXPECT_TRUE(response.found);
    ASSERT_TRUE(response.proof.has_value());
    EXPECT_EQ(*response.proof, crypto::sha256(*owner_blob_backend.raw("b2"), seed));
    EXPECT_EQ(*response.proof, *owner->expected_proof("b2", seed));
    EXPECT_TRUE(owner->verify_proof(response, seed));
}

TEST_F(OwnerClientTest, ProofWithWrongSeedIsRejected) {
    store_and_wait("b2", "secret", 1);

    auto future = owner->request_proof("b2", test::bytes_of("xyz"));
    ASSERT_EQ(future.wait_for(WAIT), std::future_status::ready);
    EXPECT_FALSE(owner->verify_proof(future.get(), test::bytes_of("other")));
}

TEST_F(OwnerClientTest, ProofFromNodeWithoutBlob) {
    // Only one of the two nodes holds the blob; ask until the other one answers
    store_and_wait("b2", "secret", 1);
    bool saw_missing = false;
    for (int i = 0; i < 2; ++i) {
        auto future = owner->request_proof("b2", client::OwnerClient::generate_seed());
        ASSERT_EQ(future.wait_for(WAIT), std::future_status::ready);
        auto response = future.get();
        if (!response.found) {
            saw_missing = true;
            EXPECT_FALSE(response.proof.has_value());
            EXPECT_FALSE(owner->verify_proof(response, Bytes{}));
        }
    }
    EXPECT_TRUE(saw_missing);
}

TEST_F(OwnerClientTest, GeneratedSeedsAreRandom) {
    Bytes seed = client::OwnerClient::generate_seed();
    EXPECT_EQ(seed.size(), client::OwnerClient::SEED_SIZE);
    EXPECT_NE(seed, client::OwnerClient::generate_seed());
}

TEST_F(OwnerClientTest, DeleteShredsEverywhere) {
    store_and_wait("b3", "bye", 2);
    Bytes node_a_key = *node_a->vault.retrieve_key("b3");
    Bytes node_b_key = *node_b->vault.retrieve_key("b3");

    owner->delete_blob("b3");
    ASSERT_TRUE(bus.wait_idle(WAIT));

    EXPECT_FALSE(owner->retrieve_blob("b3").found);
    EXPECT_EQ(owner_key_backend.size(), 0u);
    EXPECT_EQ(owner_blob_backend.size(), 0u);
    for (auto* node : {node_a.get(), node_b.get()}) {
        EXPECT_FALSE(node->layer.holds("b3"));
        EXPECT_FALSE(node->vault.has_key("b3"));
        for (const auto& record : node->key_backend.snapshot()) {
            EXPECT_NE(record.second, node_a_key);
            EXPECT_NE(record.second, node_b_key);
        }
    }

    auto remote = owner->fetch_remote("b3");
    ASSERT_EQ(remote.wait_for(WAIT), std::future_status::ready);
    EXPECT_FALSE(remote.get().found);
}

TEST_F(OwnerClientTest, SecondDeleteIsNoop) {
    store_and_wait("b3", "bye", 1);
    owner->delete_blob("b3");
    ASSERT_TRUE(bus.wait_idle(WAIT));

    EXPECT_NO_THROW(owner->delete_blob("b3"));
    ASSERT_TRUE(bus.wait_idle(WAIT));
    EXPECT_FALSE(owner->retrieve_blob("b3").found);
}

TEST_F(OwnerClientTest, MalformedResponseIsIgnored) {
    auto future = owner->fetch_remote("missing-reply");
    bus::Destinations destinations;
    bus.publish(destinations.retrieve_responses, test::bytes_of("garbage"));
    ASSERT_TRUE(bus.wait_idle(WAIT));
    // The node answered found=false; the garbage did not disturb matching
    ASSERT_EQ(future.wait_for(WAIT), std::future_status::ready);
    EXPECT_FALSE(future.get().found);
}


// ---- Node-keyed storage ----

class NodeKeyedOwnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::init_test_logging();
        storage = std::make_unique<MemoryNode>("node-k", bus, node::KeyMode::NodeKeyed);
        owner = std::make_unique<client::OwnerClient>(cipher, owner_blobs, owner_vault, bus);
    }

    void TearDown() override {
        bus.stop();
    }

    bus::LocalBus bus;
    crypto::AesGcmCipher cipher;
    store::MemoryByteStore owner_blob_backend;
    store::MemoryByteStore owner_key_backend;
    store::BlobStore owner_blobs{owner_blob_backend};
    store::KeyVault owner_vault{owner_key_backend};
    std::unique_ptr<MemoryNode> storage;
    std::unique_ptr<client::OwnerClient> owner;
};

TEST_F(NodeKeyedOwnerTest, ProofCoversOwnerLayerNotNodeLayer) {
    auto acks = owner->store_blob("b2", test::bytes_of("secret"), 1);
    ASSERT_EQ(acks[0].wait_for(WAIT), std::future_status::ready);
    EXPECT_EQ(acks[0].get().node_id, "node-k");

    Bytes owner_layer = *owner_blob_backend.raw("b2");
    Bytes node_layer = *storage->blob_backend.raw("b2");
    EXPECT_NE(node_layer, owner_layer);
    // Node-keyed mode keeps no per-document keys
    EXPECT_EQ(storage->key_backend.size(), 0u);

    Bytes seed = test::bytes_of("xyz");
    auto pending = owner->request_proof("b2", seed);
    ASSERT_EQ(pending.wait_for(WAIT), std::future_status::ready);
    auto response = pending.get();

    ASSERT_TRUE(response.found);
    ASSERT_TRUE(response.proof.has_value());
    EXPECT_EQ(*response.proof, crypto::sha256(owner_layer, seed));
    EXPECT_NE(*response.proof, crypto::sha256(node_layer, seed));
    EXPECT_TRUE(owner->verify_proof(response, seed));
    EXPECT_FALSE(owner->verify_proof(response, test::bytes_of("xyz2")));
}

TEST_F(NodeKeyedOwnerTest, RetrieveStripsNodeLayer) {
    auto acks = owner->store_blob("b1", test::bytes_of("hello"), 1);
    ASSERT_EQ(acks[0].wait_for(WAIT), std::future_status::ready);

    owner_blobs.remove("b1");
    EXPECT_TRUE(owner->restore_blob("b1", WAIT));
    EXPECT_EQ(*owner->retrieve_blob("b1").data, test::bytes_of("hello"));
}


// ---- Timed-out requests ----

TEST(OwnerTimeoutTest, ChallengeAfterTimedOutChallengeResolves) {
    test::init_test_logging();
    bus::LocalBus bus;
    crypto::AesGcmCipher cipher;
    store::MemoryByteStore owner_blob_backend;
    store::MemoryByteStore owner_key_backend;
    store::BlobStore owner_blobs(owner_blob_backend);
    store::KeyVault owner_vault(owner_key_backend);
    client::OwnerClient owner(cipher, owner_blobs, owner_vault, bus);

    // Nobody serves proof requests yet
    auto unanswered = owner.request_proof("b1", test::bytes_of("first"));
    EXPECT_EQ(unanswered.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout);

    {
        MemoryNode storage("node-late", bus);
        auto acks = owner.store_blob("b1", test::bytes_of("hello"), 1);
        ASSERT_EQ(acks[0].wait_for(WAIT), std::future_status::ready);

        Bytes seed = test::bytes_of("second");
        auto answered = owner.request_proof("b1", seed);
        ASSERT_EQ(answered.wait_for(WAIT), std::future_status::ready);
        EXPECT_TRUE(owner.verify_proof(answered.get(), seed));

        // The stale request stays withdrawn
        EXPECT_EQ(unanswered.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);

        bus.stop();
    }
}

TEST(OwnerTimeoutTest, TimedOutRestoreDoesNotSwallowNextReply) {
    test::init_test_logging();
    bus::LocalBus bus;
    crypto::AesGcmCipher cipher;
    store::MemoryByteStore owner_blob_backend;
    store::MemoryByteStore owner_key_backend;
    store::BlobStore owner_blobs(owner_blob_backend);
    store::KeyVault owner_vault(owner_key_backend);
    client::OwnerClient owner(cipher, owner_blobs, owner_vault, bus);

    owner.store_blob("b1", test::bytes_of("hello"), 0);
    auto older = owner.fetch_remote("b1");
    EXPECT_FALSE(owner.restore_blob("b1", std::chrono::milliseconds(100)));

    {
        MemoryNode storage("node-late", bus);
        auto acks = owner.store_blob("b1", test::bytes_of("hello again"), 1);
        ASSERT_EQ(acks[0].wait_for(WAIT), std::future_status::ready);

        // The restore withdrew its own request, leaving the older one first in line
        auto newer = owner.fetch_remote("b1");
        ASSERT_EQ(older.wait_for(WAIT), std::future_status::ready);
        EXPECT_TRUE(older.get().found);
        bus.stop();
    }
}


// ---- Full node over the filesystem ----

TEST(OwnerWithStorageNodeTest, FileBackedRoundTrip) {
    test::init_test_logging();
    test::TempDir dir("owner_storage_node_test");
    bus::LocalBus bus;
    crypto::AesGcmCipher cipher;
    store::MemoryByteStore owner_blob_backend;
    store::MemoryByteStore owner_key_backend;
    store::BlobStore owner_blobs(owner_blob_backend);
    store::KeyVault owner_vault(owner_key_backend);

    {
        node::StorageNode storage_node("node-1", dir.path() / "node", node::KeyMode::PerDocument, bus);
        storage_node.start();
        client::OwnerClient owner(cipher, owner_blobs, owner_vault, bus);

        auto acks = owner.store_blob("doc", test::bytes_of("file backed"), 1);
        ASSERT_EQ(acks[0].wait_for(WAIT), std::future_status::ready);
        EXPECT_EQ(acks[0].get().node_id, "node-1");
        EXPECT_TRUE(storage_node.layer().holds("doc"));

        owner.delete_blob("doc");
        ASSERT_TRUE(bus.wait_idle(WAIT));
        EXPECT_FALSE(storage_node.layer().holds("doc"));

        bus.stop();
    }
}
