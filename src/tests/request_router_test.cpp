#include <gtest/gtest.h>
#include <mutex>
#include "bus/local_bus.hpp"
#include "node/request_router.hpp"
#include "node/storage_node.hpp"
#include "store/memory_byte_store.hpp"
#include "test_utils.hpp"

using namespace quloud;
using namespace quloud::node;
using namespace quloud::protocol;

// Captures every publish for inspection
class RecordingPublisher : public bus::Publisher {
public:
    void publish(const std::string& destination, const Bytes& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.emplace_back(destination, MessageCodec::decode(payload));
    }

    std::vector<std::pair<std::string, Message>> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, Message>> records_;
};

class RequestRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::init_test_logging();
        owner_layer = cipher.encrypt(cipher.generate_key(), test::bytes_of("hello"));
    }

    crypto::AesGcmCipher cipher;
    store::MemoryByteStore blob_backend;
    store::MemoryByteStore key_backend;
    store::BlobStore blobs{blob_backend};
    store::KeyVault vault{key_backend};
    StorageLayer layer{cipher, blobs, vault, NodeKeys::per_document()};
    proof::ProofEngine engine{[this](const std::string& id) { return layer.open(id); }};

    RecordingPublisher publisher;
    StoreRequestHandler store_handler{layer, "node-1", publisher};
    RetrieveRequestHandler retrieve_handler{layer, "node-1", publisher};
    ProofRequestHandler proof_handler{engine, "node-1", publisher};
    DeleteRequestHandler delete_handler{layer, "node-1", publisher};
    RequestRouter router{store_handler, retrieve_handler, proof_handler, delete_handler};

    Bytes owner_layer;
};

TEST_F(RequestRouterTest, RoutesEachRequestType) {
    router.handle(MessageCodec::encode(StoreRequest{"b1", owner_layer}));
    router.handle(MessageCodec::encode(RetrieveRequest{"b1"}));
    router.handle(MessageCodec::encode(ProofRequest{"b1", test::bytes_of("seed")}));
    router.handle(MessageCodec::encode(DeleteRequest{"b1"}));

    auto records = publisher.records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<StoreResponse>(records[0].second));
    EXPECT_TRUE(std::holds_alternative<RetrieveResponse>(records[1].second));
    EXPECT_TRUE(std::holds_alternative<ProofResponse>(records[2].second));
    EXPECT_EQ(*std::get<RetrieveResponse>(records[1].second).data, owner_layer);
    EXPECT_FALSE(layer.holds("b1"));
}

TEST_F(RequestRouterTest, ResponsesAreNotRouted) {
    EXPECT_FALSE(router.route(StoreResponse{"b1", "node-2", true}));
    EXPECT_FALSE(router.route(RetrieveResponse{"b1", "node-2", std::nullopt, false}));
    EXPECT_FALSE(router.route(ProofResponse{"b1", "node-2", std::nullopt, false}));
    EXPECT_TRUE(publisher.records().empty());
}

TEST_F(RequestRouterTest, MalformedFrameDropped) {
    EXPECT_NO_THROW(router.handle(test::bytes_of("garbage")));
    EXPECT_TRUE(publisher.records().empty());
}

TEST(StorageNodeChannelTest, SharedChannelServesAllRequests) {
    test::init_test_logging();
    test::TempDir dir("storage_node_channel_test");
    bus::Destinations destinations;
    bus::LocalBus bus(destinations);

    std::mutex mutex;
    std::vector<Message> responses;
    auto collect = [&](const Bytes& raw) {
        std::lock_guard<std::mutex> lock(mutex);
        responses.push_back(MessageCodec::decode(raw));
    };
    bus.subscribe(destinations.store_responses, collect);
    bus.subscribe(destinations.retrieve_responses, collect);

    {
        StorageNode storage_node("node-1", dir.path(), KeyMode::NodeKeyed, bus);
        storage_node.start_on_channel("quloud.node-1.requests");
        EXPECT_EQ(storage_node.layer().mode(), KeyMode::NodeKeyed);
        EXPECT_TRUE(std::filesystem::exists(dir.path() / "node.key"));

        bus.publish("quloud.node-1.requests", MessageCodec::encode(StoreRequest{"b1", test::bytes_of("payload")}));
        ASSERT_TRUE(bus.wait_idle(std::chrono::seconds(2)));
        bus.publish("quloud.node-1.requests", MessageCodec::encode(RetrieveRequest{"b1"}));
        ASSERT_TRUE(bus.wait_idle(std::chrono::seconds(2)));

        bus.stop();
    }

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_TRUE(std::get<StoreResponse>(responses[0]).stored);
    EXPECT_EQ(*std::get<RetrieveResponse>(responses[1]).data, test::bytes_of("payload"));
}
