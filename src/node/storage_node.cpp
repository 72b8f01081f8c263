#include "node/storage_node.hpp"
#include <boost/log/trivial.hpp>

namespace quloud {
namespace node {

StorageNode::StorageNode(std::string node_id, const std::filesystem::path& root, KeyMode mode,
                         bus::MessageBus& bus, bus::Destinations destinations)
    : node_id_(std::move(node_id))
    , bus_(bus)
    , destinations_(std::move(destinations)) {

    BOOST_LOG_TRIVIAL(info) << "Storage node: Initializing " << node_id_ << " in " << to_string(mode)
                            << " mode at " << root.string();

    try {
        // Stores first (no dependencies)
        blob_backend_ = std::make_unique<store::FileByteStore>(root / "blobs");
        key_backend_ = std::make_unique<store::FileByteStore>(root / "keys");
        blobs_ = std::make_unique<store::BlobStore>(*blob_backend_);
        vault_ = std::make_unique<store::KeyVault>(*key_backend_);

        // Node key is loaded or created up front, never lazily
        NodeKeys keys = NodeKeys::per_document();
        if (mode == KeyMode::NodeKeyed) {
            keys = NodeKeys::node_keyed(load_or_create_node_key(root / "node.key", cipher_));
        }
        layer_ = std::make_unique<StorageLayer>(cipher_, *blobs_, *vault_, std::move(keys));

        // Proofs are computed over the bytes as received, with this node's layer stripped
        StorageLayer* layer = layer_.get();
        proof_engine_ = std::make_unique<proof::ProofEngine>(
            [layer](const std::string& blob_id) { return layer->open(blob_id); });

        store_handler_ = std::make_unique<StoreRequestHandler>(*layer_, node_id_, bus_, destinations_);
        retrieve_handler_ = std::make_unique<RetrieveRequestHandler>(*layer_, node_id_, bus_, destinations_);
        proof_handler_ = std::make_unique<ProofRequestHandler>(*proof_engine_, node_id_, bus_, destinations_);
        delete_handler_ = std::make_unique<DeleteRequestHandler>(*layer_, node_id_, bus_, destinations_);
        router_ = std::make_unique<RequestRouter>(*store_handler_, *retrieve_handler_,
                                                  *proof_handler_, *delete_handler_);

        BOOST_LOG_TRIVIAL(info) << "Storage node: Successfully created all components";
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Storage node: Failed to initialize components: " << e.what();
        throw;
    }
}

void StorageNode::start() {
    if (started_) {
        BOOST_LOG_TRIVIAL(warning) << "Storage node: Already started";
        return;
    }

    StoreRequestHandler* store = store_handler_.get();
    RetrieveRequestHandler* retrieve = retrieve_handler_.get();
    ProofRequestHandler* proof = proof_handler_.get();
    DeleteRequestHandler* erase = delete_handler_.get();

    bus_.subscribe(destinations_.store_requests, [store](const Bytes& raw) { store->handle(raw); });
    bus_.subscribe(destinations_.retrieve_requests, [retrieve](const Bytes& raw) { retrieve->handle(raw); });
    bus_.subscribe(destinations_.proof_requests, [proof](const Bytes& raw) { proof->handle(raw); });
    bus_.subscribe(destinations_.delete_requests, [erase](const Bytes& raw) { erase->handle(raw); });

    started_ = true;
    BOOST_LOG_TRIVIAL(info) << "Storage node: " << node_id_ << " consuming requests";
}

void StorageNode::start_on_channel(const std::string& channel) {
    if (started_) {
        BOOST_LOG_TRIVIAL(warning) << "Storage node: Already started";
        return;
    }

    RequestRouter* router = router_.get();
    bus_.subscribe(channel, [router](const Bytes& raw) { router->handle(raw); });

    started_ = true;
    BOOST_LOG_TRIVIAL(info) << "Storage node: " << node_id_ << " consuming all requests from " << channel;
}

} // namespace node
} // namespace quloud
