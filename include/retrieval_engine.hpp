#pragma once
#include "document_store.hpp"
#include "embedding_provider.hpp"
#include "index_backend.hpp"
#include "retrieval_config.hpp"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ragcore {

struct SearchResult {
    std::string text;
    float distance;  // squared L2, smaller is closer; not a similarity
    nlohmann::json metadata;
};

enum class IndexState { Empty, Populated };

/**
 * @brief Single-index exact retrieval over an embedding provider.
 *
 * Not thread-safe: callers serialise add/clear/save against each other and
 * against search.
 */
class RetrievalEngine {
public:
    /**
     * @brief Builds provider and backend from config, then loads
     * config.index_file() if it exists.
     * @throws ConfigurationError on any unusable configuration, including an
     *         index on disk whose dimension differs from the provider's.
     */
    explicit RetrievalEngine(RetrievalConfig config);

    // Same as above with a caller-supplied provider (and optionally backend).
    RetrievalEngine(RetrievalConfig config,
                    std::unique_ptr<EmbeddingProvider> provider,
                    std::unique_ptr<IndexBackend> backend = nullptr);

    // Encodes and indexes texts. All-or-nothing; empty input is a no-op.
    void add(const std::vector<std::string>& documents,
             const std::vector<nlohmann::json>& metadata = {});

    std::vector<SearchResult> search(const std::string& query, size_t top_k = 5);

    // Writes the index and its documents next to config().index_path.
    void save() const;

    // Empties store and backend. Files on disk are left alone.
    void clear();

    std::vector<float> get_embedding(const std::string& text);
    std::vector<std::vector<float>> get_embeddings(const std::vector<std::string>& texts);

    std::string build_context(const std::vector<SearchResult>& results,
                              size_t max_chars = 12000) const;
    static nlohmann::json results_to_json(const std::vector<SearchResult>& results);

    size_t document_count() const { return store_.size(); }
    size_t dimension() const { return provider_->dimension(); }
    IndexState state() const { return store_.empty() ? IndexState::Empty : IndexState::Populated; }
    IndexKind index_kind() const { return backend_->kind(); }
    bool exact_index_degraded() const { return exact_degraded_; }
    const std::string& provider_name() const { return provider_name_; }
    const RetrievalConfig& config() const { return config_; }
    const DocumentStore& documents() const { return store_; }

private:
    void load_from_disk();
    std::vector<std::vector<float>> encode_checked(const std::vector<std::string>& texts);

    RetrievalConfig config_;
    std::unique_ptr<EmbeddingProvider> provider_;
    std::unique_ptr<IndexBackend> backend_;
    DocumentStore store_;
    std::string provider_name_;
    bool exact_degraded_ = false;
};

} // namespace ragcore
