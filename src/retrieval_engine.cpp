#include "retrieval_engine.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace ragcore {

namespace fs = std::filesystem;
using json = nlohmann::json;

RetrievalEngine::RetrievalEngine(RetrievalConfig config)
    : RetrievalEngine(std::move(config), nullptr, nullptr) {}

RetrievalEngine::RetrievalEngine(RetrievalConfig config,
                                 std::unique_ptr<EmbeddingProvider> provider,
                                 std::unique_ptr<IndexBackend> backend)
    : config_(std::move(config)), provider_(std::move(provider)), backend_(std::move(backend)) {
    config_.validate();

    if (!provider_) {
        provider_ = create_embedding_provider(config_);
    }
    provider_name_ = provider_->name();
    size_t dim = provider_->dimension();
    if (dim == 0) {
        throw ConfigurationError("Embedding provider '" + provider_name_ + "' reports dimension 0");
    }

    if (!backend_) {
        auto selection = create_index_backend(config_.index_backend, dim);
        backend_ = std::move(selection.backend);
        exact_degraded_ = selection.degraded;
    } else if (backend_->dimension() != dim) {
        throw ConfigurationError("Index backend dimension " + std::to_string(backend_->dimension()) +
                                 " does not match embedding dimension " + std::to_string(dim) +
                                 " of provider '" + provider_name_ + "'");
    } else if (backend_->count() != 0) {
        throw ConfigurationError("Index backend must be empty when handed to the engine");
    }

    load_from_disk();

    spdlog::info("Retrieval engine ready: embedder={} dim={} index={}{} documents={}",
                 provider_name_, dim, to_string(backend_->kind()),
                 exact_degraded_ ? " (degraded from exact)" : "", store_.size());
}

void RetrievalEngine::load_from_disk() {
    const std::string index_file = config_.index_file();
    if (!fs::exists(index_file)) return;

    spdlog::info("📂 Loading index from {}", index_file);
    size_t loaded_dim = backend_->load(index_file);
    if (loaded_dim != provider_->dimension()) {
        throw ConfigurationError(
            "Index dimension " + std::to_string(loaded_dim) + " does not match embedding dimension " +
            std::to_string(provider_->dimension()) + " for index at '" + index_file +
            "'. If you changed LOCAL_EMBEDDING_DIM or EMBEDDING_MODEL, delete or rebuild this index file, "
            "or restore the embedding configuration it was built with.");
    }

    store_.load(config_.documents_file());
    if (store_.size() != backend_->count()) {
        throw ConfigurationError("Documents file '" + config_.documents_file() + "' holds " +
                                 std::to_string(store_.size()) + " documents but index '" + index_file +
                                 "' holds " + std::to_string(backend_->count()) + " vectors. Rebuild the index.");
    }
}

std::vector<std::vector<float>> RetrievalEngine::encode_checked(const std::vector<std::string>& texts) {
    auto vectors = provider_->encode(texts);
    if (vectors.size() != texts.size()) {
        throw BackendError("Embedder '" + provider_name_ + "' returned " + std::to_string(vectors.size()) +
                           " vectors for " + std::to_string(texts.size()) + " texts");
    }
    for (const auto& v : vectors) {
        if (v.size() != provider_->dimension()) {
            throw BackendError("Embedder '" + provider_name_ + "' returned a vector of length " +
                               std::to_string(v.size()) + ", expected " +
                               std::to_string(provider_->dimension()));
        }
    }
    return vectors;
}

void RetrievalEngine::add(const std::vector<std::string>& documents, const std::vector<json>& metadata) {
    if (documents.empty()) return;

    // Staged records are dropped again if anything below throws.
    auto pending = store_.stage(documents, metadata);

    auto vectors = encode_checked(documents);

    size_t before = backend_->count();
    try {
        backend_->add(vectors);
    } catch (...) {
        if (backend_->count() != before) {
            spdlog::error("❌ Index backend holds {} vectors after a failed add (expected {})",
                          backend_->count(), before);
        }
        throw;
    }
    pending.commit();

    spdlog::info("✅ Added {} documents. Total: {}", documents.size(), store_.size());
}

std::vector<SearchResult> RetrievalEngine::search(const std::string& query, size_t top_k) {
    if (store_.empty()) return {};
    if (top_k == 0) {
        throw ValidationError("top_k", "top_k must be a positive integer");
    }

    auto start = std::chrono::steady_clock::now();

    size_t k = std::min(top_k, store_.size());
    auto query_vector = encode_checked(std::vector<std::string>{query});
    auto neighbors = backend_->search(query_vector.front(), k);

    std::vector<SearchResult> results;
    results.reserve(neighbors.size());
    for (const auto& n : neighbors) {
        if (n.position >= store_.size()) {
            throw BackendError("Index returned position " + std::to_string(n.position) +
                               " but only " + std::to_string(store_.size()) + " documents are stored");
        }
        const auto& rec = store_.at(n.position);
        results.push_back({rec.text, n.distance, rec.metadata});
    }

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    spdlog::debug("⏱️ Search top_k={} returned {} results in {:.2f} ms", k, results.size(), duration);
    return results;
}

void RetrievalEngine::save() const {
    fs::path base(config_.index_path);
    if (base.has_parent_path()) {
        fs::create_directories(base.parent_path());
    }

    backend_->save(config_.index_file());
    store_.save(config_.documents_file());
    spdlog::info("💾 Saved {} documents to {}", store_.size(), config_.index_file());
}

void RetrievalEngine::clear() {
    store_.clear();
    backend_->reset();
    spdlog::info("Cleared index (dim={})", backend_->dimension());
}

std::vector<float> RetrievalEngine::get_embedding(const std::string& text) {
    return encode_checked(std::vector<std::string>{text}).front();
}

std::vector<std::vector<float>> RetrievalEngine::get_embeddings(const std::vector<std::string>& texts) {
    if (texts.empty()) return {};
    return encode_checked(texts);
}

std::string RetrievalEngine::build_context(const std::vector<SearchResult>& results, size_t max_chars) const {
    std::string context;

    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        std::string entry = fmt::format("[{}] (distance {:.4f})\n{}", i + 1, r.distance, r.text);
        if (r.metadata.is_object() && r.metadata.contains("source") && r.metadata["source"].is_string()) {
            entry += "\nsource: " + r.metadata["source"].get<std::string>();
        }

        std::string separator = context.empty() ? "" : "\n\n";
        if (context.size() + separator.size() + entry.size() > max_chars) {
            break;
        }
        context += separator + entry;
    }
    return context;
}

json RetrievalEngine::results_to_json(const std::vector<SearchResult>& results) {
    json out = json::array();
    for (const auto& r : results) {
        out.push_back({{"document", r.text}, {"score", r.distance}, {"metadata", r.metadata}});
    }
    return out;
}

} // namespace ragcore
