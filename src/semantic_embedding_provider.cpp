#include "embedding_provider.hpp"
#include "embedding_cache.hpp"
#include "errors.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

namespace ragcore {

using json = nlohmann::json;

namespace {

const char* const kProbeText = "dimension probe";

// Client for an Ollama-compatible /api/embed endpoint:
//   POST {"model": m, "input": [..]} -> {"embeddings": [[..], ..]}
class SemanticEmbeddingProvider : public EmbeddingProvider {
public:
    SemanticEmbeddingProvider(std::string model, std::string endpoint)
        : model_(std::move(model)), endpoint_(std::move(endpoint)) {
        spdlog::info("Connecting to semantic embedding model '{}' at {}", model_, endpoint_);

        auto start = std::chrono::steady_clock::now();
        std::vector<std::vector<float>> probe;
        try {
            probe = request_embeddings({kProbeText});
        } catch (const BackendError& e) {
            throw ConfigurationError("Semantic embedding model '" + model_ + "' at " + endpoint_ +
                                     " is unusable: " + e.what() +
                                     ". Start the embedding server or set USE_LOCAL_EMBEDDINGS=true.");
        }
        if (probe.size() != 1 || probe.front().empty()) {
            throw ConfigurationError("Semantic embedding model '" + model_ + "' at " + endpoint_ +
                                     " returned no embedding for the probe request");
        }
        dimension_ = probe.front().size();
        cache_.put(model_, kProbeText, probe.front());

        double duration = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        spdlog::info("✅ Semantic embedder ready (dim={}, {:.1f} ms)", dimension_, duration);
    }

    std::vector<std::vector<float>> encode(const std::vector<std::string>& texts) override {
        std::vector<std::vector<float>> out(texts.size());
        std::vector<std::string> missing;
        std::vector<size_t> missing_slots;

        for (size_t i = 0; i < texts.size(); ++i) {
            if (auto cached = cache_.get(model_, texts[i])) {
                out[i] = std::move(*cached);
            } else {
                missing.push_back(texts[i]);
                missing_slots.push_back(i);
            }
        }
        if (missing.empty()) return out;
        spdlog::debug("Embedding cache: {} of {} texts cached, requesting {}",
                      texts.size() - missing.size(), texts.size(), missing.size());

        auto fresh = request_embeddings(missing);
        if (fresh.size() != missing.size()) {
            throw BackendError("Embedding server returned " + std::to_string(fresh.size()) +
                               " vectors for " + std::to_string(missing.size()) + " texts");
        }
        for (size_t i = 0; i < fresh.size(); ++i) {
            if (fresh[i].size() != dimension_) {
                throw BackendError("Embedding server returned a vector of length " +
                                   std::to_string(fresh[i].size()) + ", expected " +
                                   std::to_string(dimension_));
            }
            cache_.put(model_, missing[i], fresh[i]);
            out[missing_slots[i]] = std::move(fresh[i]);
        }
        return out;
    }

    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "semantic:" + model_; }

private:
    std::vector<std::vector<float>> request_embeddings(const std::vector<std::string>& texts) {
        std::string payload = json{{"model", model_}, {"input", texts}}
                                  .dump(-1, ' ', false, json::error_handler_t::replace);

        cpr::Response r = cpr::Post(cpr::Url{endpoint_},
                                    cpr::Body{payload},
                                    cpr::Header{{"Content-Type", "application/json"}});

        if (r.status_code == 0) {
            throw BackendError("Embedding request to " + endpoint_ + " failed: " + r.error.message);
        }
        if (r.status_code != 200) {
            spdlog::error("❌ Embedding API error [{}]: {}", r.status_code, r.text);
            throw BackendError("Embedding request to " + endpoint_ + " returned HTTP " +
                               std::to_string(r.status_code));
        }

        try {
            auto response_json = json::parse(r.text);
            if (!response_json.contains("embeddings")) {
                throw BackendError("Embedding response from " + endpoint_ + " has no 'embeddings' field");
            }
            return response_json["embeddings"].get<std::vector<std::vector<float>>>();
        } catch (const json::exception& e) {
            throw BackendError("Malformed embedding response from " + endpoint_ + ": " + e.what());
        }
    }

    std::string model_;
    std::string endpoint_;
    size_t dimension_ = 0;
    EmbeddingCache cache_;
};

} // namespace

bool semantic_embeddings_available() {
    return true;
}

std::unique_ptr<EmbeddingProvider> create_semantic_provider(const std::string& model,
                                                            const std::string& endpoint) {
    return std::make_unique<SemanticEmbeddingProvider>(model, endpoint);
}

} // namespace ragcore
