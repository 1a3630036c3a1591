#pragma once
#include "errors.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ragcore {

struct RetrievalConfig;

/**
 * @brief Turns text into fixed-dimension vectors.
 *
 * Implementations must be usable as soon as they are constructed; a backend
 * that cannot serve requests throws from its constructor.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * @brief Encodes a batch of texts.
     * @return One vector per input text, in input order, each of length dimension().
     */
    virtual std::vector<std::vector<float>> encode(const std::vector<std::string>& texts) = 0;

    std::vector<float> embed(const std::string& text) {
        auto out = encode(std::vector<std::string>{text});
        if (out.size() != 1) {
            throw BackendError(name() + " embedder returned " + std::to_string(out.size()) +
                               " vectors for 1 text");
        }
        return std::move(out.front());
    }

    virtual size_t dimension() const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Deterministic bag-of-hashed-tokens embedder.
 *
 * Development and offline fallback only: vectors are stable across runs and
 * machines but carry no semantic similarity beyond shared tokens.
 */
class HashedEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashedEmbeddingProvider(size_t dimension);

    std::vector<std::vector<float>> encode(const std::vector<std::string>& texts) override;

    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "hashed"; }

    std::vector<float> encode_one(const std::string& text) const;

private:
    size_t dimension_;
};

// Lowercased maximal runs of [a-z0-9_].
std::vector<std::string> tokenize_for_hashing(const std::string& text);

// True when this build can talk to a semantic embedding server.
bool semantic_embeddings_available();

std::unique_ptr<EmbeddingProvider> create_semantic_provider(const std::string& model,
                                                            const std::string& endpoint);

// Picks the provider named by the config. Throws ConfigurationError when the
// requested backend cannot be constructed.
std::unique_ptr<EmbeddingProvider> create_embedding_provider(const RetrievalConfig& config);

} // namespace ragcore
