#include "embedding_provider.hpp"
#include "errors.hpp"
#include "retrieval_config.hpp"

namespace ragcore {

#ifndef RAGCORE_HAVE_CPR
bool semantic_embeddings_available() {
    return false;
}

std::unique_ptr<EmbeddingProvider> create_semantic_provider(const std::string& model,
                                                            const std::string& endpoint) {
    throw ConfigurationError("Semantic embedding backend is not available in this build (built without cpr); "
                             "cannot load model '" + model + "' from " + endpoint +
                             ". Set USE_LOCAL_EMBEDDINGS=true to use hashed embeddings.");
}
#endif

std::unique_ptr<EmbeddingProvider> create_embedding_provider(const RetrievalConfig& config) {
    switch (config.embedding_backend) {
    case EmbeddingBackend::Hashed:
        return std::make_unique<HashedEmbeddingProvider>(config.local_embedding_dim);
    case EmbeddingBackend::Semantic:
        return create_semantic_provider(config.embedding_model, config.embedding_endpoint);
    }
    throw ConfigurationError("Unknown embedding backend");
}

} // namespace ragcore
