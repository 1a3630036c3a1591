#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace ragcore {

enum class EmbeddingBackend {
    Semantic, // external model served over HTTP
    Hashed    // deterministic local fallback
};

enum class IndexKind {
    Exact,  // FAISS IndexFlatL2
    Linear  // brute-force scan
};

std::string to_string(EmbeddingBackend backend);
std::string to_string(IndexKind kind);
EmbeddingBackend parse_embedding_backend(const std::string& name);
IndexKind parse_index_kind(const std::string& name);

struct RetrievalConfig {
    EmbeddingBackend embedding_backend = EmbeddingBackend::Hashed;
    std::string embedding_model = "all-minilm";
    std::string embedding_endpoint = "http://localhost:11434/api/embed";
    size_t local_embedding_dim = 384;
    std::string index_path = "./data/faiss_index";
    IndexKind index_backend = IndexKind::Exact;

    /**
     * @brief Reads a JSON config file. A missing file yields the defaults.
     * @throws ConfigurationError if the file exists but is not valid JSON or
     *         holds a value of the wrong type.
     */
    static RetrievalConfig load(const std::filesystem::path& path);

    /**
     * @brief Overlays recognised environment variables on top of this config.
     *
     * USE_LOCAL_EMBEDDINGS, RAGCORE_EMBEDDING_BACKEND, EMBEDDING_MODEL,
     * EMBEDDING_ENDPOINT, LOCAL_EMBEDDING_DIM, FAISS_INDEX_PATH, USE_FAISS,
     * RAGCORE_INDEX_BACKEND.
     */
    void apply_env();

    void apply_json(const nlohmann::json& j);

    // Throws ConfigurationError on values no backend can accept.
    void validate() const;

    std::string index_file() const { return index_path + ".index"; }
    std::string documents_file() const { return index_path + ".docs.json"; }

    nlohmann::json to_json() const;
};

} // namespace ragcore
