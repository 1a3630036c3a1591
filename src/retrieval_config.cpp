#include "retrieval_config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace ragcore {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool env_flag(const char* value) {
    std::string v = lowercase(value);
    return v == "true" || v == "1" || v == "yes";
}

size_t parse_dimension(const std::string& raw, const std::string& source) {
    long long parsed = 0;
    size_t consumed = 0;
    try {
        parsed = std::stoll(raw, &consumed);
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid " + source + " '" + raw + "'; must be an integer.");
    }
    if (consumed != raw.size()) {
        throw ConfigurationError("Invalid " + source + " '" + raw + "'; must be an integer.");
    }
    if (parsed <= 0) {
        throw ConfigurationError("Invalid " + source + " " + std::to_string(parsed) +
                                 "; must be a positive integer.");
    }
    return static_cast<size_t>(parsed);
}

} // namespace

std::string to_string(EmbeddingBackend backend) {
    return backend == EmbeddingBackend::Semantic ? "semantic" : "hashed";
}

std::string to_string(IndexKind kind) {
    return kind == IndexKind::Exact ? "exact" : "linear";
}

EmbeddingBackend parse_embedding_backend(const std::string& name) {
    std::string n = lowercase(name);
    if (n == "semantic") return EmbeddingBackend::Semantic;
    if (n == "hashed" || n == "local") return EmbeddingBackend::Hashed;
    throw ConfigurationError("Unknown embedding backend '" + name + "' (expected 'semantic' or 'hashed')");
}

IndexKind parse_index_kind(const std::string& name) {
    std::string n = lowercase(name);
    if (n == "exact" || n == "faiss") return IndexKind::Exact;
    if (n == "linear") return IndexKind::Linear;
    throw ConfigurationError("Unknown index backend '" + name + "' (expected 'exact' or 'linear')");
}

RetrievalConfig RetrievalConfig::load(const fs::path& path) {
    RetrievalConfig cfg;
    if (!fs::exists(path)) {
        spdlog::debug("Config file {} not found, using defaults", path.string());
        return cfg;
    }

    std::ifstream f(path);
    if (!f) {
        throw ConfigurationError("Cannot open config file " + path.string());
    }

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Config file " + path.string() + " is not valid JSON: " + e.what());
    }

    try {
        cfg.apply_json(j);
    } catch (const json::exception& e) {
        throw ConfigurationError("Config file " + path.string() + ": " + e.what());
    }
    return cfg;
}

void RetrievalConfig::apply_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("Config root must be a JSON object");
    }
    if (j.contains("embedding_backend")) {
        embedding_backend = parse_embedding_backend(j["embedding_backend"].get<std::string>());
    }
    if (j.contains("embedding_model")) embedding_model = j["embedding_model"].get<std::string>();
    if (j.contains("embedding_endpoint")) embedding_endpoint = j["embedding_endpoint"].get<std::string>();
    if (j.contains("local_embedding_dim")) {
        const auto& dim = j["local_embedding_dim"];
        if (dim.is_number_integer()) {
            local_embedding_dim = parse_dimension(std::to_string(dim.get<long long>()), "local_embedding_dim");
        } else if (dim.is_string()) {
            local_embedding_dim = parse_dimension(dim.get<std::string>(), "local_embedding_dim");
        } else {
            throw ConfigurationError("Invalid local_embedding_dim " + dim.dump() + "; must be an integer.");
        }
    }
    if (j.contains("index_path")) index_path = j["index_path"].get<std::string>();
    if (j.contains("index_backend")) {
        index_backend = parse_index_kind(j["index_backend"].get<std::string>());
    }
}

void RetrievalConfig::apply_env() {
    if (const char* v = std::getenv("USE_LOCAL_EMBEDDINGS")) {
        embedding_backend = env_flag(v) ? EmbeddingBackend::Hashed : EmbeddingBackend::Semantic;
    }
    if (const char* v = std::getenv("RAGCORE_EMBEDDING_BACKEND")) {
        embedding_backend = parse_embedding_backend(v);
    }
    if (const char* v = std::getenv("EMBEDDING_MODEL")) embedding_model = v;
    if (const char* v = std::getenv("EMBEDDING_ENDPOINT")) embedding_endpoint = v;
    if (const char* v = std::getenv("LOCAL_EMBEDDING_DIM")) {
        local_embedding_dim = parse_dimension(v, "LOCAL_EMBEDDING_DIM");
    }
    if (const char* v = std::getenv("FAISS_INDEX_PATH")) index_path = v;
    if (const char* v = std::getenv("USE_FAISS")) {
        index_backend = env_flag(v) ? IndexKind::Exact : IndexKind::Linear;
    }
    if (const char* v = std::getenv("RAGCORE_INDEX_BACKEND")) {
        index_backend = parse_index_kind(v);
    }
}

void RetrievalConfig::validate() const {
    if (embedding_backend == EmbeddingBackend::Hashed && local_embedding_dim == 0) {
        throw ConfigurationError("local_embedding_dim must be a positive integer");
    }
    if (embedding_backend == EmbeddingBackend::Semantic) {
        if (embedding_model.empty()) {
            throw ConfigurationError("embedding_model is required for the semantic embedding backend");
        }
        if (embedding_endpoint.empty()) {
            throw ConfigurationError("embedding_endpoint is required for the semantic embedding backend");
        }
    }
    if (index_path.empty()) {
        throw ConfigurationError("index_path must not be empty");
    }
}

json RetrievalConfig::to_json() const {
    return {
        {"embedding_backend", to_string(embedding_backend)},
        {"embedding_model", embedding_model},
        {"embedding_endpoint", embedding_endpoint},
        {"local_embedding_dim", local_embedding_dim},
        {"index_path", index_path},
        {"index_backend", to_string(index_backend)}
    };
}

} // namespace ragcore
