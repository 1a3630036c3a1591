#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "retrieval_config.hpp"
#include "retrieval_engine.hpp"

using json = nlohmann::json;

namespace {

struct CliOptions {
    std::optional<std::string> config_path;
    bool verbose = false;
    size_t top_k = 5;
    size_t max_chars = 12000;
    std::string command;
    std::vector<std::string> args;
};

void print_usage() {
    std::cerr <<
        "Usage: ragcore [--config FILE] [--verbose] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  add <file.json>                       index {\"documents\": [...], \"metadata\": [...]}\n"
        "  search <query> [--top-k N]            print nearest documents as JSON\n"
        "  context <query> [--top-k N] [--max-chars N]\n"
        "                                        print the assembled prompt context\n"
        "  clear                                 empty the index and save it\n"
        "  info                                  print backend and index status\n"
        "\n"
        "Environment: USE_LOCAL_EMBEDDINGS, EMBEDDING_MODEL, EMBEDDING_ENDPOINT,\n"
        "             LOCAL_EMBEDDING_DIM, FAISS_INDEX_PATH, USE_FAISS\n";
}

size_t parse_count(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        long long n = std::stoll(value, &consumed);
        if (consumed == value.size() && n > 0) return static_cast<size_t>(n);
    } catch (const std::exception&) {
    }
    throw ragcore::ValidationError(flag, flag + " expects a positive integer, got '" + value + "'");
}

// Returns nullopt on a usage error.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "--config") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.config_path = *v;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--top-k") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.top_k = parse_count("--top-k", *v);
        } else if (arg == "--max-chars") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.max_chars = parse_count("--max-chars", *v);
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }
    if (opts.command.empty()) return std::nullopt;
    return opts;
}

void load_documents_file(const std::string& path,
                         std::vector<std::string>& documents,
                         std::vector<json>& metadata) {
    std::ifstream f(path);
    if (!f) {
        throw ragcore::ValidationError("documents", "Cannot open documents file " + path);
    }

    json body;
    try {
        body = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ragcore::ValidationError("documents", "Documents file " + path + " is not valid JSON: " + e.what());
    }

    const json* docs = &body;
    if (body.is_object()) {
        if (!body.contains("documents")) {
            throw ragcore::ValidationError("documents", "Missing required field 'documents' in " + path);
        }
        docs = &body["documents"];
        if (body.contains("metadata") && !body["metadata"].is_null()) {
            if (!body["metadata"].is_array()) {
                throw ragcore::ValidationError("metadata", "'metadata' must be an array in " + path);
            }
            for (const auto& m : body["metadata"]) metadata.push_back(m);
        }
    }

    if (!docs->is_array()) {
        throw ragcore::ValidationError("documents", "'documents' must be an array of strings in " + path);
    }
    for (const auto& d : *docs) {
        if (!d.is_string()) {
            throw ragcore::ValidationError("documents", "'documents' must be an array of strings in " + path);
        }
        documents.push_back(d.get<std::string>());
    }
}

int run_command(const CliOptions& opts) {
    ragcore::RetrievalConfig config = opts.config_path
        ? ragcore::RetrievalConfig::load(*opts.config_path)
        : ragcore::RetrievalConfig{};
    config.apply_env();

    ragcore::RetrievalEngine engine(config);

    if (opts.command == "add") {
        if (opts.args.size() != 1) return 2;
        std::vector<std::string> documents;
        std::vector<json> metadata;
        load_documents_file(opts.args[0], documents, metadata);
        engine.add(documents, metadata);
        engine.save();
        std::cout << json{{"status", "added"}, {"count", documents.size()},
                          {"total", engine.document_count()}}.dump() << "\n";
        return 0;
    }

    if (opts.command == "search" || opts.command == "context") {
        if (opts.args.empty()) return 2;
        std::string query;
        for (const auto& a : opts.args) {
            if (!query.empty()) query += ' ';
            query += a;
        }
        auto results = engine.search(query, opts.top_k);
        if (opts.command == "search") {
            std::cout << json{{"query", query},
                              {"results", ragcore::RetrievalEngine::results_to_json(results)}}.dump(2) << "\n";
        } else {
            std::cout << engine.build_context(results, opts.max_chars) << "\n";
        }
        return 0;
    }

    if (opts.command == "clear") {
        engine.clear();
        engine.save();
        std::cout << json{{"status", "cleared"}}.dump() << "\n";
        return 0;
    }

    if (opts.command == "info") {
        json info = {
            {"embedder", engine.provider_name()},
            {"dimension", engine.dimension()},
            {"index_backend", ragcore::to_string(engine.index_kind())},
            {"exact_index_degraded", engine.exact_index_degraded()},
            {"documents", engine.document_count()},
            {"state", engine.state() == ragcore::IndexState::Empty ? "empty" : "populated"},
            {"config", engine.config().to_json()}
        };
        std::cout << info.dump(2) << "\n";
        return 0;
    }

    spdlog::error("Unknown command '{}'", opts.command);
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("ragcore"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::optional<CliOptions> opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const ragcore::ValidationError& e) {
        spdlog::error("{}", e.what());
        return 2;
    }
    if (!opts) {
        print_usage();
        return 2;
    }
    if (opts->verbose) spdlog::set_level(spdlog::level::debug);

    try {
        int rc = run_command(*opts);
        if (rc == 2) print_usage();
        return rc;
    } catch (const ragcore::ConfigurationError& e) {
        spdlog::error("❌ Configuration error: {}", e.what());
    } catch (const ragcore::ValidationError& e) {
        spdlog::error("❌ Invalid {}: {}", e.field(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("❌ {}", e.what());
    }
    return 1;
}
