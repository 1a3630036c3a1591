#include <catch2/catch.hpp>

#include "errors.hpp"
#include "retrieval_engine.hpp"
#include "test_util.hpp"

#include <filesystem>
#include <fstream>

using namespace ragcore;
using json = nlohmann::json;
using ragcore::test::TempDir;
using ragcore::test::hashed_config;

namespace {

const std::vector<std::string> kDocs = {
    "Python is a programming language",
    "Java is used for enterprise applications",
    "JavaScript runs in web browsers",
    "Machine learning models predict patterns",
};

} // namespace

TEST_CASE("Saved index reproduces search results after reload", "[persistence]")
{
    for (auto kind : {IndexKind::Exact, IndexKind::Linear}) {
        TempDir dir;
        auto cfg = hashed_config(dir, 384, kind);

        std::vector<SearchResult> before;
        {
            RetrievalEngine engine(cfg);
            engine.add(kDocs, {json{{"lang", "py"}}, json{{"lang", "java"}}, json{{"lang", "js"}}, json::object()});
            engine.save();
            before = engine.search("programming languages", 4);
        }

        RetrievalEngine reloaded(cfg);
        REQUIRE(reloaded.document_count() == kDocs.size());
        REQUIRE(reloaded.state() == IndexState::Populated);

        auto after = reloaded.search("programming languages", 4);
        REQUIRE(after.size() == before.size());
        for (size_t i = 0; i < before.size(); ++i) {
            REQUIRE(after[i].text == before[i].text);
            REQUIRE(after[i].distance == before[i].distance);
            REQUIRE(after[i].metadata == before[i].metadata);
        }

        // The reloaded engine keeps growing from where it left off.
        reloaded.add({"Rust guarantees memory safety"});
        auto rust = reloaded.search("Rust guarantees memory safety", 1);
        REQUIRE(rust.size() == 1);
        REQUIRE(rust[0].text == "Rust guarantees memory safety");
    }
}

TEST_CASE("Save creates missing parent directories", "[persistence]")
{
    TempDir dir;
    auto cfg = hashed_config(dir, 16);
    cfg.index_path = (dir.path() / "deeply" / "nested" / "store" / "faiss_index").string();

    RetrievalEngine engine(cfg);
    engine.add({"one document"});
    engine.save();

    REQUIRE(std::filesystem::exists(cfg.index_file()));
    REQUIRE(std::filesystem::exists(cfg.documents_file()));
}

TEST_CASE("Dimension mismatch with a persisted index fails construction", "[persistence][config]")
{
    TempDir dir;
    {
        RetrievalEngine engine(hashed_config(dir, 384));
        engine.add({"built with 384 dimensions"});
        engine.save();
    }

    try {
        RetrievalEngine engine(hashed_config(dir, 256));
        FAIL("expected ConfigurationError");
    } catch (const ConfigurationError& e) {
        std::string message = e.what();
        REQUIRE(message.find("384") != std::string::npos);
        REQUIRE(message.find("256") != std::string::npos);
        REQUIRE(message.find("faiss_index.index") != std::string::npos);
    }
}

TEST_CASE("An index without its documents file is rejected", "[persistence]")
{
    TempDir dir;
    auto cfg = hashed_config(dir, 32, IndexKind::Linear);
    {
        RetrievalEngine engine(cfg);
        engine.add({"a", "b"});
        engine.save();
    }

    std::filesystem::remove(cfg.documents_file());
    REQUIRE_THROWS_AS(RetrievalEngine(cfg), ConfigurationError);
}

TEST_CASE("Documents and vectors out of step are rejected", "[persistence]")
{
    TempDir dir;
    auto cfg = hashed_config(dir, 32, IndexKind::Linear);
    {
        RetrievalEngine engine(cfg);
        engine.add({"a", "b"});
        engine.save();
    }
    {
        std::ofstream out(cfg.documents_file(), std::ios::trunc);
        out << R"({"version": 1, "documents": [{"text": "a", "metadata": {}}]})";
    }
    REQUIRE_THROWS_AS(RetrievalEngine(cfg), ConfigurationError);
}

TEST_CASE("Clear followed by save persists the empty index", "[persistence]")
{
    TempDir dir;
    auto cfg = hashed_config(dir, 32);
    {
        RetrievalEngine engine(cfg);
        engine.add({"a", "b", "c"});
        engine.save();
        engine.clear();
    }
    {
        // clear() alone leaves the saved state untouched.
        RetrievalEngine engine(cfg);
        REQUIRE(engine.document_count() == 3);
        engine.clear();
        engine.save();
    }
    RetrievalEngine engine(cfg);
    REQUIRE(engine.document_count() == 0);
    REQUIRE(engine.search("a", 3).empty());
}

TEST_CASE("An index written by the linear backend is not read as FAISS", "[persistence][exact]")
{
    if (!exact_index_available()) {
        WARN("Built without FAISS; exact requests load linear files");
        return;
    }

    TempDir dir;
    {
        RetrievalEngine engine(hashed_config(dir, 16, IndexKind::Linear));
        engine.add({"linear only"});
        engine.save();
    }
    REQUIRE_THROWS_AS(RetrievalEngine(hashed_config(dir, 16, IndexKind::Exact)), ConfigurationError);
}
