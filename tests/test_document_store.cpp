#include <catch2/catch.hpp>

#include "document_store.hpp"
#include "errors.hpp"
#include "test_util.hpp"

#include <fstream>

using namespace ragcore;
using json = nlohmann::json;
using ragcore::test::TempDir;

TEST_CASE("Committed appends keep positions aligned", "[store]")
{
    DocumentStore store;
    {
        auto pending = store.stage({"first", "second"}, {});
        pending.commit();
    }
    {
        auto pending = store.stage({"third"}, {json{{"source", "c.txt"}}});
        REQUIRE(pending.first_position() == 2);
        pending.commit();
    }

    REQUIRE(store.size() == 3);
    for (size_t i = 0; i < store.size(); ++i) {
        REQUIRE(store.at(i).position == i);
    }
    REQUIRE(store.at(0).metadata == json::object());
    REQUIRE(store.at(2).metadata["source"] == "c.txt");
}

TEST_CASE("Uncommitted appends roll back", "[store]")
{
    DocumentStore store;
    store.stage({"kept"}, {}).commit();
    {
        auto pending = store.stage({"dropped-1", "dropped-2"}, {});
        REQUIRE(store.size() == 3);
    }
    REQUIRE(store.size() == 1);
    REQUIRE(store.at(0).text == "kept");
}

TEST_CASE("Metadata must match documents", "[store][validation]")
{
    DocumentStore store;

    try {
        store.stage({"a", "b"}, {json::object()});
        FAIL("expected ValidationError");
    } catch (const ValidationError& e) {
        REQUIRE(e.field() == "metadata");
    }
    REQUIRE_THROWS_AS(store.stage({"a"}, {json::array()}), ValidationError);
    REQUIRE(store.empty());

    // A null entry is treated as empty metadata.
    store.stage({"a"}, {json()}).commit();
    REQUIRE(store.at(0).metadata == json::object());
}

TEST_CASE("Lookups past the end throw", "[store]")
{
    DocumentStore store;
    store.stage({"only"}, {}).commit();
    REQUIRE_THROWS_AS(store.at(1), std::out_of_range);
}

TEST_CASE("Document store persists text and metadata", "[store][persistence]")
{
    TempDir dir;
    const std::string path = (dir.path() / "docs.json").string();

    DocumentStore store;
    store.stage({"alpha", "beta"}, {json{{"source", "a"}, {"page", 3}}, json::object()}).commit();
    store.save(path);

    DocumentStore restored;
    restored.load(path);
    REQUIRE(restored.size() == 2);
    REQUIRE(restored.at(0).text == "alpha");
    REQUIRE(restored.at(0).metadata["page"] == 3);
    REQUIRE(restored.at(1).position == 1);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    REQUIRE_THROWS_AS(restored.load(path), ConfigurationError);
    REQUIRE(restored.size() == 2);

    REQUIRE_THROWS_AS(restored.load((dir.path() / "missing.json").string()), ConfigurationError);
}
