#include <catch2/catch.hpp>

#include "util/blake2b.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

using ragcore::util::Blake2b;

namespace {

std::string hex(const std::vector<uint8_t>& bytes) {
    std::string out;
    char buf[3];
    for (auto b : bytes) {
        std::snprintf(buf, sizeof(buf), "%02x", b);
        out += buf;
    }
    return out;
}

} // namespace

TEST_CASE("BLAKE2b 8-byte digests match known answers", "[blake2b]")
{
    REQUIRE(hex(Blake2b::digest("", 8)) == "e4a6a0577479b2b4");
    REQUIRE(hex(Blake2b::digest("abc", 8)) == "d8bb14d833d59559");
    REQUIRE(hex(Blake2b::digest("python", 8)) == "a8b6986e9ee1c8b1");
}

TEST_CASE("BLAKE2b full-length digest matches RFC 7693", "[blake2b]")
{
    REQUIRE(hex(Blake2b::digest("abc", 64)) ==
            "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
            "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923");
}

TEST_CASE("BLAKE2b handles block boundaries", "[blake2b]")
{
    REQUIRE(hex(Blake2b::digest(std::string(128, 'x'), 8)) == "901ce374e8e12402");
    REQUIRE(hex(Blake2b::digest(std::string(129, 'x'), 8)) == "18de14b9d8eea5a3");
    REQUIRE(hex(Blake2b::digest(std::string(300, 'y'), 32)) ==
            "4a893856fb2eca42d93b23e485646bc5d4a11b5d2c64aac39e2f23f399c0a54e");
}

TEST_CASE("BLAKE2b incremental updates equal one-shot", "[blake2b]")
{
    std::string data(300, 'y');
    Blake2b hasher(32);
    hasher.update(data.data(), 7);
    hasher.update(data.data() + 7, 121);
    hasher.update(data.data() + 128, 172);
    REQUIRE(hasher.final() == Blake2b::digest(data, 32));
}

TEST_CASE("BLAKE2b rejects invalid digest lengths", "[blake2b]")
{
    REQUIRE_THROWS_AS(Blake2b(0), std::invalid_argument);
    REQUIRE_THROWS_AS(Blake2b(65), std::invalid_argument);
}

TEST_CASE("BLAKE2b refuses to be reused after final", "[blake2b]")
{
    Blake2b hasher(8);
    hasher.update("abc", 3);
    REQUIRE(hex(hasher.final()) == "d8bb14d833d59559");
    REQUIRE_THROWS_AS(hasher.final(), std::logic_error);
    REQUIRE_THROWS_AS(hasher.update("x", 1), std::logic_error);
}
