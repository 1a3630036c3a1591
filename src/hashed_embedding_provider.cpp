#include "embedding_provider.hpp"
#include "errors.hpp"
#include "util/blake2b.hpp"
#include <cctype>
#include <cmath>
#include <spdlog/spdlog.h>

namespace ragcore {

namespace {

constexpr size_t kTokenDigestBytes = 8;

bool is_token_char(unsigned char c) {
    return std::isalnum(c) != 0 || c == '_';
}

} // namespace

std::vector<std::string> tokenize_for_hashing(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    };

    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            if (is_token_char(c)) {
                current.push_back(static_cast<char>(std::tolower(c)));
            } else {
                flush();
            }
            continue;
        }

        // Only two code points lowercase to ASCII letters under full Unicode
        // case mapping. U+212A KELVIN SIGN becomes 'k'. U+0130 becomes 'i'
        // followed by a combining dot, which ends the token.
        if (text.compare(i, 3, "\xE2\x84\xAA") == 0) {
            current.push_back('k');
            i += 2;
        } else if (text.compare(i, 2, "\xC4\xB0") == 0) {
            current.push_back('i');
            flush();
            i += 1;
        } else {
            // Any other non-ASCII byte separates tokens.
            flush();
        }
    }
    flush();
    return tokens;
}

HashedEmbeddingProvider::HashedEmbeddingProvider(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw ConfigurationError("Hashed embedding dimension must be a positive integer, got 0");
    }
    spdlog::warn("⚠️ Using hashed embeddings (dim={}). This is a deterministic, non-semantic fallback "
                 "for development/testing, not production-quality retrieval.", dimension_);
}

std::vector<float> HashedEmbeddingProvider::encode_one(const std::string& text) const {
    std::vector<float> vec(dimension_, 0.0f);

    auto tokens = tokenize_for_hashing(text);
    if (tokens.empty()) return vec;

    for (const auto& token : tokens) {
        auto digest = util::Blake2b::digest(token, kTokenDigestBytes);
        uint32_t bucket = static_cast<uint32_t>(digest[0]) |
                          (static_cast<uint32_t>(digest[1]) << 8) |
                          (static_cast<uint32_t>(digest[2]) << 16) |
                          (static_cast<uint32_t>(digest[3]) << 24);
        float sign = (digest[4] & 1) == 0 ? 1.0f : -1.0f;
        vec[bucket % dimension_] += sign;
    }

    double norm = 0.0;
    for (float v : vec) norm += static_cast<double>(v) * v;
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (auto& v : vec) v = static_cast<float>(v / norm);
    }
    return vec;
}

std::vector<std::vector<float>> HashedEmbeddingProvider::encode(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(encode_one(text));
    }
    return out;
}

} // namespace ragcore
