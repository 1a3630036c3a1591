#include "index_backend.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace ragcore {

namespace fs = std::filesystem;

namespace {

// File layout (host byte order):
//   char[8]  magic "RAGLIN01"
//   uint32   dimension
//   uint64   count
//   float    data[count * dimension]
constexpr char kLinearMagic[8] = {'R', 'A', 'G', 'L', 'I', 'N', '0', '1'};
constexpr uint64_t kHeaderBytes = sizeof(kLinearMagic) + sizeof(uint32_t) + sizeof(uint64_t);

bool all_finite(const std::vector<float>& v) {
    return std::all_of(v.begin(), v.end(), [](float x) { return std::isfinite(x); });
}

} // namespace

float squared_l2(const float* a, const float* b, size_t dimension) {
    float sum = 0.0f;
    for (size_t i = 0; i < dimension; ++i) {
        float d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

LinearIndex::LinearIndex(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw ConfigurationError("Index dimension must be positive");
    }
}

void LinearIndex::add(const std::vector<std::vector<float>>& vectors) {
    if (vectors.empty()) return;

    for (const auto& v : vectors) {
        if (v.size() != dimension_) {
            throw BackendError("Cannot add vector of length " + std::to_string(v.size()) +
                               " to linear index of dimension " + std::to_string(dimension_));
        }
        if (!all_finite(v)) {
            throw BackendError("Cannot add vector with NaN or infinite components to linear index");
        }
    }

    data_.reserve(data_.size() + vectors.size() * dimension_);
    for (const auto& v : vectors) {
        data_.insert(data_.end(), v.begin(), v.end());
    }
    count_ += vectors.size();
    spdlog::debug("Added {} vectors to linear index. Total: {}", vectors.size(), count_);
}

std::vector<Neighbor> LinearIndex::search(const std::vector<float>& query, size_t k) const {
    if (count_ == 0 || k == 0) return {};
    if (query.size() != dimension_) {
        throw BackendError("Query vector has length " + std::to_string(query.size()) +
                           ", index dimension is " + std::to_string(dimension_));
    }
    if (!all_finite(query)) {
        throw BackendError("Query vector has NaN or infinite components");
    }

    std::vector<Neighbor> all;
    all.reserve(count_);
    for (size_t i = 0; i < count_; ++i) {
        all.push_back({i, squared_l2(query.data(), data_.data() + i * dimension_, dimension_)});
    }

    k = std::min(k, count_);
    // Equal distances keep insertion order.
    std::partial_sort(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(k), all.end(),
                      [](const Neighbor& a, const Neighbor& b) {
                          if (a.distance != b.distance) return a.distance < b.distance;
                          return a.position < b.position;
                      });
    all.resize(k);
    return all;
}

void LinearIndex::save(const std::string& path) const {
    fs::path target(path);
    fs::path tmp = target;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw BackendError("Cannot open " + tmp.string() + " for writing");
        }
        uint32_t dim = static_cast<uint32_t>(dimension_);
        uint64_t count = static_cast<uint64_t>(count_);
        out.write(kLinearMagic, sizeof(kLinearMagic));
        out.write(reinterpret_cast<const char*>(&dim), sizeof(dim));
        out.write(reinterpret_cast<const char*>(&count), sizeof(count));
        out.write(reinterpret_cast<const char*>(data_.data()),
                  static_cast<std::streamsize>(data_.size() * sizeof(float)));
        if (!out) {
            throw BackendError("Failed writing linear index to " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        throw BackendError("Cannot move " + tmp.string() + " to " + target.string() + ": " + ec.message());
    }
}

size_t LinearIndex::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConfigurationError("Cannot open linear index file " + path);
    }

    char magic[sizeof(kLinearMagic)] = {};
    in.read(magic, sizeof(magic));
    if (!in || std::memcmp(magic, kLinearMagic, sizeof(kLinearMagic)) != 0) {
        throw ConfigurationError("Index file " + path + " is not a linear index "
                                 "(was it written by the exact backend?)");
    }

    uint32_t dim = 0;
    uint64_t count = 0;
    in.read(reinterpret_cast<char*>(&dim), sizeof(dim));
    in.read(reinterpret_cast<char*>(&count), sizeof(count));
    if (!in || dim == 0) {
        throw ConfigurationError("Index file " + path + " has a corrupt header");
    }

    std::error_code ec;
    uint64_t file_bytes = fs::file_size(path, ec);
    if (ec || file_bytes < kHeaderBytes) {
        throw ConfigurationError("Cannot determine size of index file " + path);
    }
    const uint64_t row_bytes = static_cast<uint64_t>(dim) * sizeof(float);
    const uint64_t payload_bytes = file_bytes - kHeaderBytes;
    if (count > payload_bytes / row_bytes) {
        throw ConfigurationError("Index file " + path + " is truncated: header claims " +
                                 std::to_string(count) + " vectors of dimension " + std::to_string(dim) +
                                 " but only " + std::to_string(payload_bytes) + " data bytes follow");
    }
    if (count * row_bytes != payload_bytes) {
        throw ConfigurationError("Index file " + path + " has " +
                                 std::to_string(payload_bytes - count * row_bytes) + " trailing bytes");
    }

    std::vector<float> data(static_cast<size_t>(count) * dim);
    in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size() * sizeof(float)));
    if (!in) {
        throw ConfigurationError("Index file " + path + " is truncated: expected " +
                                 std::to_string(count) + " vectors of dimension " + std::to_string(dim));
    }

    dimension_ = dim;
    count_ = static_cast<size_t>(count);
    data_ = std::move(data);
    spdlog::info("✅ Loaded linear index with {} vectors (dim={}) from {}", count_, dimension_, path);
    return dimension_;
}

void LinearIndex::reset() {
    data_.clear();
    data_.shrink_to_fit();
    count_ = 0;
}

} // namespace ragcore
