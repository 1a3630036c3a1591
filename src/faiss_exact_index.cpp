#include "faiss_exact_index.hpp"
#include "errors.hpp"
#include <algorithm>
#include <filesystem>
#include <faiss/IndexFlat.h>
#include <faiss/index_io.h>
#include <faiss/impl/FaissException.h>
#include <spdlog/spdlog.h>

namespace ragcore {

FaissExactIndex::FaissExactIndex(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw ConfigurationError("Index dimension must be positive");
    }
    index_ = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dimension_));
}

FaissExactIndex::~FaissExactIndex() {
}

size_t FaissExactIndex::count() const {
    return static_cast<size_t>(index_->ntotal);
}

void FaissExactIndex::add(const std::vector<std::vector<float>>& vectors) {
    if (vectors.empty()) return;

    std::vector<float> vectors_flat;
    vectors_flat.reserve(vectors.size() * dimension_);
    for (const auto& v : vectors) {
        if (v.size() != dimension_) {
            throw BackendError("Cannot add vector of length " + std::to_string(v.size()) +
                               " to FAISS index of dimension " + std::to_string(dimension_));
        }
        vectors_flat.insert(vectors_flat.end(), v.begin(), v.end());
    }

    // FaissException propagates as-is; IndexFlat::add is all-or-nothing.
    index_->add(static_cast<faiss::idx_t>(vectors.size()), vectors_flat.data());

    spdlog::debug("Added {} vectors to FAISS. Total: {}", vectors.size(), index_->ntotal);
}

std::vector<Neighbor> FaissExactIndex::search(const std::vector<float>& query, size_t k) const {
    if (index_->ntotal == 0 || k == 0) return {};
    if (query.size() != dimension_) {
        throw BackendError("Query vector has length " + std::to_string(query.size()) +
                           ", index dimension is " + std::to_string(dimension_));
    }

    k = std::min(k, count());
    std::vector<float> distances(k);
    std::vector<faiss::idx_t> labels(k);

    index_->search(1, query.data(), static_cast<faiss::idx_t>(k), distances.data(), labels.data());

    std::vector<Neighbor> results;
    results.reserve(k);
    for (size_t i = 0; i < k; ++i) {
        if (labels[i] < 0) continue;
        results.push_back({static_cast<size_t>(labels[i]), distances[i]});
    }
    return results;
}

void FaissExactIndex::save(const std::string& path) const {
    const std::string tmp = path + ".tmp";
    try {
        faiss::write_index(index_.get(), tmp.c_str());
    } catch (const faiss::FaissException& e) {
        throw BackendError("Failed writing FAISS index to " + tmp + ": " + e.what());
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        throw BackendError("Cannot move " + tmp + " to " + path + ": " + ec.message());
    }
}

size_t FaissExactIndex::load(const std::string& path) {
    std::unique_ptr<faiss::Index> loaded;
    try {
        loaded.reset(faiss::read_index(path.c_str()));
    } catch (const faiss::FaissException& e) {
        throw ConfigurationError("Cannot read FAISS index file " + path +
                                 " (was it written by the linear backend?): " + e.what());
    }

    auto* flat = dynamic_cast<faiss::IndexFlatL2*>(loaded.get());
    if (!flat) {
        throw ConfigurationError("FAISS index file " + path + " is not a flat L2 index");
    }

    index_ = std::move(loaded);
    dimension_ = static_cast<size_t>(index_->d);
    spdlog::info("✅ Loaded FAISS index with {} vectors (dim={}) from {}", index_->ntotal, dimension_, path);
    return dimension_;
}

void FaissExactIndex::reset() {
    index_ = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dimension_));
}

} // namespace ragcore
