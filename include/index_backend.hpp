#pragma once

#include "retrieval_config.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace ragcore {

struct Neighbor {
    size_t position;  // insertion order within the index
    float distance;   // squared L2
};

/**
 * @brief Stores vectors and answers exact k-nearest queries.
 *
 * Positions are dense and assigned in insertion order starting at 0; there is
 * no per-vector removal, only reset().
 */
class IndexBackend {
public:
    virtual ~IndexBackend() = default;

    /**
     * @brief Appends vectors. Either all of them are added or none is.
     * @throws BackendError if a vector does not have dimension() entries.
     */
    virtual void add(const std::vector<std::vector<float>>& vectors) = 0;

    /**
     * @brief Returns up to k neighbours of query, nearest first.
     */
    virtual std::vector<Neighbor> search(const std::vector<float>& query, size_t k) const = 0;

    virtual void save(const std::string& path) const = 0;

    /**
     * @brief Replaces the contents with the index stored at path.
     * @return The dimension of the loaded vectors.
     * @throws ConfigurationError if the file is not an index of this kind.
     */
    virtual size_t load(const std::string& path) = 0;

    // Drops every vector, keeping the dimension.
    virtual void reset() = 0;

    virtual size_t count() const = 0;
    virtual size_t dimension() const = 0;
    virtual IndexKind kind() const = 0;
};

// Brute-force index over a flat in-memory vector list.
class LinearIndex : public IndexBackend {
public:
    explicit LinearIndex(size_t dimension);

    void add(const std::vector<std::vector<float>>& vectors) override;
    std::vector<Neighbor> search(const std::vector<float>& query, size_t k) const override;
    void save(const std::string& path) const override;
    size_t load(const std::string& path) override;
    void reset() override;

    size_t count() const override { return count_; }
    size_t dimension() const override { return dimension_; }
    IndexKind kind() const override { return IndexKind::Linear; }

private:
    size_t dimension_;
    size_t count_ = 0;
    std::vector<float> data_;
};

float squared_l2(const float* a, const float* b, size_t dimension);

// Whether this build links the library behind the exact backend.
bool exact_index_available();

// Throws ConfigurationError when exact_index_available() is false.
std::unique_ptr<IndexBackend> create_exact_index(size_t dimension);

struct IndexSelection {
    std::unique_ptr<IndexBackend> backend;
    bool degraded = false;  // exact was requested but linear was built
};

/**
 * @brief Builds the requested backend. A request for the exact backend in a
 * build without it falls back to LinearIndex and sets degraded.
 */
IndexSelection create_index_backend(IndexKind requested, size_t dimension);

} // namespace ragcore
