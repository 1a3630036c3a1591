#pragma once

#include "index_backend.hpp"
#include <string>
#include <vector>
#include <memory>

namespace faiss { struct Index; }

namespace ragcore {

// Exact L2 search delegated to faiss::IndexFlatL2. Only flat L2 indexes are
// accepted by load().
class FaissExactIndex : public IndexBackend {
public:
    explicit FaissExactIndex(size_t dimension);
    ~FaissExactIndex() override;

    void add(const std::vector<std::vector<float>>& vectors) override;
    std::vector<Neighbor> search(const std::vector<float>& query, size_t k) const override;

    void save(const std::string& path) const override;
    size_t load(const std::string& path) override;
    void reset() override;

    size_t count() const override;
    size_t dimension() const override { return dimension_; }
    IndexKind kind() const override { return IndexKind::Exact; }

private:
    size_t dimension_;
    std::unique_ptr<faiss::Index> index_;
};

} // namespace ragcore
