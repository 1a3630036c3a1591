#include "index_backend.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#ifdef RAGCORE_HAVE_FAISS
#include "faiss_exact_index.hpp"
#endif

namespace ragcore {

bool exact_index_available() {
#ifdef RAGCORE_HAVE_FAISS
    return true;
#else
    return false;
#endif
}

std::unique_ptr<IndexBackend> create_exact_index(size_t dimension) {
#ifdef RAGCORE_HAVE_FAISS
    return std::make_unique<FaissExactIndex>(dimension);
#else
    (void)dimension;
    throw ConfigurationError("Exact index backend is not available in this build (built without FAISS)");
#endif
}

IndexSelection create_index_backend(IndexKind requested, size_t dimension) {
    IndexSelection selection;
    if (requested == IndexKind::Exact) {
        if (exact_index_available()) {
            selection.backend = create_exact_index(dimension);
            return selection;
        }
        spdlog::warn("⚠️ Exact (FAISS) index requested but not available; falling back to linear index.");
        selection.degraded = true;
    }
    selection.backend = std::make_unique<LinearIndex>(dimension);
    return selection;
}

} // namespace ragcore
