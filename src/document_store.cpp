#include "document_store.hpp"
#include "errors.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace ragcore {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
constexpr int kDocumentsFormatVersion = 1;
}

json DocumentRecord::to_json() const {
    return {{"text", text}, {"metadata", metadata}};
}

DocumentRecord DocumentRecord::from_json(const json& j, size_t position) {
    DocumentRecord rec;
    rec.text = j.at("text").get<std::string>();
    rec.metadata = j.value("metadata", json::object());
    rec.position = position;
    return rec;
}

DocumentStore::PendingAppend::PendingAppend(PendingAppend&& other) noexcept
    : store_(other.store_), first_(other.first_), committed_(other.committed_) {
    other.store_ = nullptr;
}

DocumentStore::PendingAppend::~PendingAppend() {
    if (store_ && !committed_) {
        spdlog::debug("Rolling back {} staged documents", store_->size() - first_);
        store_->truncate(first_);
    }
}

DocumentStore::PendingAppend DocumentStore::stage(const std::vector<std::string>& texts,
                                                  const std::vector<json>& metadata) {
    if (!metadata.empty() && metadata.size() != texts.size()) {
        throw ValidationError("metadata", "metadata has " + std::to_string(metadata.size()) +
                                          " entries but documents has " + std::to_string(texts.size()));
    }
    for (size_t i = 0; i < metadata.size(); ++i) {
        if (!metadata[i].is_object() && !metadata[i].is_null()) {
            throw ValidationError("metadata", "metadata[" + std::to_string(i) + "] must be an object, got " +
                                              std::string(metadata[i].type_name()));
        }
    }

    size_t first = records_.size();
    records_.reserve(first + texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        DocumentRecord rec;
        rec.text = texts[i];
        if (!metadata.empty() && metadata[i].is_object()) rec.metadata = metadata[i];
        rec.position = first + i;
        records_.push_back(std::move(rec));
    }
    return PendingAppend(this, first);
}

const DocumentRecord& DocumentStore::at(size_t position) const {
    if (position >= records_.size()) {
        throw std::out_of_range("Document position " + std::to_string(position) +
                                " out of range (size " + std::to_string(records_.size()) + ")");
    }
    return records_[position];
}

void DocumentStore::clear() {
    records_.clear();
}

void DocumentStore::truncate(size_t new_size) {
    if (new_size < records_.size()) {
        records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(new_size), records_.end());
    }
}

void DocumentStore::save(const std::string& path) const {
    json documents = json::array();
    for (const auto& rec : records_) {
        documents.push_back(rec.to_json());
    }
    json root = {{"version", kDocumentsFormatVersion}, {"documents", documents}};

    fs::path target(path);
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw BackendError("Cannot open " + tmp.string() + " for writing");
        }
        out << root.dump(2, ' ', false, json::error_handler_t::replace);
        if (!out) {
            throw BackendError("Failed writing documents to " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        throw BackendError("Cannot move " + tmp.string() + " to " + target.string() + ": " + ec.message());
    }
}

void DocumentStore::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("Documents file " + path + " is missing; the index next to it cannot be used. "
                                 "Rebuild the index.");
    }

    std::vector<DocumentRecord> loaded;
    try {
        json root = json::parse(in);
        int version = root.value("version", 0);
        if (version != kDocumentsFormatVersion) {
            throw ConfigurationError("Documents file " + path + " has unsupported version " +
                                     std::to_string(version));
        }
        const auto& documents = root.at("documents");
        loaded.reserve(documents.size());
        for (const auto& j : documents) {
            loaded.push_back(DocumentRecord::from_json(j, loaded.size()));
        }
    } catch (const json::exception& e) {
        throw ConfigurationError("Documents file " + path + " is corrupt: " + e.what());
    }

    records_ = std::move(loaded);
}

} // namespace ragcore
