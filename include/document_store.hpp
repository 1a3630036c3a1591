#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ragcore {

struct DocumentRecord {
    std::string text;
    nlohmann::json metadata = nlohmann::json::object();
    size_t position = 0;  // equals the vector's position in the index backend

    nlohmann::json to_json() const;
    static DocumentRecord from_json(const nlohmann::json& j, size_t position);
};

/**
 * @brief Owns the text and metadata of every indexed document, in index order.
 *
 * Appends go through stage(): the staged records are visible immediately and
 * are dropped again unless the returned PendingAppend is committed.
 */
class DocumentStore {
public:
    class PendingAppend {
    public:
        PendingAppend(PendingAppend&& other) noexcept;
        PendingAppend(const PendingAppend&) = delete;
        PendingAppend& operator=(const PendingAppend&) = delete;
        PendingAppend& operator=(PendingAppend&&) = delete;
        ~PendingAppend();

        void commit() { committed_ = true; }
        size_t first_position() const { return first_; }

    private:
        friend class DocumentStore;
        PendingAppend(DocumentStore* store, size_t first) : store_(store), first_(first) {}

        DocumentStore* store_;
        size_t first_;
        bool committed_ = false;
    };

    /**
     * @brief Appends one record per text. metadata is either empty or the same
     * length as texts; each entry must be an object or null.
     * @throws ValidationError otherwise, leaving the store untouched.
     */
    PendingAppend stage(const std::vector<std::string>& texts,
                        const std::vector<nlohmann::json>& metadata);

    const DocumentRecord& at(size_t position) const;
    const std::vector<DocumentRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    void clear();

    void save(const std::string& path) const;
    // Replaces the contents with the file at path. Throws ConfigurationError.
    void load(const std::string& path);

private:
    void truncate(size_t new_size);

    std::vector<DocumentRecord> records_;
};

} // namespace ragcore
