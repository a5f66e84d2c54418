#pragma once
// DocumentRegistry.hpp
// Per-document ingestion state (status, stage flags, extracted metadata),
// persisted as documents.json so failures can be inspected after the fact.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "DocumentModel.hpp"

class DocumentRegistry {
public:
    DocumentRegistry();

    // Load registry from JSON file
    bool load(const std::string& registry_path);

    // Save registry to JSON file (temp file + rename). Full text is not persisted.
    bool save(const std::string& registry_path) const;

    std::optional<Document> get(const std::string& document_id) const;
    bool contains(const std::string& document_id) const;

    // Creates the record if missing, otherwise replaces it
    void put(const Document& doc);

    // Applies fn to the record (created in the uploaded state if missing)
    void update(const std::string& document_id, const std::function<void(Document&)>& fn);

    void set_status(const std::string& document_id, DocumentStatus status);

    std::vector<Document> list() const;
    size_t size() const;

    // Count of documents per status name
    std::map<std::string, size_t> status_counts() const;

    // Bumped on every mutation, used by the background persister
    std::uint64_t version() const { return version_; }

private:
    std::map<std::string, Document> documents_;
    mutable std::mutex mutex_;
    std::atomic<std::uint64_t> version_{0};

    static std::int64_t now_seconds();
};
