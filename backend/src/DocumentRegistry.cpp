#include "DocumentRegistry.hpp"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>

DocumentRegistry::DocumentRegistry() {}

std::int64_t DocumentRegistry::now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool DocumentRegistry::load(const std::string& registry_path) {
    std::ifstream in(registry_path);
    if (!in.is_open()) {
        std::cerr << "[Registry] Warning: Could not open registry file: " << registry_path << std::endl;
        return false;
    }

    try {
        json j;
        in >> j;

        // Expected format: {document_id: {status, stages, title, ...}}
        std::map<std::string, Document> loaded;
        for (auto& [key, value] : j.items()) {
            json record = value;
            record["id"] = key;
            Document doc = document_from_json(record);

            // A run interrupted by shutdown never finished its replace
            if (doc.status == DocumentStatus::Extracting ||
                doc.status == DocumentStatus::Chunking ||
                doc.status == DocumentStatus::Embedding) {
                doc.status = DocumentStatus::Failed;
                doc.last_error = "interrupted by shutdown";
            }
            loaded[key] = std::move(doc);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        documents_.swap(loaded);
        ++version_;
        std::cout << "[Registry] Loaded " << documents_.size() << " documents" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[Registry] Error parsing registry file: " << e.what() << std::endl;
        return false;
    }
}

bool DocumentRegistry::save(const std::string& registry_path) const {
    try {
        json j = json::object();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, doc] : documents_) {
                json record = document_to_json(doc, false);
                record.erase("id");
                j[id] = record;
            }
        }

        // Write to temporary file first
        std::string temp_path = registry_path + ".tmp";
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[Registry] Error: Could not open file for writing: " << temp_path << std::endl;
            return false;
        }

        out << j.dump(2, ' ', false, json::error_handler_t::replace);
        out.flush();

        if (!out.good()) {
            std::cerr << "[Registry] Error: Write failed for: " << temp_path << std::endl;
            out.close();
            return false;
        }

        out.close();

        // Atomic rename
        if (std::rename(temp_path.c_str(), registry_path.c_str()) != 0) {
            std::cerr << "[Registry] Error: Could not rename temp file" << std::endl;
            return false;
        }

        return true;

    } catch (const std::exception& e) {
        std::cerr << "[Registry] Error saving registry: " << e.what() << std::endl;
        return false;
    }
}

std::optional<Document> DocumentRegistry::get(const std::string& document_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(document_id);
    if (it == documents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DocumentRegistry::contains(const std::string& document_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return documents_.find(document_id) != documents_.end();
}

void DocumentRegistry::put(const Document& doc) {
    std::lock_guard<std::mutex> lock(mutex_);
    Document stored = doc;
    stored.updated_at = now_seconds();
    documents_[doc.id] = std::move(stored);
    ++version_;
}

void DocumentRegistry::update(const std::string& document_id, const std::function<void(Document&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(document_id);
    if (it == documents_.end()) {
        Document doc;
        doc.id = document_id;
        it = documents_.emplace(document_id, std::move(doc)).first;
    }
    fn(it->second);
    it->second.updated_at = now_seconds();
    ++version_;
}

void DocumentRegistry::set_status(const std::string& document_id, DocumentStatus status) {
    update(document_id, [status](Document& doc) { doc.status = status; });
}

std::vector<Document> DocumentRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Document> out;
    out.reserve(documents_.size());
    for (const auto& [id, doc] : documents_) out.push_back(doc);
    return out;
}

size_t DocumentRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return documents_.size();
}

std::map<std::string, size_t> DocumentRegistry::status_counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, size_t> counts;
    for (const auto& [id, doc] : documents_) counts[to_string(doc.status)]++;
    return counts;
}
