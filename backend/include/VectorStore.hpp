#pragma once
// VectorStore.hpp
// In-memory chunk + vector store with exact cosine search, snapshotted to a
// binary file. Readers never observe a half-replaced or half-deleted document.

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "DocumentModel.hpp"

struct SearchFilters {
    std::optional<std::string> document_id;
    std::optional<std::string> section;
    std::optional<ChunkType> chunk_type;
};

struct ScoredChunk {
    Chunk chunk;
    double score = 0.0;
};

class VectorStore {
public:
    explicit VectorStore(std::size_t dimension);

    // Overwrites any chunk with the same (document_id, ordinal)
    void store(const Chunk& chunk);

    // Removes every chunk of the document in one step; returns how many were removed
    std::size_t delete_all(const std::string& document_id);

    // Swaps in the document's complete chunk set in one step
    void replace_document(const std::string& document_id, const std::vector<Chunk>& chunks);

    /**
     * Top-k chunks by descending cosine similarity to the query, restricted to
     * the filters. Ties break by ascending ordinal, then document id.
     * k <= 0 yields an empty result. Throws StoreUnavailable if the store has
     * been marked unavailable, DimensionMismatch for a wrong-sized query.
     */
    std::vector<ScoredChunk> search(const std::vector<float>& query, int k,
                                    const SearchFilters& filters = SearchFilters()) const;

    std::vector<Chunk> chunks_for(const std::string& document_id) const;
    bool has_document(const std::string& document_id) const;
    std::size_t document_count() const;
    std::size_t chunk_count() const;
    std::size_t dimension() const { return dimension_; }

    // Binary snapshot: written to <path>.tmp, then renamed over path
    bool save(const std::string& path) const;
    // Missing file = empty store; a corrupt or wrong-dimension file throws
    bool load(const std::string& path);

    void set_available(bool available) { available_ = available; }

    // Bumped on every mutation, used by the background persister
    std::uint64_t version() const { return version_; }

private:
    std::size_t dimension_;
    std::map<std::string, std::map<int, Chunk>> documents_;
    mutable std::shared_mutex mutex_;
    std::atomic<bool> available_{true};
    std::atomic<std::uint64_t> version_{0};

    void check_dimension(const std::vector<float>& vec, const std::string& what) const;
};
