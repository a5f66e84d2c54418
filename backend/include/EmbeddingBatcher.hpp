#pragma once
// EmbeddingBatcher.hpp
// Embeds a document's chunks in parallel batches. A failed batch falls back
// to per-chunk retries; chunks that still fail are reported, not dropped silently.

#include <vector>
#include "CancellationToken.hpp"
#include "DocumentModel.hpp"
#include "EmbeddingClient.hpp"
#include "ServiceConfig.hpp"

struct EmbeddingOutcome {
    std::vector<Chunk> embedded;       // ordinal order, embedding filled in
    std::vector<int> failed_ordinals;  // excluded from the index
};

class EmbeddingBatcher {
public:
    EmbeddingBatcher(const EmbeddingClient& client, const EmbeddingConfig& config);

    // Throws IngestionCancelled if the token fires between batches
    EmbeddingOutcome embed_chunks(std::vector<Chunk> chunks,
                                  const CancellationToken* cancel = nullptr) const;

private:
    const EmbeddingClient& client_;
    EmbeddingConfig config_;

    bool valid(const std::vector<float>& vec) const;
    void embed_range(std::vector<Chunk>& chunks, std::vector<bool>& ok,
                     std::size_t begin, std::size_t end) const;
    bool embed_single(Chunk& chunk) const;
};
