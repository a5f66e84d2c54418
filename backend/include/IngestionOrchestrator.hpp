#pragma once
// IngestionOrchestrator.hpp
// Drives one document through extraction -> chunking -> embedding -> storage.
// Runs for the same document id never overlap, the chunk set is swapped in
// with a single replace, and stage failures end up as document status instead
// of exceptions.

#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "BatchIndexWriter.hpp"
#include "CancellationToken.hpp"
#include "Chunker.hpp"
#include "DocumentRegistry.hpp"
#include "EmbeddingBatcher.hpp"
#include "EmbeddingClient.hpp"
#include "LayoutAnalyzer.hpp"
#include "PDFLayoutReader.hpp"
#include "ServiceConfig.hpp"
#include "StructuralExtractor.hpp"
#include "VectorStore.hpp"

// Exactly one input form is used: pdf_bytes, then layout, then full_text
struct IngestionRequest {
    std::string document_id;
    std::optional<std::string> pdf_bytes;
    std::optional<PdfLayout> layout;          // already dumped page content
    std::optional<std::string> full_text;
    std::vector<Section> sections;            // caller-supplied, used with full_text
};

struct IngestionResult {
    bool success = false;
    bool rejected = false;    // another run for the same document was in flight
    bool cancelled = false;
    std::string document_id;
    DocumentStatus status = DocumentStatus::Uploaded;
    std::size_t chunk_count = 0;
    std::vector<int> failed_chunks;
    std::string error;
};

json ingestion_result_to_json(const IngestionResult& result);

class IngestionOrchestrator {
public:
    IngestionOrchestrator(const LayoutSource& layout_source,
                          const EmbeddingClient& embedder,
                          VectorStore& store,
                          DocumentRegistry& registry,
                          const ServiceConfig& config,
                          BatchIndexWriter* writer = nullptr);

    // Never throws for stage failures; see result.status and the registry record
    IngestionResult process(const IngestionRequest& request,
                            const CancellationToken* cancel = nullptr);

    // Drops the document's chunks; returns how many were removed
    std::size_t delete_document(const std::string& document_id);

    bool in_flight(const std::string& document_id) const;

    struct Stats {
        size_t indexed = 0;
        size_t failed = 0;
        size_t rejected = 0;
        size_t cancelled = 0;
    };
    Stats get_stats() const;

private:
    const LayoutSource& layout_source_;
    const EmbeddingClient& embedder_;
    VectorStore& store_;
    DocumentRegistry& registry_;
    ServiceConfig config_;
    BatchIndexWriter* writer_;

    LayoutAnalyzer analyzer_;
    StructuralExtractor extractor_;
    Chunker chunker_;
    EmbeddingBatcher batcher_;

    std::set<std::string> in_flight_;
    mutable std::mutex in_flight_mutex_;

    mutable std::mutex stats_mutex_;
    Stats stats_{};

    bool try_acquire(const std::string& document_id);
    void release(const std::string& document_id);

    // Fills doc with text, sections and artifacts; throws on document-fatal errors
    void extract(const IngestionRequest& request, Document& doc,
                 std::vector<std::size_t>& page_offsets,
                 std::chrono::steady_clock::time_point deadline) const;

    // extraction_failed marks every stage that never ran as failed
    void mark_failed(const std::string& document_id, const std::string& error,
                     const StageFlags& stages, bool extraction_failed);
    void notify_writer(const std::string& document_id);
};
