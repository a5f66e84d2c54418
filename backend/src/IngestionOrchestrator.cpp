#include "IngestionOrchestrator.hpp"
#include "Errors.hpp"
#include "ReferenceParser.hpp"
#include "SectionSplitter.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <iostream>
#include <stdexcept>

namespace {

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

// Releases the per-document slot however the run ends
class InFlightSlot {
public:
    explicit InFlightSlot(std::function<void()> release) : release_(std::move(release)) {}
    ~InFlightSlot() { release_(); }
    InFlightSlot(const InFlightSlot&) = delete;
    InFlightSlot& operator=(const InFlightSlot&) = delete;

private:
    std::function<void()> release_;
};

}

json ingestion_result_to_json(const IngestionResult& result) {
    json j;
    j["document_id"] = result.document_id;
    j["success"] = result.success;
    j["status"] = to_string(result.status);
    j["chunk_count"] = result.chunk_count;
    j["failed_chunks"] = result.failed_chunks;
    if (result.rejected) j["rejected"] = true;
    if (result.cancelled) j["cancelled"] = true;
    if (!result.error.empty()) j["error"] = result.error;
    return j;
}

IngestionOrchestrator::IngestionOrchestrator(const LayoutSource& layout_source,
                                             const EmbeddingClient& embedder,
                                             VectorStore& store,
                                             DocumentRegistry& registry,
                                             const ServiceConfig& config,
                                             BatchIndexWriter* writer)
    : layout_source_(layout_source),
      embedder_(embedder),
      store_(store),
      registry_(registry),
      config_(config),
      writer_(writer),
      analyzer_(config.layout),
      extractor_(config.extraction),
      chunker_(config.chunking),
      batcher_(embedder, config.embedding) {}

bool IngestionOrchestrator::try_acquire(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.insert(document_id).second;
}

void IngestionOrchestrator::release(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.erase(document_id);
}

bool IngestionOrchestrator::in_flight(const std::string& document_id) const {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.count(document_id) > 0;
}

IngestionOrchestrator::Stats IngestionOrchestrator::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

IngestionResult IngestionOrchestrator::process(const IngestionRequest& request,
                                               const CancellationToken* cancel) {
    IngestionResult result;
    result.document_id = request.document_id;

    if (request.document_id.empty()) {
        result.status = DocumentStatus::Failed;
        result.error = "document id is required";
        return result;
    }

    if (!try_acquire(request.document_id)) {
        std::cerr << "[Ingestion] Rejected " << request.document_id
                  << ": an ingestion for this document is already running" << std::endl;
        result.rejected = true;
        result.error = "ingestion already in progress for " + request.document_id;
        result.status = registry_.get(request.document_id)
                            .value_or(Document()).status;
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.rejected++;
        return result;
    }
    InFlightSlot slot([this, id = request.document_id]() { release(id); });

    auto start = std::chrono::steady_clock::now();
    auto deadline = start + std::chrono::seconds(config_.extraction.timeout_seconds);
    const std::string& id = request.document_id;

    // Restored as-is when the run is cancelled
    std::optional<Document> previous = registry_.get(id);

    std::cout << "[Ingestion] Processing " << id << std::endl;

    registry_.update(id, [](Document& doc) {
        doc.status = DocumentStatus::Extracting;
        doc.stages = StageFlags();
        doc.last_error.clear();
    });

    Document doc;
    doc.id = id;

    try {
        std::vector<std::size_t> page_offsets;
        extract(request, doc, page_offsets, deadline);

        if (cancel) cancel->throw_if_cancelled("extraction");

        std::vector<Section> ordered = SectionSplitter::canonical_order(doc.sections);

        registry_.update(id, [&doc, &ordered](Document& rec) {
            rec.status = DocumentStatus::Chunking;
            rec.stages = doc.stages;
            rec.page_count = doc.page_count;
            rec.title = doc.title;
            rec.authors = doc.authors;
            rec.doi = doc.doi;
            rec.ocr_applied = doc.ocr_applied;
            rec.full_text = doc.full_text;
            rec.sections = ordered;
            rec.tables = doc.tables;
            rec.figures = doc.figures;
            rec.references = doc.references;
        });

        std::vector<Chunk> chunks = chunker_.chunk(id, ordered, doc.full_text, page_offsets);
        std::cout << "[Ingestion] " << id << ": " << chunks.size() << " chunks from "
                  << ordered.size() << " sections" << std::endl;

        if (cancel) cancel->throw_if_cancelled("chunking");
        registry_.set_status(id, DocumentStatus::Embedding);

        EmbeddingOutcome outcome = batcher_.embed_chunks(std::move(chunks), cancel);

        if (cancel) cancel->throw_if_cancelled("embedding");

        // Searches see the old chunk set until this call returns
        store_.replace_document(id, outcome.embedded);

        registry_.update(id, [&outcome](Document& rec) {
            rec.status = DocumentStatus::Indexed;
            rec.chunk_count = outcome.embedded.size();
            rec.failed_chunks = outcome.failed_ordinals;
        });
        notify_writer(id);

        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        std::cout << "[Ingestion] " << id << " indexed: " << outcome.embedded.size() << " chunks";
        if (!outcome.failed_ordinals.empty()) {
            std::cout << ", " << outcome.failed_ordinals.size() << " failed embedding";
        }
        std::cout << " (" << duration_ms << "ms)" << std::endl;

        result.success = true;
        result.status = DocumentStatus::Indexed;
        result.chunk_count = outcome.embedded.size();
        result.failed_chunks = outcome.failed_ordinals;

        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.indexed++;
        return result;

    } catch (const IngestionCancelled& e) {
        std::cerr << "[Ingestion] " << id << " " << e.what()
                  << "; keeping the last indexed state" << std::endl;
        if (previous) {
            registry_.put(*previous);
        } else {
            registry_.update(id, [&e, &id](Document& rec) {
                rec = Document();
                rec.id = id;
                rec.last_error = e.what();
            });
        }
        notify_writer(id);
        result.cancelled = true;
        result.error = e.what();
        result.status = previous ? previous->status : DocumentStatus::Uploaded;
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.cancelled++;
        return result;

    } catch (const ExtractionTimeout& e) {
        mark_failed(id, std::string("extraction timed out: ") + e.what(), doc.stages, true);
        result.error = std::string("extraction timed out: ") + e.what();
    } catch (const UnreadablePdf& e) {
        mark_failed(id, std::string("unreadable PDF: ") + e.what(), doc.stages, true);
        result.error = std::string("unreadable PDF: ") + e.what();
    } catch (const std::exception& e) {
        mark_failed(id, e.what(), doc.stages, false);
        result.error = e.what();
    }

    result.status = DocumentStatus::Failed;
    return result;
}

void IngestionOrchestrator::extract(const IngestionRequest& request, Document& doc,
                                    std::vector<std::size_t>& page_offsets,
                                    std::chrono::steady_clock::time_point deadline) const {
    if (request.pdf_bytes || request.layout) {
        PdfLayout pdf = request.pdf_bytes
            ? layout_source_.read(request.document_id, *request.pdf_bytes, deadline)
            : *request.layout;

        std::vector<PageLayout> layouts = analyzer_.analyze_pages(pdf.pages);
        ExtractionResult extracted = extractor_.extract(pdf, layouts, deadline);

        doc.stages = extracted.stages;
        doc.page_count = extracted.page_count;
        doc.title = extracted.title;
        doc.authors = extracted.authors;
        doc.doi = extracted.doi;
        doc.ocr_applied = pdf.info.ocr_applied;
        if (doc.ocr_applied) {
            std::cout << "[Ingestion] " << request.document_id
                      << ": scanned PDF, text comes from OCR" << std::endl;
        }
        doc.tables = std::move(extracted.tables);
        doc.figures = std::move(extracted.figures);
        doc.references = std::move(extracted.references);

        if (!extracted.success) {
            throw std::runtime_error("text extraction failed: " + extracted.error);
        }
        doc.full_text = std::move(extracted.full_text);
        page_offsets = std::move(extracted.page_offsets);
        doc.sections = SectionSplitter::split(doc.full_text);

    } else if (request.full_text) {
        doc.full_text = *request.full_text;
        doc.stages.text = StageState::Done;
        doc.sections = request.sections.empty()
            ? SectionSplitter::split(doc.full_text)
            : request.sections;
        doc.doi = ReferenceParser::find_doi(doc.full_text);

        try {
            doc.references = ReferenceParser::parse(doc.full_text);
            doc.stages.references = StageState::Done;
        } catch (const std::exception& e) {
            std::cerr << "[Ingestion] " << request.document_id
                      << ": reference parsing failed: " << e.what() << std::endl;
            doc.stages.references = StageState::Failed;
        }

    } else {
        throw std::invalid_argument("request carries neither a PDF nor extracted text");
    }

    bool has_section_text = std::any_of(doc.sections.begin(), doc.sections.end(),
                                        [](const Section& s) { return !is_blank(s.text); });
    if (is_blank(doc.full_text) && !has_section_text) {
        doc.stages.text = StageState::Failed;
        throw std::runtime_error("No text extracted");
    }
}

void IngestionOrchestrator::mark_failed(const std::string& document_id,
                                        const std::string& error,
                                        const StageFlags& stages,
                                        bool extraction_failed) {
    std::cerr << "[Ingestion] " << document_id << " failed: " << error << std::endl;

    // The previously indexed chunks, if any, stay searchable
    registry_.update(document_id, [&error, &stages, extraction_failed](Document& rec) {
        rec.status = DocumentStatus::Failed;
        rec.last_error = error;
        rec.stages = stages;
        if (extraction_failed) {
            rec.stages.text = StageState::Failed;
            if (rec.stages.tables == StageState::Pending) rec.stages.tables = StageState::Failed;
            if (rec.stages.figures == StageState::Pending) rec.stages.figures = StageState::Failed;
            if (rec.stages.references == StageState::Pending) rec.stages.references = StageState::Failed;
        }
    });
    notify_writer(document_id);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.failed++;
}

std::size_t IngestionOrchestrator::delete_document(const std::string& document_id) {
    std::size_t removed = store_.delete_all(document_id);
    if (registry_.contains(document_id)) {
        registry_.update(document_id, [](Document& rec) {
            rec.chunk_count = 0;
            rec.failed_chunks.clear();
            if (rec.status == DocumentStatus::Indexed) rec.status = DocumentStatus::Uploaded;
        });
    }
    notify_writer(document_id);
    std::cout << "[Ingestion] Deleted " << removed << " chunks of " << document_id << std::endl;
    return removed;
}

void IngestionOrchestrator::notify_writer(const std::string& document_id) {
    if (writer_) writer_->enqueue_document(document_id);
}
