#pragma once
// BatchIndexWriter.hpp
// Background persister: ingestion and deletion enqueue the touched document,
// and the writer thread snapshots the vector store and the registry to disk
// once batch_size documents are pending or flush_interval has elapsed.

#include <vector>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include "VectorStore.hpp"
#include "DocumentRegistry.hpp"

struct PendingDocument {
    std::string document_id;
    std::chrono::steady_clock::time_point enqueue_time;
};

class BatchIndexWriter {
public:
    BatchIndexWriter(
        VectorStore& store,
        DocumentRegistry& registry,
        const std::string& data_dir,
        size_t batch_size = 10,
        std::chrono::seconds flush_interval = std::chrono::seconds(30)
    );

    ~BatchIndexWriter();

    // Thread-safe: mark a document as changed since the last snapshot
    void enqueue_document(const std::string& document_id);

    // Force immediate flush (blocking). Returns false if a snapshot failed to write.
    bool flush_now();

    std::string vectors_path() const { return data_dir_ + "/vectors.bin"; }
    std::string registry_path() const { return data_dir_ + "/documents.json"; }

    struct Stats {
        size_t documents_queued = 0;
        size_t documents_flushed = 0;
        size_t batches_flushed = 0;
        size_t failed_flushes = 0;
        double avg_batch_time_ms = 0.0;
        size_t current_queue_size = 0;
    };
    Stats get_stats() const;

private:
    void writer_thread();
    bool flush_batch(std::vector<PendingDocument>& batch);
    bool write_snapshots();

    VectorStore& store_;
    DocumentRegistry& registry_;
    std::string data_dir_;

    std::vector<PendingDocument> queue_;
    std::mutex queue_mutex_;
    std::mutex flush_mutex_;  // Prevents concurrent flushes
    std::condition_variable queue_cv_;
    std::thread writer_thread_;
    std::atomic<bool> shutdown_{false};

    size_t batch_size_;
    std::chrono::seconds flush_interval_;

    mutable std::mutex stats_mutex_;
    Stats stats_{};
    std::chrono::steady_clock::time_point last_flush_time_;

    // Versions written by the last successful snapshot
    std::uint64_t written_store_version_ = 0;
    std::uint64_t written_registry_version_ = 0;
};
