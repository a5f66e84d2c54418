#include "BatchIndexWriter.hpp"
#include <iostream>
#include <algorithm>
#include <filesystem>

BatchIndexWriter::BatchIndexWriter(
    VectorStore& store,
    DocumentRegistry& registry,
    const std::string& data_dir,
    size_t batch_size,
    std::chrono::seconds flush_interval
) : store_(store),
    registry_(registry),
    data_dir_(data_dir),
    batch_size_(std::max<size_t>(1, batch_size)),
    flush_interval_(flush_interval),
    last_flush_time_(std::chrono::steady_clock::now()),
    written_store_version_(store.version()),
    written_registry_version_(registry.version())
{
    std::error_code ec;
    std::filesystem::create_directories(data_dir_, ec);
    if (ec) {
        std::cerr << "[BatchIndexWriter] Warning: could not create " << data_dir_ << ": " << ec.message() << "\n";
    }

    writer_thread_ = std::thread(&BatchIndexWriter::writer_thread, this);
    std::cout << "[BatchIndexWriter] Started with batch_size=" << batch_size_
              << ", flush_interval=" << flush_interval.count() << "s\n";
}

BatchIndexWriter::~BatchIndexWriter() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_ = true;
    }
    queue_cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

    // Flush remaining documents
    size_t remaining = get_stats().current_queue_size;
    if (remaining > 0) {
        std::cout << "[BatchIndexWriter] Flushing " << remaining
                  << " remaining documents on shutdown\n";
    }
    if (!flush_now()) {
        std::cerr << "[BatchIndexWriter] Final snapshot failed; last flushed state remains on disk\n";
    }
}

void BatchIndexWriter::enqueue_document(const std::string& document_id) {
    PendingDocument doc;
    doc.document_id = document_id;
    doc.enqueue_time = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(doc));

        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.documents_queued++;
        stats_.current_queue_size = queue_.size();
    }

    queue_cv_.notify_one();
}

bool BatchIndexWriter::flush_now() {
    std::lock_guard<std::mutex> flush_lock(flush_mutex_);

    std::vector<PendingDocument> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        batch.swap(queue_);
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.current_queue_size = 0;
    }

    // An empty queue still writes when something changed outside it (e.g. registry status updates)
    bool dirty = store_.version() != written_store_version_ ||
                 registry_.version() != written_registry_version_;
    if (batch.empty() && !dirty) {
        std::cout << "[BatchIndexWriter] Nothing to flush" << std::endl;
        return true;
    }

    return flush_batch(batch);
}

BatchIndexWriter::Stats BatchIndexWriter::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void BatchIndexWriter::writer_thread() {
    while (!shutdown_) {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        queue_cv_.wait_for(lock, flush_interval_, [this]() {
            auto time_since_flush = std::chrono::steady_clock::now() - last_flush_time_;
            return shutdown_ ||
                   queue_.size() >= batch_size_ ||
                   (!queue_.empty() && time_since_flush >= flush_interval_);
        });

        if (shutdown_ || queue_.empty()) continue;

        auto time_since_flush = std::chrono::steady_clock::now() - last_flush_time_;
        if (queue_.size() < batch_size_ && time_since_flush < flush_interval_) continue;

        // A snapshot covers every pending document, so the whole queue goes at once
        std::vector<PendingDocument> batch;
        batch.swap(queue_);
        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.current_queue_size = 0;
        }

        lock.unlock();

        std::lock_guard<std::mutex> flush_lock(flush_mutex_);
        if (!flush_batch(batch)) {
            std::cerr << "[BatchIndexWriter] Will retry on the next batch\n";
        }
    }
}

bool BatchIndexWriter::flush_batch(std::vector<PendingDocument>& batch) {
    auto start = std::chrono::steady_clock::now();

    std::cout << "[BatchIndexWriter] Flushing batch of " << batch.size() << " documents...\n";

    bool ok = write_snapshots();

    auto end = std::chrono::steady_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex_);
        last_flush_time_ = end;
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (!ok) {
        stats_.failed_flushes++;
        std::cerr << "[BatchIndexWriter] Batch flush failed; "
                  << batch.size() << " documents stay dirty until the next flush\n";
        return false;
    }

    double total_latency = 0;
    for (const auto& doc : batch) {
        total_latency += std::chrono::duration_cast<std::chrono::milliseconds>(
            end - doc.enqueue_time).count();
    }
    double avg_latency = batch.empty() ? 0.0 : total_latency / batch.size();

    stats_.documents_flushed += batch.size();
    stats_.batches_flushed++;
    stats_.avg_batch_time_ms =
        (stats_.avg_batch_time_ms * (stats_.batches_flushed - 1) + duration_ms) /
        stats_.batches_flushed;

    std::cout << "[BatchIndexWriter] Batch complete in " << duration_ms << "ms "
              << "(avg latency: " << avg_latency << "ms)\n";
    return true;
}

bool BatchIndexWriter::write_snapshots() {
    // Versions are read before saving: a mutation during the save stays dirty
    std::uint64_t store_version = store_.version();
    std::uint64_t registry_version = registry_.version();

    bool ok = true;
    try {
        if (store_version != written_store_version_) {
            if (store_.save(vectors_path())) {
                written_store_version_ = store_version;
            } else {
                ok = false;
            }
        }
        if (registry_version != written_registry_version_) {
            if (registry_.save(registry_path())) {
                written_registry_version_ = registry_version;
            } else {
                ok = false;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[BatchIndexWriter] Snapshot failed: " << e.what() << "\n";
        ok = false;
    }
    return ok;
}
