#pragma once
// PDFProcessingPool.hpp
// Worker threads that run ingestion jobs off the request thread.
// Each job gets its own cancellation token, reachable through cancel().

#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include "IngestionOrchestrator.hpp"

class PDFProcessingPool {
public:
    PDFProcessingPool(size_t num_threads, IngestionOrchestrator& orchestrator);

    ~PDFProcessingPool();

    // Submit a document for async ingestion
    std::future<IngestionResult> submit(IngestionRequest request);

    // Cancels queued and running jobs for the document; returns how many were signalled
    size_t cancel(const std::string& document_id);

    struct Stats {
        size_t active_workers = 0;
        size_t queue_size = 0;
        size_t completed_tasks = 0;
        size_t failed_tasks = 0;
        size_t rejected_tasks = 0;
        size_t cancelled_tasks = 0;
    };
    Stats get_stats() const;

private:
    struct Task {
        IngestionRequest request;
        std::shared_ptr<CancellationToken> cancel;
        std::promise<IngestionResult> result;
    };

    void worker_thread();
    void process_task(Task& task);

    IngestionOrchestrator& orchestrator_;

    std::vector<std::thread> workers_;
    std::queue<Task> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> shutdown_{false};

    // Tokens of jobs not yet finished, by document id
    std::multimap<std::string, std::shared_ptr<CancellationToken>> tokens_;
    std::mutex tokens_mutex_;

    mutable std::mutex stats_mutex_;
    Stats stats_{};
};
