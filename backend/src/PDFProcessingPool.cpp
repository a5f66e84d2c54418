#include "PDFProcessingPool.hpp"
#include <algorithm>
#include <iostream>

PDFProcessingPool::PDFProcessingPool(
    size_t num_threads,
    IngestionOrchestrator& orchestrator
) : orchestrator_(orchestrator) {

    if (num_threads == 0) {
        num_threads = std::max(1u, std::thread::hardware_concurrency());
    }

    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&PDFProcessingPool::worker_thread, this);
    }

    stats_.active_workers = num_threads;

    std::cout << "[PDFProcessingPool] Started with " << num_threads << " workers\n";
}

PDFProcessingPool::~PDFProcessingPool() {
    {
        // Queued jobs still run; a running job finishes its current stage first
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_ = true;
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<IngestionResult> PDFProcessingPool::submit(IngestionRequest request) {
    Task task;
    task.cancel = std::make_shared<CancellationToken>();
    task.request = std::move(request);

    auto future = task.result.get_future();

    {
        std::lock_guard<std::mutex> tokens_lock(tokens_mutex_);
        tokens_.emplace(task.request.document_id, task.cancel);
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(std::move(task));

        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.queue_size = task_queue_.size();
    }

    queue_cv_.notify_one();

    return future;
}

size_t PDFProcessingPool::cancel(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    size_t signalled = 0;
    auto range = tokens_.equal_range(document_id);
    for (auto it = range.first; it != range.second; ++it) {
        it->second->cancel();
        signalled++;
    }
    if (signalled > 0) {
        std::cout << "[PDFProcessingPool] Cancel requested for " << document_id
                  << " (" << signalled << " jobs)\n";
    }
    return signalled;
}

PDFProcessingPool::Stats PDFProcessingPool::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void PDFProcessingPool::worker_thread() {
    while (true) {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        queue_cv_.wait(lock, [this]() {
            return shutdown_ || !task_queue_.empty();
        });

        if (shutdown_ && task_queue_.empty()) break;

        Task task = std::move(task_queue_.front());
        task_queue_.pop();

        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.queue_size = task_queue_.size();
        }

        lock.unlock();

        try {
            process_task(task);
        } catch (const std::exception& e) {
            std::cerr << "[PDFProcessingPool] Error processing "
                      << task.request.document_id << ": " << e.what() << "\n";
            task.result.set_exception(std::current_exception());

            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.failed_tasks++;
        }

        std::lock_guard<std::mutex> tokens_lock(tokens_mutex_);
        auto range = tokens_.equal_range(task.request.document_id);
        for (auto it = range.first; it != range.second; ++it) {
            if (it->second == task.cancel) {
                tokens_.erase(it);
                break;
            }
        }
    }
}

void PDFProcessingPool::process_task(Task& task) {
    auto start = std::chrono::steady_clock::now();

    std::cout << "[PDFProcessingPool] Processing " << task.request.document_id << "\n";

    IngestionResult result = orchestrator_.process(task.request, task.cancel.get());

    auto end = std::chrono::steady_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        if (result.rejected) {
            stats_.rejected_tasks++;
        } else if (result.cancelled) {
            stats_.cancelled_tasks++;
        } else if (result.success) {
            stats_.completed_tasks++;
        } else {
            stats_.failed_tasks++;
        }
    }

    std::cout << "[PDFProcessingPool] " << task.request.document_id << " finished as "
              << to_string(result.status) << " in " << duration_ms << "ms\n";

    task.result.set_value(std::move(result));
}
