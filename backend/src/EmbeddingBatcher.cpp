#include "EmbeddingBatcher.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>

EmbeddingBatcher::EmbeddingBatcher(const EmbeddingClient& client, const EmbeddingConfig& config)
    : client_(client), config_(config) {}

bool EmbeddingBatcher::valid(const std::vector<float>& vec) const {
    if (vec.size() != client_.dimension()) return false;
    return std::all_of(vec.begin(), vec.end(), [](float x) { return std::isfinite(x); });
}

bool EmbeddingBatcher::embed_single(Chunk& chunk) const {
    int attempts = std::max(1, config_.max_retries);
    std::string last_error;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            std::vector<float> vec = client_.embed(chunk.text);
            if (valid(vec)) {
                chunk.embedding = std::move(vec);
                return true;
            }
            last_error = "invalid vector (" + std::to_string(vec.size()) + " dims)";
        } catch (const std::exception& e) {
            last_error = e.what();
        }
    }

    std::cerr << "[Embedding] Chunk " << chunk.chunk_id() << " failed after "
              << attempts << " attempts: " << last_error << "\n";
    return false;
}

void EmbeddingBatcher::embed_range(std::vector<Chunk>& chunks, std::vector<bool>& ok,
                                   std::size_t begin, std::size_t end) const {
    std::vector<std::string> texts;
    texts.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) texts.push_back(chunks[i].text);

    bool batch_ok = false;
    try {
        std::vector<std::vector<float>> vectors = client_.embed_batch(texts);
        batch_ok = vectors.size() == texts.size() &&
                   std::all_of(vectors.begin(), vectors.end(),
                               [this](const std::vector<float>& v) { return valid(v); });
        if (batch_ok) {
            for (std::size_t i = begin; i < end; ++i) {
                chunks[i].embedding = std::move(vectors[i - begin]);
                ok[i] = true;
            }
            return;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Embedding] Batch of " << texts.size() << " chunks failed ("
                  << e.what() << "), retrying individually\n";
    }

    for (std::size_t i = begin; i < end; ++i) {
        ok[i] = embed_single(chunks[i]);
    }
}

EmbeddingOutcome EmbeddingBatcher::embed_chunks(std::vector<Chunk> chunks,
                                                const CancellationToken* cancel) const {
    std::size_t batch_size = std::max<std::size_t>(1, config_.batch_size);
    std::size_t num_batches = (chunks.size() + batch_size - 1) / batch_size;
    std::size_t workers = std::max<std::size_t>(1, std::min(config_.workers, num_batches));

    // Each slot is written by exactly one worker
    std::vector<bool> ok_flags(chunks.size(), false);
    std::vector<std::vector<bool>> worker_flags(workers, std::vector<bool>(chunks.size(), false));

    std::vector<std::future<void>> futures;
    for (std::size_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, [&, w]() {
            for (std::size_t b = w; b < num_batches; b += workers) {
                if (cancel) cancel->throw_if_cancelled("embedding");
                std::size_t begin = b * batch_size;
                std::size_t end = std::min(chunks.size(), begin + batch_size);
                embed_range(chunks, worker_flags[w], begin, end);
            }
        }));
    }

    // Wait for every worker before rethrowing so none outlives the chunk vector
    std::exception_ptr first_error;
    for (auto& f : futures) {
        try {
            f.get();
        } catch (const std::exception&) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);

    for (std::size_t w = 0; w < workers; ++w) {
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            if (worker_flags[w][i]) ok_flags[i] = true;
        }
    }

    EmbeddingOutcome outcome;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (ok_flags[i]) {
            outcome.embedded.push_back(std::move(chunks[i]));
        } else {
            outcome.failed_ordinals.push_back(chunks[i].ordinal);
        }
    }

    if (!outcome.failed_ordinals.empty()) {
        std::cerr << "[Embedding] " << outcome.failed_ordinals.size() << " of " << chunks.size()
                  << " chunks excluded after retries\n";
    }
    return outcome;
}
