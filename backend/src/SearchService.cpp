#include "SearchService.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

SearchService::SearchService(const VectorStore& store,
                             const EmbeddingClient& embedder,
                             QueryLog* query_log,
                             int max_results_cap)
    : store_(store), embedder_(embedder), query_log_(query_log), max_results_cap_(max_results_cap) {}

json SearchService::search(const SearchRequest& request) const {
    if (request.max_results < 1 || request.max_results > max_results_cap_) {
        throw std::invalid_argument("max_results must be between 1 and " + std::to_string(max_results_cap_));
    }

    auto start = std::chrono::high_resolution_clock::now();

    std::vector<float> query_vec = embedder_.embed(request.query);
    std::vector<ScoredChunk> hits = store_.search(query_vec, request.max_results, request.filters);

    auto end = std::chrono::high_resolution_clock::now();
    double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

    json response_json;
    response_json["query"] = request.query;
    response_json["results_count"] = hits.size();
    response_json["search_time_ms"] = elapsed_ms;
    response_json["chunks"] = json::array();

    for (const auto& hit : hits) {
        json item = chunk_to_json(hit.chunk);
        item["similarity_score"] = hit.score;
        response_json["chunks"].push_back(item);
    }

    if (query_log_) {
        SearchQueryRecord record;
        record.query = request.query;
        record.embedding = query_vec;
        record.results_count = hits.size();
        if (!hits.empty()) record.top_score = hits.front().score;
        record.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        if (!query_log_->append(record)) {
            std::cerr << "[Search] Query not recorded in audit log" << std::endl;
        }
    }

    std::cout << "[Search] \"" << request.query.substr(0, 60) << "\" -> " << hits.size()
              << " chunks in " << elapsed_ms << "ms" << std::endl;
    return response_json;
}
