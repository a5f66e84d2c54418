#pragma once
// SearchService.hpp
// Query path: embed the query text, rank stored chunks, build the response
// object and append an audit record.

#include <string>
#include <nlohmann/json.hpp>
#include "EmbeddingClient.hpp"
#include "QueryLog.hpp"
#include "VectorStore.hpp"

using json = nlohmann::json;

struct SearchRequest {
    std::string query;
    int max_results = 10;
    SearchFilters filters;
};

class SearchService {
public:
    // query_log may be null (no audit trail)
    SearchService(const VectorStore& store,
                  const EmbeddingClient& embedder,
                  QueryLog* query_log,
                  int max_results_cap = 50);

    /**
     * {query, results_count, search_time_ms, chunks: [...]}, chunks ordered by
     * similarity descending then ordinal ascending. An empty query or an
     * unknown document_id gives a valid, possibly empty, response.
     * Throws std::invalid_argument when max_results is outside [1, cap] and
     * StoreUnavailable when the store cannot serve.
     */
    json search(const SearchRequest& request) const;

    int max_results_cap() const { return max_results_cap_; }

private:
    const VectorStore& store_;
    const EmbeddingClient& embedder_;
    QueryLog* query_log_;
    int max_results_cap_;
};
