#pragma once
// QueryLog.hpp
// Append-only JSONL audit log of search queries. Never read by the search path.

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct SearchQueryRecord {
    std::string query;
    std::vector<float> embedding;
    std::size_t results_count = 0;
    std::optional<double> top_score;
    std::int64_t timestamp = 0;   // unix milliseconds
};

class QueryLog {
public:
    explicit QueryLog(const std::string& path);

    // Write failures are logged and reported as false, never thrown
    bool append(const SearchQueryRecord& record);

    // Malformed lines are skipped
    std::vector<SearchQueryRecord> read_all() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
};
