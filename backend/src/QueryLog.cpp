#include "QueryLog.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

QueryLog::QueryLog(const std::string& path) : path_(path) {}

bool QueryLog::append(const SearchQueryRecord& record) {
    json line;
    line["query"] = record.query;
    line["embedding"] = record.embedding;
    line["results_count"] = record.results_count;
    line["top_score"] = record.top_score ? json(*record.top_score) : json(nullptr);
    line["timestamp"] = record.timestamp;

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) {
        std::cerr << "[QueryLog] Warning: Could not open " << path_ << std::endl;
        return false;
    }
    out << line.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        std::cerr << "[QueryLog] Warning: Write failed for " << path_ << std::endl;
        return false;
    }
    return true;
}

std::vector<SearchQueryRecord> QueryLog::read_all() const {
    std::vector<SearchQueryRecord> records;

    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path_);
    if (!in.is_open()) return records;

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        try {
            json j = json::parse(line);
            SearchQueryRecord record;
            record.query = j.value("query", "");
            record.embedding = j.value("embedding", std::vector<float>());
            record.results_count = j.value("results_count", static_cast<std::size_t>(0));
            if (j.contains("top_score") && !j["top_score"].is_null()) {
                record.top_score = j["top_score"].get<double>();
            }
            record.timestamp = j.value("timestamp", static_cast<std::int64_t>(0));
            records.push_back(std::move(record));
        } catch (const json::exception& e) {
            std::cerr << "[QueryLog] Skipping malformed line: " << e.what() << std::endl;
        }
    }
    return records;
}
