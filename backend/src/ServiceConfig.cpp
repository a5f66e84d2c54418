#include "ServiceConfig.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& section, const char* key, T& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<T>();
    }
}

}

void ServiceConfig::validate() const {
    if (chunking.chunk_size == 0) {
        throw std::invalid_argument("chunking.chunk_size must be positive");
    }
    if (chunking.chunk_overlap >= chunking.chunk_size) {
        throw std::invalid_argument("chunking.chunk_overlap must be smaller than chunk_size");
    }
    if (chunking.min_chunk_size > chunking.chunk_size) {
        throw std::invalid_argument("chunking.min_chunk_size must not exceed chunk_size");
    }
    if (embedding.dimension == 0) {
        throw std::invalid_argument("embedding.dimension must be positive");
    }
    if (embedding.provider != "hashing" && embedding.provider != "http") {
        throw std::invalid_argument("embedding.provider must be 'hashing' or 'http'");
    }
    if (embedding.max_retries < 0) {
        throw std::invalid_argument("embedding.max_retries must not be negative");
    }
    if (layout.band_start < 0.0 || layout.band_end > 1.0 || layout.band_start >= layout.band_end) {
        throw std::invalid_argument("layout search band must satisfy 0 <= band_start < band_end <= 1");
    }
    if (extraction.timeout_seconds <= 0) {
        throw std::invalid_argument("extraction.timeout_seconds must be positive");
    }
    if (server.max_results_cap <= 0) {
        throw std::invalid_argument("server.max_results_cap must be positive");
    }
}

ServiceConfig ServiceConfig::from_json(const json& j) {
    ServiceConfig cfg;

    if (j.contains("layout")) {
        const json& s = j["layout"];
        read_key(s, "bin_width", cfg.layout.bin_width);
        read_key(s, "smoothing_window", cfg.layout.smoothing_window);
        read_key(s, "gap_density_ratio", cfg.layout.gap_density_ratio);
        read_key(s, "min_gap_width", cfg.layout.min_gap_width);
        read_key(s, "band_start", cfg.layout.band_start);
        read_key(s, "band_end", cfg.layout.band_end);
        read_key(s, "min_chars", cfg.layout.min_chars);
        read_key(s, "min_side_share", cfg.layout.min_side_share);
    }
    if (j.contains("chunking")) {
        const json& s = j["chunking"];
        read_key(s, "chunk_size", cfg.chunking.chunk_size);
        read_key(s, "chunk_overlap", cfg.chunking.chunk_overlap);
        read_key(s, "min_chunk_size", cfg.chunking.min_chunk_size);
    }
    if (j.contains("extraction")) {
        const json& s = j["extraction"];
        read_key(s, "timeout_seconds", cfg.extraction.timeout_seconds);
        read_key(s, "max_page_count", cfg.extraction.max_page_count);
        read_key(s, "extractor_command", cfg.extraction.extractor_command);
        read_key(s, "temp_dir", cfg.extraction.temp_dir);
        read_key(s, "figures_dir", cfg.extraction.figures_dir);
        read_key(s, "caption_search_distance", cfg.extraction.caption_search_distance);
    }
    if (j.contains("embedding")) {
        const json& s = j["embedding"];
        read_key(s, "provider", cfg.embedding.provider);
        read_key(s, "host", cfg.embedding.host);
        read_key(s, "port", cfg.embedding.port);
        read_key(s, "path", cfg.embedding.path);
        read_key(s, "model", cfg.embedding.model);
        read_key(s, "dimension", cfg.embedding.dimension);
        read_key(s, "batch_size", cfg.embedding.batch_size);
        read_key(s, "max_retries", cfg.embedding.max_retries);
        read_key(s, "workers", cfg.embedding.workers);
        read_key(s, "timeout_seconds", cfg.embedding.timeout_seconds);
    }
    if (j.contains("storage")) {
        const json& s = j["storage"];
        read_key(s, "data_dir", cfg.storage.data_dir);
        read_key(s, "flush_batch_size", cfg.storage.flush_batch_size);
        read_key(s, "flush_interval_seconds", cfg.storage.flush_interval_seconds);
    }
    if (j.contains("server")) {
        const json& s = j["server"];
        read_key(s, "host", cfg.server.host);
        read_key(s, "port", cfg.server.port);
        read_key(s, "max_results_cap", cfg.server.max_results_cap);
        read_key(s, "processing_workers", cfg.server.processing_workers);
    }

    cfg.validate();
    return cfg;
}

ServiceConfig ServiceConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[Config] Warning: Could not open " << path << ", using defaults" << std::endl;
        return ServiceConfig{};
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        std::cerr << "[Config] Warning: Malformed " << path << " (" << e.what() << "), using defaults" << std::endl;
        return ServiceConfig{};
    }

    // Type errors and invalid values propagate
    ServiceConfig cfg = from_json(j);
    std::cout << "[Config] Loaded " << path << std::endl;
    return cfg;
}
