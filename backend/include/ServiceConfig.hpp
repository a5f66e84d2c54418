#pragma once
// ServiceConfig.hpp
// Runtime configuration for the ingestion pipeline, vector store and server.
// Loaded from a JSON file; every key is optional and falls back to the
// defaults below.

#include <string>
#include <cstddef>
#include <nlohmann/json.hpp>

struct LayoutConfig {
    double bin_width = 0.0;            // 0 = derive from page width (max(2, width / 150))
    int smoothing_window = 0;          // bins on each side of the moving average, 0 = none
    double gap_density_ratio = 0.15;   // gutter bins must fall below ratio * peak density
    double min_gap_width = 8.0;        // points of sustained low density required
    double band_start = 0.25;          // gutter search band, as fractions of page width
    double band_end = 0.75;
    std::size_t min_chars = 40;        // fewer glyphs than this = degenerate page
    double min_side_share = 0.15;      // each column must hold this share of glyphs
};

struct ChunkingConfig {
    std::size_t chunk_size = 1000;
    std::size_t chunk_overlap = 200;
    std::size_t min_chunk_size = 200;
};

struct ExtractionConfig {
    int timeout_seconds = 60;
    int max_page_count = 500;
    std::string extractor_command = "python3 scripts/dump_pdf_layout.py";
    std::string temp_dir = "data/temp_pdfs";
    std::string figures_dir = "data/figures";
    double caption_search_distance = 60.0;
};

struct EmbeddingConfig {
    std::string provider = "hashing";  // "hashing" | "http"
    std::string host = "localhost";
    int port = 11434;
    std::string path = "/api/embeddings";
    std::string model = "all-minilm";
    std::size_t dimension = 384;
    std::size_t batch_size = 32;
    int max_retries = 3;
    std::size_t workers = 4;
    int timeout_seconds = 60;
};

struct StorageConfig {
    std::string data_dir = "data/processed";
    std::size_t flush_batch_size = 10;
    int flush_interval_seconds = 30;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    int max_results_cap = 50;
    std::size_t processing_workers = 0;  // 0 = hardware concurrency
};

struct ServiceConfig {
    LayoutConfig layout;
    ChunkingConfig chunking;
    ExtractionConfig extraction;
    EmbeddingConfig embedding;
    StorageConfig storage;
    ServerConfig server;

    // Throws std::invalid_argument on inconsistent values
    void validate() const;

    // Missing file or malformed JSON keeps the defaults (logged)
    static ServiceConfig load(const std::string& path);
    static ServiceConfig from_json(const nlohmann::json& j);
};
