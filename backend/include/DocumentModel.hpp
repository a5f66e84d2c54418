#pragma once
// DocumentModel.hpp
// Records produced by extraction and chunking, plus the per-document state
// kept by the registry.

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "PageModel.hpp"

using json = nlohmann::json;

enum class ChunkType { Text, Table, Reference };

std::string to_string(ChunkType type);
std::optional<ChunkType> chunk_type_from_string(const std::string& name);

// uploaded -> extracting -> chunking -> embedding -> indexed; failed from any non-terminal state
enum class DocumentStatus { Uploaded, Extracting, Chunking, Embedding, Indexed, Failed };

std::string to_string(DocumentStatus status);
std::optional<DocumentStatus> document_status_from_string(const std::string& name);

enum class StageState { Pending, Done, Failed };

std::string to_string(StageState state);
StageState stage_state_from_string(const std::string& name);

struct StageFlags {
    StageState text = StageState::Pending;
    StageState tables = StageState::Pending;
    StageState figures = StageState::Pending;
    StageState references = StageState::Pending;
};

// A labelled region of the full text
struct Section {
    std::string name;
    std::string text;
    std::optional<std::size_t> offset;   // start in the full text, unknown for caller-supplied sections
};

struct TableRecord {
    int page = 0;
    int index = 0;   // 1-based, per page
    std::optional<std::string> caption;
    BBox box;
    std::vector<std::vector<std::optional<std::string>>> cells;
};

struct FigureRecord {
    int page = 0;
    int index = 0;   // 1-based, per page
    std::optional<std::string> caption;
    BBox box;
    double width = 0.0;
    double height = 0.0;
    std::optional<std::string> image_path;
};

struct Reference {
    int index = 0;
    std::string raw_text;
    std::optional<int> year;
    std::optional<std::vector<std::string>> authors;
    std::optional<std::string> title;
};

struct Chunk {
    std::string document_id;
    int ordinal = 0;
    std::string text;
    std::string section;
    std::optional<int> page;
    ChunkType type = ChunkType::Text;
    std::vector<float> embedding;   // empty until embedded

    // "<document_id>-<ordinal>"
    std::string chunk_id() const;
};

struct Document {
    std::string id;
    DocumentStatus status = DocumentStatus::Uploaded;
    StageFlags stages;
    int page_count = 0;
    std::optional<std::string> title;
    std::optional<std::vector<std::string>> authors;
    std::optional<std::string> doi;
    bool ocr_applied = false;
    std::string full_text;
    std::vector<Section> sections;
    std::vector<TableRecord> tables;
    std::vector<FigureRecord> figures;
    std::vector<Reference> references;
    std::vector<int> failed_chunks;   // ordinals excluded after embedding retries
    std::size_t chunk_count = 0;
    std::string last_error;
    std::int64_t updated_at = 0;       // unix seconds
};

json section_to_json(const Section& section);
json table_to_json(const TableRecord& table);
json figure_to_json(const FigureRecord& figure);
json reference_to_json(const Reference& ref);
json chunk_to_json(const Chunk& chunk, bool include_embedding = false);

// Full text and section bodies are only written when include_text is set
json document_to_json(const Document& doc, bool include_text);
Document document_from_json(const json& j);

// Caller-supplied sections: {"name": "text", ...} or [{"name", "text"}, ...].
// Throws std::invalid_argument for any other shape.
std::vector<Section> sections_from_json(const json& j);
