#include "DocumentModel.hpp"
#include <stdexcept>

namespace {

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

template <typename T>
std::optional<T> optional_from_json(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<T>();
}

json bbox_to_json(const BBox& box) {
    return json::array({box.x0, box.top, box.x1, box.bottom});
}

BBox bbox_from_json(const json& j) {
    BBox box;
    if (j.is_array() && j.size() == 4) {
        box.x0 = j[0].get<double>();
        box.top = j[1].get<double>();
        box.x1 = j[2].get<double>();
        box.bottom = j[3].get<double>();
    }
    return box;
}

json cells_to_json(const std::vector<std::vector<std::optional<std::string>>>& cells) {
    json rows = json::array();
    for (const auto& row : cells) {
        json r = json::array();
        for (const auto& cell : row) r.push_back(optional_to_json(cell));
        rows.push_back(r);
    }
    return rows;
}

std::vector<std::vector<std::optional<std::string>>> cells_from_json(const json& j) {
    std::vector<std::vector<std::optional<std::string>>> cells;
    if (!j.is_array()) return cells;
    for (const auto& row : j) {
        std::vector<std::optional<std::string>> r;
        for (const auto& cell : row) {
            if (cell.is_null()) {
                r.push_back(std::nullopt);
            } else {
                r.push_back(cell.get<std::string>());
            }
        }
        cells.push_back(std::move(r));
    }
    return cells;
}

}

std::string to_string(ChunkType type) {
    switch (type) {
        case ChunkType::Text: return "text";
        case ChunkType::Table: return "table";
        case ChunkType::Reference: return "reference";
    }
    return "text";
}

std::optional<ChunkType> chunk_type_from_string(const std::string& name) {
    if (name == "text") return ChunkType::Text;
    if (name == "table") return ChunkType::Table;
    if (name == "reference") return ChunkType::Reference;
    return std::nullopt;
}

std::string to_string(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::Uploaded: return "uploaded";
        case DocumentStatus::Extracting: return "extracting";
        case DocumentStatus::Chunking: return "chunking";
        case DocumentStatus::Embedding: return "embedding";
        case DocumentStatus::Indexed: return "indexed";
        case DocumentStatus::Failed: return "failed";
    }
    return "uploaded";
}

std::optional<DocumentStatus> document_status_from_string(const std::string& name) {
    if (name == "uploaded") return DocumentStatus::Uploaded;
    if (name == "extracting") return DocumentStatus::Extracting;
    if (name == "chunking") return DocumentStatus::Chunking;
    if (name == "embedding") return DocumentStatus::Embedding;
    if (name == "indexed") return DocumentStatus::Indexed;
    if (name == "failed") return DocumentStatus::Failed;
    return std::nullopt;
}

std::string to_string(StageState state) {
    switch (state) {
        case StageState::Pending: return "pending";
        case StageState::Done: return "done";
        case StageState::Failed: return "failed";
    }
    return "pending";
}

StageState stage_state_from_string(const std::string& name) {
    if (name == "done") return StageState::Done;
    if (name == "failed") return StageState::Failed;
    return StageState::Pending;
}

std::string Chunk::chunk_id() const {
    return document_id + "-" + std::to_string(ordinal);
}

json section_to_json(const Section& section) {
    json j;
    j["name"] = section.name;
    j["text"] = section.text;
    j["offset"] = optional_to_json(section.offset);
    return j;
}

json table_to_json(const TableRecord& table) {
    json j;
    j["page"] = table.page;
    j["index"] = table.index;
    j["caption"] = optional_to_json(table.caption);
    j["bbox"] = bbox_to_json(table.box);
    j["cells"] = cells_to_json(table.cells);
    return j;
}

json figure_to_json(const FigureRecord& figure) {
    json j;
    j["page"] = figure.page;
    j["index"] = figure.index;
    j["caption"] = optional_to_json(figure.caption);
    j["bbox"] = bbox_to_json(figure.box);
    j["width"] = figure.width;
    j["height"] = figure.height;
    j["image_path"] = optional_to_json(figure.image_path);
    return j;
}

json reference_to_json(const Reference& ref) {
    json j;
    j["index"] = ref.index;
    j["raw_text"] = ref.raw_text;
    j["year"] = optional_to_json(ref.year);
    j["authors"] = optional_to_json(ref.authors);
    j["title"] = optional_to_json(ref.title);
    return j;
}

json chunk_to_json(const Chunk& chunk, bool include_embedding) {
    json j;
    j["chunk_id"] = chunk.chunk_id();
    j["document_id"] = chunk.document_id;
    j["chunk_index"] = chunk.ordinal;
    j["section"] = chunk.section;
    j["chunk_type"] = to_string(chunk.type);
    j["text"] = chunk.text;
    j["page_number"] = optional_to_json(chunk.page);
    if (include_embedding) {
        j["embedding"] = chunk.embedding;
    }
    return j;
}

json document_to_json(const Document& doc, bool include_text) {
    json j;
    j["id"] = doc.id;
    j["status"] = to_string(doc.status);
    j["stages"] = {
        {"text", to_string(doc.stages.text)},
        {"tables", to_string(doc.stages.tables)},
        {"figures", to_string(doc.stages.figures)},
        {"references", to_string(doc.stages.references)}
    };
    j["page_count"] = doc.page_count;
    j["title"] = optional_to_json(doc.title);
    j["authors"] = optional_to_json(doc.authors);
    j["doi"] = optional_to_json(doc.doi);
    j["ocr_applied"] = doc.ocr_applied;

    json sections = json::array();
    for (const auto& s : doc.sections) {
        if (include_text) {
            sections.push_back(section_to_json(s));
        } else {
            sections.push_back({{"name", s.name}, {"length", s.text.size()}});
        }
    }
    j["sections"] = sections;
    if (include_text) {
        j["full_text"] = doc.full_text;
    }

    json tables = json::array();
    for (const auto& t : doc.tables) tables.push_back(table_to_json(t));
    j["tables"] = tables;

    json figures = json::array();
    for (const auto& f : doc.figures) figures.push_back(figure_to_json(f));
    j["figures"] = figures;

    json refs = json::array();
    for (const auto& r : doc.references) refs.push_back(reference_to_json(r));
    j["references"] = refs;

    j["failed_chunks"] = doc.failed_chunks;
    j["chunk_count"] = doc.chunk_count;
    j["last_error"] = doc.last_error;
    j["updated_at"] = doc.updated_at;
    return j;
}

Document document_from_json(const json& j) {
    Document doc;
    doc.id = j.at("id").get<std::string>();
    doc.status = document_status_from_string(j.value("status", "uploaded")).value_or(DocumentStatus::Uploaded);

    if (j.contains("stages")) {
        const json& s = j["stages"];
        doc.stages.text = stage_state_from_string(s.value("text", "pending"));
        doc.stages.tables = stage_state_from_string(s.value("tables", "pending"));
        doc.stages.figures = stage_state_from_string(s.value("figures", "pending"));
        doc.stages.references = stage_state_from_string(s.value("references", "pending"));
    }

    doc.page_count = j.value("page_count", 0);
    doc.title = optional_from_json<std::string>(j, "title");
    doc.authors = optional_from_json<std::vector<std::string>>(j, "authors");
    doc.doi = optional_from_json<std::string>(j, "doi");
    doc.ocr_applied = j.value("ocr_applied", false);
    doc.full_text = j.value("full_text", "");

    if (j.contains("sections") && j["sections"].is_array()) {
        for (const auto& s : j["sections"]) {
            Section section;
            section.name = s.value("name", "unclassified");
            section.text = s.value("text", "");
            section.offset = optional_from_json<std::size_t>(s, "offset");
            doc.sections.push_back(std::move(section));
        }
    }

    if (j.contains("tables") && j["tables"].is_array()) {
        for (const auto& t : j["tables"]) {
            TableRecord table;
            table.page = t.value("page", 0);
            table.index = t.value("index", 0);
            table.caption = optional_from_json<std::string>(t, "caption");
            if (t.contains("bbox")) table.box = bbox_from_json(t["bbox"]);
            if (t.contains("cells")) table.cells = cells_from_json(t["cells"]);
            doc.tables.push_back(std::move(table));
        }
    }

    if (j.contains("figures") && j["figures"].is_array()) {
        for (const auto& f : j["figures"]) {
            FigureRecord figure;
            figure.page = f.value("page", 0);
            figure.index = f.value("index", 0);
            figure.caption = optional_from_json<std::string>(f, "caption");
            if (f.contains("bbox")) figure.box = bbox_from_json(f["bbox"]);
            figure.width = f.value("width", 0.0);
            figure.height = f.value("height", 0.0);
            figure.image_path = optional_from_json<std::string>(f, "image_path");
            doc.figures.push_back(std::move(figure));
        }
    }

    if (j.contains("references") && j["references"].is_array()) {
        for (const auto& r : j["references"]) {
            Reference ref;
            ref.index = r.value("index", 0);
            ref.raw_text = r.value("raw_text", "");
            ref.year = optional_from_json<int>(r, "year");
            ref.authors = optional_from_json<std::vector<std::string>>(r, "authors");
            ref.title = optional_from_json<std::string>(r, "title");
            doc.references.push_back(std::move(ref));
        }
    }

    doc.failed_chunks = j.value("failed_chunks", std::vector<int>());
    doc.chunk_count = j.value("chunk_count", static_cast<std::size_t>(0));
    doc.last_error = j.value("last_error", "");
    doc.updated_at = j.value("updated_at", static_cast<std::int64_t>(0));
    return doc;
}

std::vector<Section> sections_from_json(const json& j) {
    std::vector<Section> sections;
    if (j.is_null()) return sections;

    if (j.is_object()) {
        for (auto& [name, text] : j.items()) {
            if (!text.is_string()) {
                throw std::invalid_argument("section '" + name + "' must be a string");
            }
            sections.push_back({name, text.get<std::string>(), std::nullopt});
        }
        return sections;
    }

    if (!j.is_array()) {
        throw std::invalid_argument("sections must be an object or an array");
    }
    for (const auto& s : j) {
        if (!s.is_object() || !s.contains("text") || !s["text"].is_string()) {
            throw std::invalid_argument("each section needs a string 'text'");
        }
        Section section;
        section.name = s.value("name", "unclassified");
        section.text = s["text"].get<std::string>();
        sections.push_back(std::move(section));
    }
    return sections;
}
