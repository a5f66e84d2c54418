#include "Chunker.hpp"
#include <algorithm>
#include <cctype>

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), is_space);
}

std::size_t skip_space(const std::string& text, std::size_t pos) {
    while (pos < text.size() && is_space(text[pos])) ++pos;
    return pos;
}

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Moves pos back onto the first byte of a UTF-8 sequence; falls forward
// instead when that would not get past floor
std::size_t code_point_boundary(const std::string& text, std::size_t pos, std::size_t floor) {
    if (pos >= text.size()) return text.size();
    std::size_t back = pos;
    while (back > floor && is_continuation_byte(text[back])) --back;
    if (back > floor) return back;
    while (pos < text.size() && is_continuation_byte(text[pos])) ++pos;
    return pos;
}

}

Chunker::Chunker(const ChunkingConfig& config) : config_(config) {}

ChunkType Chunker::type_for_section(const std::string& section) {
    if (section == "references") return ChunkType::Reference;
    if (section.rfind("table", 0) == 0) return ChunkType::Table;
    return ChunkType::Text;
}

// Last sentence boundary that keeps the chunk at least min_chunk_size long,
// otherwise a hard cut at chunk_size
std::size_t Chunker::window_end(const std::string& text, std::size_t start) const {
    std::size_t limit = std::min(text.size(), start + config_.chunk_size);
    std::size_t earliest = start + std::max<std::size_t>(config_.min_chunk_size, 1);

    for (std::size_t end = limit; end >= earliest && end > start; --end) {
        char c = text[end - 1];
        if (c == '\n') return end;
        if ((c == '.' || c == '!' || c == '?') && end < text.size() && text[end] == ' ') {
            return end;
        }
    }
    return code_point_boundary(text, limit, start);
}

std::vector<std::pair<std::size_t, std::size_t>> Chunker::windows(const std::string& text) const {
    std::vector<std::pair<std::size_t, std::size_t>> out;

    std::size_t start = skip_space(text, 0);
    while (start < text.size()) {
        if (text.size() - start <= config_.chunk_size) {
            out.emplace_back(start, text.size());
            break;
        }

        std::size_t end = window_end(text, start);
        out.emplace_back(start, end);

        std::size_t next = (end > config_.chunk_overlap) ? end - config_.chunk_overlap : 0;
        if (next <= start) next = start + 1;
        start = skip_space(text, code_point_boundary(text, next, start));
    }
    return out;
}

std::vector<Chunk> Chunker::chunk(const std::string& document_id,
                                  const std::vector<Section>& sections,
                                  const std::string& full_text,
                                  const std::vector<std::size_t>& page_offsets) const {
    bool has_content = std::any_of(sections.begin(), sections.end(),
                                   [](const Section& s) { return !is_blank(s.text); });

    std::vector<Section> fallback;
    const std::vector<Section>* source = &sections;
    if (!has_content) {
        Section whole;
        whole.name = "unclassified";
        whole.text = full_text;
        whole.offset = 0;
        fallback.push_back(std::move(whole));
        source = &fallback;
    }

    std::vector<Chunk> chunks;
    int ordinal = 0;
    for (const auto& section : *source) {
        if (is_blank(section.text)) continue;

        ChunkType type = type_for_section(section.name);
        for (const auto& [start, end] : windows(section.text)) {
            Chunk chunk;
            chunk.document_id = document_id;
            chunk.ordinal = ordinal++;
            chunk.text = section.text.substr(start, end - start);
            chunk.section = section.name;
            chunk.type = type;

            if (section.offset && !page_offsets.empty()) {
                std::size_t absolute = *section.offset + start;
                auto it = std::upper_bound(page_offsets.begin(), page_offsets.end(), absolute);
                chunk.page = static_cast<int>(std::max<std::ptrdiff_t>(1, it - page_offsets.begin()));
            }
            chunks.push_back(std::move(chunk));
        }
    }
    return chunks;
}
