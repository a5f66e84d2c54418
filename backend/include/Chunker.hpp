#pragma once
// Chunker.hpp
// Deterministic character-window chunking of sectioned text.

#include <string>
#include <vector>
#include "DocumentModel.hpp"
#include "ServiceConfig.hpp"

class Chunker {
public:
    explicit Chunker(const ChunkingConfig& config = ChunkingConfig());

    /**
     * Chunks every section in the given order; ordinals run across the
     * whole document. When no section has content, full_text is chunked as
     * one "unclassified" section instead.
     *
     * page_offsets[i] is where page i+1 starts in full_text; chunks of
     * sections without an offset get no page.
     */
    std::vector<Chunk> chunk(const std::string& document_id,
                             const std::vector<Section>& sections,
                             const std::string& full_text,
                             const std::vector<std::size_t>& page_offsets = {}) const;

    // Window [start, end) pairs for one section's text
    std::vector<std::pair<std::size_t, std::size_t>> windows(const std::string& text) const;

    static ChunkType type_for_section(const std::string& section);

private:
    ChunkingConfig config_;

    std::size_t window_end(const std::string& text, std::size_t start) const;
};
