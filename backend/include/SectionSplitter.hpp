#pragma once
// SectionSplitter.hpp
// Splits extracted full text into labelled sections by heading lines.

#include <optional>
#include <string>
#include <vector>
#include "DocumentModel.hpp"

class SectionSplitter {
public:
    // Label for a heading line ("3. Methods" -> "methodology"), nullopt if the line is not a heading
    static std::optional<std::string> classify_heading(const std::string& line);

    // Sections in document order. Text before the first heading (or all of it,
    // when there are no headings) is "unclassified". Offsets point into full_text.
    static std::vector<Section> split(const std::string& full_text);

    // abstract, introduction, related_work, ..., appendix, unclassified
    static const std::vector<std::string>& canonical_names();

    // Position in canonical_names(); unknown labels sort after all known ones
    static int canonical_rank(const std::string& name);

    // Stable sort by canonical rank, spans with the same label keep their order
    static std::vector<Section> canonical_order(std::vector<Section> sections);

private:
    static void add_span(std::vector<Section>& out, const std::string& name,
                         const std::string& full_text, std::size_t begin, std::size_t end);
    static void carve_leading_abstract(std::vector<Section>& sections, const std::string& full_text);
};
