#pragma once
// ReferenceParser.hpp
// Best-effort bibliography parsing: locate the references span, split it into
// entries and pull year / authors / quoted title out of each entry.
// Every field heuristic returns nullopt instead of guessing.

#include <optional>
#include <string>
#include <vector>
#include "DocumentModel.hpp"

class ReferenceParser {
public:
    // Body of the last references heading, ending at an appendix or acknowledgments heading
    static std::optional<std::string> find_references_span(const std::string& full_text);

    static std::vector<Reference> parse(const std::string& full_text);

    // Entries marked "[n]" or "n." at line start; blank-line paragraphs otherwise
    static std::vector<Reference> parse_entries(const std::string& span);

    static std::optional<int> find_year(const std::string& entry);
    static std::optional<std::vector<std::string>> find_authors(const std::string& entry);
    static std::optional<std::string> find_title(const std::string& entry);

    // First DOI in the text, without "doi:" / "https://doi.org/" prefixes
    static std::optional<std::string> find_doi(const std::string& text);
};
