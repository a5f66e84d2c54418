#pragma once
// StructuralExtractor.hpp
// Turns dumped page content plus per-page layout decisions into ordered
// full text, title/author guesses, tables, figures and references.

#include <chrono>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "DocumentModel.hpp"
#include "LayoutAnalyzer.hpp"
#include "PageModel.hpp"
#include "ServiceConfig.hpp"

struct TextLine {
    std::string text;
    BBox box;
    double size = 0.0;            // average glyph size
    std::vector<Glyph> glyphs;    // left to right
};

// Lines of one page in reading order, grouped into blocks
// (spanning header, left column, right column, spanning footer)
struct PageText {
    std::vector<std::vector<TextLine>> blocks;

    std::vector<TextLine> lines() const;
    std::string text() const;
};

struct ExtractionResult {
    bool success = false;       // text stage succeeded
    std::string error;
    std::string full_text;
    std::vector<std::size_t> page_offsets;   // [i] = offset where page i+1 starts
    int page_count = 0;
    std::optional<std::string> title;
    std::optional<std::vector<std::string>> authors;
    std::optional<std::string> doi;
    std::vector<TableRecord> tables;
    std::vector<FigureRecord> figures;
    std::vector<Reference> references;
    StageFlags stages;
};

class StructuralExtractor {
public:
    using Clock = std::chrono::steady_clock;

    explicit StructuralExtractor(const ExtractionConfig& config = ExtractionConfig());

    // Throws ExtractionTimeout once the deadline passes; every other failure
    // is confined to its stage and recorded in result.stages.
    ExtractionResult extract(const PdfLayout& pdf,
                             const std::vector<PageLayout>& layouts,
                             Clock::time_point deadline) const;

    // Glyphs grouped into lines by vertical position, sorted top to bottom
    static std::vector<TextLine> group_lines(const std::vector<Glyph>& glyphs);

    static PageText reading_order(const PageContent& page, const PageLayout& layout);

    static std::optional<std::string> find_title(const std::vector<TextLine>& first_page_lines,
                                                 double page_height);
    static std::optional<std::vector<std::string>> find_authors(const std::vector<TextLine>& first_page_lines,
                                                                double page_height);

    // Nearest matching line within max_distance above or below the box
    static std::optional<std::string> find_caption(const std::vector<TextLine>& lines,
                                                   const BBox& box,
                                                   const std::regex& pattern,
                                                   double max_distance);

    static const std::regex& table_caption_pattern();
    static const std::regex& figure_caption_pattern();

private:
    ExtractionConfig config_;

    void check_deadline(Clock::time_point deadline, int page) const;

    void extract_text(const std::vector<PageContent>& pages,
                      const std::vector<PageLayout>& layouts,
                      Clock::time_point deadline,
                      std::vector<std::vector<TextLine>>& page_lines,
                      ExtractionResult& result) const;
    void extract_title_and_authors(const PdfLayout& pdf, ExtractionResult& result) const;
    void extract_tables(const std::vector<PageContent>& pages,
                        const std::vector<std::vector<TextLine>>& page_lines,
                        Clock::time_point deadline,
                        ExtractionResult& result) const;
    void extract_figures(const std::vector<PageContent>& pages,
                         const std::vector<std::vector<TextLine>>& page_lines,
                         Clock::time_point deadline,
                         ExtractionResult& result) const;
    void extract_references(ExtractionResult& result) const;
};
