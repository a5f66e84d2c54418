#pragma once
// LayoutAnalyzer.hpp
// Per-page column detection from glyph position density.

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "PageModel.hpp"
#include "ServiceConfig.hpp"

struct SingleColumn {};

struct TwoColumn {
    double boundary = 0.0;   // x coordinate splitting left and right columns
};

using PageLayout = std::variant<SingleColumn, TwoColumn>;

bool is_two_column(const PageLayout& layout);
std::optional<double> column_boundary(const PageLayout& layout);
std::string describe_layout(const PageLayout& layout);

/**
 * LayoutAnalyzer: decides single- vs two-column layout for one page.
 *
 * All glyph bounding boxes are projected onto the x axis to build a density
 * histogram. A sustained low-density band inside the central search band
 * (wide enough and deep enough) is taken as a column gutter.
 * Degenerate pages and any analysis error yield SingleColumn.
 */
class LayoutAnalyzer {
public:
    explicit LayoutAnalyzer(const LayoutConfig& config = LayoutConfig());

    PageLayout analyze(const PageContent& page) const;

    // Convenience for a whole document; each page is decided independently
    std::vector<PageLayout> analyze_pages(const std::vector<PageContent>& pages) const;

private:
    LayoutConfig config_;

    PageLayout detect(const PageContent& page) const;
    double bin_width_for(double page_width) const;
    std::vector<double> density_histogram(const PageContent& page, double bin_width) const;
    std::vector<double> smooth(const std::vector<double>& bins) const;
};
