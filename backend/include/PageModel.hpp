#pragma once
// PageModel.hpp
// Raw per-page content as dumped by the external PDF layout extractor:
// positioned glyphs, embedded images and detected table grids.
// Coordinates are PDF points with the origin at the top-left of the page.

#include <string>
#include <vector>
#include <optional>

struct BBox {
    double x0 = 0.0;
    double top = 0.0;
    double x1 = 0.0;
    double bottom = 0.0;

    double width() const { return x1 - x0; }
    double height() const { return bottom - top; }
    double center_x() const { return (x0 + x1) / 2.0; }
};

// One rendered character (or short run) with its font size
struct Glyph {
    std::string text;
    BBox box;
    double size = 0.0;
};

struct ImageBox {
    BBox box;
    double width = 0.0;       // intrinsic pixel width
    double height = 0.0;      // intrinsic pixel height
    std::string image_path;   // where the extractor saved the bytes (may be empty)
};

struct TableGrid {
    BBox box;
    std::vector<std::vector<std::optional<std::string>>> cells;
};

struct PageContent {
    int number = 0;           // 1-based
    double width = 0.0;
    double height = 0.0;
    std::vector<Glyph> glyphs;
    std::vector<ImageBox> images;
    std::vector<TableGrid> tables;
};

// Document-level info embedded in the PDF (/Title, /Author), if any
struct PdfInfo {
    std::optional<std::string> title;
    std::optional<std::string> author;
    int page_count = 0;
    bool ocr_applied = false;   // glyphs came from OCR of a scanned PDF
};

struct PdfLayout {
    PdfInfo info;
    std::vector<PageContent> pages;
};
