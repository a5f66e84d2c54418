#pragma once
// PDFLayoutReader.hpp
// Gets positioned page content out of a PDF by running the external layout
// dumper (scripts/dump_pdf_layout.py) under the extraction time budget.

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "PageModel.hpp"
#include "ServiceConfig.hpp"

using json = nlohmann::json;

// Source of page layouts; tests substitute in-memory pages
class LayoutSource {
public:
    virtual ~LayoutSource() = default;

    // Throws UnreadablePdf when the PDF cannot be opened, ExtractionTimeout past the deadline
    virtual PdfLayout read(const std::string& document_id,
                           const std::string& pdf_bytes,
                           std::chrono::steady_clock::time_point deadline) const = 0;
};

class PDFLayoutReader : public LayoutSource {
public:
    explicit PDFLayoutReader(const ExtractionConfig& config);

    PdfLayout read(const std::string& document_id,
                   const std::string& pdf_bytes,
                   std::chrono::steady_clock::time_point deadline) const override;

    // Dumper output -> PdfLayout; throws UnreadablePdf on a malformed dump
    static PdfLayout parse_layout_json(const json& j);

    // Per-document directory for saved figure images: the id with unsafe
    // characters replaced, plus a hash of the raw id so distinct ids never share it
    std::string figures_dir_for(const std::string& document_id) const;

    // Removes stale temp files left by crashed runs (older than one hour)
    void cleanup_temp_files() const;

private:
    ExtractionConfig config_;

    std::string extractor_command() const;
};
