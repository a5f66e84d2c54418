#include "StructuralExtractor.hpp"
#include "Errors.hpp"
#include "ReferenceParser.hpp"
#include "SectionSplitter.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <limits>

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string trim(const std::string& s, const char* chars = " \t\r\n") {
    std::size_t b = s.find_first_not_of(chars);
    if (b == std::string::npos) return "";
    std::size_t e = s.find_last_not_of(chars);
    return s.substr(b, e - b + 1);
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::string current;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) words.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

double glyph_size(const Glyph& g) {
    return g.size > 0.0 ? g.size : std::max(1.0, g.box.height());
}

TextLine make_line(std::vector<Glyph> glyphs) {
    std::sort(glyphs.begin(), glyphs.end(),
              [](const Glyph& a, const Glyph& b) { return a.box.x0 < b.box.x0; });

    TextLine line;
    double size_sum = 0.0;
    for (std::size_t i = 0; i < glyphs.size(); ++i) {
        const Glyph& g = glyphs[i];
        if (i == 0) {
            line.box = g.box;
        } else {
            const Glyph& prev = glyphs[i - 1];
            double gap = g.box.x0 - prev.box.x1;
            if (gap > 0.25 * std::max(glyph_size(prev), glyph_size(g))) {
                line.text += ' ';
            }
            line.box.x0 = std::min(line.box.x0, g.box.x0);
            line.box.top = std::min(line.box.top, g.box.top);
            line.box.x1 = std::max(line.box.x1, g.box.x1);
            line.box.bottom = std::max(line.box.bottom, g.box.bottom);
        }
        line.text += g.text;
        size_sum += glyph_size(g);
    }
    line.size = glyphs.empty() ? 0.0 : size_sum / static_cast<double>(glyphs.size());
    line.text = trim(line.text);
    line.glyphs = std::move(glyphs);
    return line;
}

// Glyphs sharing a baseline band, sorted top to bottom
std::vector<std::vector<Glyph>> cluster_rows(const std::vector<Glyph>& glyphs) {
    std::vector<Glyph> sorted;
    sorted.reserve(glyphs.size());
    for (const auto& g : glyphs) {
        if (!is_blank(g.text)) sorted.push_back(g);
    }
    std::sort(sorted.begin(), sorted.end(), [](const Glyph& a, const Glyph& b) {
        if (a.box.top != b.box.top) return a.box.top < b.box.top;
        return a.box.x0 < b.box.x0;
    });

    std::vector<std::vector<Glyph>> rows;
    double row_top = 0.0;
    double tolerance = 0.0;
    for (const auto& g : sorted) {
        if (rows.empty() || g.box.top - row_top > tolerance) {
            rows.emplace_back();
            row_top = g.box.top;
            tolerance = std::max(1.5, 0.4 * glyph_size(g));
        }
        rows.back().push_back(g);
    }
    return rows;
}

std::string join_block(const std::vector<TextLine>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            double gap = lines[i].box.top - lines[i - 1].box.bottom;
            out += (gap > 0.8 * std::max(1.0, lines[i - 1].size)) ? "\n\n" : "\n";
        }
        out += lines[i].text;
    }
    return out;
}

bool looks_like_affiliation(const std::string& text) {
    static const std::vector<std::string> keywords = {
        "@", "department of", "dept", "university", "institute", "school of", "laboratory",
        "college", "center", "centre", "inc.", "llc", "corp", "email", "orcid",
        ".com", ".edu", ".org"
    };
    std::string low = lowercase(text);
    return std::any_of(keywords.begin(), keywords.end(),
                       [&](const std::string& k) { return low.find(k) != std::string::npos; });
}

// Drops superscript affiliation markers, emails, footnote symbols and digits
std::string clean_author_line(const TextLine& line) {
    std::vector<double> sizes;
    for (const auto& g : line.glyphs) sizes.push_back(glyph_size(g));
    std::string text = line.text;
    if (!sizes.empty()) {
        std::nth_element(sizes.begin(), sizes.begin() + static_cast<std::ptrdiff_t>(sizes.size() / 2), sizes.end());
        double median = sizes[sizes.size() / 2];
        std::vector<Glyph> kept;
        for (const auto& g : line.glyphs) {
            if (glyph_size(g) >= 0.8 * median) kept.push_back(g);
        }
        text = make_line(kept).text;
    }

    static const std::regex email(R"(\S+@\S+)");
    static const std::regex markers(R"([0-9*#])");
    text = std::regex_replace(text, email, " ");
    text = std::regex_replace(text, markers, "");
    replace_all(text, "\xE2\x80\xA0", "");   // dagger
    replace_all(text, "\xE2\x80\xA1", "");   // double dagger
    replace_all(text, "\xC2\xA7", "");       // section sign
    replace_all(text, "\xC2\xB6", "");       // pilcrow
    return text;
}

bool plausible_name(const std::string& candidate) {
    std::vector<std::string> words = split_words(candidate);
    if (words.size() < 2 || words.size() > 5) return false;
    std::size_t capitalized = static_cast<std::size_t>(std::count_if(words.begin(), words.end(),
        [](const std::string& w) { return std::isupper(static_cast<unsigned char>(w[0])); }));
    return static_cast<double>(capitalized) >= 0.6 * static_cast<double>(words.size());
}

// "Artem A. Sukhobokov Yury E. Gapanyuk" -> two names
std::vector<std::string> split_concatenated_names(const std::string& text) {
    static const std::regex given_initial_family(R"([A-Z][a-z]+(?:\s+[A-Z]\.)+\s+[A-Z][a-z]+)");
    std::vector<std::string> names;
    for (std::sregex_iterator it(text.begin(), text.end(), given_initial_family), end; it != end; ++it) {
        names.push_back(it->str());
    }
    if (names.size() >= 2) return names;
    return {text};
}

std::vector<std::string> split_author_candidates(const std::string& text) {
    static const std::regex separators(R"(\s*(?:,|;|&|\band\b|\bAND\b)\s*)");
    std::vector<std::string> out;
    std::sregex_token_iterator it(text.begin(), text.end(), separators, -1);
    for (std::sregex_token_iterator end; it != end; ++it) {
        std::string piece = trim(it->str(), " \t.,;");
        if (!piece.empty()) out.push_back(piece);
    }
    return out;
}

struct TitleSpan {
    std::string text;
    std::size_t last_line = 0;
    double size = 0.0;
};

std::optional<TitleSpan> locate_title(const std::vector<TextLine>& lines, double page_height) {
    std::optional<std::size_t> best;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const TextLine& line = lines[i];
        if (line.box.top >= 0.35 * page_height || line.size <= 6.0) continue;
        std::size_t letters = static_cast<std::size_t>(std::count_if(line.text.begin(), line.text.end(),
            [](unsigned char c) { return std::isalpha(c); }));
        if (letters < 2) continue;
        if (!best || line.size > lines[*best].size + 0.01) best = i;
    }
    if (!best) return std::nullopt;

    TitleSpan span;
    span.text = lines[*best].text;
    span.size = lines[*best].size;
    span.last_line = *best;

    // Titles wrap onto following lines of the same size
    for (std::size_t i = *best + 1; i < lines.size(); ++i) {
        const TextLine& prev = lines[i - 1];
        const TextLine& line = lines[i];
        if (std::abs(line.size - span.size) >= 0.5) break;
        if (line.box.top - prev.box.bottom > 1.5 * span.size) break;
        span.text += " " + line.text;
        span.last_line = i;
    }

    span.text = trim(span.text);
    if (span.text.size() < 3) return std::nullopt;
    return span;
}

}

std::vector<TextLine> PageText::lines() const {
    std::vector<TextLine> all;
    for (const auto& block : blocks) all.insert(all.end(), block.begin(), block.end());
    return all;
}

std::string PageText::text() const {
    std::string out;
    for (const auto& block : blocks) {
        if (block.empty()) continue;
        if (!out.empty()) out += "\n\n";
        out += join_block(block);
    }
    return out;
}

StructuralExtractor::StructuralExtractor(const ExtractionConfig& config) : config_(config) {}

const std::regex& StructuralExtractor::table_caption_pattern() {
    static const std::regex pattern(R"(^(Table|TABLE)\s+[IVXLC\d]+[:.])");
    return pattern;
}

const std::regex& StructuralExtractor::figure_caption_pattern() {
    static const std::regex pattern(R"(^(Figure|Fig\.?)\s+\d+)", std::regex::icase);
    return pattern;
}

std::vector<TextLine> StructuralExtractor::group_lines(const std::vector<Glyph>& glyphs) {
    std::vector<TextLine> lines;
    for (auto& row : cluster_rows(glyphs)) {
        TextLine line = make_line(std::move(row));
        if (!line.text.empty()) lines.push_back(std::move(line));
    }
    return lines;
}

PageText StructuralExtractor::reading_order(const PageContent& page, const PageLayout& layout) {
    PageText result;
    auto boundary = column_boundary(layout);
    if (!boundary) {
        result.blocks.push_back(group_lines(page.glyphs));
        return result;
    }

    std::vector<TextLine> spanning;
    std::vector<TextLine> left;
    std::vector<TextLine> right;

    for (auto& row : cluster_rows(page.glyphs)) {
        std::sort(row.begin(), row.end(),
                  [](const Glyph& a, const Glyph& b) { return a.box.x0 < b.box.x0; });

        // A row is full-width only if its text runs across the gutter without a column-sized gap
        bool crosses = false;
        for (std::size_t i = 1; i < row.size(); ++i) {
            const Glyph& a = row[i - 1];
            const Glyph& b = row[i];
            if (a.box.center_x() < *boundary && b.box.center_x() >= *boundary) {
                double gap = b.box.x0 - a.box.x1;
                crosses = gap < 0.8 * std::max(glyph_size(a), glyph_size(b));
                break;
            }
        }

        if (crosses) {
            TextLine line = make_line(std::move(row));
            if (!line.text.empty()) spanning.push_back(std::move(line));
            continue;
        }

        std::vector<Glyph> left_glyphs;
        std::vector<Glyph> right_glyphs;
        for (auto& g : row) {
            if (g.box.center_x() < *boundary) {
                left_glyphs.push_back(std::move(g));
            } else {
                right_glyphs.push_back(std::move(g));
            }
        }
        if (!left_glyphs.empty()) {
            TextLine line = make_line(std::move(left_glyphs));
            if (!line.text.empty()) left.push_back(std::move(line));
        }
        if (!right_glyphs.empty()) {
            TextLine line = make_line(std::move(right_glyphs));
            if (!line.text.empty()) right.push_back(std::move(line));
        }
    }

    double column_top = std::numeric_limits<double>::max();
    if (!left.empty()) column_top = std::min(column_top, left.front().box.top);
    if (!right.empty()) column_top = std::min(column_top, right.front().box.top);

    std::vector<TextLine> header;
    std::vector<TextLine> footer;
    for (auto& line : spanning) {
        if (line.box.top < column_top) {
            header.push_back(std::move(line));
        } else {
            footer.push_back(std::move(line));
        }
    }

    result.blocks.push_back(std::move(header));
    result.blocks.push_back(std::move(left));
    result.blocks.push_back(std::move(right));
    result.blocks.push_back(std::move(footer));
    return result;
}

std::optional<std::string> StructuralExtractor::find_title(const std::vector<TextLine>& first_page_lines,
                                                           double page_height) {
    auto span = locate_title(first_page_lines, page_height);
    if (!span) return std::nullopt;
    return span->text;
}

std::optional<std::vector<std::string>> StructuralExtractor::find_authors(
        const std::vector<TextLine>& first_page_lines, double page_height) {
    auto title = locate_title(first_page_lines, page_height);
    if (!title) return std::nullopt;

    std::vector<std::string> authors;
    std::size_t taken = 0;
    for (std::size_t i = title->last_line + 1; i < first_page_lines.size() && taken < 3; ++i) {
        const TextLine& line = first_page_lines[i];
        std::string low = lowercase(line.text);
        if (low.rfind("abstract", 0) == 0 || SectionSplitter::classify_heading(line.text)) break;
        if (line.text.size() < 3) continue;
        ++taken;

        for (const auto& candidate : split_author_candidates(clean_author_line(line))) {
            if (looks_like_affiliation(candidate)) continue;

            std::vector<std::string> names;
            if (split_words(candidate).size() > 5) {
                names = split_concatenated_names(candidate);
            } else {
                names.push_back(candidate);
            }
            for (const auto& name : names) {
                std::string cleaned = trim(name, " \t.,;");
                if (plausible_name(cleaned)) authors.push_back(cleaned);
            }
        }
    }

    if (authors.empty()) return std::nullopt;
    return authors;
}

std::optional<std::string> StructuralExtractor::find_caption(const std::vector<TextLine>& lines,
                                                             const BBox& box,
                                                             const std::regex& pattern,
                                                             double max_distance) {
    std::vector<std::pair<double, const TextLine*>> nearby;
    for (const auto& line : lines) {
        bool overlaps = line.box.x1 >= box.x0 && line.box.x0 <= box.x1;
        if (!overlaps) continue;

        if (line.box.top >= box.bottom - 1.0) {
            double distance = std::max(0.0, line.box.top - box.bottom);
            if (distance <= max_distance) nearby.emplace_back(distance, &line);
        } else if (line.box.bottom <= box.top + 1.0) {
            double distance = std::max(0.0, box.top - line.box.bottom);
            if (distance <= max_distance) nearby.emplace_back(distance, &line);
        }
    }

    std::stable_sort(nearby.begin(), nearby.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    for (const auto& [distance, line] : nearby) {
        std::string text = trim(line->text);
        if (!std::regex_search(text, pattern)) continue;
        if (text.size() > 200) {
            text = text.substr(0, 200) + "...";
        }
        return text;
    }
    return std::nullopt;
}

void StructuralExtractor::check_deadline(Clock::time_point deadline, int page) const {
    if (Clock::now() > deadline) {
        throw ExtractionTimeout("extraction exceeded " + std::to_string(config_.timeout_seconds) +
                                "s budget at page " + std::to_string(page));
    }
}

ExtractionResult StructuralExtractor::extract(const PdfLayout& pdf,
                                              const std::vector<PageLayout>& layouts,
                                              Clock::time_point deadline) const {
    ExtractionResult result;

    std::vector<PageContent> pages = pdf.pages;
    if (config_.max_page_count > 0 && pages.size() > static_cast<std::size_t>(config_.max_page_count)) {
        std::cerr << "[Extractor] Warning: " << pages.size() << " pages, only the first "
                  << config_.max_page_count << " are processed\n";
        pages.resize(static_cast<std::size_t>(config_.max_page_count));
    }
    result.page_count = static_cast<int>(pages.size());

    std::vector<std::vector<TextLine>> page_lines(pages.size());

    extract_text(pages, layouts, deadline, page_lines, result);
    extract_title_and_authors(pdf, result);
    extract_tables(pages, page_lines, deadline, result);
    extract_figures(pages, page_lines, deadline, result);
    extract_references(result);

    result.doi = ReferenceParser::find_doi(result.full_text);
    result.success = result.stages.text == StageState::Done;

    std::cout << "[Extractor] " << result.page_count << " pages, "
              << result.full_text.size() << " chars, "
              << result.tables.size() << " tables, "
              << result.figures.size() << " figures, "
              << result.references.size() << " references" << std::endl;
    return result;
}

void StructuralExtractor::extract_text(const std::vector<PageContent>& pages,
                                       const std::vector<PageLayout>& layouts,
                                       Clock::time_point deadline,
                                       std::vector<std::vector<TextLine>>& page_lines,
                                       ExtractionResult& result) const {
    bool any_failed = false;

    for (std::size_t i = 0; i < pages.size(); ++i) {
        const PageContent& page = pages[i];
        check_deadline(deadline, page.number);

        if (!result.full_text.empty()) result.full_text += "\n\n";
        result.page_offsets.push_back(result.full_text.size());

        try {
            PageLayout layout = (i < layouts.size()) ? layouts[i] : PageLayout(SingleColumn{});
            PageText text = reading_order(page, layout);
            page_lines[i] = text.lines();
            result.full_text += text.text();
        } catch (const ExtractionTimeout&) {
            throw;
        } catch (const std::exception& e) {
            any_failed = true;
            std::cerr << "[Extractor] Text extraction failed on page " << page.number << ": " << e.what() << "\n";
        }
    }

    if (any_failed) {
        result.stages.text = StageState::Failed;
        result.error = "text extraction failed on one or more pages";
    } else {
        result.stages.text = StageState::Done;
    }
}

void StructuralExtractor::extract_title_and_authors(const PdfLayout& pdf, ExtractionResult& result) const {
    try {
        if (!pdf.pages.empty()) {
            const PageContent& first = pdf.pages.front();
            std::vector<TextLine> lines = group_lines(first.glyphs);
            result.title = find_title(lines, first.height);
            result.authors = find_authors(lines, first.height);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Extractor] Title/author heuristic failed: " << e.what() << "\n";
    }

    // Layout first, embedded metadata second
    if (!result.title && pdf.info.title && !trim(*pdf.info.title).empty()) {
        result.title = trim(*pdf.info.title);
    }
    if (!result.authors && pdf.info.author) {
        std::vector<std::string> names = split_author_candidates(*pdf.info.author);
        if (!names.empty()) result.authors = names;
    }
}

void StructuralExtractor::extract_tables(const std::vector<PageContent>& pages,
                                         const std::vector<std::vector<TextLine>>& page_lines,
                                         Clock::time_point deadline,
                                         ExtractionResult& result) const {
    try {
        for (std::size_t p = 0; p < pages.size(); ++p) {
            const PageContent& page = pages[p];
            check_deadline(deadline, page.number);

            for (std::size_t t = 0; t < page.tables.size(); ++t) {
                const TableGrid& grid = page.tables[t];
                try {
                    bool has_content = std::any_of(grid.cells.begin(), grid.cells.end(), [](const auto& row) {
                        return std::any_of(row.begin(), row.end(),
                                           [](const auto& cell) { return cell && !is_blank(*cell); });
                    });
                    if (!has_content) continue;

                    TableRecord table;
                    table.page = page.number;
                    table.index = static_cast<int>(t) + 1;
                    table.box = grid.box;
                    table.cells = grid.cells;
                    table.caption = find_caption(page_lines[p], grid.box, table_caption_pattern(),
                                                 config_.caption_search_distance);
                    result.tables.push_back(std::move(table));
                } catch (const std::exception& e) {
                    std::cerr << "[Extractor] Skipping table " << (t + 1) << " on page "
                              << page.number << ": " << e.what() << "\n";
                }
            }
        }
        result.stages.tables = StageState::Done;
    } catch (const ExtractionTimeout&) {
        throw;
    } catch (const std::exception& e) {
        result.stages.tables = StageState::Failed;
        std::cerr << "[Extractor] Table extraction failed: " << e.what() << "\n";
    }
}

void StructuralExtractor::extract_figures(const std::vector<PageContent>& pages,
                                          const std::vector<std::vector<TextLine>>& page_lines,
                                          Clock::time_point deadline,
                                          ExtractionResult& result) const {
    try {
        for (std::size_t p = 0; p < pages.size(); ++p) {
            const PageContent& page = pages[p];
            check_deadline(deadline, page.number);

            for (std::size_t f = 0; f < page.images.size(); ++f) {
                const ImageBox& image = page.images[f];
                try {
                    FigureRecord figure;
                    figure.page = page.number;
                    figure.index = static_cast<int>(f) + 1;
                    figure.box = image.box;
                    figure.width = image.width;
                    figure.height = image.height;
                    if (!image.image_path.empty()) figure.image_path = image.image_path;
                    figure.caption = find_caption(page_lines[p], image.box, figure_caption_pattern(),
                                                  config_.caption_search_distance);
                    result.figures.push_back(std::move(figure));
                } catch (const std::exception& e) {
                    std::cerr << "[Extractor] Skipping image " << (f + 1) << " on page "
                              << page.number << ": " << e.what() << "\n";
                }
            }
        }
        result.stages.figures = StageState::Done;
    } catch (const ExtractionTimeout&) {
        throw;
    } catch (const std::exception& e) {
        result.stages.figures = StageState::Failed;
        std::cerr << "[Extractor] Figure extraction failed: " << e.what() << "\n";
    }
}

void StructuralExtractor::extract_references(ExtractionResult& result) const {
    if (is_blank(result.full_text)) {
        result.stages.references = StageState::Failed;
        return;
    }
    try {
        result.references = ReferenceParser::parse(result.full_text);
        result.stages.references = StageState::Done;
    } catch (const std::exception& e) {
        result.stages.references = StageState::Failed;
        std::cerr << "[Extractor] Reference extraction failed: " << e.what() << "\n";
    }
}
