#include "SectionSplitter.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <regex>

namespace {

const std::map<std::string, std::string>& heading_labels() {
    static const std::map<std::string, std::string> labels = {
        {"abstract", "abstract"},
        {"summary", "abstract"},
        {"introduction", "introduction"},
        {"background", "introduction"},
        {"related work", "related_work"},
        {"related works", "related_work"},
        {"literature review", "related_work"},
        {"methodology", "methodology"},
        {"methods", "methodology"},
        {"method", "methodology"},
        {"materials and methods", "methodology"},
        {"results", "results"},
        {"findings", "results"},
        {"experiments", "results"},
        {"experimental results", "results"},
        {"discussion", "conclusion"},
        {"conclusion", "conclusion"},
        {"conclusions", "conclusion"},
        {"discussion and conclusion", "conclusion"},
        {"discussion and conclusions", "conclusion"},
        {"acknowledgments", "acknowledgments"},
        {"acknowledgements", "acknowledgments"},
        {"acknowledgment", "acknowledgments"},
        {"acknowledgement", "acknowledgments"},
        {"references", "references"},
        {"bibliography", "references"},
        {"works cited", "references"},
        {"appendix", "appendix"},
        {"appendices", "appendix"}
    };
    return labels;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string collapse_spaces(const std::string& s) {
    std::string out;
    bool in_space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) out += ' ';
        in_space = false;
        out += c;
    }
    return out;
}

struct Heading {
    std::string name;
    std::size_t line_start;
    std::size_t body_start;
};

}

std::optional<std::string> SectionSplitter::classify_heading(const std::string& line) {
    std::string text = collapse_spaces(line);
    if (text.empty() || text.size() > 60) return std::nullopt;

    // Optional numbering: "3", "3.", "3.1", "IV."
    static const std::regex numbered(R"(^(?:(?:\d+(?:\.\d+)*|[ivxlc]+)\.?\s+)?([a-z][a-z ]*?)\s*:?$)");
    std::smatch m;
    std::string lower = lowercase(text);
    if (!std::regex_match(lower, m, numbered)) return std::nullopt;

    std::string words = m[1].str();
    const auto& labels = heading_labels();
    auto it = labels.find(words);
    if (it != labels.end()) return it->second;

    // "Appendix A", "Appendix B"
    static const std::regex appendix(R"(^appendix(?: [a-z])?$)");
    if (std::regex_match(words, appendix)) return std::string("appendix");

    return std::nullopt;
}

const std::vector<std::string>& SectionSplitter::canonical_names() {
    static const std::vector<std::string> names = {
        "abstract", "introduction", "related_work", "methodology", "results",
        "conclusion", "acknowledgments", "references", "appendix", "unclassified"
    };
    return names;
}

int SectionSplitter::canonical_rank(const std::string& name) {
    const auto& names = canonical_names();
    auto it = std::find(names.begin(), names.end(), name);
    if (it == names.end()) return static_cast<int>(names.size());
    return static_cast<int>(it - names.begin());
}

std::vector<Section> SectionSplitter::canonical_order(std::vector<Section> sections) {
    std::stable_sort(sections.begin(), sections.end(), [](const Section& a, const Section& b) {
        return canonical_rank(a.name) < canonical_rank(b.name);
    });
    return sections;
}

void SectionSplitter::add_span(std::vector<Section>& out, const std::string& name,
                               const std::string& full_text, std::size_t begin, std::size_t end) {
    while (begin < end && std::isspace(static_cast<unsigned char>(full_text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(full_text[end - 1]))) --end;
    if (begin >= end) return;

    Section section;
    section.name = name;
    section.text = full_text.substr(begin, end - begin);
    section.offset = begin;
    out.push_back(std::move(section));
}

std::vector<Section> SectionSplitter::split(const std::string& full_text) {
    std::vector<Heading> headings;

    std::size_t pos = 0;
    while (pos < full_text.size()) {
        std::size_t nl = full_text.find('\n', pos);
        std::size_t line_end = (nl == std::string::npos) ? full_text.size() : nl;
        auto label = classify_heading(full_text.substr(pos, line_end - pos));
        std::size_t next = (nl == std::string::npos) ? full_text.size() : nl + 1;
        if (label) {
            headings.push_back({*label, pos, next});
        }
        pos = next;
    }

    std::vector<Section> sections;
    if (headings.empty()) {
        add_span(sections, "unclassified", full_text, 0, full_text.size());
    } else {
        add_span(sections, "unclassified", full_text, 0, headings.front().line_start);
        for (std::size_t i = 0; i < headings.size(); ++i) {
            std::size_t end = (i + 1 < headings.size()) ? headings[i + 1].line_start : full_text.size();
            add_span(sections, headings[i].name, full_text, headings[i].body_start, end);
        }
    }

    bool has_abstract = std::any_of(sections.begin(), sections.end(),
                                    [](const Section& s) { return s.name == "abstract"; });
    if (!has_abstract) {
        carve_leading_abstract(sections, full_text);
    }
    return sections;
}

void SectionSplitter::carve_leading_abstract(std::vector<Section>& sections, const std::string& full_text) {
    if (sections.empty() || sections.front().name != "unclassified" || !sections.front().offset) return;

    const Section lead = sections.front();
    std::size_t lead_begin = *lead.offset;
    std::size_t lead_end = lead_begin + lead.text.size();

    // Only the first hundred lines are searched for an inline "Abstract:" paragraph
    std::size_t search_end = lead_begin;
    for (int lines = 0; lines < 100 && search_end < lead_end; ++lines) {
        std::size_t nl = full_text.find('\n', search_end);
        if (nl == std::string::npos || nl >= lead_end) {
            search_end = lead_end;
            break;
        }
        search_end = nl + 1;
    }

    static const std::regex marker(R"((^|\n)[ \t]*abstract(?![a-z])[ \t]*[:.\-]?[ \t]*)", std::regex::icase);
    std::smatch m;
    auto first = full_text.begin() + static_cast<std::ptrdiff_t>(lead_begin);
    auto last = full_text.begin() + static_cast<std::ptrdiff_t>(search_end);
    if (!std::regex_search(first, last, m, marker)) return;

    std::size_t marker_start = lead_begin + static_cast<std::size_t>(m.position(0)) + static_cast<std::size_t>(m[1].length());
    std::size_t body_start = lead_begin + static_cast<std::size_t>(m.position(0) + m.length(0));

    static const std::regex blank_line(R"(\n[ \t]*\n)");
    std::size_t body_end = lead_end;
    std::smatch end_match;
    auto body_it = full_text.begin() + static_cast<std::ptrdiff_t>(body_start);
    auto lead_it = full_text.begin() + static_cast<std::ptrdiff_t>(lead_end);
    if (std::regex_search(body_it, lead_it, end_match, blank_line)) {
        body_end = body_start + static_cast<std::size_t>(end_match.position(0));
    }

    std::vector<Section> replaced;
    add_span(replaced, "unclassified", full_text, lead_begin, marker_start);
    std::size_t before = replaced.size();
    add_span(replaced, "abstract", full_text, body_start, body_end);
    if (replaced.size() == before) return;   // empty abstract body, keep the lead untouched
    add_span(replaced, "unclassified", full_text, body_end, lead_end);

    sections.erase(sections.begin());
    sections.insert(sections.begin(), replaced.begin(), replaced.end());
}
