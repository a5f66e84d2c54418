#include "ReferenceParser.hpp"
#include "SectionSplitter.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>

namespace {

std::string trim(const std::string& s, const char* chars = " \t\r\n") {
    std::size_t b = s.find_first_not_of(chars);
    if (b == std::string::npos) return "";
    std::size_t e = s.find_last_not_of(chars);
    return s.substr(b, e - b + 1);
}

std::string collapse_whitespace(const std::string& s) {
    std::string out;
    bool pending_space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out += ' ';
        pending_space = false;
        out += c;
    }
    return out;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t nl = text.find('\n', pos);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(pos));
            break;
        }
        lines.push_back(text.substr(pos, nl - pos));
        pos = nl + 1;
    }
    return lines;
}

// Start of the year match used by find_year, or npos
std::size_t year_position(const std::string& entry) {
    static const std::regex paren_year(R"(\((\d{4})\))");
    static const std::regex bare_year(R"(\b(19\d{2}|20\d{2})\b)");
    std::smatch m;
    if (std::regex_search(entry, m, paren_year)) return static_cast<std::size_t>(m.position(0));
    if (std::regex_search(entry, m, bare_year)) return static_cast<std::size_t>(m.position(0));
    return std::string::npos;
}

// "[12] rest" or "12. rest"; the marker is at most six digits. Scanned by hand
// so entry length never matters.
std::optional<std::pair<std::string, std::string>> split_marker(const std::string& line, bool brackets) {
    std::size_t pos = 0;
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
    if (brackets) {
        if (pos >= line.size() || line[pos] != '[') return std::nullopt;
        ++pos;
    }

    std::size_t digits_start = pos;
    while (pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos]))) ++pos;
    std::size_t digits = pos - digits_start;
    if (digits == 0 || digits > (brackets ? 6u : 3u)) return std::nullopt;
    std::string number = line.substr(digits_start, digits);

    if (brackets) {
        if (pos >= line.size() || line[pos] != ']') return std::nullopt;
        ++pos;
    } else {
        if (pos + 1 >= line.size() || line[pos] != '.' ||
            !std::isspace(static_cast<unsigned char>(line[pos + 1]))) {
            return std::nullopt;
        }
        ++pos;
    }
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
    return std::make_pair(number, line.substr(pos));
}

// First period that closes a word of two or more characters ("Lee." but not "J.")
std::size_t sentence_period_position(const std::string& entry) {
    for (std::size_t i = 0; i < entry.size(); ++i) {
        if (entry[i] != '.') continue;
        bool at_break = (i + 1 == entry.size()) || std::isspace(static_cast<unsigned char>(entry[i + 1]));
        if (!at_break) continue;

        std::size_t word_start = i;
        while (word_start > 0 && std::isalpha(static_cast<unsigned char>(entry[word_start - 1]))) {
            --word_start;
        }
        if (i - word_start >= 2) return i;
    }
    return std::string::npos;
}

}

std::optional<std::string> ReferenceParser::find_references_span(const std::string& full_text) {
    std::optional<std::size_t> body_start;
    std::optional<std::size_t> body_end;

    std::size_t pos = 0;
    while (pos < full_text.size()) {
        std::size_t nl = full_text.find('\n', pos);
        std::size_t line_end = (nl == std::string::npos) ? full_text.size() : nl;
        std::size_t next = (nl == std::string::npos) ? full_text.size() : nl + 1;

        auto label = SectionSplitter::classify_heading(full_text.substr(pos, line_end - pos));
        if (label) {
            if (*label == "references") {
                body_start = next;
                body_end.reset();
            } else if (body_start && !body_end && (*label == "appendix" || *label == "acknowledgments")) {
                body_end = pos;
            }
        }
        pos = next;
    }

    if (!body_start) return std::nullopt;
    std::size_t end = body_end.value_or(full_text.size());
    std::string span = trim(full_text.substr(*body_start, end - *body_start));
    if (span.empty()) return std::nullopt;
    return span;
}

std::vector<Reference> ReferenceParser::parse(const std::string& full_text) {
    auto span = find_references_span(full_text);
    if (!span) return {};
    return parse_entries(*span);
}

std::vector<Reference> ReferenceParser::parse_entries(const std::string& span) {
    std::vector<std::string> lines = split_lines(span);

    bool has_brackets = std::any_of(lines.begin(), lines.end(),
                                    [](const std::string& l) { return split_marker(l, true).has_value(); });
    bool has_numbers = !has_brackets &&
                       std::any_of(lines.begin(), lines.end(),
                                   [](const std::string& l) { return split_marker(l, false).has_value(); });

    // (marker digits, raw text)
    std::vector<std::pair<std::optional<std::string>, std::string>> raw_entries;

    if (has_brackets || has_numbers) {
        for (const auto& line : lines) {
            auto marker = split_marker(line, has_brackets);
            if (marker) {
                raw_entries.emplace_back(marker->first, marker->second);
            } else if (!raw_entries.empty() && !trim(line).empty()) {
                raw_entries.back().second += " " + line;
            }
        }
    } else {
        std::string paragraph;
        for (const auto& line : lines) {
            if (trim(line).empty()) {
                if (!trim(paragraph).empty()) raw_entries.emplace_back(std::nullopt, paragraph);
                paragraph.clear();
            } else {
                paragraph += " " + line;
            }
        }
        if (!trim(paragraph).empty()) raw_entries.emplace_back(std::nullopt, paragraph);
    }

    std::vector<Reference> refs;
    for (std::size_t i = 0; i < raw_entries.size(); ++i) {
        std::string text = collapse_whitespace(raw_entries[i].second);
        if (text.empty()) continue;

        try {
            Reference ref;
            ref.index = raw_entries[i].first ? std::stoi(*raw_entries[i].first)
                                             : static_cast<int>(i) + 1;
            ref.raw_text = text;
            ref.year = find_year(text);
            ref.authors = find_authors(text);
            ref.title = find_title(text);
            refs.push_back(std::move(ref));
        } catch (const std::exception& e) {
            std::cerr << "[ReferenceParser] Skipping entry " << (i + 1) << ": " << e.what() << "\n";
        }
    }
    return refs;
}

std::optional<int> ReferenceParser::find_year(const std::string& entry) {
    static const std::regex paren_year(R"(\((\d{4})\))");
    static const std::regex bare_year(R"(\b(19\d{2}|20\d{2})\b)");
    std::smatch m;
    if (std::regex_search(entry, m, paren_year) || std::regex_search(entry, m, bare_year)) {
        return std::stoi(m[1].str());
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> ReferenceParser::find_authors(const std::string& entry) {
    std::size_t cut = std::min(year_position(entry), sentence_period_position(entry));
    if (cut == std::string::npos) return std::nullopt;

    std::string head = trim(entry.substr(0, cut), " \t,;:(");
    if (head.empty() || head.size() > 300) return std::nullopt;

    static const std::regex et_al(R"(\s*,?\s*et\.?\s+al\.?$)", std::regex::icase);
    head = std::regex_replace(head, et_al, "");

    static const std::regex separators(R"(\s*(?:,|;|&|\band\b)\s*)");
    static const std::regex initials_only(R"(^(?:[A-Z]\.\s*-?\s*)+$)");

    std::vector<std::string> authors;
    std::sregex_token_iterator it(head.begin(), head.end(), separators, -1);
    std::sregex_token_iterator end;
    for (; it != end; ++it) {
        std::string piece = trim(it->str(), " \t.");
        if (piece.empty()) continue;
        // "Smith, J." lists put the initials in their own piece
        if (std::regex_match(piece + ".", initials_only) && !authors.empty()) {
            authors.back() += " " + piece + ".";
            continue;
        }
        authors.push_back(piece);
    }

    if (authors.empty()) return std::nullopt;
    return authors;
}

std::optional<std::string> ReferenceParser::find_title(const std::string& entry) {
    std::string title;
    std::size_t open_quote = entry.find('"');
    std::size_t close_quote = (open_quote == std::string::npos) ? std::string::npos
                                                                : entry.find('"', open_quote + 1);
    if (close_quote != std::string::npos && close_quote > open_quote + 1) {
        title = entry.substr(open_quote + 1, close_quote - open_quote - 1);
    } else {
        // Typographic quotes, matched as raw UTF-8 sequences
        const std::string open = "\xE2\x80\x9C";
        const std::string close = "\xE2\x80\x9D";
        std::size_t b = entry.find(open);
        if (b != std::string::npos) {
            std::size_t e = entry.find(close, b + open.size());
            if (e != std::string::npos) title = entry.substr(b + open.size(), e - b - open.size());
        }
    }

    title = trim(title, " \t,.");
    if (title.empty()) return std::nullopt;
    return title;
}

std::optional<std::string> ReferenceParser::find_doi(const std::string& text) {
    // Only the registrant prefix goes through the regex; the suffix is scanned
    static const std::regex doi_prefix(R"(10\.\d{4,9}/)");
    std::smatch m;
    if (!std::regex_search(text, m, doi_prefix)) return std::nullopt;

    std::size_t end = static_cast<std::size_t>(m.position(0) + m.length(0));
    while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end])) &&
           std::string("\"<>").find(text[end]) == std::string::npos) {
        ++end;
    }
    if (end == static_cast<std::size_t>(m.position(0) + m.length(0))) return std::nullopt;

    std::string value = text.substr(static_cast<std::size_t>(m.position(0)),
                                    end - static_cast<std::size_t>(m.position(0)));
    while (!value.empty() && std::string(".,;)]").find(value.back()) != std::string::npos) {
        value.pop_back();
    }
    if (value.empty()) return std::nullopt;
    return value;
}
