#include "PDFLayoutReader.hpp"
#include "Errors.hpp"
#include <atomic>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace {

// Exit status of coreutils `timeout` when the budget ran out
constexpr int kTimeoutExitCode = 124;

std::string safe_name(const std::string& document_id) {
    std::string out;
    for (char c : document_id) {
        bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
        out += ok ? c : '_';
    }
    return out.empty() ? "doc" : out;
}

std::uint32_t fnv1a_32(const std::string& s) {
    std::uint32_t hash = 2166136261u;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

std::optional<std::string> optional_string(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

BBox read_box(const json& j) {
    BBox box;
    if (j.is_array()) {
        if (j.size() != 4) throw std::runtime_error("bbox must have four numbers");
        box.x0 = j[0].get<double>();
        box.top = j[1].get<double>();
        box.x1 = j[2].get<double>();
        box.bottom = j[3].get<double>();
    } else {
        box.x0 = j.at("x0").get<double>();
        box.top = j.at("top").get<double>();
        box.x1 = j.at("x1").get<double>();
        box.bottom = j.at("bottom").get<double>();
    }
    return box;
}

}

PDFLayoutReader::PDFLayoutReader(const ExtractionConfig& config) : config_(config) {}

std::string PDFLayoutReader::extractor_command() const {
    // Prefer the project venv when the default interpreter is configured
    std::string cmd = config_.extractor_command;
    const std::string default_python = "python3 ";
    if (cmd.rfind(default_python, 0) == 0) {
    #ifdef _WIN32
        if (fs::exists("venv/Scripts/python.exe")) {
            cmd = "venv\\Scripts\\python.exe " + cmd.substr(default_python.size());
        }
    #else
        if (fs::exists("venv/bin/python")) {
            cmd = "venv/bin/python " + cmd.substr(default_python.size());
        }
    #endif
    }
    return cmd;
}

std::string PDFLayoutReader::figures_dir_for(const std::string& document_id) const {
    char suffix[9];
    std::snprintf(suffix, sizeof(suffix), "%08x", static_cast<unsigned>(fnv1a_32(document_id)));
    return config_.figures_dir + "/" + safe_name(document_id) + "_" + suffix;
}

PdfLayout PDFLayoutReader::read(const std::string& document_id,
                                const std::string& pdf_bytes,
                                std::chrono::steady_clock::time_point deadline) const {
    static std::atomic<unsigned long> counter{0};

    if (pdf_bytes.empty()) {
        throw UnreadablePdf("empty PDF upload");
    }
    if (pdf_bytes.compare(0, 5, "%PDF-") != 0) {
        throw UnreadablePdf("upload is not a PDF (missing %PDF- header)");
    }

    fs::create_directories(config_.temp_dir);
    std::string figures_dir = figures_dir_for(document_id);
    fs::create_directories(figures_dir);

    std::string stem = config_.temp_dir + "/temp_" + safe_name(document_id) + "_" + std::to_string(++counter);
    std::string pdf_path = stem + ".pdf";
    std::string json_path = stem + ".json";

    {
        std::ofstream out(pdf_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("could not write temp PDF " + pdf_path);
        }
        out.write(pdf_bytes.data(), static_cast<std::streamsize>(pdf_bytes.size()));
        if (!out.good()) {
            throw std::runtime_error("write failed for temp PDF " + pdf_path);
        }
    }

    auto cleanup = [&]() {
        std::error_code ec;
        fs::remove(pdf_path, ec);
        fs::remove(json_path, ec);
    };

    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) {
        cleanup();
        throw ExtractionTimeout("no time left for layout extraction");
    }

    std::string cmd;
#ifndef _WIN32
    cmd = "timeout " + std::to_string(remaining) + " ";
#endif
    cmd += extractor_command() + " \"" + pdf_path + "\" \"" + json_path + "\" \"" + figures_dir + "\"";

    std::cout << "[PDFLayoutReader] Dumping layout for " << document_id
              << " (budget " << remaining << "s)..." << std::endl;
    int ret = std::system(cmd.c_str());

    int exit_code = ret;
#ifndef _WIN32
    if (ret != -1 && WIFEXITED(ret)) exit_code = WEXITSTATUS(ret);
#endif
    if (exit_code == kTimeoutExitCode) {
        cleanup();
        throw ExtractionTimeout("layout extraction exceeded " + std::to_string(config_.timeout_seconds) + "s");
    }
    if (ret != 0) {
        cleanup();
        throw UnreadablePdf("layout extractor failed (exit " + std::to_string(exit_code) + ")");
    }

    std::ifstream f(json_path);
    if (!f.is_open()) {
        cleanup();
        throw UnreadablePdf("could not read layout output");
    }

    PdfLayout layout;
    try {
        json j;
        f >> j;
        f.close();
        layout = parse_layout_json(j);
    } catch (const json::exception& e) {
        cleanup();
        throw UnreadablePdf(std::string("layout JSON parse error: ") + e.what());
    } catch (const UnreadablePdf&) {
        cleanup();
        throw;
    }

    cleanup();
    std::cout << "[PDFLayoutReader] " << layout.pages.size() << " pages read" << std::endl;
    return layout;
}

PdfLayout PDFLayoutReader::parse_layout_json(const json& j) {
    PdfLayout layout;
    try {
        if (j.contains("info") && j["info"].is_object()) {
            const json& info = j["info"];
            layout.info.title = optional_string(info, "title");
            layout.info.author = optional_string(info, "author");
            layout.info.page_count = info.value("page_count", 0);
            layout.info.ocr_applied = info.value("ocr_applied", false);
        }

        if (!j.contains("pages") || !j["pages"].is_array()) {
            throw UnreadablePdf("layout dump has no pages array");
        }

        int ordinal = 0;
        for (const auto& p : j["pages"]) {
            PageContent page;
            page.number = p.value("number", ordinal + 1);
            page.width = p.at("width").get<double>();
            page.height = p.at("height").get<double>();

            if (p.contains("chars")) {
                page.glyphs.reserve(p["chars"].size());
                for (const auto& c : p["chars"]) {
                    Glyph g;
                    g.text = c.value("text", "");
                    g.box = read_box(c);
                    g.size = c.value("size", 0.0);
                    page.glyphs.push_back(std::move(g));
                }
            }

            if (p.contains("images")) {
                for (const auto& img : p["images"]) {
                    ImageBox image;
                    image.box = read_box(img.contains("bbox") ? img["bbox"] : img);
                    image.width = img.value("width", image.box.width());
                    image.height = img.value("height", image.box.height());
                    image.image_path = optional_string(img, "path").value_or("");
                    page.images.push_back(std::move(image));
                }
            }

            if (p.contains("tables")) {
                for (const auto& t : p["tables"]) {
                    TableGrid grid;
                    grid.box = read_box(t.at("bbox"));
                    for (const auto& row : t.value("cells", json::array())) {
                        std::vector<std::optional<std::string>> cells;
                        for (const auto& cell : row) {
                            if (cell.is_null()) {
                                cells.push_back(std::nullopt);
                            } else {
                                cells.push_back(cell.is_string() ? cell.get<std::string>() : cell.dump());
                            }
                        }
                        grid.cells.push_back(std::move(cells));
                    }
                    page.tables.push_back(std::move(grid));
                }
            }

            layout.pages.push_back(std::move(page));
            ++ordinal;
        }
    } catch (const json::exception& e) {
        throw UnreadablePdf(std::string("malformed layout dump: ") + e.what());
    } catch (const UnreadablePdf&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw UnreadablePdf(std::string("malformed layout dump: ") + e.what());
    }

    if (layout.info.page_count == 0) {
        layout.info.page_count = static_cast<int>(layout.pages.size());
    }
    return layout;
}

void PDFLayoutReader::cleanup_temp_files() const {
    if (!fs::exists(config_.temp_dir)) return;

    int cleaned = 0;
    try {
        for (const auto& entry : fs::directory_iterator(config_.temp_dir)) {
            if (!entry.is_regular_file()) continue;

            std::string filename = entry.path().filename().string();
            // Only temp_* files (not user data)
            if (filename.find("temp_") != 0) continue;

            auto ftime = fs::last_write_time(entry.path());
            auto now = fs::file_time_type::clock::now();
            auto age = std::chrono::duration_cast<std::chrono::hours>(now - ftime).count();
            if (age >= 1) {
                fs::remove(entry.path());
                cleaned++;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[PDFLayoutReader] Warning: Error cleaning " << config_.temp_dir << ": " << e.what() << "\n";
    }

    if (cleaned > 0) {
        std::cout << "[PDFLayoutReader] Cleaned up " << cleaned << " old temp files\n";
    }
}
