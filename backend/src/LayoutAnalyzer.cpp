#include "LayoutAnalyzer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

namespace {

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

bool usable_glyph(const Glyph& g) {
    return !is_blank(g.text) &&
           std::isfinite(g.box.x0) && std::isfinite(g.box.x1) &&
           g.box.x1 >= g.box.x0;
}

}

bool is_two_column(const PageLayout& layout) {
    return std::holds_alternative<TwoColumn>(layout);
}

std::optional<double> column_boundary(const PageLayout& layout) {
    if (const auto* two = std::get_if<TwoColumn>(&layout)) {
        return two->boundary;
    }
    return std::nullopt;
}

std::string describe_layout(const PageLayout& layout) {
    return is_two_column(layout) ? "two-column" : "single-column";
}

LayoutAnalyzer::LayoutAnalyzer(const LayoutConfig& config) : config_(config) {}

PageLayout LayoutAnalyzer::analyze(const PageContent& page) const {
    try {
        return detect(page);
    } catch (const std::exception& e) {
        std::cerr << "[LayoutAnalyzer] Page " << page.number
                  << ": analysis failed (" << e.what() << "), assuming single column\n";
        return SingleColumn{};
    }
}

std::vector<PageLayout> LayoutAnalyzer::analyze_pages(const std::vector<PageContent>& pages) const {
    std::vector<PageLayout> layouts;
    layouts.reserve(pages.size());
    for (const auto& page : pages) {
        layouts.push_back(analyze(page));
    }
    return layouts;
}

double LayoutAnalyzer::bin_width_for(double page_width) const {
    if (config_.bin_width > 0.0) return config_.bin_width;
    return std::max(2.0, page_width / 150.0);
}

std::vector<double> LayoutAnalyzer::density_histogram(const PageContent& page, double bin_width) const {
    size_t num_bins = static_cast<size_t>(page.width / bin_width) + 1;
    std::vector<double> bins(num_bins, 0.0);

    for (const auto& glyph : page.glyphs) {
        if (!usable_glyph(glyph)) continue;

        double x0 = std::max(0.0, glyph.box.x0);
        double x1 = std::min(page.width, glyph.box.x1);
        if (x1 < x0) continue;

        size_t first = static_cast<size_t>(x0 / bin_width);
        size_t last = static_cast<size_t>(std::max(x0, x1 - 1e-9) / bin_width);
        first = std::min(first, num_bins - 1);
        last = std::min(last, num_bins - 1);
        for (size_t b = first; b <= last; ++b) {
            bins[b] += 1.0;
        }
    }
    return bins;
}

std::vector<double> LayoutAnalyzer::smooth(const std::vector<double>& bins) const {
    int w = std::max(0, config_.smoothing_window);
    if (w == 0) return bins;

    std::vector<double> smoothed(bins.size(), 0.0);
    for (size_t i = 0; i < bins.size(); ++i) {
        size_t lo = (i >= static_cast<size_t>(w)) ? i - w : 0;
        size_t hi = std::min(bins.size() - 1, i + w);
        double sum = 0.0;
        for (size_t k = lo; k <= hi; ++k) sum += bins[k];
        smoothed[i] = sum / static_cast<double>(hi - lo + 1);
    }
    return smoothed;
}

PageLayout LayoutAnalyzer::detect(const PageContent& page) const {
    if (!(page.width > 0.0) || !std::isfinite(page.width)) {
        return SingleColumn{};
    }

    size_t usable = static_cast<size_t>(
        std::count_if(page.glyphs.begin(), page.glyphs.end(), usable_glyph));
    if (usable < config_.min_chars) {
        return SingleColumn{};
    }

    double bin_width = bin_width_for(page.width);
    std::vector<double> smoothed = smooth(density_histogram(page, bin_width));

    double peak = *std::max_element(smoothed.begin(), smoothed.end());
    if (peak <= 0.0) return SingleColumn{};
    double threshold = config_.gap_density_ratio * peak;

    size_t band_lo = static_cast<size_t>(config_.band_start * static_cast<double>(smoothed.size()));
    size_t band_hi = std::min(smoothed.size(),
                              static_cast<size_t>(config_.band_end * static_cast<double>(smoothed.size())));

    // Longest low-density run inside the band; ties go to the run closest to the midline
    double midline = page.width / 2.0;
    bool found = false;
    size_t best_len = 0;
    double best_center = 0.0;

    size_t i = band_lo;
    while (i < band_hi) {
        if (smoothed[i] >= threshold) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < band_hi && smoothed[i] < threshold) ++i;
        size_t len = i - start;
        double center = (static_cast<double>(start) + static_cast<double>(len) / 2.0) * bin_width;

        if (static_cast<double>(len) * bin_width < config_.min_gap_width) continue;

        if (!found || len > best_len ||
            (len == best_len && std::abs(center - midline) < std::abs(best_center - midline))) {
            found = true;
            best_len = len;
            best_center = center;
        }
    }

    if (!found) return SingleColumn{};

    // Both sides of the gutter must actually carry text
    size_t left = 0;
    size_t right = 0;
    for (const auto& glyph : page.glyphs) {
        if (!usable_glyph(glyph)) continue;
        if (glyph.box.center_x() < best_center) {
            ++left;
        } else {
            ++right;
        }
    }
    double total = static_cast<double>(left + right);
    if (static_cast<double>(left) / total < config_.min_side_share ||
        static_cast<double>(right) / total < config_.min_side_share) {
        return SingleColumn{};
    }

    return TwoColumn{best_center};
}
