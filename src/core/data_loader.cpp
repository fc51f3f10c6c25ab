/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for daily observation series.

#include "rmce/data_loader.hpp"
#include "rmce/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace rmce::core {

namespace {

std::string trim(const std::string& token) {
    const auto first = token.find_first_not_of(" \t\r\n\"");
    if (first == std::string::npos) return {};
    const auto last = token.find_last_not_of(" \t\r\n\"");
    return token.substr(first, last - first + 1);
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        fields.push_back(trim(token));
    }
    // getline drops a trailing empty field.
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<double> parse_number(const std::string& token) {
    if (token.empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        const double val = std::stod(token, &pos);
        if (pos != token.size() || !std::isfinite(val)) {
            return std::nullopt;
        }
        return val;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool is_skippable(const std::string& line) {
    return line.empty() || line[0] == '#';
}

}  // namespace

// ─── DataLoader::parse_header ────────────────────────────────────────────────

std::optional<CsvLayout> DataLoader::parse_header(const std::string& line) {
    const auto names = split_fields(line);

    std::optional<std::size_t> date_col;
    std::optional<std::size_t> close_col;
    std::optional<std::size_t> volume_col;
    for (std::size_t i = 0; i < names.size(); ++i) {
        const std::string name = lower(names[i]);
        if (!date_col && (name == "date" || name == "timestamp")) {
            date_col = i;
        } else if (!close_col && name == "close") {
            close_col = i;
        } else if (!volume_col && name == "volume") {
            volume_col = i;
        }
    }

    if (!date_col || !close_col) {
        return std::nullopt;
    }
    return CsvLayout{
        .date_col   = *date_col,
        .close_col  = *close_col,
        .volume_col = volume_col,
    };
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<Observation>
DataLoader::parse_row(const std::string& line, const CsvLayout& layout) {
    if (is_skippable(line)) {
        return std::nullopt;
    }

    const auto fields = split_fields(line);
    const std::size_t needed = std::max({layout.date_col, layout.close_col,
                                         layout.volume_col.value_or(0)}) + 1;
    if (fields.size() < needed) {
        return std::nullopt;
    }

    const std::string& date = fields[layout.date_col];
    if (date.empty()) {
        return std::nullopt;
    }

    const auto close = parse_number(fields[layout.close_col]);
    if (!close || *close <= 0.0) {
        return std::nullopt;
    }

    double volume = 0.0;
    if (layout.volume_col) {
        const auto parsed = parse_number(fields[*layout.volume_col]);
        if (!parsed || *parsed < 0.0) {
            return std::nullopt;
        }
        volume = *parsed;
    }

    return Observation{.date = date, .close = *close, .volume = volume};
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

ObservationSeries DataLoader::parse_csv_string(const std::string& csv_content) {
    ObservationSeries series;
    std::istringstream stream(csv_content);
    std::string line;
    std::optional<CsvLayout> layout;
    bool header_seen = false;
    std::size_t skipped = 0;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_seen) {
            if (is_skippable(line)) continue;
            header_seen = true;
            layout = parse_header(line);
            if (!layout) {
                log::logger()->warn("CSV header has no date/close columns: '{}'", line);
                return series;
            }
            continue;
        }
        if (is_skippable(line)) continue;

        if (auto obs = parse_row(line, *layout)) {
            series.push_back(std::move(*obs));
        } else {
            ++skipped;
        }
    }

    if (skipped > 0) {
        log::logger()->warn("skipped {} malformed CSV row(s), kept {}", skipped, series.size());
    }
    return series;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<ObservationSeries> DataLoader::load_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        log::logger()->error("cannot open '{}'", filepath);
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace rmce::core
