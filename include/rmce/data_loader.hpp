#pragma once

/// @file include/rmce/data_loader.hpp
/// @brief CSV loader for daily observation series.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files of daily market data into an `ObservationSeries`.
/// Malformed rows are skipped and counted; the loader never fails on bad
/// content, only on an unreadable file.
///
/// ## Expected CSV Format
/// ```
/// date,open,high,low,close,volume
/// 2024-01-02,185.1,186.9,183.4,185.6,82488700
/// 2024-01-03,184.2,185.9,183.4,184.3,58414500
/// ```
/// The first non-comment line is the header. Columns are located by name
/// (case-insensitive): `date` (or `timestamp`), `close` and, optionally,
/// `volume`; other columns are ignored. A missing volume column yields 0.
///
/// ## Guarantees
/// - Returns `nullopt` only when the file cannot be opened
/// - Skips rows with missing fields, unparsable or non-finite numbers,
///   non-positive closes or negative volumes
/// - Does not sort or de-duplicate; ordering is checked by the Engine

#include "rmce/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace rmce::core {

/// Column positions resolved from a CSV header row.
struct CsvLayout {
    std::size_t                date_col;
    std::size_t                close_col;
    std::optional<std::size_t> volume_col;
};

class DataLoader {
public:
    DataLoader() = delete;

    /// Load observations from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty series if the header is unusable or no row is valid
    [[nodiscard]] static std::optional<ObservationSeries>
    load_csv(const std::string& filepath);

    /// Parse observations from CSV text (same format as `load_csv`).
    [[nodiscard]] static ObservationSeries
    parse_csv_string(const std::string& csv_content);

    /// Resolve column positions from a header line; `nullopt` if the date or
    /// close column is absent.
    [[nodiscard]] static std::optional<CsvLayout>
    parse_header(const std::string& line);

    /// Parse one data row; `nullopt` if it is malformed or invalid.
    [[nodiscard]] static std::optional<Observation>
    parse_row(const std::string& line, const CsvLayout& layout);
};

}  // namespace rmce::core
