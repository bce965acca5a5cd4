#pragma once

#include "fits_inspect/core/types.hpp"

#include <fitsio.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fits_inspect::io {

// One keyed header card. type_code is CFITSIO's value class
// ('C', 'L', 'I', 'F', 'X') or '\0' when the card carries no value.
struct HeaderRecord {
    std::string key;
    std::string value;
    char type_code = '\0';
};

bool is_fits_path(const fs::path& path);

std::string fits_status_message(int status);

// Largest sample count a double buffer can hold.
int64_t max_sample_count();

// Read-only handle on a FITS container. Units are addressed by 0-based
// index; every accessor works on the currently selected unit.
class FitsFile {
public:
    explicit FitsFile(const fs::path& path);
    ~FitsFile();

    FitsFile(const FitsFile&) = delete;
    FitsFile& operator=(const FitsFile&) = delete;
    FitsFile(FitsFile&& o) noexcept;
    FitsFile& operator=(FitsFile&& o) noexcept;

    const fs::path& path() const { return path_; }

    int unit_count() const;
    void select(int index);
    int selected() const { return current_; }

    UnitKind kind() const;
    std::string kind_name() const;

    std::vector<HeaderRecord> header_records() const;
    std::optional<std::string> read_string_key(const std::string& key) const;

    // Image units: declared geometry, NAXIS1 first.
    std::vector<int64_t> image_shape() const;
    int image_bitpix() const;

    // Full sample array, null pixels mapped to NaN.
    std::vector<double> read_samples() const;
    // Samples of a 2-D unit as a row-major (NAXIS2 x NAXIS1) plane.
    Matrix2Dd read_plane() const;

    // Table units; columns are 1-based.
    int64_t row_count() const;
    int column_count() const;
    std::string column_format(int column) const;
    std::vector<double> read_column(int column) const;

private:
    void check(int status, const std::string& what) const;
    void close() noexcept;

    fitsfile* fptr_ = nullptr;
    fs::path path_;
    int current_ = -1;
};

} // namespace fits_inspect::io
