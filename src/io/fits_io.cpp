#include "fits_inspect/io/fits_io.hpp"
#include "fits_inspect/core/errors.hpp"
#include "fits_inspect/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <utility>

namespace fits_inspect::io {

bool is_fits_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts" || ext == ".fz";
}

std::string fits_status_message(int status) {
    char text[FLEN_STATUS];
    std::memset(text, 0, sizeof(text));
    fits_get_errstatus(status, text);
    return std::string(text) + " (status " + std::to_string(status) + ")";
}

int64_t max_sample_count() {
    return static_cast<int64_t>(std::min<size_t>(std::vector<double>().max_size(),
                                                 static_cast<size_t>(std::numeric_limits<int64_t>::max())));
}

FitsFile::FitsFile(const fs::path& path) : path_(path) {
    int status = 0;
    if (fits_open_file(&fptr_, path.string().c_str(), READONLY, &status)) {
        fptr_ = nullptr;
        throw FitsError("Cannot open FITS file " + path.string() + ": " +
                        fits_status_message(status));
    }
    current_ = 0;
}

FitsFile::~FitsFile() {
    close();
}

FitsFile::FitsFile(FitsFile&& o) noexcept
    : fptr_(o.fptr_), path_(std::move(o.path_)), current_(o.current_) {
    o.fptr_ = nullptr;
    o.current_ = -1;
}

FitsFile& FitsFile::operator=(FitsFile&& o) noexcept {
    if (this != &o) {
        close();
        fptr_ = o.fptr_;
        path_ = std::move(o.path_);
        current_ = o.current_;
        o.fptr_ = nullptr;
        o.current_ = -1;
    }
    return *this;
}

void FitsFile::close() noexcept {
    if (fptr_) {
        int status = 0;
        fits_close_file(fptr_, &status);
        fptr_ = nullptr;
    }
}

void FitsFile::check(int status, const std::string& what) const {
    if (status) {
        throw FitsError(what + " (" + path_.filename().string() + ", HDU " +
                        std::to_string(current_) + "): " + fits_status_message(status));
    }
}

int FitsFile::unit_count() const {
    int status = 0;
    int nhdus = 0;
    fits_get_num_hdus(fptr_, &nhdus, &status);
    check(status, "Cannot count HDUs");
    return nhdus;
}

void FitsFile::select(int index) {
    int status = 0;
    int hdu_type = 0;
    fits_movabs_hdu(fptr_, index + 1, &hdu_type, &status);
    current_ = index;
    check(status, "Cannot move to HDU");
}

UnitKind FitsFile::kind() const {
    int status = 0;
    int hdu_type = 0;
    fits_get_hdu_type(fptr_, &hdu_type, &status);
    check(status, "Cannot read HDU type");
    switch (hdu_type) {
        case IMAGE_HDU: return UnitKind::Image;
        case ASCII_TBL:
        case BINARY_TBL: return UnitKind::Table;
        default: return UnitKind::Other;
    }
}

std::string FitsFile::kind_name() const {
    int status = 0;
    int hdu_type = 0;
    fits_get_hdu_type(fptr_, &hdu_type, &status);
    check(status, "Cannot read HDU type");
    switch (hdu_type) {
        case IMAGE_HDU: {
            if (current_ == 0) return "PrimaryHDU";
            int cstatus = 0;
            if (fits_is_compressed_image(fptr_, &cstatus)) return "CompImageHDU";
            return "ImageHDU";
        }
        case ASCII_TBL: return "TableHDU";
        case BINARY_TBL: return "BinTableHDU";
        default: return "Unknown";
    }
}

std::vector<HeaderRecord> FitsFile::header_records() const {
    std::vector<HeaderRecord> records;
    int status = 0;
    int nkeys = 0;
    fits_get_hdrspace(fptr_, &nkeys, nullptr, &status);
    check(status, "Cannot read header size");

    char card[FLEN_CARD];
    for (int i = 1; i <= nkeys; ++i) {
        status = 0;
        fits_read_record(fptr_, i, card, &status);
        if (status) continue;

        char keyname[FLEN_KEYWORD];
        int keylen = 0;
        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) continue;

        HeaderRecord rec;
        rec.key = core::trim(keyname);

        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        value[0] = '\0';
        fits_parse_value(card, value, comment, &status);
        if (status) {
            // Commentary cards and malformed values still keep their key.
            records.push_back(std::move(rec));
            continue;
        }
        rec.value = value;

        char dtype = '\0';
        fits_get_keytype(value, &dtype, &status);
        rec.type_code = status ? '\0' : dtype;
        records.push_back(std::move(rec));
    }
    return records;
}

std::optional<std::string> FitsFile::read_string_key(const std::string& key) const {
    char value[FLEN_VALUE];
    int status = 0;
    fits_read_key(fptr_, TSTRING, const_cast<char*>(key.c_str()), value, nullptr, &status);
    if (status == KEY_NO_EXIST) {
        return std::nullopt;
    }
    check(status, "Cannot read keyword " + key);
    return core::trim(value);
}

std::vector<int64_t> FitsFile::image_shape() const {
    int status = 0;
    int naxis = 0;
    fits_get_img_dim(fptr_, &naxis, &status);
    check(status, "Cannot read NAXIS");
    if (naxis <= 0) return {};

    std::vector<LONGLONG> naxes(static_cast<size_t>(naxis), 0);
    fits_get_img_sizell(fptr_, naxis, naxes.data(), &status);
    check(status, "Cannot read NAXISn");
    return std::vector<int64_t>(naxes.begin(), naxes.end());
}

int FitsFile::image_bitpix() const {
    int status = 0;
    int bitpix = 0;
    fits_get_img_type(fptr_, &bitpix, &status);
    check(status, "Cannot read BITPIX");
    return bitpix;
}

std::vector<double> FitsFile::read_samples() const {
    std::vector<int64_t> shape = image_shape();
    if (shape.empty()) return {};

    const auto count = core::checked_product(shape);
    if (!count || *count > max_sample_count()) {
        throw FitsError("Declared image size is not addressable (" + path_.filename().string() +
                        ", HDU " + std::to_string(current_) + ")");
    }
    const LONGLONG total = static_cast<LONGLONG>(*count);
    if (total <= 0) return {};

    std::vector<double> buffer(static_cast<size_t>(total));
    std::vector<LONGLONG> fpixel(shape.size(), 1);
    double nulval = std::numeric_limits<double>::quiet_NaN();
    int anynul = 0;
    int status = 0;
    fits_read_pixll(fptr_, TDOUBLE, fpixel.data(), total, &nulval, buffer.data(),
                    &anynul, &status);
    check(status, "Cannot read pixel data");
    return buffer;
}

Matrix2Dd FitsFile::read_plane() const {
    std::vector<int64_t> shape = image_shape();
    if (shape.size() != 2) {
        throw FitsError("Image is not 2-D (NAXIS=" + std::to_string(shape.size()) + ")");
    }
    const int64_t width = shape[0];
    const int64_t height = shape[1];
    if (width <= 0 || height <= 0) {
        throw FitsError("Image has an empty axis");
    }
    const auto count = core::checked_product(shape);
    if (!count || *count > max_sample_count()) {
        throw FitsError("Declared image size is not addressable");
    }

    Matrix2Dd plane(height, width);
    LONGLONG fpixel[2] = {1, 1};
    double nulval = std::numeric_limits<double>::quiet_NaN();
    int anynul = 0;
    int status = 0;
    fits_read_pixll(fptr_, TDOUBLE, fpixel, static_cast<LONGLONG>(plane.size()), &nulval,
                    plane.data(), &anynul, &status);
    check(status, "Cannot read pixel data");
    return plane;
}

int64_t FitsFile::row_count() const {
    int status = 0;
    LONGLONG nrows = 0;
    fits_get_num_rowsll(fptr_, &nrows, &status);
    check(status, "Cannot read row count");
    return static_cast<int64_t>(nrows);
}

int FitsFile::column_count() const {
    int status = 0;
    int ncols = 0;
    fits_get_num_cols(fptr_, &ncols, &status);
    check(status, "Cannot read column count");
    return ncols;
}

std::string FitsFile::column_format(int column) const {
    auto tform = read_string_key("TFORM" + std::to_string(column));
    return tform ? core::to_upper(*tform) : std::string();
}

std::vector<double> FitsFile::read_column(int column) const {
    const int64_t nrows = row_count();
    if (column < 1 || column > column_count()) {
        throw FitsError("Column " + std::to_string(column) + " out of range");
    }
    if (nrows <= 0) return {};

    int status = 0;
    int typecode = 0;
    LONGLONG repeat = 0;
    LONGLONG width = 0;
    fits_get_eqcoltypell(fptr_, column, &typecode, &repeat, &width, &status);
    check(status, "Cannot read column type");

    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> out(static_cast<size_t>(nrows), nan);

    if (typecode < 0) {
        throw FitsError("Variable-length column " + std::to_string(column) + " not supported");
    }
    if (typecode == TCOMPLEX || typecode == TDBLCOMPLEX || typecode == TBIT) {
        throw FitsError("Column " + std::to_string(column) + " has no real scalar form");
    }

    if (typecode == TSTRING) {
        const size_t cell = static_cast<size_t>(std::max<LONGLONG>(repeat, width)) + 1;
        std::vector<char> storage(cell * static_cast<size_t>(nrows), '\0');
        std::vector<char*> rows(static_cast<size_t>(nrows));
        for (size_t r = 0; r < rows.size(); ++r) rows[r] = storage.data() + r * cell;
        char nulstr[] = "";
        int anynul = 0;
        fits_read_col_str(fptr_, column, 1, 1, nrows, nulstr, rows.data(), &anynul, &status);
        check(status, "Cannot read string column");
        for (size_t r = 0; r < rows.size(); ++r) {
            std::string text = core::trim(rows[r]);
            if (text.empty()) continue;
            char* end = nullptr;
            double v = std::strtod(text.c_str(), &end);
            if (end && *end == '\0') out[r] = v;
        }
        return out;
    }

    if (repeat <= 0) return out;

    double nulval = nan;
    int anynul = 0;
    if (typecode == TLOGICAL) {
        std::vector<char> flags(out.size(), 0);
        char lnul = 0;
        if (repeat == 1) {
            fits_read_col(fptr_, TLOGICAL, column, 1, 1, nrows, &lnul, flags.data(), &anynul,
                          &status);
        } else {
            for (LONGLONG r = 0; r < nrows && status == 0; ++r) {
                fits_read_col(fptr_, TLOGICAL, column, r + 1, 1, 1, &lnul,
                              &flags[static_cast<size_t>(r)], &anynul, &status);
            }
        }
        check(status, "Cannot read logical column");
        for (size_t i = 0; i < flags.size(); ++i) out[i] = flags[i] ? 1.0 : 0.0;
        return out;
    }

    if (repeat == 1) {
        fits_read_col(fptr_, TDOUBLE, column, 1, 1, nrows, &nulval, out.data(), &anynul, &status);
    } else {
        // Vector columns contribute their first element per row.
        for (LONGLONG r = 0; r < nrows && status == 0; ++r) {
            fits_read_col(fptr_, TDOUBLE, column, r + 1, 1, 1, &nulval,
                          &out[static_cast<size_t>(r)], &anynul, &status);
        }
    }
    check(status, "Cannot read numeric column");
    return out;
}

} // namespace fits_inspect::io
