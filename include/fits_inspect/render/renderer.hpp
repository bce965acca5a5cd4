#pragma once

#include "fits_inspect/config/configuration.hpp"
#include "fits_inspect/core/result.hpp"
#include "fits_inspect/core/types.hpp"
#include "fits_inspect/io/fits_io.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fits_inspect::render {

std::string preview_file_name(const std::string& file_id, int index);
std::string preview_url(const std::string& url_prefix, const std::string& file_name);

// TFORMn holds one of the numeric codes E, D, I, J, K.
bool is_numeric_format(const std::string& tform);

// A chosen (x, y) column pair as 0-based positions in the column roster.
// -1 stands for the row index.
struct ColumnPair {
    int x = -1;
    int y = -1;
};

// Last matching column wins; otherwise the first / second declared column.
std::optional<ColumnPair> resolve_time_flux_columns(const std::vector<std::string>& names);
std::optional<ColumnPair> resolve_wavelength_flux_columns(const std::vector<std::string>& names);

// First two numeric columns; a single numeric column is plotted against the
// row index; with none, the first two declared columns.
std::optional<ColumnPair> resolve_scatter_columns(const std::vector<std::string>& names,
                                                  const std::vector<std::string>& formats);

struct TableSeries {
    std::vector<double> x;
    std::vector<double> y;
    std::string x_label;
    std::string y_label;
};

// Reads the chosen columns of the selected table unit. A column with no
// finite value is replaced by the row index; the result is thinned to at
// most max_rows points with the first and last row kept.
TableSeries read_table_series(const io::FitsFile& file, const std::vector<std::string>& names,
                              const ColumnPair& pair, size_t max_rows);

// Writes the preview for one analysed unit and returns its URL.
Result<std::string> try_render_unit(const fs::path& fits_path, const Analysis& analysis,
                                    const fs::path& out_dir, const std::string& file_id,
                                    const config::Config& cfg);

// Same, with every failure folded into nullopt.
std::optional<std::string> render_unit(const fs::path& fits_path, const Analysis& analysis,
                                       const fs::path& out_dir, const std::string& file_id,
                                       const config::Config& cfg);

// Creates out_dir if needed; throws RenderError when that fails.
void prepare_output_dir(const fs::path& out_dir);

// One entry per analysis, in order. Throws RenderError only when out_dir
// cannot be created.
std::vector<std::optional<std::string>> render_all(const fs::path& fits_path,
                                                   const std::vector<Analysis>& analyses,
                                                   const fs::path& out_dir,
                                                   const std::string& file_id,
                                                   const config::Config& cfg);

} // namespace fits_inspect::render
