#include "fits_inspect/pipeline/column_roles.hpp"
#include "fits_inspect/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace fits_inspect::pipeline {

namespace {

const std::set<std::string>& time_vocabulary() {
    static const std::set<std::string> words = {
        "time", "mjd", "jd", "date", "epoch", "bjd", "day"};
    return words;
}

const std::set<std::string>& flux_vocabulary() {
    static const std::set<std::string> words = {
        "flux", "count", "rate", "counts", "mag", "magnitude", "fluxerr", "flux_err"};
    return words;
}

const std::set<std::string>& wavelength_vocabulary() {
    static const std::set<std::string> words = {
        "wavelength", "wave", "wl", "lam", "lambda", "energy", "freq", "frequency"};
    return words;
}

} // namespace

std::string normalize_column_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (c == '_' || std::isspace(c)) continue;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool has_role(const std::string& name, ColumnRole role) {
    const std::string n = normalize_column_name(name);
    switch (role) {
        case ColumnRole::Time:
            return time_vocabulary().count(n) > 0;
        case ColumnRole::Flux:
            return flux_vocabulary().count(n) > 0 || core::contains(n, "flux") ||
                   core::contains(n, "count");
        case ColumnRole::Wavelength:
            return wavelength_vocabulary().count(n) > 0 || core::contains(n, "wave") ||
                   core::contains(n, "lam");
    }
    return false;
}

bool any_has_role(const std::vector<std::string>& names, ColumnRole role) {
    return std::any_of(names.begin(), names.end(),
                       [role](const std::string& n) { return has_role(n, role); });
}

} // namespace fits_inspect::pipeline
