#include "fits_inspect/core/types.hpp"
#include "fits_inspect/core/utils.hpp"

#include <type_traits>

namespace fits_inspect {

std::string header_value_to_string(const HeaderValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "True" : "False";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return core::format_double(v);
        } else {
            return v.text;
        }
    }, value);
}

} // namespace fits_inspect
