#include "fits_inspect/core/utils.hpp"

#include <cmath>
#include <limits>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace fits_inspect;

TEST_CASE("uniform_indices_keeps_short_series_whole") {
    auto idx = core::uniform_indices(200, 50000);
    REQUIRE(idx.size() == 200);
    REQUIRE(idx.front() == 0);
    REQUIRE(idx.back() == 199);
}

TEST_CASE("uniform_indices_caps_long_series_and_spans_range") {
    const size_t n = 120000;
    auto idx = core::uniform_indices(n, 50000);

    REQUIRE(idx.size() == 50000);
    REQUIRE(idx.front() == 0);
    REQUIRE(idx.back() == n - 1);
    for (size_t i = 1; i < idx.size(); ++i) {
        REQUIRE(idx[i] > idx[i - 1]);
    }
}

TEST_CASE("uniform_indices_handles_degenerate_requests") {
    REQUIRE(core::uniform_indices(0, 10).empty());
    REQUIRE(core::uniform_indices(10, 0).empty());
    REQUIRE(core::uniform_indices(10, 1) == std::vector<size_t>{0});
}

TEST_CASE("percentile_of_interpolates_and_ignores_nan") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> v = {4.0, nan, 1.0, 3.0, 2.0};

    REQUIRE(core::percentile_of(v, 50.0) == Catch::Approx(2.5));
    REQUIRE(core::percentile_of(v, 0.0) == Catch::Approx(1.0));
    REQUIRE(core::percentile_of(v, 100.0) == Catch::Approx(4.0));
    REQUIRE(std::isnan(core::percentile_of({nan, nan}, 50.0)));
}

TEST_CASE("median_of_even_and_odd_counts") {
    REQUIRE(core::median_of({3.0, 1.0, 2.0}) == Catch::Approx(2.0));
    REQUIRE(core::median_of({4.0, 1.0, 3.0, 2.0}) == Catch::Approx(2.5));
}

TEST_CASE("format_double_round_trips_shortest") {
    REQUIRE(core::format_double(0.1) == "0.1");
    REQUIRE(core::format_double(3.5) == "3.5");
    REQUIRE(core::format_double(-2.0) == "-2");
}

TEST_CASE("random_hex_id_is_lowercase_hex") {
    const std::string id = core::random_hex_id(8);
    REQUIRE(id.size() == 8);
    for (char c : id) {
        REQUIRE(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
    }
}

TEST_CASE("string_helpers") {
    REQUIRE(core::trim("  abc \t") == "abc");
    REQUIRE(core::to_lower("MiXeD") == "mixed");
    REQUIRE(core::ends_with("image.fits", ".fits"));
    REQUIRE(core::starts_with("CTYPE1", "CTYPE"));
    REQUIRE(core::contains("uncertainty map", "uncertainty"));
}

TEST_CASE("checked_product_detects_overflow") {
    REQUIRE(core::checked_product({}).value() == 1);
    REQUIRE(core::checked_product({100, 200}).value() == 20000);
    REQUIRE(core::checked_product({2147483647, 2147483647}).value() == 4611686014132420609LL);
    REQUIRE_FALSE(core::checked_product({4294967296LL, 4294967296LL}).has_value());
    REQUIRE_FALSE(core::checked_product({3, -1}).has_value());
    REQUIRE(core::checked_product({0, 4294967296LL, 4294967296LL}).value() == 0);
}
