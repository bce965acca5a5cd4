#include "fits_inspect/pipeline/column_roles.hpp"

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace fits_inspect::pipeline;

TEST_CASE("flux_matching_ignores_case_and_separators") {
    REQUIRE(has_role("Flux_Err", ColumnRole::Flux));
    REQUIRE(has_role("fluxerr", ColumnRole::Flux));
    REQUIRE(has_role("FLUX ERR", ColumnRole::Flux));
    REQUIRE(has_role("SAP_FLUX", ColumnRole::Flux));
    REQUIRE(has_role("net_counts", ColumnRole::Flux));
    REQUIRE(has_role("MAG", ColumnRole::Flux));
    REQUIRE_FALSE(has_role("ID", ColumnRole::Flux));
}

TEST_CASE("time_matching_is_exact_after_normalization") {
    REQUIRE(has_role("MJD", ColumnRole::Time));
    REQUIRE(has_role("Time", ColumnRole::Time));
    REQUIRE(has_role("B_JD", ColumnRole::Time));
    REQUIRE_FALSE(has_role("TIMEDEL", ColumnRole::Time));
}

TEST_CASE("wavelength_matching_accepts_vocabulary_and_substrings") {
    REQUIRE(has_role("WAVELENGTH", ColumnRole::Wavelength));
    REQUIRE(has_role("lambda", ColumnRole::Wavelength));
    REQUIRE(has_role("obs_wave", ColumnRole::Wavelength));
    REQUIRE(has_role("FREQ", ColumnRole::Wavelength));
    REQUIRE_FALSE(has_role("FLUX", ColumnRole::Wavelength));
}

TEST_CASE("one_name_can_carry_several_roles") {
    REQUIRE(has_role("lam_flux", ColumnRole::Flux));
    REQUIRE(has_role("lam_flux", ColumnRole::Wavelength));
    REQUIRE_FALSE(has_role("lam_flux", ColumnRole::Time));
}

TEST_CASE("roster_scan_finds_any_member") {
    const std::vector<std::string> lc = {"ID", "MJD", "FLUX"};
    REQUIRE(any_has_role(lc, ColumnRole::Time));
    REQUIRE(any_has_role(lc, ColumnRole::Flux));
    REQUIRE_FALSE(any_has_role(lc, ColumnRole::Wavelength));
    REQUIRE_FALSE(any_has_role({}, ColumnRole::Flux));
    REQUIRE(normalize_column_name(" Flux_Err ") == "fluxerr");
}
