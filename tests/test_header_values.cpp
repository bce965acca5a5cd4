#include "fits_inspect/core/types.hpp"
#include "fits_inspect/io/fits_io.hpp"
#include "fits_inspect/pipeline/extractor.hpp"

#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace fits_inspect;
using pipeline::to_header_value;

TEST_CASE("string_cards_are_unquoted_and_trimmed") {
    auto v = to_header_value("'NGC 1234  '", 'C');
    REQUIRE(std::holds_alternative<std::string>(v));
    REQUIRE(std::get<std::string>(v) == "NGC 1234");

    auto q = to_header_value("'O''Brien'", 'C');
    REQUIRE(std::get<std::string>(q) == "O'Brien");
}

TEST_CASE("logical_integer_and_float_cards_become_native_scalars") {
    REQUIRE(std::get<bool>(to_header_value("T", 'L')) == true);
    REQUIRE(std::get<bool>(to_header_value("F", 'L')) == false);
    REQUIRE(std::get<int64_t>(to_header_value("  -32", 'I')) == -32);
    REQUIRE(std::get<double>(to_header_value("1.5E3", 'F')) == Catch::Approx(1500.0));
    REQUIRE(std::get<double>(to_header_value("2.0D-1", 'F')) == Catch::Approx(0.2));
}

TEST_CASE("unrepresentable_values_are_kept_as_opaque_text") {
    auto overflow = to_header_value("123456789012345678901234567890", 'I');
    REQUIRE(std::holds_alternative<OpaqueValue>(overflow));
    REQUIRE(std::get<OpaqueValue>(overflow).text == "123456789012345678901234567890");

    auto complex = to_header_value("(1.0, 2.0)", 'X');
    REQUIRE(std::holds_alternative<OpaqueValue>(complex));
    REQUIRE(header_value_to_string(complex) == "(1.0, 2.0)");
}

TEST_CASE("clean_header_drops_commentary_blank_and_valueless_cards") {
    std::vector<io::HeaderRecord> records = {
        {"SIMPLE", "T", 'L'},
        {"BITPIX", "-32", 'I'},
        {"COMMENT", "free text", 'C'},
        {"HISTORY", "processed", 'C'},
        {"   ", "'x'", 'C'},
        {"NOVALUE", "", '\0'},
        {"OBJECT", "'M31'", 'C'},
    };
    Header h = pipeline::clean_header(records);

    REQUIRE(h.size() == 3);
    REQUIRE(h.count("COMMENT") == 0);
    REQUIRE(h.count("HISTORY") == 0);
    REQUIRE(h.count("NOVALUE") == 0);
    REQUIRE(std::get<bool>(h.at("SIMPLE")) == true);
    REQUIRE(std::get<int64_t>(h.at("BITPIX")) == -32);
    REQUIRE(std::get<std::string>(h.at("OBJECT")) == "M31");
}

TEST_CASE("header_value_to_string_formats_each_alternative") {
    REQUIRE(header_value_to_string(HeaderValue(std::string("abc"))) == "abc");
    REQUIRE(header_value_to_string(HeaderValue(int64_t{7})) == "7");
    REQUIRE(header_value_to_string(HeaderValue(true)) == "True");
    REQUIRE(header_value_to_string(HeaderValue(0.5)) == "0.5");
}

TEST_CASE("collect_units_reads_bunit_tunit_and_cunit") {
    Header h;
    h["BUNIT"] = std::string("adu");
    h["TUNIT2"] = std::string("d ");
    h["CUNIT1"] = std::string("deg");
    h["OBJECT"] = std::string("ignored");

    UnitMap units = pipeline::collect_units(h);
    REQUIRE(units.size() == 3);
    REQUIRE(units.at("BUNIT") == "adu");
    REQUIRE(units.at("TUNIT2") == "d");
    REQUIRE(units.at("CUNIT1") == "deg");
}

TEST_CASE("shape_and_dtype_come_from_declared_keys") {
    Header h;
    h["NAXIS"] = int64_t{2};
    h["NAXIS1"] = int64_t{640};
    h["NAXIS2"] = int64_t{480};
    REQUIRE(pipeline::shape_from_header(h) == std::vector<int64_t>{640, 480});

    Header none;
    none["NAXIS"] = int64_t{0};
    REQUIRE(pipeline::shape_from_header(none).empty());

    REQUIRE(pipeline::dtype_from_bitpix(-32) == "float32");
    REQUIRE(pipeline::dtype_from_bitpix(16) == "int16");
    REQUIRE(pipeline::dtype_from_bitpix(3) == "unknown");
}
