#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "io/parquet_writer.hpp"
#include "enumerator.hpp"
#include "errors.hpp"
#include <filesystem>

using namespace isikukood;

#ifdef HAVE_ARROW

TEST_CASE("Parquet I/O - generated code export", "[parquet][io]") {
    GenerateConstraints c;
    c.days = std::vector<int>{1, 2};
    c.months = std::vector<int>{1};
    c.years = std::vector<int>{2000};
    c.sequences = std::vector<int>{0, 1, 2, 3, 4};
    std::vector<std::string> codes = generate(c);
    REQUIRE(codes.size() == 20);

    std::string test_output = "test_codes.parquet";
    if (std::filesystem::exists(test_output)) {
        std::filesystem::remove(test_output);
    }

    SECTION("write_codes creates a Parquet file") {
        REQUIRE_NOTHROW(ParquetWriter::write_codes(codes, test_output));
        REQUIRE(std::filesystem::exists(test_output));
        REQUIRE(std::filesystem::file_size(test_output) > 100);
    }

    SECTION("Empty code list still writes the schema") {
        REQUIRE_NOTHROW(ParquetWriter::write_codes({}, test_output));
        REQUIRE(std::filesystem::exists(test_output));
    }

    SECTION("Invalid code is rejected before writing") {
        REQUIRE_THROWS_AS(ParquetWriter::write_codes({"50001010000"}, test_output), SemanticError);
        REQUIRE_FALSE(std::filesystem::exists(test_output));
    }

    SECTION("Unwritable path") {
        REQUIRE_THROWS_WITH(
            ParquetWriter::write_codes(codes, "no_such_dir/codes.parquet"),
            Catch::Matchers::ContainsSubstring("Cannot open Parquet file")
        );
    }

    std::filesystem::remove(test_output);
}

#else // !HAVE_ARROW

TEST_CASE("Parquet I/O - Not available without Arrow", "[parquet]") {
    REQUIRE_THROWS_WITH(
        ParquetWriter::write_codes({"50001010006"}, "test.parquet"),
        Catch::Matchers::ContainsSubstring("Apache Arrow not available")
    );
}

#endif // HAVE_ARROW
