#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "io/json_writer.hpp"
#include "code_codec.hpp"

using namespace isikukood;
using json = nlohmann::json;

TEST_CASE("Codes JSON", "[io][json]") {
    std::vector<std::string> codes = {"50001010006", "50001010017"};

    SECTION("Pretty output parses back") {
        std::ostringstream oss;
        io::write_codes_json(oss, codes);

        json j = json::parse(oss.str());
        REQUIRE(j["count"] == 2);
        REQUIRE(j["codes"].get<std::vector<std::string>>() == codes);
        REQUIRE(oss.str().find('\n') != oss.str().rfind('\n'));
    }

    SECTION("Compact output is a single line") {
        std::ostringstream oss;
        io::write_codes_json(oss, codes, false);

        REQUIRE(oss.str() == "{\"count\":2,\"codes\":[\"50001010006\",\"50001010017\"]}");
    }

    SECTION("Empty list") {
        std::ostringstream oss;
        io::write_codes_json(oss, {}, false);
        REQUIRE(oss.str() == "{\"count\":0,\"codes\":[]}");
    }

    SECTION("File output") {
        const std::string path = "test_codes_output.json";
        io::write_codes_json(path, codes);

        std::ifstream file(path);
        json j = json::parse(file);
        REQUIRE(j["count"] == 2);
        file.close();
        std::filesystem::remove(path);
    }

    SECTION("Unwritable file") {
        REQUIRE_THROWS_AS(io::write_codes_json("no_such_dir/codes.json", codes), std::runtime_error);
    }
}

TEST_CASE("Decoded record JSON", "[io][json]") {
    const std::string code = "48507140420";
    std::ostringstream oss;
    io::write_record_json(oss, code, decode(code));

    json j = json::parse(oss.str());
    REQUIRE(j["code"] == code);
    REQUIRE(j["gender"] == "f");
    REQUIRE(j["birthdate"] == "1985-07-14");
    REQUIRE(j["sequence"] == 42);
    REQUIRE(j["checksum"] == 0);
}

TEST_CASE("Validation JSON", "[io][json]") {
    std::vector<io::ValidationOutcome> outcomes = {
        {"50001010006", true, ""},
        {"50001010000", false, "Semantic error: invalid checksum for '50001010000', expected 6"},
        {"abc\"", false, "Format error: 'abc\"' is not numeric"},
    };

    SECTION("Single outcome") {
        std::ostringstream oss;
        io::write_validation_json(oss, outcomes[0]);
        json j = json::parse(oss.str());
        REQUIRE(j["valid"] == true);
        REQUIRE_FALSE(j.contains("error"));
    }

    SECTION("Report") {
        std::ostringstream oss;
        io::write_validation_report_json(oss, outcomes);

        json j = json::parse(oss.str());
        REQUIRE(j["total"] == 3);
        REQUIRE(j["valid"] == 1);
        REQUIRE(j["invalid"] == 2);
        REQUIRE(j["results"].size() == 3);
        REQUIRE(j["results"][1]["valid"] == false);
        REQUIRE(j["results"][1]["error"].get<std::string>().find("expected 6") != std::string::npos);
        REQUIRE(j["results"][2]["code"] == "abc\"");
    }
}

TEST_CASE("JSON string quoting", "[io][json]") {
    REQUIRE(io::json_quote("plain") == "\"plain\"");
    REQUIRE(io::json_quote("a\"b") == "\"a\\\"b\"");
    REQUIRE(io::json_quote("a\\b") == "\"a\\\\b\"");
    REQUIRE(io::json_quote("a\nb") == "\"a\\nb\"");
    REQUIRE(io::json_quote(std::string(1, '\x01')) == "\"\\u0001\"");
}

TEST_CASE("Invalid UTF-8 in a validated code still yields parseable JSON", "[io][json]") {
    std::string garbled = "5000101\xff\xfe" "06";
    REQUIRE(io::json_quote("\xff") == "\"\xEF\xBF\xBD\"");

    io::ValidationOutcome outcome;
    outcome.code = garbled;
    outcome.valid = false;
    outcome.error = "bad input " + garbled;

    std::ostringstream oss;
    io::write_validation_json(oss, outcome, false);

    json j = json::parse(oss.str());
    REQUIRE(j["code"] == "5000101\xEF\xBF\xBD\xEF\xBF\xBD" "06");
    REQUIRE(j["valid"] == false);
}
