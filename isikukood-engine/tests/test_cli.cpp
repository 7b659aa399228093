#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <sys/wait.h>
#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using json = nlohmann::json;

namespace {

const std::string CLI = ISIKUKOOD_CLI_PATH;

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream stream(path);
    std::ostringstream ss;
    if (stream) {
        ss << stream.rdbuf();
    }
    return ss.str();
}

CommandResult run_command(const std::string& args) {
    CommandResult result;

    // Create temp files for output, one pair per test process
    std::string suffix = std::to_string(::getpid()) + ".txt";
    std::string stdout_file = "/tmp/isikukood_test_stdout_" + suffix;
    std::string stderr_file = "/tmp/isikukood_test_stderr_" + suffix;

    // Run command with output redirection
    std::string full_cmd = "\"" + CLI + "\" " + args + " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);
    std::filesystem::remove(stdout_file);
    std::filesystem::remove(stderr_file);

    // Normalize exit code (system() returns a wait status)
    result.exit_code = WEXITSTATUS(status);

    return result;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_command("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(contains(result.stderr_output, "Usage:"));
    REQUIRE(contains(result.stderr_output, "--decode"));
    REQUIRE(contains(result.stderr_output, "--encode"));
    REQUIRE(contains(result.stderr_output, "--generate"));
    REQUIRE(contains(result.stderr_output, "--validate-file"));
    REQUIRE(contains(result.stderr_output, "--output"));
    REQUIRE(result.stdout_output.empty());
}

TEST_CASE("CLI no args shows usage", "[cli]") {
    auto result = run_command("");
    REQUIRE(result.exit_code == 0);
    REQUIRE(contains(result.stderr_output, "Usage:"));
}

TEST_CASE("CLI argument errors", "[cli]") {
    SECTION("Unknown option") {
        auto result = run_command("--frobnicate");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Unknown option"));
    }

    SECTION("Missing action") {
        auto result = run_command("--log-plain");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "No action given"));
    }

    SECTION("Two actions") {
        auto result = run_command("--decode 50001010006 --checksum 5000101000");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Only one action"));
    }

    SECTION("Encode without sequence choice") {
        auto result = run_command("--encode --gender m --birthdate 2000-01-01");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "exactly one of --sequence, --sequences or --all"));
    }

    SECTION("Generate option without --generate") {
        auto result = run_command("--decode 50001010006 --years 2000");
        REQUIRE(result.exit_code == 1);
    }

    SECTION("Bad log level") {
        auto result = run_command("--checksum 5000101000 --log-level LOUD");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "--log-level"));
    }

    SECTION("Parquet output for a non-code action") {
        auto result = run_command("--decode 50001010006 --output out.parquet");
        REQUIRE(result.exit_code == 1);
    }
}

TEST_CASE("CLI checksum actions", "[cli]") {
    SECTION("checksum") {
        auto result = run_command("--checksum 5000101000");
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stdout_output == "6\n");
    }

    SECTION("insert-checksum") {
        auto result = run_command("--insert-checksum 5000101000x");
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stdout_output == "50001010006\n");
    }

    SECTION("checksum of malformed base") {
        auto result = run_command("--checksum 12345");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Format error"));
        REQUIRE(result.stdout_output.empty());
    }
}

TEST_CASE("CLI decode", "[cli]") {
    SECTION("Valid code") {
        auto result = run_command("--decode 48507140420");
        REQUIRE(result.exit_code == 0);

        json j = json::parse(result.stdout_output);
        REQUIRE(j["gender"] == "f");
        REQUIRE(j["birthdate"] == "1985-07-14");
        REQUIRE(j["sequence"] == 42);
        REQUIRE(j["checksum"] == 0);
    }

    SECTION("Rejected code is logged and exits 1") {
        auto result = run_command("--decode 90001010006");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Range error"));
        REQUIRE(contains(result.stderr_output, "input_rejected"));
        REQUIRE(result.stdout_output.empty());
    }

    SECTION("Plain text logging") {
        auto result = run_command("--decode 50001010000 --log-plain");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "[WARN] Input rejected"));
        REQUIRE(contains(result.stderr_output, "error_kind=semantic"));
    }

    SECTION("Log level filters operation events") {
        auto result = run_command("--decode 50001010006 --log-level ERROR");
        REQUIRE(result.exit_code == 0);
        REQUIRE_FALSE(contains(result.stderr_output, "operation_start"));
    }
}

TEST_CASE("CLI validate", "[cli]") {
    SECTION("Valid") {
        auto result = run_command("--validate 50001010006");
        REQUIRE(result.exit_code == 0);
        json j = json::parse(result.stdout_output);
        REQUIRE(j["valid"] == true);
    }

    SECTION("Invalid") {
        auto result = run_command("--validate 38001085710");
        REQUIRE(result.exit_code == 1);
        json j = json::parse(result.stdout_output);
        REQUIRE(j["valid"] == false);
        REQUIRE(contains(j["error"].get<std::string>(), "checksum"));
    }

    SECTION("File") {
        const std::string csv = "test_cli_codes.csv";
        {
            std::ofstream file(csv);
            file << "code\n50001010006\n50001010000\n60001010007\n";
        }

        auto result = run_command("--validate-file " + csv);
        REQUIRE(result.exit_code == 1);
        json j = json::parse(result.stdout_output);
        REQUIRE(j["total"] == 3);
        REQUIRE(j["valid"] == 2);
        REQUIRE(j["invalid"] == 1);
        REQUIRE(j["results"][1]["code"] == "50001010000");

        std::filesystem::remove(csv);
    }

    SECTION("Missing file") {
        auto result = run_command("--validate-file no_such_file.csv");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "not found"));
    }
}

TEST_CASE("CLI encode", "[cli]") {
    SECTION("Single sequence") {
        auto result = run_command("--encode --gender m --birthdate 2000-01-01 --sequence 10");
        REQUIRE(result.exit_code == 0);
        json j = json::parse(result.stdout_output);
        REQUIRE(j["codes"] == json::array({"50001010104"}));
    }

    SECTION("Sequence list keeps order") {
        auto result = run_command("--encode --gender male --birthdate 2000-01-01 --sequences 100,0,10");
        REQUIRE(result.exit_code == 0);
        json j = json::parse(result.stdout_output);
        REQUIRE(j["codes"] == json::array({"50001011003", "50001010006", "50001010104"}));
    }

    SECTION("All sequences") {
        auto result = run_command("--encode --gender f --birthdate 2000-02-29 --all");
        REQUIRE(result.exit_code == 0);
        json j = json::parse(result.stdout_output);
        REQUIRE(j["count"] == 1000);
    }

    SECTION("Repeated sequence") {
        auto result = run_command("--encode --gender m --birthdate 2000-01-01 --sequences 1,2,1");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Semantic error"));
        REQUIRE(result.stdout_output.empty());
    }

    SECTION("Nonexistent date") {
        auto result = run_command("--encode --gender m --birthdate 2001-02-29 --sequence 0");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "does not exist"));
    }

    SECTION("Bad gender") {
        auto result = run_command("--encode --gender x --birthdate 2000-01-01 --sequence 0");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Range error"));
    }
}

TEST_CASE("CLI generate", "[cli]") {
    SECTION("Flags") {
        auto result = run_command("--generate --years 2000 --months 1 --days 1 --sequences 0-2");
        REQUIRE(result.exit_code == 0);
        json j = json::parse(result.stdout_output);
        REQUIRE(j["codes"] == json::array({"50001010006", "50001010017", "50001010028",
                                           "60001010007", "60001010018", "60001010029"}));
        REQUIRE(contains(result.stderr_output, "generation_complete"));
    }

    SECTION("Out of range constraint") {
        auto result = run_command("--generate --years 2000 --days 0");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Range error"));
    }

    SECTION("Bad list text") {
        auto result = run_command("--generate --years 2000-1999");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Invalid range"));
    }

    SECTION("Config file with flag override and file output") {
        const std::string dir = "test_cli_config";
        std::filesystem::create_directories(dir);
        {
            std::ofstream file(dir + "/gen.json");
            file << R"({
                "generate": {"genders": ["f"], "days": "1-2", "months": [1], "years": [1999], "sequences": [5]},
                "output": {"path": "codes.json", "pretty": false}
            })";
        }

        auto result = run_command("--generate --config " + dir + "/gen.json --years 2000");
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stdout_output.empty());

        json j = json::parse(read_file(dir + "/codes.json"));
        REQUIRE(j["count"] == 2);
        REQUIRE(j["codes"][0] == "60001010051");
        REQUIRE(j["codes"][1] == "60001020058");

        std::filesystem::remove_all(dir);
    }

    SECTION("Malformed config") {
        const std::string cfg = "test_cli_bad.json";
        {
            std::ofstream file(cfg);
            file << "{ not json";
        }

        auto result = run_command("--generate --config " + cfg);
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "JSON parse error"));

        std::filesystem::remove(cfg);
    }
}

TEST_CASE("CLI output file and log file", "[cli]") {
    const std::string out = "test_cli_out.json";
    const std::string log = "test_cli_run.log";
    std::filesystem::remove(log);

    auto result = run_command("--encode --gender f --birthdate 1985-07-14 --sequence 42 --output " +
                              out + " --log-file " + log);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_output.empty());

    json j = json::parse(read_file(out));
    REQUIRE(j["codes"][0] == "48507140420");

    std::string log_text = read_file(log);
    REQUIRE(contains(log_text, "operation_start"));
    REQUIRE(contains(log_text, "operation_complete"));

    std::filesystem::remove(out);
    std::filesystem::remove(log);
}
