#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <sstream>
#include <chrono>
#include <cstdlib>
#include "checksum.hpp"
#include "code_codec.hpp"
#include "config_parser.hpp"
#include "enumerator.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "io/csv_reader.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace {

constexpr int EXIT_INTERNAL_FAILURE = 3;

struct CLIArgs {
    // Action (exactly one)
    std::string action;                 // decode, validate, validate-file, checksum, insert-checksum, encode, generate
    std::string action_value;           // argument of the action flag, if any
    int action_count = 0;
    // Encode options
    std::string gender;
    std::string birthdate;
    std::string sequence;
    bool all_sequences = false;
    // Generate options
    std::string genders;
    std::string days;
    std::string months;
    std::string years;
    std::string config_path;
    // Shared by encode and generate
    std::string sequences;
    // Output and logging
    std::string output_path;
    std::string log_level;
    std::string log_file;
    bool log_plain = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "isikukood v1.0.0 - Estonian personal identification codes\n\n";
    std::cerr << "Usage: " << program_name << " <action> [options]\n\n";
    std::cerr << "Actions (exactly one):\n";
    std::cerr << "  --decode <code>             Decode a code and print gender, birth date and sequence\n";
    std::cerr << "  --validate <code>           Check a code (exit 0 if valid, 1 otherwise)\n";
    std::cerr << "  --validate-file <csv>       Validate the first column of every row\n";
    std::cerr << "  --checksum <base>           Print the check digit of a 10 or 11 digit string\n";
    std::cerr << "  --insert-checksum <code>    Print the code with a freshly computed check digit\n";
    std::cerr << "  --encode                    Build codes for one person (see encode options)\n";
    std::cerr << "  --generate                  Enumerate every code matching the constraints\n\n";
    std::cerr << "Encode options:\n";
    std::cerr << "  --gender <m|f>              Gender of the person\n";
    std::cerr << "  --birthdate <YYYY-MM-DD>    Birth date (1800-01-01 to 2199-12-31)\n";
    std::cerr << "  --sequence <n>              Single sequence number (0-999)\n";
    std::cerr << "  --sequences <list>          Sequence numbers, e.g. 0-9,100\n";
    std::cerr << "  --all                       All 1000 sequence numbers\n\n";
    std::cerr << "Generate options (each defaults to its full domain, years to the current year):\n";
    std::cerr << "  --genders <list>            Comma-separated genders, e.g. m,f\n";
    std::cerr << "  --days <list>               Days of month, e.g. 1-31\n";
    std::cerr << "  --months <list>             Months, e.g. 1,6,12\n";
    std::cerr << "  --years <list>              Years, e.g. 1990-1999\n";
    std::cerr << "  --sequences <list>          Sequence numbers, e.g. 0-999\n";
    std::cerr << "  --config <path>             JSON configuration file (flags override it)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             Output file (default: stdout)\n";
    std::cerr << "                              .parquet writes a Parquet table of codes\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log entries to a file\n";
    std::cerr << "  --log-plain                 Plain text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " --decode 50001010006\n";
    std::cerr << "  " << program_name << " --encode --gender f --birthdate 1985-07-14 --sequences 0-9\n";
    std::cerr << "  " << program_name << " --generate --years 2000 --months 1 --days 1 --output codes.parquet\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (str.length() < suffix.length()) return false;
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

void set_action(CLIArgs& args, const std::string& action, const std::string& value = "") {
    args.action = action;
    args.action_value = value;
    ++args.action_count;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--decode" && i + 1 < argc) {
            set_action(args, "decode", argv[++i]);
        } else if (arg == "--validate" && i + 1 < argc) {
            set_action(args, "validate", argv[++i]);
        } else if (arg == "--validate-file" && i + 1 < argc) {
            set_action(args, "validate-file", argv[++i]);
        } else if (arg == "--checksum" && i + 1 < argc) {
            set_action(args, "checksum", argv[++i]);
        } else if (arg == "--insert-checksum" && i + 1 < argc) {
            set_action(args, "insert-checksum", argv[++i]);
        } else if (arg == "--encode") {
            set_action(args, "encode");
        } else if (arg == "--generate") {
            set_action(args, "generate");
        } else if (arg == "--gender" && i + 1 < argc) {
            args.gender = argv[++i];
        } else if (arg == "--birthdate" && i + 1 < argc) {
            args.birthdate = argv[++i];
        } else if (arg == "--sequence" && i + 1 < argc) {
            args.sequence = argv[++i];
        } else if (arg == "--sequences" && i + 1 < argc) {
            args.sequences = argv[++i];
        } else if (arg == "--all") {
            args.all_sequences = true;
        } else if (arg == "--genders" && i + 1 < argc) {
            args.genders = argv[++i];
        } else if (arg == "--days" && i + 1 < argc) {
            args.days = argv[++i];
        } else if (arg == "--months" && i + 1 < argc) {
            args.months = argv[++i];
        } else if (arg == "--years" && i + 1 < argc) {
            args.years = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--log-plain") {
            args.log_plain = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.action_count > 1) {
        std::cerr << "Error: Only one action may be given per invocation\n";
        valid = false;
    }

    if (!args.log_level.empty() && args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    if (args.action == "encode") {
        if (args.gender.empty()) {
            std::cerr << "Error: --encode requires --gender\n";
            valid = false;
        }
        if (args.birthdate.empty()) {
            std::cerr << "Error: --encode requires --birthdate\n";
            valid = false;
        }
        int choices = (args.sequence.empty() ? 0 : 1) + (args.sequences.empty() ? 0 : 1) +
                      (args.all_sequences ? 1 : 0);
        if (choices != 1) {
            std::cerr << "Error: --encode requires exactly one of --sequence, --sequences or --all\n";
            valid = false;
        }
    }

    bool has_generate_options = !args.genders.empty() || !args.days.empty() ||
                                !args.months.empty() || !args.years.empty() ||
                                !args.config_path.empty();
    if (args.action != "generate" && has_generate_options) {
        std::cerr << "Error: --genders, --days, --months, --years and --config require --generate\n";
        valid = false;
    }
    if (args.action != "encode" &&
        (!args.gender.empty() || !args.birthdate.empty() || !args.sequence.empty() || args.all_sequences)) {
        std::cerr << "Error: --gender, --birthdate, --sequence and --all require --encode\n";
        valid = false;
    }
    if (!args.sequences.empty() && args.action != "encode" && args.action != "generate") {
        std::cerr << "Error: --sequences requires --encode or --generate\n";
        valid = false;
    }

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }
    if (args.action == "validate-file" && !file_exists(args.action_value)) {
        std::cerr << "Error: CSV file not found: " << args.action_value << "\n";
        valid = false;
    }

    if (ends_with(args.output_path, ".parquet") &&
        args.action != "encode" && args.action != "generate") {
        std::cerr << "Error: Parquet output is only available for --encode and --generate\n";
        valid = false;
    }

    return valid;
}

// Logger settings from the command line, applied on top of `base`
isikukood::LoggerConfig logger_config_from_args(const CLIArgs& args,
                                                isikukood::LoggerConfig base) {
    if (!args.log_level.empty()) {
        base.min_level = isikukood::string_to_level(args.log_level);
    }
    if (!args.log_file.empty()) {
        base.enable_file = true;
        base.log_file_path = args.log_file;
    }
    if (args.log_plain) {
        base.enable_json = false;
    }
    return base;
}

std::vector<isikukood::Gender> parse_gender_list(const std::string& text) {
    std::vector<isikukood::Gender> genders;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        genders.push_back(isikukood::parse_gender(item));
    }
    return genders;
}

int parse_single_int(const std::string& text, const std::string& flag) {
    std::vector<int> values = isikukood::parse_int_list(text);
    if (values.size() != 1) {
        throw isikukood::ConfigParseError(flag + " expects a single integer, got '" + text + "'");
    }
    return values[0];
}

isikukood::io::ValidationOutcome validate_code(const std::string& code) {
    isikukood::io::ValidationOutcome outcome;
    outcome.code = code;
    outcome.valid = true;
    try {
        isikukood::decode(code);
    } catch (const isikukood::InputError& e) {
        outcome.valid = false;
        outcome.error = e.what();
        outcome.error_kind = e.kind();
    }
    return outcome;
}

// Plain-text result (checksum, insert-checksum)
void emit_text(const std::string& output_path, const std::string& text) {
    if (output_path.empty()) {
        std::cout << text << "\n";
        return;
    }
    std::ofstream file(output_path);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + output_path);
    }
    file << text << "\n";
    std::cerr << "Output written to: " << output_path << "\n";
}

void emit_codes(const std::string& output_path, const std::vector<std::string>& codes, bool pretty) {
    if (output_path.empty()) {
        isikukood::io::write_codes_json(std::cout, codes, pretty);
    } else if (ends_with(output_path, ".parquet")) {
        isikukood::ParquetWriter::write_codes(codes, output_path);
        std::cerr << "Output written to: " << output_path << "\n";
    } else {
        isikukood::io::write_codes_json(output_path, codes, pretty);
        std::cerr << "Output written to: " << output_path << "\n";
    }
}

double elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    auto end = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.action_count == 0) {
        std::cerr << "Error: No action given\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    isikukood::Logger& logger = isikukood::Logger::get_instance();
    logger.configure(logger_config_from_args(args, isikukood::LoggerConfig()));

    std::string input = args.action_value.empty() ? args.config_path : args.action_value;
    isikukood::OperationContext ctx(args.action, input);
    auto start = std::chrono::steady_clock::now();

    try {
        logger.log_operation_start(ctx);
        size_t result_count = 0;
        int exit_code = 0;

        if (args.action == "decode") {
            isikukood::IdentityRecord record = isikukood::decode(args.action_value);
            if (args.output_path.empty()) {
                isikukood::io::write_record_json(std::cout, args.action_value, record);
            } else {
                std::ofstream file(args.output_path);
                if (!file) {
                    throw std::runtime_error("Failed to open output file: " + args.output_path);
                }
                isikukood::io::write_record_json(file, args.action_value, record);
                std::cerr << "Output written to: " << args.output_path << "\n";
            }
            result_count = 1;

        } else if (args.action == "validate") {
            isikukood::io::ValidationOutcome outcome = validate_code(args.action_value);
            if (args.output_path.empty()) {
                isikukood::io::write_validation_json(std::cout, outcome);
            } else {
                std::ofstream file(args.output_path);
                if (!file) {
                    throw std::runtime_error("Failed to open output file: " + args.output_path);
                }
                isikukood::io::write_validation_json(file, outcome);
            }
            if (!outcome.valid) {
                logger.log_input_rejected(ctx, outcome.error_kind, outcome.error);
                exit_code = 1;
            }
            result_count = outcome.valid ? 1 : 0;

        } else if (args.action == "validate-file") {
            std::vector<std::string> codes = isikukood::read_code_column(args.action_value);
            std::vector<isikukood::io::ValidationOutcome> outcomes;
            outcomes.reserve(codes.size());
            for (const auto& code : codes) {
                outcomes.push_back(validate_code(code));
                if (!outcomes.back().valid) {
                    exit_code = 1;
                }
            }
            if (args.output_path.empty()) {
                isikukood::io::write_validation_report_json(std::cout, outcomes);
            } else {
                isikukood::io::write_validation_report_json(args.output_path, outcomes);
                std::cerr << "Output written to: " << args.output_path << "\n";
            }
            result_count = outcomes.size();

        } else if (args.action == "checksum") {
            uint8_t digit = isikukood::calculate_checksum(args.action_value);
            emit_text(args.output_path, std::to_string(digit));
            result_count = 1;

        } else if (args.action == "insert-checksum") {
            emit_text(args.output_path, isikukood::insert_checksum(args.action_value));
            result_count = 1;

        } else if (args.action == "encode") {
            isikukood::IdentityRecord record(
                isikukood::parse_gender(args.gender),
                isikukood::BirthDate::from_iso(args.birthdate));

            std::vector<std::string> codes;
            if (args.all_sequences) {
                codes = isikukood::construct_all(record);
            } else if (!args.sequences.empty()) {
                codes = isikukood::construct_many(record, isikukood::parse_int_list(args.sequences));
            } else {
                codes.push_back(isikukood::encode(record, parse_single_int(args.sequence, "--sequence")));
            }
            emit_codes(args.output_path, codes, true);
            result_count = codes.size();

        } else if (args.action == "generate") {
            isikukood::EngineConfig config;
            if (!args.config_path.empty()) {
                config = isikukood::parse_engine_config_from_file(args.config_path);
                if (config.has_logging) {
                    logger.configure(logger_config_from_args(args, config.logging));
                }
                logger.log_config_loaded(args.config_path, isikukood::describe_config(config));
            }

            // Flags override the configuration file
            isikukood::GenerateConstraints& constraints = config.constraints;
            if (!args.genders.empty()) constraints.genders = parse_gender_list(args.genders);
            if (!args.days.empty()) constraints.days = isikukood::parse_int_list(args.days);
            if (!args.months.empty()) constraints.months = isikukood::parse_int_list(args.months);
            if (!args.years.empty()) constraints.years = isikukood::parse_int_list(args.years);
            if (!args.sequences.empty()) constraints.sequences = isikukood::parse_int_list(args.sequences);
            std::string output_path = args.output_path.empty() ? config.output.path : args.output_path;

            isikukood::GenerationStats stats;
            std::vector<std::string> codes = isikukood::generate(constraints, &stats);
            logger.log_generation_complete(ctx, stats);

            emit_codes(output_path, codes, config.output.pretty);
            result_count = codes.size();
        }

        logger.log_operation_complete(ctx, result_count, elapsed_ms_since(start));
        logger.flush();
        return exit_code;

    } catch (const isikukood::InputError& e) {
        logger.log_input_rejected(ctx, e.kind(), e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const isikukood::InternalConsistencyError& e) {
        // Already logged where it was detected
        logger.flush();
        std::cerr << "\n*** INTERNAL ERROR: the engine produced an invalid result ***\n";
        std::cerr << e.what() << "\n";
        std::cerr << "This is a defect in isikukood, not a problem with the input.\n";
        return EXIT_INTERNAL_FAILURE;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
