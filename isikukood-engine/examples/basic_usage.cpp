/**
 * @file basic_usage.cpp
 * @brief Example of the engine API: decoding, encoding and generation
 *
 * Shows how to:
 * - Decode and validate codes, telling rejected input apart from engine defects
 * - Build codes for a person
 * - Enumerate codes for a set of birth dates with generation statistics
 */

#include "../src/code_codec.hpp"
#include "../src/enumerator.hpp"
#include "../src/errors.hpp"
#include "../src/logger.hpp"
#include <iostream>

using namespace isikukood;

int main() {
    // Configure logger
    LoggerConfig log_config;
    log_config.min_level = LogLevel::INFO;
    log_config.enable_json = false;          // Plain text for reading on a terminal

    Logger& logger = Logger::get_instance();
    logger.configure(log_config);

    try {
        // Decode
        IdentityRecord record = decode("50001010006");
        std::cout << "50001010006 -> " << record << "\n";

        // Validate without exceptions
        std::cout << "50001010000 valid: " << (is_valid("50001010000") ? "yes" : "no") << "\n";

        // Rejected input carries a kind and a message
        try {
            decode("90001010006");
        } catch (const InputError& e) {
            std::cout << "Rejected (" << e.kind() << "): " << e.what() << "\n";
        }

        // Encode a person born 1985-07-14
        IdentityRecord person(Gender::Female, 1985, 7, 14);
        std::cout << "Sequence 42: " << encode(person, 42) << "\n";

        std::vector<std::string> some = construct_many(person, {0, 1, 2});
        std::cout << "Sequences 0-2:";
        for (const auto& code : some) {
            std::cout << " " << code;
        }
        std::cout << "\n";

        // Generate everything born on leap days of 2000 and 2004
        GenerateConstraints constraints;
        constraints.days = std::vector<int>{29};
        constraints.months = std::vector<int>{2};
        constraints.years = std::vector<int>{2000, 2001, 2004};

        OperationContext ctx("generate");
        logger.log_operation_start(ctx);

        GenerationStats stats;
        std::vector<std::string> codes = generate(constraints, &stats);
        logger.log_generation_complete(ctx, stats);

        std::cout << "Generated " << codes.size() << " codes ("
                  << stats.dates_pruned << " impossible date pruned), first "
                  << codes.front() << ", last " << codes.back() << "\n";

    } catch (const InternalConsistencyError& e) {
        std::cerr << "Engine defect: " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        logger.log_error(OperationContext("example"), e.what());
        return 1;
    }

    logger.flush();
    return 0;
}
