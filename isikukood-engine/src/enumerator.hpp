#ifndef ISIKUKOOD_ENUMERATOR_HPP
#define ISIKUKOOD_ENUMERATOR_HPP

#include "identity_record.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace isikukood {

// Constraints for generate(). An unset field takes its default:
//   genders   -> {male, female}
//   days      -> 1..31
//   months    -> 1..12
//   years     -> {current year}
//   sequences -> 0..999
// A field that is set must be non-empty. Duplicates are ignored.
struct GenerateConstraints {
    std::optional<std::vector<Gender>> genders;
    std::optional<std::vector<int>> days;
    std::optional<std::vector<int>> months;
    std::optional<std::vector<int>> years;
    std::optional<std::vector<int>> sequences;
};

// Summary of one generate() call
struct GenerationStats {
    size_t dates_considered;    // year x month x day combinations
    size_t dates_pruned;        // combinations that are not real dates
    size_t records;             // (gender, date) pairs encoded
    size_t codes;               // codes returned
    int threads;                // worker threads available to the fan-out
    double elapsed_ms;

    GenerationStats();
};

// Generate every valid code matching the constraints.
//
// 1. Deduplicate and range-check each set (RangeError on violation)
// 2. Cross years x months x days, silently dropping nonexistent dates
// 3. Cross surviving dates with genders
// 4. Encode every sequence for every record (parallel over records with OpenMP)
// 5. Sort ascending
// 6. Verify the result is duplicate-free and every code decodes
//
// The output order does not depend on the order of the input sets.
std::vector<std::string> generate(
    const GenerateConstraints& constraints = GenerateConstraints(),
    GenerationStats* stats = nullptr
);

} // namespace isikukood

#endif // ISIKUKOOD_ENUMERATOR_HPP
