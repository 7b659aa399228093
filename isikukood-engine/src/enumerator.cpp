#include "enumerator.hpp"
#include "calendar.hpp"
#include "code_codec.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <iterator>
#include <numeric>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace isikukood {

GenerationStats::GenerationStats()
    : dates_considered(0),
      dates_pruned(0),
      records(0),
      codes(0),
      threads(1),
      elapsed_ms(0.0) {}

namespace {

std::vector<int> int_range(int first, int last) {
    std::vector<int> values(static_cast<size_t>(last - first + 1));
    std::iota(values.begin(), values.end(), first);
    return values;
}

// Sorted, duplicate-free copy of values; RangeError if empty or any value is outside [min, max]
std::vector<int> normalize_set(const std::vector<int>& values, const std::string& name,
                               int min, int max) {
    if (values.empty()) {
        throw RangeError(name + " must contain at least one value");
    }

    std::vector<int> result = values;
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());

    for (int v : result) {
        if (v < min || v > max) {
            throw RangeError(name + " must only contain values between " + std::to_string(min) +
                             " and " + std::to_string(max) + " (incl.), found unexpected value " +
                             std::to_string(v));
        }
    }
    return result;
}

std::vector<Gender> normalize_genders(const std::vector<Gender>& values) {
    if (values.empty()) {
        throw RangeError("genders must contain m, f, or both");
    }

    std::vector<Gender> result;
    for (Gender g : values) {
        if (g != Gender::Male && g != Gender::Female) {
            throw RangeError("genders must contain m, f, or both, found value " +
                             std::to_string(static_cast<int>(g)));
        }
        if (std::find(result.begin(), result.end(), g) == result.end()) {
            result.push_back(g);
        }
    }
    return result;
}

} // anonymous namespace

std::vector<std::string> generate(const GenerateConstraints& constraints, GenerationStats* stats) {
    auto start_time = std::chrono::high_resolution_clock::now();
    GenerationStats local_stats;

    std::vector<Gender> genders = normalize_genders(
        constraints.genders.value_or(std::vector<Gender>{Gender::Male, Gender::Female}));
    std::vector<int> days = normalize_set(
        constraints.days.value_or(int_range(1, 31)), "days", 1, 31);
    std::vector<int> months = normalize_set(
        constraints.months.value_or(int_range(1, 12)), "months", 1, 12);
    std::vector<int> years = normalize_set(
        constraints.years.value_or(std::vector<int>{current_year()}), "years", MIN_YEAR, MAX_YEAR);
    std::vector<int> sequences = normalize_set(
        constraints.sequences.value_or(int_range(MIN_SEQUENCE, MAX_SEQUENCE)),
        "sequences", MIN_SEQUENCE, MAX_SEQUENCE);

    // Dates: impossible combinations (Feb 30, Apr 31, ...) contribute nothing
    std::vector<BirthDate> dates;
    for (int year : years) {
        for (int month : months) {
            for (int day : days) {
                ++local_stats.dates_considered;
                if (date_exists(year, month, day)) {
                    dates.push_back(BirthDate{year, month, day});
                } else {
                    ++local_stats.dates_pruned;
                }
            }
        }
    }

    std::vector<IdentityRecord> records;
    records.reserve(genders.size() * dates.size());
    for (Gender gender : genders) {
        for (const BirthDate& date : dates) {
            records.emplace_back(gender, date);
        }
    }
    local_stats.records = records.size();

    // Fan-out: each record fills only its own slot
    std::vector<std::vector<std::string>> slots(records.size());
    std::exception_ptr first_error;

#ifdef HAVE_OPENMP
    local_stats.threads = omp_get_max_threads();

    #pragma omp parallel for schedule(dynamic, 16)
    for (long r = 0; r < static_cast<long>(records.size()); ++r) {
        try {
            slots[r] = construct_many(records[r], sequences);
        } catch (...) {
            // Exceptions cannot leave the parallel region; rethrown below
            #pragma omp critical
            {
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
    }
#else
    for (size_t r = 0; r < records.size(); ++r) {
        slots[r] = construct_many(records[r], sequences);
    }
#endif

    if (first_error) {
        std::rethrow_exception(first_error);
    }

    // Fan-in
    size_t total = 0;
    for (const auto& slot : slots) {
        total += slot.size();
    }

    std::vector<std::string> codes;
    codes.reserve(total);
    for (auto& slot : slots) {
        std::move(slot.begin(), slot.end(), std::back_inserter(codes));
    }
    slots.clear();
    std::sort(codes.begin(), codes.end());

    assert_codec_consistency(codes);

    local_stats.codes = codes.size();
    auto end_time = std::chrono::high_resolution_clock::now();
    local_stats.elapsed_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    if (stats) {
        *stats = local_stats;
    }
    return codes;
}

} // namespace isikukood
