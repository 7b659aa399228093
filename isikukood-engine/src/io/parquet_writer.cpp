#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include "../code_codec.hpp"
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace isikukood {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

} // anonymous namespace

void ParquetWriter::write_codes(const std::vector<std::string>& codes, const std::string& filepath) {
    auto schema = arrow::schema({
        arrow::field("code", arrow::utf8()),
        arrow::field("marker", arrow::uint8()),
        arrow::field("gender", arrow::utf8()),
        arrow::field("birthdate", arrow::utf8()),
        arrow::field("sequence", arrow::uint16())
    });

    arrow::StringBuilder code_builder;
    arrow::UInt8Builder marker_builder;
    arrow::StringBuilder gender_builder;
    arrow::StringBuilder birthdate_builder;
    arrow::UInt16Builder sequence_builder;

    check(code_builder.Reserve(codes.size()), "reserve memory for code column");
    check(marker_builder.Reserve(codes.size()), "reserve memory for marker column");
    check(gender_builder.Reserve(codes.size()), "reserve memory for gender column");
    check(birthdate_builder.Reserve(codes.size()), "reserve memory for birthdate column");
    check(sequence_builder.Reserve(codes.size()), "reserve memory for sequence column");

    for (const auto& code : codes) {
        IdentityRecord record = decode(code);

        check(code_builder.Append(code), "append code");
        check(marker_builder.Append(static_cast<uint8_t>(code[0] - '0')), "append marker");
        check(gender_builder.Append(gender_to_string(record.gender())), "append gender");
        check(birthdate_builder.Append(record.birthdate().to_iso()), "append birthdate");
        check(sequence_builder.Append(static_cast<uint16_t>(sequence_from_code(code))),
              "append sequence");
    }

    std::shared_ptr<arrow::Array> code_array;
    std::shared_ptr<arrow::Array> marker_array;
    std::shared_ptr<arrow::Array> gender_array;
    std::shared_ptr<arrow::Array> birthdate_array;
    std::shared_ptr<arrow::Array> sequence_array;
    check(code_builder.Finish(&code_array), "finish code array");
    check(marker_builder.Finish(&marker_array), "finish marker array");
    check(gender_builder.Finish(&gender_array), "finish gender array");
    check(birthdate_builder.Finish(&birthdate_array), "finish birthdate array");
    check(sequence_builder.Finish(&sequence_array), "finish sequence array");

    auto table = arrow::Table::Make(schema, {
        code_array, marker_array, gender_array, birthdate_array, sequence_array
    });

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_codes(const std::vector<std::string>& /* codes */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace isikukood
