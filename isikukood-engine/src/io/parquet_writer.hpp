#ifndef ISIKUKOOD_PARQUET_WRITER_HPP
#define ISIKUKOOD_PARQUET_WRITER_HPP

#include <string>
#include <vector>

namespace isikukood {

class ParquetWriter {
public:
    /**
     * Write generated codes to a Parquet file, one row per code.
     *
     * Output schema:
     *   - code: utf8 (11 digits)
     *   - marker: uint8 (century/gender marker, 1-8)
     *   - gender: utf8 ("m" or "f")
     *   - birthdate: utf8 (YYYY-MM-DD)
     *   - sequence: uint16 (0-999)
     *
     * @param codes Valid identity codes
     * @param filepath Path to output Parquet file
     * @throws InputError if a code does not decode
     * @throws std::runtime_error if file cannot be written
     */
    static void write_codes(const std::vector<std::string>& codes, const std::string& filepath);
};

} // namespace isikukood

#endif // ISIKUKOOD_PARQUET_WRITER_HPP
