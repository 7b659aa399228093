#ifndef ISIKUKOOD_CSV_READER_HPP
#define ISIKUKOOD_CSV_READER_HPP

#include <string>
#include <vector>
#include <istream>

namespace isikukood {

class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

private:
    std::istream& is_;
    char delimiter_;

    static std::string trim(const std::string& s);
};

// First column of every non-blank row. A first row whose first cell is
// "code" (any case) is treated as a header and skipped.
std::vector<std::string> read_code_column(std::istream& is);

// Throws std::runtime_error if the file cannot be opened
std::vector<std::string> read_code_column(const std::string& filepath);

} // namespace isikukood

#endif // ISIKUKOOD_CSV_READER_HPP
