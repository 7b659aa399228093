#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace isikukood {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter) {}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    std::string line;

    if (!std::getline(is_, line)) {
        return row;
    }

    // Files written on Windows
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    std::stringstream ss(line);
    std::string cell;

    while (std::getline(ss, cell, delimiter_)) {
        row.push_back(trim(cell));
    }

    return row;
}

bool CsvReader::has_more() const {
    return is_.good() && is_.peek() != EOF;
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::vector<std::string> read_code_column(std::istream& is) {
    CsvReader reader(is);
    std::vector<std::string> codes;
    bool first_row = true;

    while (reader.has_more()) {
        std::vector<std::string> row = reader.read_row();
        if (row.empty() || (row.size() == 1 && row[0].empty())) {
            continue;
        }

        if (first_row) {
            first_row = false;
            std::string head = row[0];
            std::transform(head.begin(), head.end(), head.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            if (head == "code") {
                continue;
            }
        }
        codes.push_back(row[0]);
    }

    return codes;
}

std::vector<std::string> read_code_column(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open CSV file: " + filepath);
    }
    return read_code_column(file);
}

} // namespace isikukood
