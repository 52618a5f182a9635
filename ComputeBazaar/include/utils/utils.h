#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace bazaar {
namespace utils {

class Formatter {
public:
    static std::string formatDecimal(double value, int precision = 6);
    static std::string formatPrice(double value);
    static std::string formatFactor(double factor);
    static std::string formatAddress(const std::string& address);
    static std::string padLeft(const std::string& str, size_t width, char padChar = ' ');
    static std::string padRight(const std::string& str, size_t width, char padChar = ' ');
    static std::string toLower(const std::string& str);
    static std::string trim(const std::string& str);
    // Splits on runs of blanks and drops empty tokens.
    static std::vector<std::string> tokenize(const std::string& str);
};

class TableFormatter {
public:
    TableFormatter();
    void setHeaders(const std::vector<std::string>& hdrs);
    // Numeric columns are padded on the left.
    void setRightAligned(size_t column, bool right = true);
    void addRow(const std::vector<std::string>& row);
    std::string render() const;
    std::string renderRow(const std::vector<std::string>& row) const;
    std::string renderSeparator() const;
    size_t rowCount() const { return rows.size(); }
    void clear();

private:
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    std::vector<size_t> columnWidths;
    std::vector<bool> rightAligned;
    char borderChar;
    char headerSeparator;
};

}
}
