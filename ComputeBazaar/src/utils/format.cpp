#include "utils/utils.h"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace bazaar {
namespace utils {

std::string Formatter::formatDecimal(double value, int precision) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string Formatter::formatPrice(double value) { return formatDecimal(value, 6); }

std::string Formatter::formatFactor(double factor) { return formatDecimal(factor, 4); }

std::string Formatter::formatAddress(const std::string& address) {
    if (address.length() <= 19) return address;
    return address.substr(0, 10) + "..." + address.substr(address.length() - 6);
}

std::string Formatter::padLeft(const std::string& str, size_t width, char padChar) {
    if (str.length() >= width) return str;
    return std::string(width - str.length(), padChar) + str;
}

std::string Formatter::padRight(const std::string& str, size_t width, char padChar) {
    if (str.length() >= width) return str;
    return str + std::string(width - str.length(), padChar);
}

std::string Formatter::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string Formatter::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> Formatter::tokenize(const std::string& str) {
    std::vector<std::string> result;
    std::istringstream ss(str);
    std::string item;
    while (ss >> item) result.push_back(item);
    return result;
}

TableFormatter::TableFormatter() : borderChar('|'), headerSeparator('-') {}

void TableFormatter::setHeaders(const std::vector<std::string>& hdrs) {
    headers = hdrs;
    columnWidths.assign(headers.size(), 0);
    rightAligned.resize(headers.size(), false);
    for (size_t i = 0; i < headers.size(); i++) {
        columnWidths[i] = headers[i].length();
    }
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < columnWidths.size(); i++) {
            columnWidths[i] = std::max(columnWidths[i], row[i].length());
        }
    }
}

void TableFormatter::setRightAligned(size_t column, bool right) {
    if (column >= rightAligned.size()) rightAligned.resize(column + 1, false);
    rightAligned[column] = right;
}

void TableFormatter::addRow(const std::vector<std::string>& row) {
    rows.push_back(row);
    for (size_t i = 0; i < row.size() && i < columnWidths.size(); i++) {
        columnWidths[i] = std::max(columnWidths[i], row[i].length());
    }
}

std::string TableFormatter::render() const {
    std::stringstream ss;
    ss << renderRow(headers);
    ss << renderSeparator();
    for (const auto& row : rows) ss << renderRow(row);
    return ss.str();
}

std::string TableFormatter::renderRow(const std::vector<std::string>& row) const {
    std::stringstream ss;
    ss << borderChar;
    for (size_t i = 0; i < columnWidths.size(); i++) {
        std::string cell = (i < row.size()) ? row[i] : "";
        bool right = i < rightAligned.size() && rightAligned[i];
        ss << " " << (right ? Formatter::padLeft(cell, columnWidths[i]) : Formatter::padRight(cell, columnWidths[i]))
           << " " << borderChar;
    }
    ss << "\n";
    return ss.str();
}

std::string TableFormatter::renderSeparator() const {
    std::stringstream ss;
    ss << borderChar;
    for (size_t width : columnWidths) ss << std::string(width + 2, headerSeparator) << borderChar;
    ss << "\n";
    return ss.str();
}

void TableFormatter::clear() {
    headers.clear();
    rows.clear();
    columnWidths.clear();
    rightAligned.clear();
}

}
}
