#include "utils/Parser.hpp"
#include "utils/Exception.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <cerrno>
#include <iomanip>
#include <sstream>

int Parser::parseInt(const std::string& input) {
    std::string clean = trim(input);
    
    if (clean.empty()) {
        throw ParsingException("Empty input");
    }
    
    size_t pos = 0;
    if (clean[0] == '+' || clean[0] == '-') {
        pos = 1;
    }
    if (pos == clean.size()) {
        throw ParsingException("Invalid number: " + clean);
    }
    
    for (size_t i = pos; i < clean.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(clean[i]))) {
            throw ParsingException("Invalid number: " + clean);
        }
    }
    
    errno = 0;
    long value = std::strtol(clean.c_str(), nullptr, 10);
    if (errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        throw ParsingException("Number out of range: " + clean);
    }
    
    return static_cast<int>(value);
}

bool Parser::tryParseInt(const std::string& input, int& value) {
    try {
        value = parseInt(input);
    } catch (const ParsingException&) {
        return false;
    }
    return true;
}

bool Parser::isAffirmative(const std::string& answer) {
    return toUpper(stripCarriageReturn(answer)) == "Y";
}

std::string Parser::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

std::string Parser::stripCarriageReturn(const std::string& str) {
    if (!str.empty() && str.back() == '\r') {
        return str.substr(0, str.size() - 1);
    }
    return str;
}

std::string Parser::toUpper(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return upper;
}

std::string Parser::toLower(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

std::string Parser::formatAmount(double amount) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << amount;
    return oss.str();
}
