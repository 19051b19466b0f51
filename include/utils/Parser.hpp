#ifndef PARSER_HPP
#define PARSER_HPP

#include <string>

class Parser {
public:
    // Throws ParsingException unless the whole line is a base-10 int.
    static int parseInt(const std::string& input);
    static bool tryParseInt(const std::string& input, int& value);
    static bool isAffirmative(const std::string& answer);

    static std::string trim(const std::string& str);
    static std::string stripCarriageReturn(const std::string& str);
    static std::string toUpper(const std::string& str);
    static std::string toLower(const std::string& str);

    // Fixed two-decimal rendering for totals and payments.
    static std::string formatAmount(double amount);
};

#endif
