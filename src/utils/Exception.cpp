#include "utils/Exception.hpp"

RestaurantException::RestaurantException(const std::string& message) : _message(message) {}

const char* RestaurantException::what() const noexcept {
    return _message.c_str();
}

ParsingException::ParsingException(const std::string& message) 
    : RestaurantException("Parsing Error: " + message) {}

MenuException::MenuException(const std::string& message) 
    : RestaurantException("Menu Error: " + message) {}
