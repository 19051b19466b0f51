#ifndef EXCEPTION_HPP
#define EXCEPTION_HPP

#include <exception>
#include <string>

class RestaurantException : public std::exception {
protected:
    std::string _message;

public:
    explicit RestaurantException(const std::string& message);
    const char* what() const noexcept override;
};

class ParsingException : public RestaurantException {
public:
    explicit ParsingException(const std::string& message);
};

class MenuException : public RestaurantException {
public:
    explicit MenuException(const std::string& message);
};

#endif
