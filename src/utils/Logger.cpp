#include "utils/Logger.hpp"
#include "utils/Parser.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>

std::unique_ptr<Logger> Logger::_instance = nullptr;
Mutex Logger::_mutex;

Logger::Logger() : _currentLevel(LogLevel::INFO), _consoleOutput(false) {}

Logger::~Logger() {
    if (_logFile.is_open()) {
        _logFile.close();
    }
}

Logger& Logger::getInstance() {
    ScopedLock lock(_mutex);
    if (!_instance) {
        _instance = std::unique_ptr<Logger>(new Logger());
    }
    return *_instance;
}

void Logger::setLogLevel(LogLevel level) {
    ScopedLock lock(_mutex);
    _currentLevel = level;
}

LogLevel Logger::getLogLevel() const {
    return _currentLevel;
}

void Logger::enableConsoleOutput(bool enable) {
    ScopedLock lock(_mutex);
    _consoleOutput = enable;
}

void Logger::enableFileOutput(const std::string& filename) {
    ScopedLock lock(_mutex);
    if (_logFile.is_open()) {
        _logFile.close();
    }
    _logFile.open(filename, std::ios::app);
    if (!_logFile.is_open()) {
        std::cerr << "Logger: cannot open " << filename << ", file logging disabled" << std::endl;
    }
}

void Logger::disableFileOutput() {
    ScopedLock lock(_mutex);
    if (_logFile.is_open()) {
        _logFile.close();
    }
}

bool Logger::isFileOutputEnabled() const {
    return _logFile.is_open();
}

void Logger::log(LogLevel level, const std::string& message) {
    ScopedLock lock(_mutex);

    if (level < _currentLevel) {
        return;
    }
    if (!_consoleOutput && !_logFile.is_open()) {
        return;
    }
    
    std::string logMessage = "[" + getCurrentTime() + "] [" + levelToString(level) + "] " + message;
    
    // stderr keeps the menu protocol on stdout untouched
    if (_consoleOutput) {
        std::cerr << logMessage << std::endl;
    }
    
    if (_logFile.is_open()) {
        _logFile << logMessage << std::endl;
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::logMenuDisplayed(bool withCheese) {
    info(std::string("Menu displayed") + (withCheese ? " (pizza with extra cheese)" : ""));
}

void Logger::logItemAdded(const std::string& itemName, double orderTotal) {
    std::ostringstream oss;
    oss << "Item added: " << itemName << ", order total now " << Parser::formatAmount(orderTotal);
    info(oss.str());
}

void Logger::logPayment(const std::string& method, double amount) {
    std::ostringstream oss;
    oss << "Payment of " << Parser::formatAmount(amount) << " settled by " << method;
    info(oss.str());
}

std::string Logger::getCurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    
    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}
