#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <fstream>
#include <memory>
#include "../threading/Mutex.hpp"

enum LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

class Logger {
private:
    static std::unique_ptr<Logger> _instance;
    static Mutex _mutex;
    
    std::ofstream _logFile;
    LogLevel _currentLevel;
    bool _consoleOutput;

    Logger();

public:
    ~Logger();
    
    static Logger& getInstance();
    
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void enableConsoleOutput(bool enable);
    void enableFileOutput(const std::string& filename);
    void disableFileOutput();
    bool isFileOutputEnabled() const;
    
    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    
    void logMenuDisplayed(bool withCheese);
    void logItemAdded(const std::string& itemName, double orderTotal);
    void logPayment(const std::string& method, double amount);

    static std::string levelToString(LogLevel level);

private:
    std::string getCurrentTime();
};

// Convenience macros
#define LOG_DEBUG(msg) Logger::getInstance().debug(msg)
#define LOG_INFO(msg) Logger::getInstance().info(msg)
#define LOG_WARNING(msg) Logger::getInstance().warning(msg)
#define LOG_ERROR(msg) Logger::getInstance().error(msg)

#endif
