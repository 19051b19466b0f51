#include "core/Restaurant.hpp"
#include "utils/Logger.hpp"
#include "utils/Exception.hpp"
#include <iostream>

int main() {
    try {
        Logger& logger = Logger::getInstance();
        logger.enableConsoleOutput(false);
        logger.enableFileOutput("restaurant.log");
        logger.setLogLevel(LogLevel::INFO);
        
        Restaurant restaurant(std::cin, std::cout);
        restaurant.run();
        
    } catch (const RestaurantException& e) {
        std::cerr << "Restaurant Error: " << e.what() << std::endl;
        LOG_ERROR(std::string("Restaurant Error: ") + e.what());
        return 84;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        LOG_ERROR(std::string("Unexpected error: ") + e.what());
        return 84;
    }
    
    return 0;
}
