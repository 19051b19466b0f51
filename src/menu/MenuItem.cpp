#include "menu/MenuItem.hpp"
#include "utils/Exception.hpp"
#include "utils/Parser.hpp"

MenuItem::MenuItem(MenuItemType type)
    : _type(type), 
      _name(MenuItemTypeHelper::menuItemTypeToString(type)), 
      _price(MenuItemTypeHelper::getPrice(type)) {}

MenuItemType MenuItem::getType() const {
    return _type;
}

std::string MenuItem::getName() const {
    return _name;
}

double MenuItem::getPrice() const {
    return _price;
}

void MenuItem::display(std::ostream& out) const {
    out << _name << " - $" << _price << std::endl;
}

std::string MenuItemTypeHelper::menuItemTypeToString(MenuItemType type) {
    switch (type) {
        case Pizza: return "Pizza";
        case Pasta: return "Pasta";
        default: return "Unknown";
    }
}

MenuItemType MenuItemTypeHelper::stringToMenuItemType(const std::string& str) {
    std::string lower = Parser::toLower(Parser::trim(str));
    
    if (lower == "pizza") return Pizza;
    if (lower == "pasta") return Pasta;
    
    throw ParsingException("Unknown menu item: " + str);
}

MenuItemType MenuItemTypeHelper::fromNumber(int number) {
    if (!isValidNumber(number)) {
        throw ParsingException("Unknown item number: " + std::to_string(number));
    }
    return static_cast<MenuItemType>(number);
}

bool MenuItemTypeHelper::isValidNumber(int number) {
    return number == Pizza || number == Pasta;
}

double MenuItemTypeHelper::getPrice(MenuItemType type) {
    switch (type) {
        case Pizza: return 10.99;
        case Pasta: return 8.99;
        default: return 0.0;
    }
}

std::vector<MenuItemType> MenuItemTypeHelper::allTypes() {
    return {Pizza, Pasta};
}
