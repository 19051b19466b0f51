#ifndef MENUITEMTYPE_HPP
#define MENUITEMTYPE_HPP

#include <string>
#include <vector>

// Values double as the item numbers typed at the "add item" prompt.
enum MenuItemType {
    Pizza = 1,
    Pasta = 2
};

class MenuItemTypeHelper {
public:
    static std::string menuItemTypeToString(MenuItemType type);
    static MenuItemType stringToMenuItemType(const std::string& str);
    static MenuItemType fromNumber(int number);
    static bool isValidNumber(int number);
    static double getPrice(MenuItemType type);
    static std::vector<MenuItemType> allTypes();
};

#endif
