#ifndef MENUITEMFACTORY_HPP
#define MENUITEMFACTORY_HPP

#include "MenuItem.hpp"
#include "ToppingDecorator.hpp"
#include <memory>

class MenuItemFactory {
public:
    static MenuItemPtr createItem(MenuItemType type);
    static MenuItemPtr createItem(const std::string& name);
    static MenuItemPtr addCheese(MenuItemPtr item);
};

#endif
