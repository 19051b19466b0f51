#include "menu/MenuItemFactory.hpp"

MenuItemPtr MenuItemFactory::createItem(MenuItemType type) {
    return std::make_unique<MenuItem>(type);
}

MenuItemPtr MenuItemFactory::createItem(const std::string& name) {
    return createItem(MenuItemTypeHelper::stringToMenuItemType(name));
}

MenuItemPtr MenuItemFactory::addCheese(MenuItemPtr item) {
    return std::make_unique<CheeseTopping>(std::move(item));
}
