#ifndef MENUITEM_HPP
#define MENUITEM_HPP

#include "IMenuItem.hpp"

class MenuItem : public IMenuItem {
private:
    MenuItemType _type;
    std::string _name;
    double _price;

public:
    explicit MenuItem(MenuItemType type);
    ~MenuItem() = default;

    MenuItemType getType() const override;
    std::string getName() const override;
    double getPrice() const override;
    void display(std::ostream& out) const override;
};

#endif
