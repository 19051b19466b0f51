#ifndef IMENUITEM_HPP
#define IMENUITEM_HPP

#include "MenuItemType.hpp"
#include <memory>
#include <ostream>
#include <string>

class IMenuItem {
public:
    virtual ~IMenuItem() = default;
    
    virtual MenuItemType getType() const = 0;
    virtual std::string getName() const = 0;
    virtual double getPrice() const = 0;
    virtual void display(std::ostream& out) const = 0;
};

using MenuItemPtr = std::unique_ptr<IMenuItem>;

#endif
