#include "menu/ToppingDecorator.hpp"
#include "utils/Exception.hpp"
#include <utility>

constexpr double CheeseTopping::SURCHARGE;

ToppingDecorator::ToppingDecorator(MenuItemPtr item) : _item(std::move(item)) {
    if (!_item) {
        throw MenuException("Cannot decorate an empty menu item");
    }
}

MenuItemType ToppingDecorator::getType() const {
    return _item->getType();
}

std::string ToppingDecorator::getName() const {
    return _item->getName() + " + " + getToppingName();
}

double ToppingDecorator::getPrice() const {
    return _item->getPrice() + getSurcharge();
}

void ToppingDecorator::display(std::ostream& out) const {
    _item->display(out);
    out << " + " << getToppingName() << " - $" << getSurcharge() << std::endl;
}

const IMenuItem& ToppingDecorator::getWrappedItem() const {
    return *_item;
}

CheeseTopping::CheeseTopping(MenuItemPtr item) : ToppingDecorator(std::move(item)) {}

std::string CheeseTopping::getToppingName() const {
    return "Cheese";
}

double CheeseTopping::getSurcharge() const {
    return SURCHARGE;
}
