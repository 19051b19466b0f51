#include "order/OrderBuilder.hpp"
#include "utils/Exception.hpp"
#include <utility>

void OrderBuilder::addItem(MenuItemPtr item) {
    if (!item) {
        throw MenuException("Cannot add an empty menu item to the order");
    }
    _items.push_back(std::move(item));
}

double OrderBuilder::calculateTotal() const {
    double total = 0;
    for (const auto& item : _items) {
        total += item->getPrice();
    }
    return total;
}

size_t OrderBuilder::getItemCount() const {
    return _items.size();
}

bool OrderBuilder::isEmpty() const {
    return _items.empty();
}

std::vector<std::string> OrderBuilder::getItemNames() const {
    std::vector<std::string> names;
    names.reserve(_items.size());
    for (const auto& item : _items) {
        names.push_back(item->getName());
    }
    return names;
}
