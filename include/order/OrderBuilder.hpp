#ifndef ORDERBUILDER_HPP
#define ORDERBUILDER_HPP

#include "menu/IMenuItem.hpp"
#include <vector>
#include <string>

class OrderBuilder {
private:
    std::vector<MenuItemPtr> _items;

public:
    OrderBuilder() = default;
    ~OrderBuilder() = default;

    OrderBuilder(const OrderBuilder&) = delete;
    OrderBuilder& operator=(const OrderBuilder&) = delete;

    void addItem(MenuItemPtr item);
    double calculateTotal() const;

    size_t getItemCount() const;
    bool isEmpty() const;
    std::vector<std::string> getItemNames() const;
};

#endif
