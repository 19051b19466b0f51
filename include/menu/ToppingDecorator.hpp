#ifndef TOPPINGDECORATOR_HPP
#define TOPPINGDECORATOR_HPP

#include "IMenuItem.hpp"

// Wraps another item: adds a surcharge and one " + <topping>" display line.
class ToppingDecorator : public IMenuItem {
protected:
    MenuItemPtr _item;

public:
    explicit ToppingDecorator(MenuItemPtr item);
    virtual ~ToppingDecorator() = default;

    MenuItemType getType() const override;
    std::string getName() const override;
    double getPrice() const override;
    void display(std::ostream& out) const override;

    const IMenuItem& getWrappedItem() const;

    virtual std::string getToppingName() const = 0;
    virtual double getSurcharge() const = 0;
};

class CheeseTopping : public ToppingDecorator {
public:
    static constexpr double SURCHARGE = 1.50;

    explicit CheeseTopping(MenuItemPtr item);

    std::string getToppingName() const override;
    double getSurcharge() const override;
};

#endif
