#ifndef ORDER_HPP
#define ORDER_HPP

#include "IOrderObserver.hpp"
#include <vector>
#include <cstddef>

// Observers are not owned and must outlive the order.
class Order {
private:
    std::vector<IOrderObserver*> _observers;

public:
    Order() = default;
    ~Order() = default;

    Order(const Order&) = delete;
    Order& operator=(const Order&) = delete;

    void attach(IOrderObserver& observer);
    void notify() const;

    size_t getObserverCount() const;
};

#endif
