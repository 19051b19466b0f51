#include "order/Order.hpp"

void Order::attach(IOrderObserver& observer) {
    _observers.push_back(&observer);
}

void Order::notify() const {
    for (IOrderObserver* observer : _observers) {
        observer->update(*this);
    }
}

size_t Order::getObserverCount() const {
    return _observers.size();
}
