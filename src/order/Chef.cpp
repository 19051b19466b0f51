#include "order/Chef.hpp"
#include "order/Order.hpp"
#include "utils/Logger.hpp"

Chef::Chef(std::ostream& out) : _out(out), _ordersReceived(0) {}

void Chef::update(const Order& order) {
    (void)order;
    ++_ordersReceived;
    _out << "Chef: New order received." << std::endl;
    LOG_INFO("Chef notified of order #" + std::to_string(_ordersReceived));
}

int Chef::getOrdersReceived() const {
    return _ordersReceived;
}
