#ifndef CHEF_HPP
#define CHEF_HPP

#include "IOrderObserver.hpp"
#include <ostream>

class Chef : public IOrderObserver {
private:
    std::ostream& _out;
    int _ordersReceived;

public:
    explicit Chef(std::ostream& out);

    void update(const Order& order) override;
    int getOrdersReceived() const;
};

#endif
