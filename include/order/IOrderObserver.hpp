#ifndef IORDEROBSERVER_HPP
#define IORDEROBSERVER_HPP

class Order;

class IOrderObserver {
public:
    virtual ~IOrderObserver() = default;
    
    virtual void update(const Order& order) = 0;
};

#endif
