#ifndef IPAYMENTSTRATEGY_HPP
#define IPAYMENTSTRATEGY_HPP

#include <memory>
#include <string>

class IPaymentStrategy {
public:
    virtual ~IPaymentStrategy() = default;
    
    virtual void pay(double amount) = 0;
    virtual std::string getName() const = 0;
};

using PaymentStrategyPtr = std::unique_ptr<IPaymentStrategy>;

#endif
