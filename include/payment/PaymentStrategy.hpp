#ifndef PAYMENTSTRATEGY_HPP
#define PAYMENTSTRATEGY_HPP

#include "IPaymentStrategy.hpp"
#include "PaymentMethod.hpp"
#include <ostream>

class CashPayment : public IPaymentStrategy {
private:
    std::ostream& _out;

public:
    explicit CashPayment(std::ostream& out);

    void pay(double amount) override;
    std::string getName() const override;
};

class CreditCardPayment : public IPaymentStrategy {
private:
    std::ostream& _out;

public:
    explicit CreditCardPayment(std::ostream& out);

    void pay(double amount) override;
    std::string getName() const override;
};

class PaymentStrategyFactory {
public:
    static PaymentStrategyPtr createStrategy(PaymentMethod method, std::ostream& out);
};

#endif
