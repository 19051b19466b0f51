#include "payment/PaymentStrategy.hpp"
#include "utils/Exception.hpp"
#include "utils/Logger.hpp"
#include "utils/Parser.hpp"

CashPayment::CashPayment(std::ostream& out) : _out(out) {}

void CashPayment::pay(double amount) {
    _out << "Paid $" << Parser::formatAmount(amount) << " by cash." << std::endl;
    Logger::getInstance().logPayment(getName(), amount);
}

std::string CashPayment::getName() const {
    return "cash";
}

CreditCardPayment::CreditCardPayment(std::ostream& out) : _out(out) {}

void CreditCardPayment::pay(double amount) {
    _out << "Paid $" << Parser::formatAmount(amount) << " by credit card." << std::endl;
    Logger::getInstance().logPayment(getName(), amount);
}

std::string CreditCardPayment::getName() const {
    return "credit card";
}

PaymentStrategyPtr PaymentStrategyFactory::createStrategy(PaymentMethod method, std::ostream& out) {
    switch (method) {
        case Cash: return std::make_unique<CashPayment>(out);
        case CreditCard: return std::make_unique<CreditCardPayment>(out);
        default: break;
    }
    throw ParsingException("Unknown payment method: " + std::to_string(static_cast<int>(method)));
}

std::string PaymentMethodHelper::paymentMethodToString(PaymentMethod method) {
    switch (method) {
        case Cash: return "Cash";
        case CreditCard: return "Credit Card";
        default: return "Unknown";
    }
}

PaymentMethod PaymentMethodHelper::fromCode(int code) {
    if (!isValidCode(code)) {
        throw ParsingException("Unknown payment method code: " + std::to_string(code));
    }
    return static_cast<PaymentMethod>(code);
}

bool PaymentMethodHelper::isValidCode(int code) {
    return code == Cash || code == CreditCard;
}

PaymentMethod PaymentMethodHelper::defaultMethod() {
    return Cash;
}
