#ifndef PAYMENTMETHOD_HPP
#define PAYMENTMETHOD_HPP

#include <string>

// Values double as the codes typed at the payment prompt.
enum PaymentMethod {
    Cash = 1,
    CreditCard = 2
};

class PaymentMethodHelper {
public:
    static std::string paymentMethodToString(PaymentMethod method);
    static PaymentMethod fromCode(int code);
    static bool isValidCode(int code);
    static PaymentMethod defaultMethod();
};

#endif
