#include <gtest/gtest.h>
#include "payment/PaymentStrategy.hpp"
#include "utils/Exception.hpp"
#include <sstream>

TEST(PaymentStrategyTest, CashPrintsAmountAndMethod) {
    std::ostringstream out;
    CashPayment payment(out);
    payment.pay(19.98);

    EXPECT_EQ(out.str(), "Paid $19.98 by cash.\n");
    EXPECT_EQ(payment.getName(), "cash");
}

TEST(PaymentStrategyTest, CreditCardPrintsAmountAndMethod) {
    std::ostringstream out;
    CreditCardPayment payment(out);
    payment.pay(12.49);

    EXPECT_EQ(out.str(), "Paid $12.49 by credit card.\n");
    EXPECT_EQ(payment.getName(), "credit card");
}

TEST(PaymentStrategyTest, LargeAmountsKeepTheirCents) {
    std::ostringstream out;
    CashPayment cash(out);
    CreditCardPayment card(out);
    cash.pay(10011.89);
    card.pay(123456.7);

    EXPECT_EQ(out.str(), "Paid $10011.89 by cash.\nPaid $123456.70 by credit card.\n");
}

TEST(PaymentStrategyTest, StrategiesAreInterchangeable) {
    std::ostringstream out;
    PaymentStrategyPtr strategies[] = {
        PaymentStrategyFactory::createStrategy(Cash, out),
        PaymentStrategyFactory::createStrategy(CreditCard, out)
    };

    for (auto& strategy : strategies) {
        strategy->pay(8.99);
    }

    EXPECT_EQ(out.str(), "Paid $8.99 by cash.\nPaid $8.99 by credit card.\n");
}

TEST(PaymentMethodHelperTest, CodesSelectMethods) {
    EXPECT_EQ(PaymentMethodHelper::fromCode(1), Cash);
    EXPECT_EQ(PaymentMethodHelper::fromCode(2), CreditCard);
    EXPECT_THROW(PaymentMethodHelper::fromCode(3), ParsingException);
    EXPECT_THROW(PaymentMethodHelper::fromCode(-1), ParsingException);
}

TEST(PaymentMethodHelperTest, UnknownCodesAreInvalid) {
    EXPECT_TRUE(PaymentMethodHelper::isValidCode(1));
    EXPECT_TRUE(PaymentMethodHelper::isValidCode(2));
    EXPECT_FALSE(PaymentMethodHelper::isValidCode(0));
    EXPECT_FALSE(PaymentMethodHelper::isValidCode(42));
    EXPECT_EQ(PaymentMethodHelper::defaultMethod(), Cash);
}

TEST(PaymentMethodHelperTest, MethodNames) {
    EXPECT_EQ(PaymentMethodHelper::paymentMethodToString(Cash), "Cash");
    EXPECT_EQ(PaymentMethodHelper::paymentMethodToString(CreditCard), "Credit Card");
}
