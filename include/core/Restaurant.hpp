#ifndef RESTAURANT_HPP
#define RESTAURANT_HPP

#include "order/OrderBuilder.hpp"
#include "order/Order.hpp"
#include "order/Chef.hpp"
#include "payment/PaymentMethod.hpp"
#include <istream>
#include <ostream>
#include <string>

enum MenuChoice {
    DisplayMenu = 1,
    AddItem = 2,
    MakePayment = 3,
    ExitProgram = 4
};

// Interactive ordering loop. Reads one line per prompt from `in` and
// writes every menu, confirmation and price to `out`.
class Restaurant {
private:
    enum InputResult {
        InputOk,
        InputInvalid,
        InputClosed
    };

    std::istream& _in;
    std::ostream& _out;
    OrderBuilder _orderBuilder;
    Chef _chef;
    Order _order;
    bool _running;

public:
    Restaurant(std::istream& in, std::ostream& out);
    ~Restaurant() = default;
    
    Restaurant(const Restaurant&) = delete;
    Restaurant& operator=(const Restaurant&) = delete;
    
    void run();
    bool isRunning() const;

    const OrderBuilder& getOrderBuilder() const;
    const Order& getOrder() const;
    const Chef& getChef() const;
    
private:
    void processChoice(int choice);
    void handleDisplayMenu();
    void handleAddItem();
    void handlePayment();
    void handleExit();

    PaymentMethod selectPaymentMethod(int code);

    bool readLine(std::string& line);
    InputResult readInt(int& value);

    void displayWelcome();
    void showMainMenu();
    void showPaymentMenu();
};

#endif
