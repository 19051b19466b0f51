#include "core/Restaurant.hpp"
#include "menu/MenuItemFactory.hpp"
#include "payment/PaymentStrategy.hpp"
#include "utils/Exception.hpp"
#include "utils/Logger.hpp"
#include "utils/Parser.hpp"
#include <utility>

Restaurant::Restaurant(std::istream& in, std::ostream& out)
    : _in(in), _out(out), _chef(out), _running(false) {
    // The chef is subscribed but nothing in the loop triggers notify().
    _order.attach(_chef);
}

void Restaurant::run() {
    _running = true;
    
    LOG_INFO("Restaurant opened");
    displayWelcome();
    
    while (_running) {
        showMainMenu();
        
        int choice = 0;
        InputResult result = readInt(choice);
        if (result == InputClosed) {
            LOG_INFO("Input closed, leaving the ordering loop");
            break;
        }
        if (result == InputInvalid) {
            continue;
        }
        
        processChoice(choice);
    }
    
    _running = false;
    LOG_INFO("Restaurant shutting down");
}

bool Restaurant::isRunning() const {
    return _running;
}

const OrderBuilder& Restaurant::getOrderBuilder() const {
    return _orderBuilder;
}

const Order& Restaurant::getOrder() const {
    return _order;
}

const Chef& Restaurant::getChef() const {
    return _chef;
}

void Restaurant::processChoice(int choice) {
    switch (choice) {
        case DisplayMenu:
            handleDisplayMenu();
            break;
        case AddItem:
            handleAddItem();
            break;
        case MakePayment:
            handlePayment();
            break;
        case ExitProgram:
            handleExit();
            break;
        default:
            _out << "Invalid choice. Please enter a valid option." << std::endl;
            LOG_WARNING("Unknown main menu choice: " + std::to_string(choice));
            break;
    }
}

void Restaurant::handleDisplayMenu() {
    _out << "Menu Items:" << std::endl;
    MenuItemPtr pizza = MenuItemFactory::createItem(Pizza);
    MenuItemPtr pasta = MenuItemFactory::createItem(Pasta);
    
    _out << "Do you want to add extra cheese to the pizza? (Y/N):" << std::endl;
    std::string answer;
    if (!readLine(answer)) {
        answer.clear();
    }
    
    bool withCheese = Parser::isAffirmative(answer);
    if (withCheese) {
        pizza = MenuItemFactory::addCheese(std::move(pizza));
    }
    
    pizza->display(_out);
    pasta->display(_out);
    Logger::getInstance().logMenuDisplayed(withCheese);
}

void Restaurant::handleAddItem() {
    _out << "Enter item number to add (1 for Pizza, 2 for Pasta):" << std::endl;
    
    int itemNumber = 0;
    if (readInt(itemNumber) != InputOk) {
        return;
    }
    
    if (!MenuItemTypeHelper::isValidNumber(itemNumber)) {
        _out << "Invalid item number." << std::endl;
        LOG_WARNING("Unknown item number: " + std::to_string(itemNumber));
        return;
    }
    
    MenuItemPtr item = MenuItemFactory::createItem(MenuItemTypeHelper::fromNumber(itemNumber));
    std::string name = item->getName();
    _orderBuilder.addItem(std::move(item));
    
    _out << name << " added to order." << std::endl;
    Logger::getInstance().logItemAdded(name, _orderBuilder.calculateTotal());
}

void Restaurant::handlePayment() {
    if (_orderBuilder.isEmpty()) {
        _out << "Please add items to the order first." << std::endl;
        return;
    }
    
    showPaymentMenu();
    
    int code = 0;
    if (readInt(code) != InputOk) {
        return;
    }
    
    PaymentStrategyPtr paymentStrategy = 
        PaymentStrategyFactory::createStrategy(selectPaymentMethod(code), _out);
    
    double totalAmount = _orderBuilder.calculateTotal();
    _out << "Total Amount: $" << Parser::formatAmount(totalAmount) << std::endl;
    paymentStrategy->pay(totalAmount);
}

void Restaurant::handleExit() {
    _out << "Exiting program. Goodbye!" << std::endl;
    _running = false;
}

PaymentMethod Restaurant::selectPaymentMethod(int code) {
    if (PaymentMethodHelper::isValidCode(code)) {
        return PaymentMethodHelper::fromCode(code);
    }
    
    _out << "Invalid choice. Using default payment method (Cash)." << std::endl;
    LOG_WARNING("Unknown payment method code " + std::to_string(code) + ", falling back to cash");
    return PaymentMethodHelper::defaultMethod();
}

bool Restaurant::readLine(std::string& line) {
    if (!std::getline(_in, line)) {
        return false;
    }
    line = Parser::stripCarriageReturn(line);
    return true;
}

Restaurant::InputResult Restaurant::readInt(int& value) {
    std::string line;
    if (!readLine(line)) {
        _running = false;
        return InputClosed;
    }
    
    try {
        value = Parser::parseInt(line);
    } catch (const ParsingException& e) {
        _out << "Invalid input. Please enter a number." << std::endl;
        LOG_WARNING(e.what());
        return InputInvalid;
    }
    
    return InputOk;
}

void Restaurant::displayWelcome() {
    _out << "Welcome to the Restaurant!" << std::endl;
}

void Restaurant::showMainMenu() {
    _out << std::endl;
    _out << "Choose an option:" << std::endl;
    _out << "1. Display Menu" << std::endl;
    _out << "2. Add Item to Order" << std::endl;
    _out << "3. Make Payment" << std::endl;
    _out << "4. Exit" << std::endl;
}

void Restaurant::showPaymentMenu() {
    _out << "Select payment method:" << std::endl;
    _out << "1. " << PaymentMethodHelper::paymentMethodToString(Cash) << " Payment" << std::endl;
    _out << "2. " << PaymentMethodHelper::paymentMethodToString(CreditCard) << " Payment" << std::endl;
}
