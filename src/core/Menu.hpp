#pragma once
#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tray_icon {

template <typename Signal>
class MenuItem;

struct MenuSeparator {
    bool operator==(const MenuSeparator&) const { return true; }
};

template <typename Signal>
struct MenuButton {
    std::string name;
    Signal signal;
    bool checked{false};

    bool operator==(const MenuButton& other) const {
        return name == other.name && signal == other.signal &&
               checked == other.checked;
    }
};

template <typename Signal>
struct Submenu {
    std::string name;
    std::vector<MenuItem<Signal>> children;

    bool operator==(const Submenu& other) const {
        return name == other.name && children == other.children;
    }
};

// One entry of a tray menu. Plain data: nothing here talks to the platform.
template <typename Signal>
class MenuItem {
public:
    using Value = std::variant<MenuSeparator, MenuButton<Signal>, Submenu<Signal>>;

    static MenuItem separator() {
        return MenuItem(MenuSeparator{});
    }

    static MenuItem button(std::string name, Signal signal, bool checked = false) {
        return MenuItem(MenuButton<Signal>{std::move(name), std::move(signal), checked});
    }

    static MenuItem menu(std::string name, std::vector<MenuItem> children) {
        return MenuItem(Submenu<Signal>{std::move(name), std::move(children)});
    }

    static MenuItem menu(std::string name, std::initializer_list<MenuItem> children) {
        return menu(std::move(name), std::vector<MenuItem>(children));
    }

    bool isSeparator() const { return std::holds_alternative<MenuSeparator>(value_); }
    bool isButton() const { return std::holds_alternative<MenuButton<Signal>>(value_); }
    bool isSubmenu() const { return std::holds_alternative<Submenu<Signal>>(value_); }

    const Value& value() const { return value_; }

    bool operator==(const MenuItem& other) const { return value_ == other.value_; }
    bool operator!=(const MenuItem& other) const { return !(*this == other); }

private:
    explicit MenuItem(Value value)
        : value_(std::move(value)) {
    }

    Value value_;
};

template <typename Signal>
class Menu {
public:
    Menu() = default;

    explicit Menu(std::vector<MenuItem<Signal>> items)
        : items_(std::move(items)) {
    }

    Menu(std::initializer_list<MenuItem<Signal>> items)
        : items_(items) {
    }

    const std::vector<MenuItem<Signal>>& items() const { return items_; }
    bool empty() const { return items_.empty(); }

    bool operator==(const Menu& other) const { return items_ == other.items_; }
    bool operator!=(const Menu& other) const { return !(*this == other); }

private:
    std::vector<MenuItem<Signal>> items_;
};

} // namespace tray_icon
