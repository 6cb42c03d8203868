#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace tray_icon {

enum class ClickType {
    Left,
    Right,
    Double
};

enum class ErrorKind {
    ResourceAllocationFailed,
    HookRegistrationFailed,
    NativeApiError
};

// Event handed to the user callback: either a click on the icon itself or
// the signal of a selected menu button.
template <typename Signal>
class TrayEvent {
public:
    enum class Kind {
        Tray,
        Menu
    };

    static TrayEvent tray(ClickType click) {
        return TrayEvent(Storage(std::in_place_index<0>, click));
    }

    static TrayEvent menu(Signal signal) {
        return TrayEvent(Storage(std::in_place_index<1>, std::move(signal)));
    }

    Kind kind() const {
        return value_.index() == 0 ? Kind::Tray : Kind::Menu;
    }

    bool isTray() const { return kind() == Kind::Tray; }
    bool isMenu() const { return kind() == Kind::Menu; }

    ClickType click() const { return std::get<0>(value_); }
    const Signal& signal() const { return std::get<1>(value_); }

    bool operator==(const TrayEvent& other) const {
        return value_ == other.value_;
    }
    bool operator!=(const TrayEvent& other) const {
        return !(*this == other);
    }

private:
    using Storage = std::variant<ClickType, Signal>;

    explicit TrayEvent(Storage value)
        : value_(std::move(value)) {
    }

    Storage value_;
};

inline std::string toString(ClickType click) {
    switch (click) {
        case ClickType::Left:   return "Left";
        case ClickType::Right:  return "Right";
        case ClickType::Double: return "Double";
        default:                return "Unknown";
    }
}

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ResourceAllocationFailed: return "ResourceAllocationFailed";
        case ErrorKind::HookRegistrationFailed:   return "HookRegistrationFailed";
        case ErrorKind::NativeApiError:           return "NativeApiError";
        default:                                  return "Unknown";
    }
}

}
