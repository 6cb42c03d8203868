#pragma once
#include <cstdint>

namespace tray_icon {

constexpr std::uint32_t FIRST_MENU_ITEM_ID = 1;
constexpr std::uint32_t FIRST_TRAY_ID = 1;

// Raw click codes carried by TrayNotification messages
constexpr std::uint32_t RAW_LEFT_BUTTON_UP = 0x0202;
constexpr std::uint32_t RAW_RIGHT_BUTTON_UP = 0x0205;
constexpr std::uint32_t RAW_LEFT_BUTTON_DOUBLE_CLICK = 0x0203;
constexpr std::uint32_t RAW_UNKNOWN_CLICK = 0xFFFF;

constexpr int MAX_RECENT_LOGS = 1000;

namespace ErrorCodes {
    constexpr int SUCCESS = 0;
    constexpr int INVALID_PARAM = -1;
    constexpr int ALREADY_REGISTERED = -2;
    constexpr int RESOURCE_DESTROYED = -3;
    constexpr int SYSTEM_ERROR = -4;
}

}
