#include "TrayEventHook.hpp"
#include "CompiledMenu.hpp"
#include "ErasedCallback.hpp"
#include "Logger.hpp"
#include "NativeTraySurface.hpp"
#include "SharedTrayState.hpp"
#include <tray-icon/Constants.hpp>
#include <functional>
#include <string>

namespace tray_icon {

std::optional<ClickType> decodeClick(std::uint32_t rawCode) {
    switch (rawCode) {
        case RAW_LEFT_BUTTON_UP:           return ClickType::Left;
        case RAW_RIGHT_BUTTON_UP:          return ClickType::Right;
        case RAW_LEFT_BUTTON_DOUBLE_CLICK: return ClickType::Double;
        default:                           return std::nullopt;
    }
}

TrayEventHook::TrayEventHook(std::uint32_t trayId,
                             std::shared_ptr<SharedTrayState> state,
                             std::unique_ptr<ErasedCallback> callback)
    : trayId_(trayId)
    , state_(std::move(state))
    , callback_(std::move(callback)) {
}

TrayEventHook::~TrayEventHook() = default;

void TrayEventHook::handleMessage(NativeTraySurface& surface, const NativeMessage& message) {
    if (finalized_) {
        return;
    }

    switch (message.type) {
        case NativeMessage::Type::TrayNotification:
            handleClick(surface, message.code);
            break;

        case NativeMessage::Type::MenuCommand:
            handleCommand(message.code);
            break;

        case NativeMessage::Type::ResourceDestroyed:
            release();
            break;

        default:
            break;
    }
}

void TrayEventHook::handleClick(NativeTraySurface& surface, std::uint32_t rawCode) {
    auto click = decodeClick(rawCode);
    if (!click) {
        return;
    }

    callback_->invoke(ErasedEvent::tray(*click));

    if (*click != ClickType::Right) {
        return;
    }

    // Snapshot after the callback ran: it may have replaced the menu
    auto menu = state_->menu();
    if (!menu) {
        return;
    }

    int result = surface.showMenu(menu->nativeMenu());
    if (result == ErrorCodes::RESOURCE_DESTROYED) {
        TRAY_LOG_DEBUG("Tray is being destroyed, menu not shown (tray id: " +
                       std::to_string(trayId_) + ")");
    } else if (result != ErrorCodes::SUCCESS) {
        TRAY_LOG_WARNING("Failed to show menu (tray id: " + std::to_string(trayId_) +
                         ", code " + std::to_string(result) + ")");
    }
}

void TrayEventHook::handleCommand(std::uint32_t id) {
    auto signal = state_->lookupSignal(id);
    if (!signal) {
        TRAY_LOG_DEBUG("Unknown menu item id: " + std::to_string(id));
        return;
    }

    callback_->invoke(ErasedEvent::menu(std::cref(*signal)));
}

void TrayEventHook::release() {
    callback_.reset();
    state_.reset();
    finalized_ = true;
    TRAY_LOG_DEBUG("Released event hook data (tray id: " + std::to_string(trayId_) + ")");
}

}
