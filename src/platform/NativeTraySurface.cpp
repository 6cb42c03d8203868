#include "NativeTraySurface.hpp"
#include "TrayEventHook.hpp"

namespace tray_icon {

NativeTraySurface::NativeTraySurface(std::uint32_t trayId)
    : trayId_(trayId)
    , lifetime_(std::make_shared<bool>(true)) {
}

NativeTraySurface::~NativeTraySurface() = default;

void NativeTraySurface::deliver(const NativeMessage& message) {
    if (!hook_) {
        return;
    }

    hook_->handleMessage(*this, message);

    if (message.type == NativeMessage::Type::ResourceDestroyed) {
        hook_.reset();
    }
}

}
