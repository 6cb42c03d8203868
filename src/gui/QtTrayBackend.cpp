// src/gui/QtTrayBackend.cpp
#include "QtTrayBackend.hpp"
#include "QtTraySurface.hpp"
#include "Logger.hpp"
#include <QApplication>

namespace tray_icon {

NativeTraySurface* QtTrayBackend::createSurface(std::uint32_t trayId) {
    auto app = qobject_cast<QApplication*>(QCoreApplication::instance());
    if (!app) {
        TRAY_LOG_ERROR("A QApplication is required to create a tray icon");
        return nullptr;
    }

    return new QtTraySurface(trayId, app);
}

PlatformBackend& platformBackend() {
    static QtTrayBackend backend;
    return backend;
}

} // namespace tray_icon
