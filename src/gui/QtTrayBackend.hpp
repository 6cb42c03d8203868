// src/gui/QtTrayBackend.hpp
#pragma once
#include "PlatformBackend.hpp"

namespace tray_icon {

class QtTrayBackend : public PlatformBackend {
public:
    // Surfaces are parented to the application object; they delete
    // themselves once destroyed.
    NativeTraySurface* createSurface(std::uint32_t trayId) override;
};

} // namespace tray_icon
