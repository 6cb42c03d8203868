#pragma once
#include <cstdint>

namespace tray_icon {

class NativeTraySurface;

class PlatformBackend {
public:
    virtual ~PlatformBackend() = default;

    // Returns nullptr when the native resource cannot be allocated.
    // The backend keeps ownership; see NativeTraySurface.
    virtual NativeTraySurface* createSurface(std::uint32_t trayId) = 0;
};

// Process-wide default backend (Qt Widgets)
PlatformBackend& platformBackend();

}
