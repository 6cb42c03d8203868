#include "NativeTrayIcon.hpp"
#include "CompiledMenu.hpp"
#include "ErasedCallback.hpp"
#include "Logger.hpp"
#include "NativeTraySurface.hpp"
#include "PlatformBackend.hpp"
#include "SharedTrayState.hpp"
#include "TrayError.hpp"
#include "TrayEventHook.hpp"
#include <tray-icon/Constants.hpp>
#include <atomic>

namespace tray_icon {

std::uint32_t nextTrayId() {
    static std::atomic<std::uint32_t> counter{FIRST_TRAY_ID};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

namespace {

// Tears a half-built surface down again unless construction completes.
class SurfaceGuard {
public:
    explicit SurfaceGuard(NativeTraySurface* surface)
        : surface_(surface) {
    }

    ~SurfaceGuard() {
        if (!surface_) {
            return;
        }
        if (iconAdded_ && surface_->removeIcon() != ErrorCodes::SUCCESS) {
            TRAY_LOG_WARNING("Failed to remove tray icon of a failed construction");
        }
        if (surface_->destroy() != ErrorCodes::SUCCESS) {
            TRAY_LOG_WARNING("Failed to destroy surface of a failed construction");
        }
    }

    void iconAdded() { iconAdded_ = true; }

    NativeTraySurface* release() {
        auto surface = surface_;
        surface_ = nullptr;
        return surface;
    }

private:
    NativeTraySurface* surface_;
    bool iconAdded_{false};
};

}

class NativeTrayIcon::Private {
public:
    std::uint32_t trayId{0};
    NativeTraySurface* surface{nullptr};
    std::weak_ptr<const void> surfaceLifetime;
    std::shared_ptr<SharedTrayState> state;

    NativeTraySurface& liveSurface(const std::string& what) const {
        if (surfaceLifetime.expired()) {
            throw TrayError::nativeApiError(what, ErrorCodes::RESOURCE_DESTROYED);
        }
        return *surface;
    }
};

std::unique_ptr<NativeTrayIcon> NativeTrayIcon::create(PlatformBackend& backend,
                                                       const TraySettings& settings,
                                                       const MenuCompiler& compile,
                                                       std::unique_ptr<ErasedCallback> callback) {
    std::uint32_t trayId = nextTrayId();

    NativeTraySurface* surface = backend.createSurface(trayId);
    if (!surface) {
        throw TrayError::resourceAllocationFailed(
            "Failed to create native tray surface (tray id: " + std::to_string(trayId) + ")");
    }
    SurfaceGuard guard(surface);
    TRAY_LOG_DEBUG("Created native tray surface (tray id: " + std::to_string(trayId) + ")");

    std::shared_ptr<const CompiledMenu> menu;
    if (compile) {
        menu = compile(*surface);
    }

    auto state = std::make_shared<SharedTrayState>(std::move(menu), settings.tooltip);

    int result = surface->addIcon(settings.iconPath, settings.tooltip);
    if (result != ErrorCodes::SUCCESS) {
        throw TrayError::nativeApiError("Failed to add tray icon", result);
    }
    guard.iconAdded();

    auto hook = std::make_unique<TrayEventHook>(trayId, state, std::move(callback));
    result = surface->installHook(std::move(hook));
    if (result != ErrorCodes::SUCCESS) {
        throw TrayError::hookRegistrationFailed(
            "Failed to install event hook (code " + std::to_string(result) + ")");
    }

    return std::unique_ptr<NativeTrayIcon>(new NativeTrayIcon(guard.release(), std::move(state)));
}

NativeTrayIcon::NativeTrayIcon(NativeTraySurface* surface, std::shared_ptr<SharedTrayState> state)
    : d(std::make_unique<Private>()) {
    d->trayId = surface->trayId();
    d->surface = surface;
    d->surfaceLifetime = surface->lifetime();
    d->state = std::move(state);
}

NativeTrayIcon::~NativeTrayIcon() {
    if (!surfaceAlive()) {
        TRAY_LOG_DEBUG("Native tray surface already gone (tray id: " +
                       std::to_string(d->trayId) + ")");
        return;
    }

    TRAY_LOG_DEBUG("Destroying native tray surface (tray id: " + std::to_string(d->trayId) + ")");

    int result = d->surface->removeIcon();
    if (result != ErrorCodes::SUCCESS) {
        TRAY_LOG_WARNING("Failed to remove tray icon (code " + std::to_string(result) + ")");
    }

    result = d->surface->destroy();
    if (result != ErrorCodes::SUCCESS) {
        TRAY_LOG_WARNING("Failed to destroy native tray surface (code " +
                         std::to_string(result) + ")");
    }
}

std::uint32_t NativeTrayIcon::trayId() const {
    return d->trayId;
}

bool NativeTrayIcon::surfaceAlive() const {
    return !d->surfaceLifetime.expired();
}

void NativeTrayIcon::setTooltip(std::optional<std::string> tooltip) {
    int result = d->liveSurface("Failed to update tooltip").setToolTip(tooltip);
    if (result != ErrorCodes::SUCCESS) {
        throw TrayError::nativeApiError("Failed to update tooltip", result);
    }
    d->state->setTooltip(std::move(tooltip));
}

std::optional<std::string> NativeTrayIcon::tooltip() const {
    return d->state->tooltip();
}

void NativeTrayIcon::replaceMenu(const MenuCompiler& compile) {
    std::shared_ptr<const CompiledMenu> menu;
    if (compile) {
        menu = compile(d->liveSurface("Failed to replace menu"));
    } else if (!surfaceAlive()) {
        throw TrayError::nativeApiError("Failed to replace menu",
                                        ErrorCodes::RESOURCE_DESTROYED);
    }
    d->state->replaceMenu(std::move(menu));
}

std::shared_ptr<const CompiledMenu> NativeTrayIcon::menu() const {
    return d->state->menu();
}

}
