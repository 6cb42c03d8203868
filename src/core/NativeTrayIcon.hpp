#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tray_icon {

class CompiledMenu;
class ErasedCallback;
class NativeTraySurface;
class PlatformBackend;
class SharedTrayState;

// Hands out tray ids. Process lifetime, starts at FIRST_TRAY_ID, never reused.
std::uint32_t nextTrayId();

struct TraySettings {
    std::optional<std::string> tooltip;
    std::string iconPath;
};

/*
 * Non-generic owner of one native tray resource.
 *
 * create() either returns a fully registered icon or throws TrayError with
 * nothing left registered. The destructor removes the icon and requests
 * destruction of the surface; the hook keeps the shared state and the user
 * callback alive until the surface reports that it is gone.
 *
 * The surface may also be deleted behind the icon's back, e.g. by Qt when
 * the application object goes away first. Native calls then fail with
 * RESOURCE_DESTROYED and the destructor has nothing left to tear down.
 */
class NativeTrayIcon {
public:
    using MenuCompiler =
        std::function<std::shared_ptr<const CompiledMenu>(NativeTraySurface&)>;

    static std::unique_ptr<NativeTrayIcon> create(PlatformBackend& backend,
                                                  const TraySettings& settings,
                                                  const MenuCompiler& compile,
                                                  std::unique_ptr<ErasedCallback> callback);
    ~NativeTrayIcon();

    NativeTrayIcon(const NativeTrayIcon&) = delete;
    NativeTrayIcon& operator=(const NativeTrayIcon&) = delete;

    std::uint32_t trayId() const;
    bool surfaceAlive() const;

    void setTooltip(std::optional<std::string> tooltip);
    std::optional<std::string> tooltip() const;

    // An empty compiler removes the menu.
    void replaceMenu(const MenuCompiler& compile);
    std::shared_ptr<const CompiledMenu> menu() const;

private:
    NativeTrayIcon(NativeTraySurface* surface, std::shared_ptr<SharedTrayState> state);

    class Private;
    std::unique_ptr<Private> d;
};

}
