#pragma once
#include "Menu.hpp"
#include "MenuCompiler.hpp"
#include "NativeTrayIcon.hpp"
#include <memory>
#include <optional>
#include <string>

namespace tray_icon {

template <typename Signal>
class TrayIconBuilder;

// Handle to a live tray icon. Releasing it removes the icon.
template <typename Signal>
class TrayIcon {
public:
    TrayIcon(TrayIcon&&) noexcept = default;
    TrayIcon& operator=(TrayIcon&&) noexcept = default;

    std::uint32_t trayId() const { return native_->trayId(); }

    void setTooltip(std::optional<std::string> tooltip) {
        native_->setTooltip(std::move(tooltip));
    }

    std::optional<std::string> tooltip() const {
        return native_->tooltip();
    }

    // Recompiles the whole menu; ids of the previous menu become unknown.
    void setMenu(std::optional<Menu<Signal>> menu) {
        if (!menu) {
            native_->replaceMenu(NativeTrayIcon::MenuCompiler());
            return;
        }
        native_->replaceMenu([&menu](NativeTraySurface& surface) {
            return compileMenu(*menu, surface);
        });
    }

    std::shared_ptr<const CompiledMenu> compiledMenu() const {
        return native_->menu();
    }

private:
    friend class TrayIconBuilder<Signal>;

    explicit TrayIcon(std::unique_ptr<NativeTrayIcon> native)
        : native_(std::move(native)) {
    }

    std::unique_ptr<NativeTrayIcon> native_;
};

}
