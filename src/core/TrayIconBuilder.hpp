#pragma once
#include "ErasedCallback.hpp"
#include "Menu.hpp"
#include "MenuCompiler.hpp"
#include "NativeTrayIcon.hpp"
#include "PlatformBackend.hpp"
#include "TrayIcon.hpp"
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace tray_icon {

/*
 * Collects the configuration of a tray icon. Every with* call returns an
 * updated copy, so partially configured builders can be reused freely.
 */
template <typename Signal>
class TrayIconBuilder {
public:
    static_assert(std::is_copy_constructible_v<Signal>,
                  "Menu signals are copied when delivered and must be copy-constructible");

    TrayIconBuilder() = default;

    TrayIconBuilder withMenu(Menu<Signal> menu) const {
        TrayIconBuilder copy(*this);
        copy.menu_ = std::move(menu);
        return copy;
    }

    TrayIconBuilder withTooltip(std::string tooltip) const {
        TrayIconBuilder copy(*this);
        copy.tooltip_ = std::move(tooltip);
        return copy;
    }

    TrayIconBuilder withIcon(std::string iconPath) const {
        TrayIconBuilder copy(*this);
        copy.iconPath_ = std::move(iconPath);
        return copy;
    }

    const std::optional<Menu<Signal>>& menu() const { return menu_; }
    const std::optional<std::string>& tooltip() const { return tooltip_; }
    const std::string& iconPath() const { return iconPath_; }

    // Callback is invoked as callback(TrayEvent<Signal>) on the UI thread.
    // Throws TrayError when the icon cannot be created.
    template <typename Callback>
    TrayIcon<Signal> build(Callback callback, PlatformBackend& backend) const {
        using Wrapper = TypedCallback<Signal, std::decay_t<Callback>>;

        TraySettings settings{tooltip_, iconPath_};

        NativeTrayIcon::MenuCompiler compile;
        if (menu_) {
            const Menu<Signal>& menu = *menu_;
            compile = [&menu](NativeTraySurface& surface) {
                return compileMenu(menu, surface);
            };
        }

        auto native = NativeTrayIcon::create(backend, settings, compile,
                                             std::make_unique<Wrapper>(std::move(callback)));
        return TrayIcon<Signal>(std::move(native));
    }

    template <typename Callback>
    TrayIcon<Signal> build(Callback callback) const {
        return build(std::move(callback), platformBackend());
    }

    bool operator==(const TrayIconBuilder& other) const {
        return menu_ == other.menu_ && tooltip_ == other.tooltip_ &&
               iconPath_ == other.iconPath_;
    }

private:
    std::optional<Menu<Signal>> menu_;
    std::optional<std::string> tooltip_;
    std::string iconPath_;
};

}
