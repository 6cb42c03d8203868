#pragma once
#include <any>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace tray_icon {

class CompiledMenu;

/*
 * Menu and tooltip of one tray icon, shared by the TrayIcon handle and the
 * event hook installed on its native surface.
 *
 * All access is serialized by an internal mutex, but the lock is only held
 * to read or swap values: callers get copies (signals) or shared snapshots
 * (menus) and never run user code or native calls under the lock.
 */
class SharedTrayState {
public:
    SharedTrayState(std::shared_ptr<const CompiledMenu> menu,
                    std::optional<std::string> tooltip);
    ~SharedTrayState();

    SharedTrayState(const SharedTrayState&) = delete;
    SharedTrayState& operator=(const SharedTrayState&) = delete;

    std::shared_ptr<const CompiledMenu> menu() const;
    void replaceMenu(std::shared_ptr<const CompiledMenu> menu);

    std::optional<std::string> tooltip() const;
    void setTooltip(std::optional<std::string> tooltip);

    // Copy of the signal stored for a menu id in the current menu
    std::optional<std::any> lookupSignal(std::uint32_t id) const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
