#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace tray_icon {

class TrayEventHook;

// A native menu under construction. Buttons are wired by the owning
// surface: activating one delivers a MenuCommand message carrying its id.
class NativeMenu {
public:
    virtual ~NativeMenu() = default;

    virtual void addButton(std::uint32_t id, const std::string& name, bool checked) = 0;
    virtual void addSeparator() = 0;
    virtual void addSubmenu(const std::string& name, std::unique_ptr<NativeMenu> submenu) = 0;
};

struct NativeMessage {
    enum class Type {
        TrayNotification,   // code: raw click code
        MenuCommand,        // code: menu item id
        ResourceDestroyed,
        Other
    };

    Type type{Type::Other};
    std::uint32_t code{0};

    static NativeMessage trayNotification(std::uint32_t rawClick) {
        return {Type::TrayNotification, rawClick};
    }
    static NativeMessage menuCommand(std::uint32_t id) {
        return {Type::MenuCommand, id};
    }
    static NativeMessage resourceDestroyed() {
        return {Type::ResourceDestroyed, 0};
    }
};

/*
 * The tray-visible native resource (status item, hidden message window).
 *
 * Calls return ErrorCodes::SUCCESS or a negative error code. A surface is
 * owned by the platform backend that created it and stays valid until it
 * has delivered ResourceDestroyed to its hook. destroy() only requests
 * finalization; it must never deliver ResourceDestroyed synchronously.
 */
class NativeTraySurface {
public:
    explicit NativeTraySurface(std::uint32_t trayId);
    virtual ~NativeTraySurface();

    NativeTraySurface(const NativeTraySurface&) = delete;
    NativeTraySurface& operator=(const NativeTraySurface&) = delete;

    std::uint32_t trayId() const { return trayId_; }

    virtual std::unique_ptr<NativeMenu> createMenu() = 0;
    virtual int addIcon(const std::string& iconPath,
                        const std::optional<std::string>& tooltip) = 0;
    virtual int setToolTip(const std::optional<std::string>& tooltip) = 0;
    virtual int showMenu(NativeMenu& menu) = 0;
    virtual int removeIcon() = 0;
    virtual int destroy() = 0;

    // Takes ownership of the hook on success.
    virtual int installHook(std::unique_ptr<TrayEventHook> hook) = 0;

    // Routes a message to the installed hook. The hook is released right
    // after it has seen ResourceDestroyed; later messages are dropped.
    void deliver(const NativeMessage& message);

    bool hasHook() const { return hook_ != nullptr; }

    // Expires once this object is deleted, whoever deletes it.
    std::weak_ptr<const void> lifetime() const { return lifetime_; }

protected:
    std::unique_ptr<TrayEventHook> hook_;

private:
    std::uint32_t trayId_;
    std::shared_ptr<const void> lifetime_;
};

}
