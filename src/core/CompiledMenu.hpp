#pragma once
#include <any>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

namespace tray_icon {

class NativeMenu;

// A native menu together with the table mapping each button id to the
// signal it was built from. Immutable once compiled: replacing a menu
// means compiling a new one.
class CompiledMenu {
public:
    using SignalTable = std::map<std::uint32_t, std::any>;

    CompiledMenu(std::unique_ptr<NativeMenu> nativeMenu, SignalTable table);
    ~CompiledMenu();

    CompiledMenu(const CompiledMenu&) = delete;
    CompiledMenu& operator=(const CompiledMenu&) = delete;

    NativeMenu& nativeMenu() const;

    // nullptr when the id is not part of this menu
    const std::any* find(std::uint32_t id) const;
    bool contains(std::uint32_t id) const;

    std::vector<std::uint32_t> ids() const;
    size_t size() const;

private:
    std::unique_ptr<NativeMenu> nativeMenu_;
    SignalTable table_;
};

}
