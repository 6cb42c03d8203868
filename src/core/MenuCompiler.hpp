#pragma once
#include "CompiledMenu.hpp"
#include "Menu.hpp"
#include "NativeTraySurface.hpp"
#include "TrayError.hpp"
#include "Overloaded.hpp"
#include <tray-icon/Constants.hpp>
#include <any>
#include <memory>
#include <variant>

namespace tray_icon {

namespace detail {

template <typename Signal>
void compileItems(const std::vector<MenuItem<Signal>>& items,
                  NativeTraySurface& surface,
                  NativeMenu& target,
                  CompiledMenu::SignalTable& table,
                  std::uint32_t& nextId) {
    for (const auto& item : items) {
        std::visit(overloaded{
            [&](const MenuSeparator&) {
                target.addSeparator();
            },
            [&](const MenuButton<Signal>& button) {
                std::uint32_t id = nextId++;
                table.emplace(id, std::any(button.signal));
                target.addButton(id, button.name, button.checked);
            },
            [&](const Submenu<Signal>& submenu) {
                auto child = surface.createMenu();
                if (!child) {
                    throw TrayError::resourceAllocationFailed(
                        "Failed to create native submenu '" + submenu.name + "'");
                }
                compileItems(submenu.children, surface, *child, table, nextId);
                target.addSubmenu(submenu.name, std::move(child));
            }
        }, item.value());
    }
}

}

/*
 * Builds the native form of a menu tree.
 *
 * Buttons get sequential ids in pre-order starting at FIRST_MENU_ITEM_ID;
 * separators and submenu entries get none. Every button is wired by the
 * surface to deliver MenuCommand(id) to the hook installed on it.
 */
template <typename Signal>
std::shared_ptr<const CompiledMenu> compileMenu(const Menu<Signal>& menu,
                                                NativeTraySurface& surface) {
    auto root = surface.createMenu();
    if (!root) {
        throw TrayError::resourceAllocationFailed("Failed to create native menu");
    }

    CompiledMenu::SignalTable table;
    std::uint32_t nextId = FIRST_MENU_ITEM_ID;
    detail::compileItems(menu.items(), surface, *root, table, nextId);

    return std::make_shared<const CompiledMenu>(std::move(root), std::move(table));
}

}
