// src/gui/QtNativeMenu.hpp
#pragma once
#include "NativeTraySurface.hpp"
#include "QtTraySurface.hpp"
#include <QMenu>
#include <QPointer>
#include <memory>
#include <vector>

namespace tray_icon {

class QtNativeMenu : public NativeMenu {
public:
    explicit QtNativeMenu(QtTraySurface* surface);
    ~QtNativeMenu() override;

    void addButton(std::uint32_t id, const std::string& name, bool checked) override;
    void addSeparator() override;
    void addSubmenu(const std::string& name, std::unique_ptr<NativeMenu> submenu) override;

    QMenu* menu() const;

private:
    QPointer<QtTraySurface> surface_;
    QPointer<QMenu> menu_;
    std::vector<std::unique_ptr<NativeMenu>> submenus_;
};

} // namespace tray_icon
