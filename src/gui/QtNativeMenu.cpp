// src/gui/QtNativeMenu.cpp
#include "QtNativeMenu.hpp"
#include "QtTraySurface.hpp"
#include "TrayError.hpp"
#include <QMenu>
#include <QAction>

namespace tray_icon {

QtNativeMenu::QtNativeMenu(QtTraySurface* surface)
    : surface_(surface)
    , menu_(new QMenu()) {
}

QtNativeMenu::~QtNativeMenu() {
    // The menu may be on screen or inside one of its own action handlers.
    if (menu_) {
        menu_->deleteLater();
    }
}

void QtNativeMenu::addButton(std::uint32_t id, const std::string& name, bool checked) {
    auto action = menu_->addAction(QString::fromStdString(name));
    action->setCheckable(checked);
    action->setChecked(checked);

    QPointer<QtTraySurface> surface = surface_;
    QObject::connect(action, &QAction::triggered, action, [surface, action, id, checked]() {
        // Check state follows the model, not the click
        if (action->isCheckable()) {
            action->setChecked(checked);
        }
        if (surface) {
            surface->deliver(NativeMessage::menuCommand(id));
        }
    });
}

void QtNativeMenu::addSeparator() {
    menu_->addSeparator();
}

void QtNativeMenu::addSubmenu(const std::string& name, std::unique_ptr<NativeMenu> submenu) {
    auto child = dynamic_cast<QtNativeMenu*>(submenu.get());
    if (!child || !child->menu()) {
        throw TrayError::resourceAllocationFailed(
            "Submenu '" + name + "' was not created by the Qt backend");
    }

    child->menu()->setTitle(QString::fromStdString(name));
    menu_->addMenu(child->menu());
    submenus_.push_back(std::move(submenu));
}

QMenu* QtNativeMenu::menu() const {
    return menu_;
}

} // namespace tray_icon
