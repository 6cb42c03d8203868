// src/gui/QtTraySurface.cpp
#include "QtTraySurface.hpp"
#include "QtNativeMenu.hpp"
#include "TrayEventHook.hpp"
#include "Logger.hpp"
#include <tray-icon/Constants.hpp>
#include <QApplication>
#include <QCursor>
#include <QIcon>
#include <QMenu>
#include <QStyle>

namespace tray_icon {

class QtTraySurface::Private {
public:
    QSystemTrayIcon* trayIcon{nullptr};
    bool destroyRequested{false};

    QIcon loadIcon(const std::string& iconPath) const {
        if (!iconPath.empty()) {
            QIcon icon(QString::fromStdString(iconPath));
            if (!icon.isNull()) {
                return icon;
            }
            TRAY_LOG_WARNING("Failed to load tray icon from " + iconPath +
                             ", using the default icon");
        }
        return QApplication::style()->standardIcon(QStyle::SP_ComputerIcon);
    }
};

QtTraySurface::QtTraySurface(std::uint32_t trayId, QObject* parent)
    : QObject(parent)
    , NativeTraySurface(trayId)
    , d(std::make_unique<Private>()) {

    d->trayIcon = new QSystemTrayIcon(this);
}

QtTraySurface::~QtTraySurface() {
    disconnect(d->trayIcon, nullptr, this, nullptr);
    d->trayIcon->hide();

    deliver(NativeMessage::resourceDestroyed());
}

std::unique_ptr<NativeMenu> QtTraySurface::createMenu() {
    return std::make_unique<QtNativeMenu>(this);
}

int QtTraySurface::addIcon(const std::string& iconPath,
                           const std::optional<std::string>& tooltip) {
    if (d->destroyRequested) {
        return ErrorCodes::RESOURCE_DESTROYED;
    }

    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        TRAY_LOG_WARNING("No system tray available yet, the icon will appear once one is");
    }

    d->trayIcon->setIcon(d->loadIcon(iconPath));
    d->trayIcon->setToolTip(tooltip ? QString::fromStdString(*tooltip) : QString());
    d->trayIcon->show();
    return ErrorCodes::SUCCESS;
}

int QtTraySurface::setToolTip(const std::optional<std::string>& tooltip) {
    if (d->destroyRequested) {
        return ErrorCodes::RESOURCE_DESTROYED;
    }

    d->trayIcon->setToolTip(tooltip ? QString::fromStdString(*tooltip) : QString());
    return ErrorCodes::SUCCESS;
}

int QtTraySurface::showMenu(NativeMenu& menu) {
    if (d->destroyRequested) {
        return ErrorCodes::RESOURCE_DESTROYED;
    }

    auto qtMenu = dynamic_cast<QtNativeMenu*>(&menu);
    if (!qtMenu || !qtMenu->menu()) {
        return ErrorCodes::INVALID_PARAM;
    }

    qtMenu->menu()->popup(QCursor::pos());
    return ErrorCodes::SUCCESS;
}

int QtTraySurface::removeIcon() {
    d->trayIcon->hide();
    return ErrorCodes::SUCCESS;
}

int QtTraySurface::destroy() {
    if (d->destroyRequested) {
        return ErrorCodes::RESOURCE_DESTROYED;
    }

    d->destroyRequested = true;
    deleteLater();
    return ErrorCodes::SUCCESS;
}

int QtTraySurface::installHook(std::unique_ptr<TrayEventHook> hook) {
    if (!hook) {
        return ErrorCodes::INVALID_PARAM;
    }
    if (hook_) {
        return ErrorCodes::ALREADY_REGISTERED;
    }

    hook_ = std::move(hook);
    connect(d->trayIcon, &QSystemTrayIcon::activated,
            this, &QtTraySurface::handleActivated);
    return ErrorCodes::SUCCESS;
}

QSystemTrayIcon* QtTraySurface::trayIcon() const {
    return d->trayIcon;
}

std::uint32_t QtTraySurface::rawClickCode(QSystemTrayIcon::ActivationReason reason) {
    switch (reason) {
        case QSystemTrayIcon::Trigger:     return RAW_LEFT_BUTTON_UP;
        case QSystemTrayIcon::Context:     return RAW_RIGHT_BUTTON_UP;
        case QSystemTrayIcon::DoubleClick: return RAW_LEFT_BUTTON_DOUBLE_CLICK;
        default:                           return RAW_UNKNOWN_CLICK;
    }
}

void QtTraySurface::handleActivated(QSystemTrayIcon::ActivationReason reason) {
    deliver(NativeMessage::trayNotification(rawClickCode(reason)));
}

} // namespace tray_icon
