// src/gui/QtTraySurface.hpp
#pragma once
#include "NativeTraySurface.hpp"
#include <QObject>
#include <QSystemTrayIcon>
#include <memory>

namespace tray_icon {

// Native surface backed by a QSystemTrayIcon. Destroys itself with
// deleteLater() and reports ResourceDestroyed from its destructor.
class QtTraySurface : public QObject, public NativeTraySurface {
    Q_OBJECT

public:
    explicit QtTraySurface(std::uint32_t trayId, QObject* parent = nullptr);
    ~QtTraySurface() override;

    std::unique_ptr<NativeMenu> createMenu() override;
    int addIcon(const std::string& iconPath,
                const std::optional<std::string>& tooltip) override;
    int setToolTip(const std::optional<std::string>& tooltip) override;
    int showMenu(NativeMenu& menu) override;
    int removeIcon() override;
    int destroy() override;
    int installHook(std::unique_ptr<TrayEventHook> hook) override;

    QSystemTrayIcon* trayIcon() const;

    static std::uint32_t rawClickCode(QSystemTrayIcon::ActivationReason reason);

private slots:
    void handleActivated(QSystemTrayIcon::ActivationReason reason);

private:
    class Private;
    std::unique_ptr<Private> d;
};

} // namespace tray_icon
