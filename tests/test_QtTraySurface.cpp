// tests/test_QtTraySurface.cpp
#include <gtest/gtest.h>
#include "FakePlatform.hpp"
#include "ErasedCallback.hpp"
#include "MenuCompiler.hpp"
#include "QtNativeMenu.hpp"
#include "QtTrayBackend.hpp"
#include "QtTraySurface.hpp"
#include "SharedTrayState.hpp"
#include "TrayError.hpp"
#include "TrayIconBuilder.hpp"
#include <QAction>
#include <QApplication>
#include <QMenu>
#include <QPointer>
#include <memory>
#include <optional>

namespace tray_icon {
namespace testing {

using Item = MenuItem<int>;
using Event = TrayEvent<int>;

TEST(QtTrayBackendTest, RequiresApplicationTest) {
    ASSERT_EQ(QCoreApplication::instance(), nullptr);

    QtTrayBackend backend;
    EXPECT_EQ(backend.createSurface(1), nullptr);
}

class QtTraySurfaceTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        qputenv("QT_QPA_PLATFORM", "offscreen");
        app = new QApplication(argc, argv);
    }

    static void TearDownTestSuite() {
        delete app;
        app = nullptr;
    }

    void SetUp() override {
        surface = static_cast<QtTraySurface*>(backend.createSurface(nextTrayId()));
        ASSERT_NE(surface, nullptr);

        compiled = compileMenu(Menu<int>{
            Item::button("A", 1),
            Item::separator(),
            Item::menu("B", {Item::button("C", 2, true)})
        }, *surface);

        auto state = std::make_shared<SharedTrayState>(compiled, std::nullopt);
        auto callback = recorder.callback();
        auto hook = std::make_unique<TrayEventHook>(
            surface->trayId(), state,
            std::make_unique<TypedCallback<int, decltype(callback)>>(callback));
        ASSERT_EQ(surface->installHook(std::move(hook)), ErrorCodes::SUCCESS);
    }

    void TearDown() override {
        compiled.reset();
        if (surface) {
            surface->destroy();
        }
        QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
    }

    QMenu* rootMenu() const {
        return static_cast<QtNativeMenu&>(compiled->nativeMenu()).menu();
    }

    static int argc;
    static char* argv[];
    static QApplication* app;

    QtTrayBackend backend;
    QPointer<QtTraySurface> surface;
    std::shared_ptr<const CompiledMenu> compiled;
    EventRecorder<int> recorder;
};

int QtTraySurfaceTest::argc = 1;
char* QtTraySurfaceTest::argv[] = {(char*)"test", nullptr};
QApplication* QtTraySurfaceTest::app = nullptr;

TEST_F(QtTraySurfaceTest, ActivationReasonMappingTest) {
    EXPECT_EQ(QtTraySurface::rawClickCode(QSystemTrayIcon::Trigger), RAW_LEFT_BUTTON_UP);
    EXPECT_EQ(QtTraySurface::rawClickCode(QSystemTrayIcon::Context), RAW_RIGHT_BUTTON_UP);
    EXPECT_EQ(QtTraySurface::rawClickCode(QSystemTrayIcon::DoubleClick),
              RAW_LEFT_BUTTON_DOUBLE_CLICK);
    EXPECT_EQ(QtTraySurface::rawClickCode(QSystemTrayIcon::MiddleClick), RAW_UNKNOWN_CLICK);
}

TEST_F(QtTraySurfaceTest, CompiledMenuStructureTest) {
    auto actions = rootMenu()->actions();
    ASSERT_EQ(actions.size(), 3);
    EXPECT_EQ(actions[0]->text(), "A");
    EXPECT_FALSE(actions[0]->isCheckable());
    EXPECT_TRUE(actions[1]->isSeparator());

    QMenu* submenu = actions[2]->menu();
    ASSERT_NE(submenu, nullptr);
    EXPECT_EQ(submenu->title(), "B");
    ASSERT_EQ(submenu->actions().size(), 1);
    EXPECT_EQ(submenu->actions()[0]->text(), "C");
    EXPECT_TRUE(submenu->actions()[0]->isChecked());
}

TEST_F(QtTraySurfaceTest, TriggeredActionDeliversSignalTest) {
    rootMenu()->actions()[0]->trigger();
    rootMenu()->actions()[2]->menu()->actions()[0]->trigger();

    ASSERT_EQ(recorder.events->size(), 2u);
    EXPECT_EQ((*recorder.events)[0], Event::menu(1));
    EXPECT_EQ((*recorder.events)[1], Event::menu(2));

    // The model decides the check state
    EXPECT_TRUE(rootMenu()->actions()[2]->menu()->actions()[0]->isChecked());
}

TEST_F(QtTraySurfaceTest, ActivationDeliversClickTest) {
    emit surface->trayIcon()->activated(QSystemTrayIcon::Trigger);
    emit surface->trayIcon()->activated(QSystemTrayIcon::MiddleClick);

    ASSERT_EQ(recorder.events->size(), 1u);
    EXPECT_EQ((*recorder.events)[0], Event::tray(ClickType::Left));
}

TEST_F(QtTraySurfaceTest, ContextActivationShowsMenuTest) {
    ASSERT_FALSE(rootMenu()->isVisible());

    emit surface->trayIcon()->activated(QSystemTrayIcon::Context);

    ASSERT_EQ(recorder.events->size(), 1u);
    EXPECT_EQ((*recorder.events)[0], Event::tray(ClickType::Right));
    EXPECT_TRUE(rootMenu()->isVisible());

    rootMenu()->hide();
}

TEST_F(QtTraySurfaceTest, NoMenuAfterDestroyRequestTest) {
    ASSERT_EQ(surface->destroy(), ErrorCodes::SUCCESS);
    EXPECT_EQ(surface->showMenu(compiled->nativeMenu()), ErrorCodes::RESOURCE_DESTROYED);

    // The click is still reported, the menu stays hidden
    emit surface->trayIcon()->activated(QSystemTrayIcon::Context);

    ASSERT_EQ(recorder.events->size(), 1u);
    EXPECT_EQ((*recorder.events)[0], Event::tray(ClickType::Right));
    EXPECT_FALSE(rootMenu()->isVisible());
}

TEST_F(QtTraySurfaceTest, ForeignSubmenuRejectedTest) {
    QtNativeMenu menu(surface);

    EXPECT_THROW(menu.addSubmenu("Foreign", std::make_unique<FakeNativeMenu>()), TrayError);
    EXPECT_TRUE(menu.menu()->actions().isEmpty());
}

TEST_F(QtTraySurfaceTest, TooltipTest) {
    EXPECT_EQ(surface->setToolTip(std::string("hello")), ErrorCodes::SUCCESS);
    EXPECT_EQ(surface->trayIcon()->toolTip(), "hello");

    EXPECT_EQ(surface->setToolTip(std::nullopt), ErrorCodes::SUCCESS);
    EXPECT_TRUE(surface->trayIcon()->toolTip().isEmpty());
}

TEST_F(QtTraySurfaceTest, DestroyFinalizesLaterTest) {
    ASSERT_EQ(surface->destroy(), ErrorCodes::SUCCESS);

    // Still alive and dispatching until the event loop deletes it
    ASSERT_FALSE(surface.isNull());
    EXPECT_TRUE(surface->hasHook());
    EXPECT_EQ(surface->setToolTip(std::string("late")), ErrorCodes::RESOURCE_DESTROYED);
    rootMenu()->actions()[0]->trigger();
    EXPECT_EQ(recorder.events->size(), 1u);
    EXPECT_TRUE(recorder.callbackAlive());

    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);

    EXPECT_TRUE(surface.isNull());
    EXPECT_FALSE(recorder.callbackAlive());

    // Actions outlive the surface but no longer reach the callback
    rootMenu()->actions()[0]->trigger();
    EXPECT_EQ(recorder.events->size(), 1u);
}

TEST(QtTrayLifetimeTest, ApplicationDeletedBeforeHandleTest) {
    ASSERT_EQ(QCoreApplication::instance(), nullptr);

    qputenv("QT_QPA_PLATFORM", "offscreen");
    int argc = 1;
    char* argv[] = {(char*)"test", nullptr};
    auto app = std::make_unique<QApplication>(argc, argv);

    EventRecorder<int> recorder;
    QtTrayBackend backend;
    std::optional<TrayIcon<int>> icon = TrayIconBuilder<int>()
        .withTooltip("tray")
        .withMenu(Menu<int>{Item::button("A", 1)})
        .build(recorder.callback(), backend);
    ASSERT_TRUE(recorder.callbackAlive());

    // Deleting the application deletes the surface it parents
    app.reset();
    EXPECT_FALSE(recorder.callbackAlive());

    try {
        icon->setTooltip(std::string("late"));
        FAIL() << "setTooltip should throw";
    } catch (const TrayError& e) {
        EXPECT_EQ(e.nativeCode(), ErrorCodes::RESOURCE_DESTROYED);
    }
    EXPECT_EQ(icon->tooltip(), std::optional<std::string>("tray"));

    EXPECT_NO_THROW(icon.reset());
}

} // namespace testing
} // namespace tray_icon
