// tests/test_TrayIconBuilder.cpp
#include <gtest/gtest.h>
#include "FakePlatform.hpp"
#include "TrayError.hpp"
#include "TrayIconBuilder.hpp"
#include <string>

namespace tray_icon {
namespace testing {

using Item = MenuItem<int>;
using Event = TrayEvent<int>;

class TrayIconBuildTest : public ::testing::Test {
protected:
    TrayIconBuilder<int> builder() const {
        return TrayIconBuilder<int>()
            .withTooltip("tip")
            .withIcon("icon.png")
            .withMenu(Menu<int>{
                Item::button("A", 1),
                Item::separator(),
                Item::menu("B", {Item::button("C", 2)})
            });
    }

    template <typename Fn>
    ErrorKind buildFailure(Fn&& configure) {
        backend.onCreate = configure;
        try {
            builder().build(recorder.callback(), backend);
        } catch (const TrayError& e) {
            lastError = e.nativeCode();
            return e.kind();
        }
        ADD_FAILURE() << "build should throw";
        return ErrorKind::NativeApiError;
    }

    FakeBackend backend;
    EventRecorder<int> recorder;
    int lastError{0};
};

TEST_F(TrayIconBuildTest, BuildRegistersIconTest) {
    auto icon = builder().build(recorder.callback(), backend);

    ASSERT_EQ(backend.surfaces.size(), 1u);
    auto& surface = backend.last();
    EXPECT_EQ(icon.trayId(), surface.trayId());
    EXPECT_TRUE(surface.iconAdded);
    EXPECT_EQ(surface.iconPath, "icon.png");
    EXPECT_EQ(surface.tooltip, std::optional<std::string>("tip"));
    EXPECT_TRUE(surface.hasHook());
    EXPECT_EQ(icon.tooltip(), std::optional<std::string>("tip"));

    ASSERT_TRUE(icon.compiledMenu());
    EXPECT_EQ(icon.compiledMenu()->ids(), (std::vector<std::uint32_t>{1, 2}));
}

TEST_F(TrayIconBuildTest, SelectingButtonsInvokesCallbackTest) {
    auto icon = builder().build(recorder.callback(), backend);

    backend.last().select(1);
    backend.last().select(2);
    backend.last().click(RAW_LEFT_BUTTON_UP);

    ASSERT_EQ(recorder.events->size(), 3u);
    EXPECT_EQ((*recorder.events)[0], Event::menu(1));
    EXPECT_EQ((*recorder.events)[1], Event::menu(2));
    EXPECT_EQ((*recorder.events)[2], Event::tray(ClickType::Left));
}

TEST_F(TrayIconBuildTest, BuildWithoutMenuTest) {
    auto icon = TrayIconBuilder<int>().build(recorder.callback(), backend);

    EXPECT_FALSE(icon.compiledMenu());
    EXPECT_FALSE(icon.tooltip().has_value());
    EXPECT_EQ(backend.last().menusCreated, 0);

    backend.last().click(RAW_RIGHT_BUTTON_UP);
    EXPECT_EQ(recorder.events->size(), 1u);
    EXPECT_TRUE(backend.last().popups.empty());
}

TEST_F(TrayIconBuildTest, TrayIdsAreUniqueTest) {
    auto first = builder().build(recorder.callback(), backend);
    auto second = builder().build(recorder.callback(), backend);

    EXPECT_NE(first.trayId(), second.trayId());
    EXPECT_GE(first.trayId(), FIRST_TRAY_ID);
    EXPECT_EQ(nextTrayId(), second.trayId() + 1);
}

TEST_F(TrayIconBuildTest, SurfaceAllocationFailureTest) {
    backend.failCreateSurface = true;

    try {
        builder().build(recorder.callback(), backend);
        FAIL() << "build should throw";
    } catch (const TrayError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ResourceAllocationFailed);
    }
    EXPECT_TRUE(backend.surfaces.empty());
    EXPECT_FALSE(recorder.callbackAlive());
}

TEST_F(TrayIconBuildTest, IconFailureLeavesNothingRegisteredTest) {
    auto kind = buildFailure([](FakeSurface& surface) {
        surface.addIconResult = ErrorCodes::SYSTEM_ERROR;
    });

    EXPECT_EQ(kind, ErrorKind::NativeApiError);
    EXPECT_EQ(lastError, ErrorCodes::SYSTEM_ERROR);
    auto& surface = backend.last();
    EXPECT_FALSE(surface.iconAdded);
    EXPECT_TRUE(surface.destroyRequested);
    EXPECT_FALSE(surface.hasHook());
    EXPECT_FALSE(recorder.callbackAlive());
}

TEST_F(TrayIconBuildTest, HookFailureLeavesNothingRegisteredTest) {
    auto kind = buildFailure([](FakeSurface& surface) {
        surface.installHookResult = ErrorCodes::ALREADY_REGISTERED;
    });

    EXPECT_EQ(kind, ErrorKind::HookRegistrationFailed);
    auto& surface = backend.last();
    EXPECT_FALSE(surface.iconAdded);
    EXPECT_EQ(surface.removeIconCalls, 1);
    EXPECT_TRUE(surface.destroyRequested);
    EXPECT_FALSE(surface.hasHook());
    EXPECT_FALSE(recorder.callbackAlive());
}

TEST_F(TrayIconBuildTest, MenuFailureLeavesNothingRegisteredTest) {
    auto kind = buildFailure([](FakeSurface& surface) {
        surface.failCreateMenu = true;
    });

    EXPECT_EQ(kind, ErrorKind::ResourceAllocationFailed);
    auto& surface = backend.last();
    EXPECT_FALSE(surface.iconAdded);
    EXPECT_EQ(surface.removeIconCalls, 0);
    EXPECT_TRUE(surface.destroyRequested);
}

TEST_F(TrayIconBuildTest, BuilderIsReusableTest) {
    auto shared = builder();
    auto first = shared.build(recorder.callback(), backend);
    auto second = shared.withTooltip("other").build(recorder.callback(), backend);

    EXPECT_EQ(first.tooltip(), std::optional<std::string>("tip"));
    EXPECT_EQ(second.tooltip(), std::optional<std::string>("other"));
    EXPECT_EQ(shared.tooltip(), std::optional<std::string>("tip"));
}

} // namespace testing
} // namespace tray_icon
