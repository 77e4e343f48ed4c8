#include "app/App.h"

#include "app/Ticker.h"
#include "hw/Buttons.h"

#include "Fakes.h"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

constexpr int64_t kNow = 1700000000;

class AppTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_.current = MakeSnapshot(kNow, 12.0);
        provider_.forecast = MakeForecast(kNow, 10);
        options_.refresh_period = std::chrono::seconds(60);
        options_.clock_period = std::chrono::seconds(1);
        options_.backlight = 0.5f;
        options_.clock = [this]() { return now_; };
    }

    std::unique_ptr<App> MakeApp() {
        return std::make_unique<App>(options_, &device_, &surface_, &provider_);
    }

    void Press(App& app, int pin) {
        device_.Press(pin);
        app.ProcessPending();
    }

    void Tick(App& app) {
        app.RequestTick();
        app.ProcessPending();
    }

    int64_t now_ = kNow;
    AppOptions options_;
    FakeProvider provider_;
    FakeSurface surface_;
    FakeDevice device_;
};

} // namespace

TEST_F(AppTest, SwitchRendersDestinationOnce) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);

    EXPECT_EQ(app->ActiveKind(), ViewKind::Page);
    EXPECT_EQ(surface_.clear_count, 1);
    EXPECT_EQ(surface_.flush_count, 1);
    EXPECT_TRUE(surface_.HasText("Current"));
    EXPECT_FLOAT_EQ(device_.backlight, 0.5f);
}

TEST_F(AppTest, NextClampsAtForecastLength) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);

    for (int i = 0; i < 11; ++i) {
        Press(*app, PinForButton(Button::Y));
    }
    EXPECT_EQ(app->CursorIndex(), 10);
    EXPECT_TRUE(surface_.HasText("Forecast"));
    EXPECT_EQ(surface_.flush_count, 12);

    Press(*app, PinForButton(Button::X));
    EXPECT_EQ(app->CursorIndex(), 9);
}

TEST_F(AppTest, PrevNeverGoesNegative) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);
    Press(*app, PinForButton(Button::X));
    Press(*app, PinForButton(Button::X));
    EXPECT_EQ(app->CursorIndex(), 0);
}

TEST_F(AppTest, ButtonsFollowActiveView) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);

    Press(*app, PinForButton(Button::Y));
    EXPECT_EQ(app->CursorIndex(), 1);
    EXPECT_GT(app->Cache().IconCount(), 0u);

    int flushes = surface_.flush_count;
    Press(*app, PinForButton(Button::B));
    EXPECT_EQ(app->ActiveKind(), ViewKind::Errors);
    EXPECT_EQ(surface_.flush_count, flushes + 1);

    // Y on the errors view clears lookup tables instead of moving the cursor.
    Press(*app, PinForButton(Button::Y));
    EXPECT_EQ(app->CursorIndex(), 1);
    EXPECT_EQ(app->Cache().IconCount(), 0u);

    // X is unhandled on the errors view.
    flushes = surface_.flush_count;
    Press(*app, PinForButton(Button::X));
    EXPECT_EQ(surface_.flush_count, flushes);
    EXPECT_EQ(app->ActiveKind(), ViewKind::Errors);

    Press(*app, PinForButton(Button::A));
    EXPECT_EQ(app->ActiveKind(), ViewKind::Page);
    EXPECT_EQ(app->CursorIndex(), 1);
}

TEST_F(AppTest, TickFollowsActiveView) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);
    EXPECT_EQ(app->ActiveTickPeriod(), std::chrono::milliseconds(60000));

    int clears = surface_.clear_count;
    Tick(*app);
    EXPECT_EQ(surface_.clear_count, clears + 1);

    app->SwitchTo(ViewKind::Errors);
    EXPECT_EQ(app->ActiveTickPeriod(), std::chrono::milliseconds(1000));

    clears = surface_.clear_count;
    int fills = surface_.fill_count;
    int flushes = surface_.flush_count;
    Tick(*app);
    EXPECT_EQ(surface_.clear_count, clears);
    EXPECT_EQ(surface_.fill_count, fills + 1);
    EXPECT_EQ(surface_.flush_count, flushes + 1);
}

TEST_F(AppTest, SwitchReschedulesAttachedTicker) {
    auto app = MakeApp();
    Ticker ticker([]() {});
    app->AttachTicker(&ticker);

    app->SwitchTo(ViewKind::Errors);
    EXPECT_EQ(ticker.Period(), std::chrono::milliseconds(1000));
    app->SwitchTo(ViewKind::Grid);
    EXPECT_EQ(ticker.Period(), std::chrono::milliseconds(60000));
}

TEST_F(AppTest, PendingTicksCoalesce) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);

    int clears = surface_.clear_count;
    app->RequestTick();
    app->RequestTick();
    app->RequestTick();
    app->ProcessPending();
    EXPECT_EQ(surface_.clear_count, clears + 1);
}

TEST_F(AppTest, GridPagesByFour) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);
    Press(*app, PinForButton(Button::A));
    ASSERT_EQ(app->ActiveKind(), ViewKind::Grid);
    EXPECT_EQ(surface_.images.size(), 4u);

    Press(*app, PinForButton(Button::Y));
    EXPECT_EQ(app->CursorIndex(), 4);
    Press(*app, PinForButton(Button::Y));
    EXPECT_EQ(app->CursorIndex(), 8);
    EXPECT_EQ(surface_.images.size(), 3u);
    Press(*app, PinForButton(Button::Y));
    EXPECT_EQ(app->CursorIndex(), 10);
    Press(*app, PinForButton(Button::Y));
    EXPECT_EQ(app->CursorIndex(), 10);
    EXPECT_EQ(surface_.images.size(), 1u);

    Press(*app, PinForButton(Button::X));
    EXPECT_EQ(app->CursorIndex(), 6);

    Press(*app, PinForButton(Button::B));
    EXPECT_EQ(app->ActiveKind(), ViewKind::Errors);
}

TEST_F(AppTest, CurrentFailureWithoutCacheRecordsOnceAndRenders) {
    provider_.current_ok = false;
    auto app = MakeApp();

    EXPECT_NO_THROW(app->SwitchTo(ViewKind::Page));
    ASSERT_EQ(app->Errors().Size(), 1u);
    std::vector<ErrorRecord> errors = app->Errors().Peek();
    EXPECT_EQ(errors[0].message, "Current weather refresh failed");
    EXPECT_EQ(errors[0].cause, "current offline");
    EXPECT_EQ(surface_.flush_count, 1);
    EXPECT_TRUE(surface_.HasText("No data"));
}

TEST_F(AppTest, FailedRefreshShowsCachedValue) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);
    ASSERT_TRUE(app->Errors().Empty());

    now_ += 1000;
    provider_.current_ok = false;
    Tick(*app);

    EXPECT_EQ(app->Errors().Size(), 1u);
    EXPECT_TRUE(surface_.HasText("12.0"));
}

TEST_F(AppTest, ForecastRefetchResetsCursor) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);
    for (int i = 0; i < 5; ++i) {
        Press(*app, PinForButton(Button::Y));
    }
    ASSERT_EQ(app->CursorIndex(), 5);

    now_ = kNow + 4 * 3600;
    provider_.forecast = MakeForecast(now_, 10);
    Tick(*app);

    EXPECT_EQ(provider_.forecast_calls, 2);
    EXPECT_EQ(app->CursorIndex(), 0);
}

TEST_F(AppTest, RepeatedRenderReusesCache) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);
    Tick(*app);
    Tick(*app);
    EXPECT_EQ(provider_.current_calls, 1);
    EXPECT_EQ(provider_.forecast_calls, 1);
}

TEST_F(AppTest, ButtonNotHeldDownIsIgnored) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);

    device_.Glitch(PinForButton(Button::Y));
    app->ProcessPending();
    EXPECT_EQ(app->CursorIndex(), 0);
    EXPECT_EQ(surface_.flush_count, 1);
}

TEST_F(AppTest, UnmappedPinIsFatal) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);

    device_.Press(99);
    EXPECT_THROW(app->ProcessPending(), std::logic_error);
}

TEST_F(AppTest, SecondControllerCannotRegister) {
    auto app = MakeApp();
    EXPECT_THROW(MakeApp(), std::logic_error);
    EXPECT_EQ(device_.register_calls, 2);
}

TEST_F(AppTest, ErrorsViewDrainsAfterDisplay) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);
    app->Errors().Record("E1", "c1");
    app->Errors().Record("E2");

    Press(*app, PinForButton(Button::B));
    EXPECT_TRUE(surface_.HasText("Errors"));
    EXPECT_TRUE(surface_.HasText("E1: c1"));
    EXPECT_TRUE(surface_.HasText("E2"));
    EXPECT_TRUE(app->Errors().Empty());

    Press(*app, PinForButton(Button::A));
    Press(*app, PinForButton(Button::B));
    EXPECT_TRUE(surface_.HasText("No errors!"));
}

TEST_F(AppTest, ErrorsViewSummarizesOverflowAndStillDrains) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);
    for (int i = 0; i < 30; ++i) {
        app->Errors().Record("E" + std::to_string(i));
    }

    Press(*app, PinForButton(Button::B));
    EXPECT_TRUE(surface_.HasText("E0"));
    EXPECT_TRUE(surface_.HasText(" more"));
    EXPECT_FALSE(surface_.HasText("E29"));
    EXPECT_TRUE(app->Errors().Empty());
}

TEST_F(AppTest, ErrorsViewClearDropsDecodedImages) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);
    EXPECT_EQ(provider_.icon_calls, 1);

    Press(*app, PinForButton(Button::B));
    Press(*app, PinForButton(Button::Y));
    EXPECT_EQ(surface_.clear_images_count, 1);

    Press(*app, PinForButton(Button::A));
    EXPECT_EQ(provider_.icon_calls, 2);
    ASSERT_EQ(surface_.images.size(), 1u);
    EXPECT_EQ(surface_.images[0], "01d");
}

TEST_F(AppTest, ErrorsViewTickDoesNotDrain) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Errors);
    app->Errors().Record("late");
    Tick(*app);
    EXPECT_EQ(app->Errors().Size(), 1u);
}

TEST_F(AppTest, LedTracksBusyAndAlerts) {
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);
    EXPECT_TRUE(device_.SawLed(Led::kYellow));
    EXPECT_TRUE(device_.LastLedIs(Led::kOff));

    app->Errors().Record("boom");
    EXPECT_TRUE(device_.LastLedIs(Led::kRed));

    Press(*app, PinForButton(Button::B));
    EXPECT_TRUE(device_.LastLedIs(Led::kOff));
}

TEST_F(AppTest, FetchFailureLeavesAlertLit) {
    provider_.current_ok = false;
    auto app = MakeApp();
    app->SwitchTo(ViewKind::Page);
    EXPECT_TRUE(device_.SawLed(Led::kYellow));
    EXPECT_TRUE(device_.LastLedIs(Led::kRed));
}

TEST_F(AppTest, SurfaceFailureIsRecordedNotThrown) {
    surface_.fail_text = true;
    auto app = MakeApp();

    EXPECT_NO_THROW(app->SwitchTo(ViewKind::Page));
    ASSERT_EQ(app->Errors().Size(), 1u);
    EXPECT_NE(app->Errors().Peek()[0].message.find("Render failed"), std::string::npos);
    EXPECT_EQ(surface_.flush_count, 0);
    EXPECT_EQ(app->ActiveKind(), ViewKind::Page);
}
