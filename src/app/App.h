#pragma once

#include "app/Cursor.h"
#include "app/ErrorSink.h"
#include "hw/Buttons.h"
#include "hw/DisplayDevice.h"
#include "services/WeatherCache.h"
#include "views/View.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class RenderSurface;
class Ticker;
class WeatherProvider;

struct AppOptions {
    CachePolicy cache;
    // Tick period for views that do not ask for their own.
    std::chrono::milliseconds refresh_period{ 60000 };
    // Tick period of the live clock on the errors view.
    std::chrono::milliseconds clock_period{ 1000 };
    float backlight = 0.5f;
    // Seconds since epoch; TimeUtil::NowTs when unset.
    std::function<int64_t()> clock;
};

// Owns the view state machine. Device and ticker callbacks may arrive on any
// thread; they only enqueue work, and everything else runs on the thread that
// calls ProcessPending().
class App {
public:
    App(const AppOptions& options, DisplayDevice* device, RenderSurface* surface, WeatherProvider* provider);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    void AttachTicker(Ticker* ticker);

    // Makes `kind` the active view, rebinds button and tick dispatch to it and
    // renders it before returning.
    void SwitchTo(ViewKind kind);
    void Rerender();

    void OnPhysicalButton(int pin);
    void RequestTick();
    void ProcessPending();

    // Refreshes both weather series, recording any failure in the error sink.
    void RefreshWeather();
    // Slot 0 is the current snapshot (nullptr if never fetched), then the forecast.
    std::vector<const WeatherSnapshot*> Timeline() const;
    bool LoadIcon(const std::string& code, Image* out);

    int CursorIndex() const { return cursor_.Value(); }
    // Moves the cursor by delta, clamped to [0, len(forecast)].
    void StepCursor(int delta);

    // Drops the error alert and turns the LED off.
    void ClearAlert();
    int64_t Now() const;

    const AppOptions& Options() const { return options_; }
    WeatherCache& Cache() { return cache_; }
    ErrorSink& Errors() { return errors_; }
    RenderSurface& Surface() { return *surface_; }
    DisplayDevice& Device() { return *device_; }

    ViewKind ActiveKind() const;
    std::chrono::milliseconds ActiveTickPeriod() const { return dispatch_.tick_period; }

private:
    struct Dispatch {
        std::array<std::function<void()>, kButtonCount> buttons;
        std::function<void()> tick;
        std::chrono::milliseconds tick_period{ 0 };
    };

    struct Event {
        enum class Type { Button, Tick };
        Type type = Type::Tick;
        int pin = -1;
    };

    View* ViewFor(ViewKind kind) const;
    void Bind(View* view);
    void RenderActive();
    void HandleButton(int pin);
    void HandleTick();
    void OnBusy(bool busy);

    AppOptions options_;
    DisplayDevice* device_;
    RenderSurface* surface_;
    Ticker* ticker_ = nullptr;

    WeatherCache cache_;
    ErrorSink errors_;
    Cursor cursor_;
    bool alert_ = false;

    std::unique_ptr<View> page_view_;
    std::unique_ptr<View> grid_view_;
    std::unique_ptr<View> errors_view_;
    View* active_ = nullptr;
    Dispatch dispatch_;

    std::mutex queue_mutex_;
    std::deque<Event> queue_;
    bool tick_pending_ = false;
};
