#include "app/App.h"

#include "app/Ticker.h"
#include "render/RenderSurface.h"
#include "util/TimeUtil.h"
#include "views/ErrorsView.h"
#include "views/GridView.h"
#include "views/PageView.h"

#include <iostream>
#include <stdexcept>
#include <utility>

App::App(const AppOptions& options, DisplayDevice* device, RenderSurface* surface, WeatherProvider* provider)
    : options_(options),
      device_(device),
      surface_(surface),
      cache_(provider, options.cache),
      page_view_(std::make_unique<PageView>()),
      grid_view_(std::make_unique<GridView>()),
      errors_view_(std::make_unique<ErrorsView>()) {
    if (!device_ || !surface_) {
        throw std::invalid_argument("App requires a display device and a render surface");
    }
    if (!options_.clock) {
        options_.clock = TimeUtil::NowTs;
    }

    cache_.SetBusyCallback([this](bool busy) { OnBusy(busy); });
    cache_.SetForecastReplacedCallback([this]() { cursor_.Reset(); });
    errors_.SetAlertCallback([this]() {
        alert_ = true;
        device_->SetLed(Led::kRed.r, Led::kRed.g, Led::kRed.b);
    });

    if (!device_->OnButtonPressed([this](int pin) { OnPhysicalButton(pin); })) {
        throw std::logic_error("display button callback already registered");
    }
}

App::~App() = default;

void App::AttachTicker(Ticker* ticker) {
    ticker_ = ticker;
    if (ticker_ && active_) {
        ticker_->Reschedule(dispatch_.tick_period);
    }
}

View* App::ViewFor(ViewKind kind) const {
    switch (kind) {
        case ViewKind::Page: return page_view_.get();
        case ViewKind::Grid: return grid_view_.get();
        case ViewKind::Errors: return errors_view_.get();
    }
    throw std::logic_error("unknown view kind " + std::to_string(static_cast<int>(kind)));
}

ViewKind App::ActiveKind() const {
    if (!active_) {
        throw std::logic_error("no active view");
    }
    return active_->Kind();
}

void App::SwitchTo(ViewKind kind) {
    View* view = ViewFor(kind);
    if (view != active_) {
        std::cerr << "App: view " << ViewKindName(kind) << " (fidx " << cursor_.Value() << ")\n";
    }
    active_ = view;
    Bind(view);
    RenderActive();
}

void App::Rerender() {
    if (active_) {
        RenderActive();
    }
}

void App::Bind(View* view) {
    Dispatch next;
    next.buttons[static_cast<size_t>(Button::A)] = [this, view]() { view->OnButtonA(*this); };
    next.buttons[static_cast<size_t>(Button::B)] = [this, view]() { view->OnButtonB(*this); };
    next.buttons[static_cast<size_t>(Button::X)] = [this, view]() { view->OnButtonX(*this); };
    next.buttons[static_cast<size_t>(Button::Y)] = [this, view]() { view->OnButtonY(*this); };
    if (view->HasTick()) {
        next.tick = [this, view]() { view->OnTick(*this); };
        next.tick_period = view->TickPeriod(options_);
    } else {
        next.tick = []() {};
        next.tick_period = options_.refresh_period;
    }
    dispatch_ = std::move(next);

    if (ticker_) {
        ticker_->Reschedule(dispatch_.tick_period);
    }
}

void App::RenderActive() {
    device_->SetBacklight(options_.backlight);
    try {
        active_->Render(*this);
    } catch (const SurfaceError& ex) {
        errors_.Record(std::string("Render failed: ") + ViewKindName(active_->Kind()), ex.what());
    }
}

void App::OnPhysicalButton(int pin) {
    if (!device_->ReadButton(pin)) {
        return;
    }
    std::lock_guard<std::mutex> lock(queue_mutex_);
    Event ev;
    ev.type = Event::Type::Button;
    ev.pin = pin;
    queue_.push_back(ev);
}

void App::RequestTick() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (tick_pending_) {
        return;
    }
    tick_pending_ = true;
    queue_.push_back(Event{});
}

void App::ProcessPending() {
    std::deque<Event> events;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        events.swap(queue_);
        tick_pending_ = false;
    }
    for (const auto& ev : events) {
        if (ev.type == Event::Type::Button) {
            HandleButton(ev.pin);
        } else {
            HandleTick();
        }
    }
}

void App::HandleButton(int pin) {
    Button button;
    if (!ButtonForPin(pin, &button)) {
        throw std::logic_error("no button mapped to pin " + std::to_string(pin));
    }
    if (!active_) {
        return;
    }
    std::cerr << "App: button " << ButtonName(button) << " on " << ViewKindName(active_->Kind()) << "\n";
    // Copy: the handler may rebind dispatch_ while it runs.
    auto handler = dispatch_.buttons[static_cast<size_t>(button)];
    handler();
}

void App::HandleTick() {
    if (!active_) {
        return;
    }
    auto tick = dispatch_.tick;
    try {
        tick();
    } catch (const SurfaceError& ex) {
        errors_.Record(std::string("Tick redraw failed: ") + ViewKindName(active_->Kind()), ex.what());
    }
}

void App::RefreshWeather() {
    int64_t now_ts = Now();
    std::string error;
    if (!cache_.GetCurrent(now_ts, nullptr, &error)) {
        errors_.Record("Current weather refresh failed", error);
    }
    error.clear();
    if (!cache_.GetForecast(now_ts, nullptr, &error)) {
        errors_.Record("Forecast refresh failed", error);
    }
}

std::vector<const WeatherSnapshot*> App::Timeline() const {
    std::vector<const WeatherSnapshot*> out;
    out.reserve(cache_.Forecast().size() + 1);
    out.push_back(cache_.Current() ? &*cache_.Current() : nullptr);
    for (const auto& snap : cache_.Forecast()) {
        out.push_back(&snap);
    }
    return out;
}

bool App::LoadIcon(const std::string& code, Image* out) {
    if (code.empty()) {
        return false;
    }
    std::string error;
    if (!cache_.GetIcon(code, out, &error)) {
        errors_.Record("Icon fetch failed: " + code, error);
        return false;
    }
    return true;
}

void App::StepCursor(int delta) {
    cursor_.Step(delta, static_cast<int>(cache_.Forecast().size()));
}

void App::ClearAlert() {
    alert_ = false;
    device_->SetLed(Led::kOff.r, Led::kOff.g, Led::kOff.b);
}

void App::OnBusy(bool busy) {
    const LedColor& color = busy ? Led::kYellow : (alert_ ? Led::kRed : Led::kOff);
    device_->SetLed(color.r, color.g, color.b);
}

int64_t App::Now() const {
    return options_.clock();
}
