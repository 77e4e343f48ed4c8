#pragma once

#include "hw/DisplayDevice.h"
#include "render/RenderSurface.h"
#include "services/WeatherProvider.h"

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

class FakeProvider : public WeatherProvider {
public:
    bool FetchCurrent(WeatherSnapshot* out, std::string* error) override {
        ++current_calls;
        if (!current_ok) {
            *error = current_error;
            return false;
        }
        *out = current;
        return true;
    }

    bool FetchForecast(ForecastSeries* out, std::string* error) override {
        ++forecast_calls;
        if (!forecast_ok) {
            *error = forecast_error;
            return false;
        }
        *out = forecast;
        return true;
    }

    bool FetchIcon(const std::string& code, std::vector<unsigned char>* out, std::string* error) override {
        ++icon_calls;
        if (!icon_ok) {
            *error = "icon unavailable";
            return false;
        }
        out->assign(code.begin(), code.end());
        return true;
    }

    WeatherSnapshot current;
    ForecastSeries forecast;
    bool current_ok = true;
    bool forecast_ok = true;
    bool icon_ok = true;
    std::string current_error = "current offline";
    std::string forecast_error = "forecast offline";
    int current_calls = 0;
    int forecast_calls = 0;
    int icon_calls = 0;
};

class FakeSurface : public RenderSurface {
public:
    int Width() const override { return 320; }
    int Height() const override { return 240; }

    void Clear() override {
        ++clear_count;
        texts.clear();
        images.clear();
    }
    void FillRect(const Rect&, Color) override { ++fill_count; }
    void DrawText(int, int, const std::string& text, Color, FontSize) override {
        if (fail_text) {
            throw SurfaceError("font gone");
        }
        texts.push_back(text);
    }
    void DrawImage(int, int, const Image& image) override { images.push_back(image.key); }
    void ClearImages() override { ++clear_images_count; }
    void Flush() override { ++flush_count; }

    bool HasText(const std::string& needle) const {
        return std::any_of(texts.begin(), texts.end(), [&](const std::string& t) {
            return t.find(needle) != std::string::npos;
        });
    }

    int clear_count = 0;
    int flush_count = 0;
    int fill_count = 0;
    int clear_images_count = 0;
    bool fail_text = false;
    std::vector<std::string> texts;
    std::vector<std::string> images;
};

class FakeDevice : public DisplayDevice {
public:
    bool OnButtonPressed(ButtonCallback callback) override {
        ++register_calls;
        if (callback_) {
            return false;
        }
        callback_ = std::move(callback);
        return true;
    }

    bool ReadButton(int pin) const override {
        auto it = down_.find(pin);
        return it != down_.end() && it->second;
    }

    void SetLed(float r, float g, float b) override { leds.push_back(LedColor{ r, g, b }); }
    void SetBacklight(float value) override { backlight = value; }

    // Simulates a physical press: the pin reads down while the callback runs.
    void Press(int pin) {
        down_[pin] = true;
        if (callback_) {
            callback_(pin);
        }
        down_[pin] = false;
    }

    // Delivers the callback without the pin reading down (contact bounce).
    void Glitch(int pin) {
        if (callback_) {
            callback_(pin);
        }
    }

    bool LastLedIs(const LedColor& color) const {
        return !leds.empty() && leds.back().r == color.r && leds.back().g == color.g && leds.back().b == color.b;
    }

    bool SawLed(const LedColor& color) const {
        return std::any_of(leds.begin(), leds.end(), [&](const LedColor& c) {
            return c.r == color.r && c.g == color.g && c.b == color.b;
        });
    }

    int register_calls = 0;
    float backlight = -1.0f;
    std::vector<LedColor> leds;

private:
    ButtonCallback callback_;
    std::map<int, bool> down_;
};

inline WeatherSnapshot MakeSnapshot(int64_t ts, double temp_c, const std::string& icon = "01d") {
    WeatherSnapshot snap;
    snap.timestamp = ts;
    snap.temp_c = temp_c;
    snap.feels_like_c = temp_c - 1.0;
    snap.humidity = 70;
    snap.icon_code = icon;
    snap.description = "clear sky";
    snap.location = "Cambridge";
    return snap;
}

// `count` entries, three hours apart, starting three hours after `from`.
inline ForecastSeries MakeForecast(int64_t from, int count) {
    ForecastSeries series;
    for (int i = 0; i < count; ++i) {
        series.push_back(MakeSnapshot(from + (i + 1) * 3 * 3600, 10.0 + i));
    }
    return series;
}
