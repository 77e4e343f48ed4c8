#pragma once

#include "model/Weather.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

class WeatherProvider;

struct CachePolicy {
    int64_t current_max_age_sec = 300;
    // The forecast is kept while its first entry is at least this far in the future.
    int64_t forecast_refresh_margin_sec = 0;
};

class WeatherCache {
public:
    using BusyCallback = std::function<void(bool busy)>;
    using ReplacedCallback = std::function<void()>;

    WeatherCache(WeatherProvider* provider, const CachePolicy& policy);

    bool GetCurrent(int64_t now_ts, WeatherSnapshot* out, std::string* error);
    bool GetForecast(int64_t now_ts, ForecastSeries* out, std::string* error);
    bool GetIcon(const std::string& code, Image* out, std::string* error);
    void ClearIcons();

    const std::optional<WeatherSnapshot>& Current() const { return current_; }
    const ForecastSeries& Forecast() const { return forecast_; }
    size_t IconCount() const { return icons_.size(); }

    void SetBusyCallback(BusyCallback callback);
    void SetForecastReplacedCallback(ReplacedCallback callback);

private:
    bool CurrentIsFresh(int64_t now_ts) const;
    bool ForecastIsFresh(int64_t now_ts) const;

    WeatherProvider* provider_;
    CachePolicy policy_;
    std::optional<WeatherSnapshot> current_;
    ForecastSeries forecast_;
    std::map<std::string, Image> icons_;
    BusyCallback on_busy_;
    ReplacedCallback on_forecast_replaced_;
};
