#include "services/WeatherCache.h"

#include "services/WeatherProvider.h"

#include <iostream>
#include <utility>

namespace {

// Asserts the busy indicator for the lifetime of one provider call.
class BusyScope {
public:
    explicit BusyScope(const WeatherCache::BusyCallback& callback) : callback_(callback) {
        if (callback_) {
            callback_(true);
        }
    }
    ~BusyScope() {
        if (callback_) {
            callback_(false);
        }
    }

    BusyScope(const BusyScope&) = delete;
    BusyScope& operator=(const BusyScope&) = delete;

private:
    const WeatherCache::BusyCallback& callback_;
};

bool NoProvider(std::string* error) {
    if (error) {
        *error = "weather provider not configured";
    }
    return false;
}

} // namespace

WeatherCache::WeatherCache(WeatherProvider* provider, const CachePolicy& policy)
    : provider_(provider), policy_(policy) {}

void WeatherCache::SetBusyCallback(BusyCallback callback) {
    on_busy_ = std::move(callback);
}

void WeatherCache::SetForecastReplacedCallback(ReplacedCallback callback) {
    on_forecast_replaced_ = std::move(callback);
}

bool WeatherCache::CurrentIsFresh(int64_t now_ts) const {
    return current_ && now_ts - current_->timestamp < policy_.current_max_age_sec;
}

bool WeatherCache::ForecastIsFresh(int64_t now_ts) const {
    return !forecast_.empty() && forecast_.front().timestamp >= now_ts + policy_.forecast_refresh_margin_sec;
}

bool WeatherCache::GetCurrent(int64_t now_ts, WeatherSnapshot* out, std::string* error) {
    if (!CurrentIsFresh(now_ts)) {
        if (!provider_) {
            return NoProvider(error);
        }
        WeatherSnapshot fetched;
        {
            BusyScope busy(on_busy_);
            if (!provider_->FetchCurrent(&fetched, error)) {
                return false;
            }
        }
        current_ = std::move(fetched);
    }
    if (out) {
        *out = *current_;
    }
    return true;
}

bool WeatherCache::GetForecast(int64_t now_ts, ForecastSeries* out, std::string* error) {
    if (!ForecastIsFresh(now_ts)) {
        if (!provider_) {
            return NoProvider(error);
        }
        ForecastSeries fetched;
        {
            BusyScope busy(on_busy_);
            if (!provider_->FetchForecast(&fetched, error)) {
                return false;
            }
        }
        forecast_ = std::move(fetched);
        std::cerr << "WeatherCache: forecast replaced (" << forecast_.size() << " entries)\n";
        if (on_forecast_replaced_) {
            on_forecast_replaced_();
        }
    }
    if (out) {
        *out = forecast_;
    }
    return true;
}

bool WeatherCache::GetIcon(const std::string& code, Image* out, std::string* error) {
    auto it = icons_.find(code);
    if (it == icons_.end()) {
        if (!provider_) {
            return NoProvider(error);
        }
        Image icon;
        icon.key = code;
        {
            BusyScope busy(on_busy_);
            if (!provider_->FetchIcon(code, &icon.bytes, error)) {
                return false;
            }
        }
        it = icons_.emplace(code, std::move(icon)).first;
    }
    if (out) {
        *out = it->second;
    }
    return true;
}

void WeatherCache::ClearIcons() {
    icons_.clear();
}
