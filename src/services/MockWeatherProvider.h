#pragma once

#include "services/WeatherProvider.h"

#include <cstdint>
#include <functional>

// Offline stand-in used when mock_mode is set. Produces a plausible day/night
// temperature curve around the current time.
class MockWeatherProvider : public WeatherProvider {
public:
    using Clock = std::function<int64_t()>;

    explicit MockWeatherProvider(Clock clock);

    bool FetchCurrent(WeatherSnapshot* out, std::string* error) override;
    bool FetchForecast(ForecastSeries* out, std::string* error) override;
    // Icons are not bundled; returns an empty image that renders as a placeholder.
    bool FetchIcon(const std::string& code, std::vector<unsigned char>* out, std::string* error) override;

    static constexpr int kForecastEntries = 40;
    static constexpr int64_t kForecastStepSec = 3 * 60 * 60;

private:
    WeatherSnapshot SampleAt(int64_t ts) const;

    Clock clock_;
};
