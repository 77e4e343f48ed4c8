#include "services/MockWeatherProvider.h"

#include "util/TimeUtil.h"

#include <cmath>
#include <utility>

namespace {

const double kPi = 3.14159265358979323846;

} // namespace

MockWeatherProvider::MockWeatherProvider(Clock clock) : clock_(std::move(clock)) {}

WeatherSnapshot MockWeatherProvider::SampleAt(int64_t ts) const {
    std::tm tm = TimeUtil::LocalTime(static_cast<time_t>(ts));
    double day_phase = (tm.tm_hour * 60 + tm.tm_min) / (24.0 * 60.0);
    // Coldest around 04:00, warmest around 16:00.
    double temp = 11.0 + 6.0 * std::sin(2.0 * kPi * (day_phase - 0.416));
    bool is_day = tm.tm_hour >= 7 && tm.tm_hour < 19;

    WeatherSnapshot snap;
    snap.timestamp = ts;
    snap.temp_c = std::round(temp * 10.0) / 10.0;
    snap.feels_like_c = std::round((temp - 1.5) * 10.0) / 10.0;
    snap.humidity = 60 + static_cast<int>(20.0 * std::cos(2.0 * kPi * day_phase));
    snap.icon_code = is_day ? "02d" : "02n";
    snap.description = "few clouds";
    snap.location = "Mock Town";
    return snap;
}

bool MockWeatherProvider::FetchCurrent(WeatherSnapshot* out, std::string* error) {
    (void)error;
    *out = SampleAt(clock_());
    return true;
}

bool MockWeatherProvider::FetchForecast(ForecastSeries* out, std::string* error) {
    (void)error;
    int64_t now = clock_();
    int64_t first = (now / kForecastStepSec + 1) * kForecastStepSec;
    ForecastSeries series;
    series.reserve(kForecastEntries);
    for (int i = 0; i < kForecastEntries; ++i) {
        series.push_back(SampleAt(first + i * kForecastStepSec));
    }
    *out = std::move(series);
    return true;
}

bool MockWeatherProvider::FetchIcon(const std::string& code, std::vector<unsigned char>* out, std::string* error) {
    (void)code;
    (void)error;
    out->clear();
    return true;
}
