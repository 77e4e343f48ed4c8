#pragma once

#include "model/Weather.h"

#include <string>
#include <vector>

// Source of weather data. Every call is synchronous; on failure it returns
// false and describes the problem in *error.
class WeatherProvider {
public:
    virtual ~WeatherProvider() = default;

    virtual bool FetchCurrent(WeatherSnapshot* out, std::string* error) = 0;
    virtual bool FetchForecast(ForecastSeries* out, std::string* error) = 0;
    virtual bool FetchIcon(const std::string& code, std::vector<unsigned char>* out, std::string* error) = 0;
};
