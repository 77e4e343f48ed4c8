#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct WeatherSnapshot {
    int64_t timestamp = 0;
    double temp_c = 0.0;
    double feels_like_c = 0.0;
    int humidity = 0;
    std::string icon_code;
    std::string description;
    // Empty when the provider did not name the place.
    std::string location;
};

using ForecastSeries = std::vector<WeatherSnapshot>;

struct Image {
    std::string key;
    std::vector<unsigned char> bytes;
};
