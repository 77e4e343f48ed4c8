#pragma once

#include "services/WeatherProvider.h"

#include <string>

struct OwmConfig {
    std::string api_key;
    double latitude = 0.0;
    double longitude = 0.0;
    long timeout_sec = 5;
};

class OpenWeatherMapProvider : public WeatherProvider {
public:
    explicit OpenWeatherMapProvider(const OwmConfig& config);

    bool FetchCurrent(WeatherSnapshot* out, std::string* error) override;
    bool FetchForecast(ForecastSeries* out, std::string* error) override;
    bool FetchIcon(const std::string& code, std::vector<unsigned char>* out, std::string* error) override;

    // Looks up the first geocoding match for a place name ("Cambridge,GB").
    bool ResolveLocation(const std::string& location, double* latitude, double* longitude, std::string* error);

    static bool ParseCurrent(const std::string& body, WeatherSnapshot* out, std::string* error);
    static bool ParseForecast(const std::string& body, ForecastSeries* out, std::string* error);
    static bool ParseGeocode(const std::string& body, double* latitude, double* longitude, std::string* error);

private:
    std::string BuildUrl(const std::string& path) const;
    bool Get(const std::string& url, std::string* body, std::string* error) const;

    OwmConfig config_;
};
