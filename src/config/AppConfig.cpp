#include "config/AppConfig.h"

#include "views/View.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace {

bool IsValidCoords(double latitude, double longitude) {
    return std::isfinite(latitude) &&
           std::isfinite(longitude) &&
           latitude >= -90.0 &&
           latitude <= 90.0 &&
           longitude >= -180.0 &&
           longitude <= 180.0;
}

bool ParseDouble(const char* text, double* out) {
    char* end = nullptr;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0') {
        return false;
    }
    *out = value;
    return true;
}

} // namespace

bool LoadConfig(const std::string& path, AppConfig* out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to open config: " << path << "\n";
        return false;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& ex) {
        std::cerr << "Failed to parse config: " << ex.what() << "\n";
        return false;
    }

    try {
        if (j.contains("latitude") && j.contains("longitude")) {
            out->latitude = j.value("latitude", out->latitude);
            out->longitude = j.value("longitude", out->longitude);
            out->has_coords = true;
        }
        out->location = j.value("location", out->location);
        out->api_key = j.value("api_key", out->api_key);
        out->mock_mode = j.value("mock_mode", out->mock_mode);
        out->font_path = j.value("font_path", out->font_path);
        out->current_max_age_sec = j.value("current_max_age_sec", out->current_max_age_sec);
        out->forecast_refresh_margin_sec = j.value("forecast_refresh_margin_sec", out->forecast_refresh_margin_sec);
        out->refresh_interval_sec = j.value("refresh_interval_sec", out->refresh_interval_sec);
        out->clock_interval_sec = j.value("clock_interval_sec", out->clock_interval_sec);
        out->http_timeout_sec = j.value("http_timeout_sec", out->http_timeout_sec);
        out->backlight = j.value("backlight", out->backlight);
        out->initial_view = j.value("initial_view", out->initial_view);
        out->window_scale = j.value("window_scale", out->window_scale);
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "Invalid config value: " << ex.what() << "\n";
        return false;
    }

    out->backlight = std::clamp(out->backlight, 0.0, 1.0);
    out->window_scale = std::max(1, out->window_scale);
    return true;
}

void ApplyEnvOverrides(AppConfig* out) {
    const char* lat = std::getenv("LATITUDE");
    const char* lon = std::getenv("LONGITUDE");
    if (lat && lon) {
        double latitude = 0.0;
        double longitude = 0.0;
        if (ParseDouble(lat, &latitude) && ParseDouble(lon, &longitude)) {
            out->latitude = latitude;
            out->longitude = longitude;
            out->has_coords = true;
        } else {
            std::cerr << "Ignoring unparsable LATITUDE/LONGITUDE\n";
        }
    }
    const char* key = std::getenv("WEATHER_API_KEY");
    if (key && *key) {
        out->api_key = key;
    }
}

bool ValidateConfig(const AppConfig& config, std::string* error) {
    ViewKind kind;
    if (!ViewKindFromName(config.initial_view, &kind)) {
        *error = "initial_view must be page, grid or errors";
        return false;
    }
    if (config.refresh_interval_sec <= 0 || config.clock_interval_sec <= 0) {
        *error = "tick intervals must be positive";
        return false;
    }
    if (config.http_timeout_sec <= 0) {
        *error = "http_timeout_sec must be positive";
        return false;
    }
    if (config.mock_mode) {
        return true;
    }
    if (config.api_key.empty()) {
        *error = "api_key (or WEATHER_API_KEY) is required";
        return false;
    }
    if (config.has_coords && !IsValidCoords(config.latitude, config.longitude)) {
        *error = "latitude/longitude out of range";
        return false;
    }
    if (!config.has_coords && config.location.empty()) {
        *error = "set latitude/longitude or location";
        return false;
    }
    return true;
}
