#pragma once

#include <string>

struct AppConfig {
    double latitude = 0.0;
    double longitude = 0.0;
    bool has_coords = false;
    std::string location;
    std::string api_key;
    bool mock_mode = false;
    std::string font_path = "/usr/share/fonts/truetype/freefont/FreeMono.ttf";
    int current_max_age_sec = 300;
    int forecast_refresh_margin_sec = 0;
    int refresh_interval_sec = 60;
    int clock_interval_sec = 1;
    int http_timeout_sec = 5;
    double backlight = 0.5;
    std::string initial_view = "page";
    int window_scale = 2;
};

bool LoadConfig(const std::string& path, AppConfig* out);
// LATITUDE, LONGITUDE and WEATHER_API_KEY take precedence over the file.
void ApplyEnvOverrides(AppConfig* out);
bool ValidateConfig(const AppConfig& config, std::string* error);
