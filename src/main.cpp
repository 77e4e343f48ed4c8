#include <SDL.h>
#include <SDL_ttf.h>
#include <SDL_image.h>

#include <curl/curl.h>

#include "app/App.h"
#include "app/Ticker.h"
#include "config/AppConfig.h"
#include "hw/SdlDisplayDevice.h"
#include "render/SdlRenderSurface.h"
#include "services/MockWeatherProvider.h"
#include "services/OpenWeatherMapProvider.h"
#include "util/TimeUtil.h"

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace {

std::unique_ptr<WeatherProvider> CreateProvider(AppConfig* config) {
    if (config->mock_mode) {
        std::cerr << "Weather provider: mock\n";
        return std::make_unique<MockWeatherProvider>(TimeUtil::NowTs);
    }

    OwmConfig owm;
    owm.api_key = config->api_key;
    owm.latitude = config->latitude;
    owm.longitude = config->longitude;
    owm.timeout_sec = config->http_timeout_sec;
    auto provider = std::make_unique<OpenWeatherMapProvider>(owm);

    if (!config->has_coords) {
        double latitude = 0.0;
        double longitude = 0.0;
        std::string error;
        if (!provider->ResolveLocation(config->location, &latitude, &longitude, &error)) {
            std::cerr << "Failed to resolve location '" << config->location << "': " << error << "\n";
            return nullptr;
        }
        std::cerr << "Resolved " << config->location << " to " << latitude << ", " << longitude << "\n";
        owm.latitude = latitude;
        owm.longitude = longitude;
        provider = std::make_unique<OpenWeatherMapProvider>(owm);
    }
    return provider;
}

int Run(AppConfig config) {
    std::unique_ptr<WeatherProvider> provider = CreateProvider(&config);
    if (!provider) {
        return 1;
    }

    SdlDisplayDevice device(config.window_scale);
    if (!device.Open()) {
        return 1;
    }

    SdlRenderSurface surface(&device, config.font_path);
    if (!surface.Open()) {
        return 1;
    }

    AppOptions options;
    options.cache.current_max_age_sec = config.current_max_age_sec;
    options.cache.forecast_refresh_margin_sec = config.forecast_refresh_margin_sec;
    options.refresh_period = std::chrono::seconds(config.refresh_interval_sec);
    options.clock_period = std::chrono::seconds(config.clock_interval_sec);
    options.backlight = static_cast<float>(config.backlight);

    ViewKind initial = ViewKind::Page;
    if (!ViewKindFromName(config.initial_view, &initial)) {
        std::cerr << "Unknown initial_view: " << config.initial_view << "\n";
        return 1;
    }

    App app(options, &device, &surface, provider.get());
    Ticker ticker([&app]() { app.RequestTick(); });
    app.AttachTicker(&ticker);
    app.SwitchTo(initial);
    ticker.Start(app.ActiveTickPeriod());

    while (device.PumpEvents()) {
        app.ProcessPending();
        SDL_Delay(33);
    }

    ticker.Stop();
    device.SetLed(0.0f, 0.0f, 0.0f);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = "config/config.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    AppConfig config;
    if (!LoadConfig(config_path, &config)) {
        return 1;
    }
    ApplyEnvOverrides(&config);

    std::string config_error;
    if (!ValidateConfig(config, &config_error)) {
        std::cerr << "Invalid config: " << config_error << "\n";
        return 1;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "libcurl global init failed\n";
        return 1;
    }

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        curl_global_cleanup();
        return 1;
    }

    if (TTF_Init() != 0) {
        std::cerr << "TTF_Init failed: " << TTF_GetError() << "\n";
        SDL_Quit();
        curl_global_cleanup();
        return 1;
    }

    if ((IMG_Init(IMG_INIT_PNG) & IMG_INIT_PNG) == 0) {
        std::cerr << "IMG_Init failed: " << IMG_GetError() << "\n";
    }

    int rc = 1;
    try {
        rc = Run(config);
    } catch (const std::logic_error& ex) {
        std::cerr << "Fatal: " << ex.what() << "\n";
        rc = 1;
    }

    IMG_Quit();
    TTF_Quit();
    SDL_Quit();
    curl_global_cleanup();
    return rc;
}
