#include "services/OpenWeatherMapProvider.h"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace {

const char* kApiBase = "https://api.openweathermap.org";
const char* kIconBase = "https://openweathermap.org/img/wn/";

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

size_t WriteCallback(void* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userdata);
    out->append(static_cast<const char*>(ptr), total);
    return total;
}

void SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

// Reads one entry shaped like the /weather response (also used by each
// element of the /forecast "list" array).
bool ParseEntry(const nlohmann::json& item, WeatherSnapshot* out, std::string* error) {
    if (!item.is_object() || !item.contains("dt") || !item.contains("main") || !item["main"].is_object()) {
        SetError(error, "weather missing fields");
        return false;
    }
    const auto& main = item["main"];
    double temp = main.value("temp", std::nan(""));
    if (!std::isfinite(temp)) {
        SetError(error, "weather temperature invalid");
        return false;
    }

    WeatherSnapshot snap;
    snap.timestamp = item.value("dt", static_cast<int64_t>(0));
    snap.temp_c = temp;
    snap.feels_like_c = main.value("feels_like", temp);
    snap.humidity = main.value("humidity", 0);
    if (item.contains("weather") && item["weather"].is_array() && !item["weather"].empty()) {
        const auto& weather = item["weather"][0];
        snap.icon_code = weather.value("icon", "");
        snap.description = weather.value("description", "");
    }
    snap.location = item.value("name", "");
    *out = std::move(snap);
    return true;
}

} // namespace

OpenWeatherMapProvider::OpenWeatherMapProvider(const OwmConfig& config) : config_(config) {}

std::string OpenWeatherMapProvider::BuildUrl(const std::string& path) const {
    std::ostringstream out;
    out << kApiBase << path
        << "?units=metric"
        << "&lat=" << std::fixed << std::setprecision(5) << config_.latitude
        << "&lon=" << std::fixed << std::setprecision(5) << config_.longitude
        << "&appid=" << config_.api_key;
    return out.str();
}

bool OpenWeatherMapProvider::Get(const std::string& url, std::string* body, std::string* error) const {
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        SetError(error, "curl init failed");
        return false;
    }

    body->clear();
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, body);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "weatherscreen/1.0");
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config_.timeout_sec);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, config_.timeout_sec);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::cerr << "Weather HTTP GET failed: " << curl_easy_strerror(res) << "\n";
        SetError(error, std::string("weather http failed: ") + curl_easy_strerror(res));
        return false;
    }

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    if (code != 200) {
        SetError(error, "weather http " + std::to_string(code));
        return false;
    }
    return true;
}

bool OpenWeatherMapProvider::ParseCurrent(const std::string& body, WeatherSnapshot* out, std::string* error) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        SetError(error, "weather invalid json");
        return false;
    }
    try {
        return ParseEntry(j, out, error);
    } catch (const nlohmann::json::exception& ex) {
        SetError(error, std::string("weather bad field: ") + ex.what());
        return false;
    }
}

bool OpenWeatherMapProvider::ParseForecast(const std::string& body, ForecastSeries* out, std::string* error) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.contains("list") || !j["list"].is_array()) {
        SetError(error, "forecast invalid json");
        return false;
    }

    ForecastSeries series;
    try {
        std::string city;
        if (j.contains("city") && j["city"].is_object()) {
            city = j["city"].value("name", "");
        }

        series.reserve(j["list"].size());
        for (const auto& item : j["list"]) {
            WeatherSnapshot snap;
            if (!ParseEntry(item, &snap, error)) {
                return false;
            }
            if (snap.location.empty()) {
                snap.location = city;
            }
            series.push_back(std::move(snap));
        }
    } catch (const nlohmann::json::exception& ex) {
        SetError(error, std::string("forecast bad field: ") + ex.what());
        return false;
    }
    *out = std::move(series);
    return true;
}

bool OpenWeatherMapProvider::ParseGeocode(const std::string& body, double* latitude, double* longitude, std::string* error) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        SetError(error, "geocode invalid json");
        return false;
    }
    if (j.empty() || !j[0].is_object()) {
        SetError(error, "location not found");
        return false;
    }
    double lat = std::nan("");
    double lon = std::nan("");
    try {
        lat = j[0].value("lat", lat);
        lon = j[0].value("lon", lon);
    } catch (const nlohmann::json::exception& ex) {
        SetError(error, std::string("geocode bad field: ") + ex.what());
        return false;
    }
    if (!std::isfinite(lat) || !std::isfinite(lon)) {
        SetError(error, "geocode missing coordinates");
        return false;
    }
    *latitude = lat;
    *longitude = lon;
    return true;
}

bool OpenWeatherMapProvider::FetchCurrent(WeatherSnapshot* out, std::string* error) {
    std::string body;
    if (!Get(BuildUrl("/data/2.5/weather"), &body, error)) {
        return false;
    }
    return ParseCurrent(body, out, error);
}

bool OpenWeatherMapProvider::FetchForecast(ForecastSeries* out, std::string* error) {
    std::string body;
    if (!Get(BuildUrl("/data/2.5/forecast"), &body, error)) {
        return false;
    }
    return ParseForecast(body, out, error);
}

bool OpenWeatherMapProvider::FetchIcon(const std::string& code, std::vector<unsigned char>* out, std::string* error) {
    if (code.empty()) {
        SetError(error, "icon code empty");
        return false;
    }
    std::string body;
    if (!Get(std::string(kIconBase) + code + ".png", &body, error)) {
        return false;
    }
    out->assign(body.begin(), body.end());
    return true;
}

bool OpenWeatherMapProvider::ResolveLocation(const std::string& location, double* latitude, double* longitude, std::string* error) {
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        SetError(error, "curl init failed");
        return false;
    }
    char* escaped = curl_easy_escape(curl.get(), location.c_str(), static_cast<int>(location.size()));
    if (!escaped) {
        SetError(error, "location encode failed");
        return false;
    }
    std::string url = std::string(kApiBase) + "/geo/1.0/direct?q=" + escaped + "&limit=1&appid=" + config_.api_key;
    curl_free(escaped);

    std::string body;
    if (!Get(url, &body, error)) {
        return false;
    }
    return ParseGeocode(body, latitude, longitude, error);
}
