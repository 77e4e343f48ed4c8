#include "services/OpenWeatherMapProvider.h"

#include <gtest/gtest.h>

TEST(OpenWeatherMapParseTest, Current) {
    const std::string body = R"({
        "dt": 1700000000,
        "name": "Cambridge",
        "main": {"temp": 11.4, "feels_like": 10.2, "humidity": 81},
        "weather": [{"id": 803, "description": "broken clouds", "icon": "04d"}]
    })";

    WeatherSnapshot snap;
    std::string error;
    ASSERT_TRUE(OpenWeatherMapProvider::ParseCurrent(body, &snap, &error)) << error;
    EXPECT_EQ(snap.timestamp, 1700000000);
    EXPECT_DOUBLE_EQ(snap.temp_c, 11.4);
    EXPECT_DOUBLE_EQ(snap.feels_like_c, 10.2);
    EXPECT_EQ(snap.humidity, 81);
    EXPECT_EQ(snap.icon_code, "04d");
    EXPECT_EQ(snap.description, "broken clouds");
    EXPECT_EQ(snap.location, "Cambridge");
}

TEST(OpenWeatherMapParseTest, CurrentWithoutWeatherArray) {
    const std::string body = R"({"dt": 5, "main": {"temp": -2.0}})";
    WeatherSnapshot snap;
    std::string error;
    ASSERT_TRUE(OpenWeatherMapProvider::ParseCurrent(body, &snap, &error));
    EXPECT_TRUE(snap.icon_code.empty());
    EXPECT_TRUE(snap.location.empty());
    EXPECT_DOUBLE_EQ(snap.feels_like_c, -2.0);
}

TEST(OpenWeatherMapParseTest, CurrentRejectsMissingMain) {
    WeatherSnapshot snap;
    std::string error;
    EXPECT_FALSE(OpenWeatherMapProvider::ParseCurrent(R"({"dt": 5})", &snap, &error));
    EXPECT_EQ(error, "weather missing fields");
    EXPECT_FALSE(OpenWeatherMapProvider::ParseCurrent("<html>", &snap, &error));
    EXPECT_EQ(error, "weather invalid json");
}

TEST(OpenWeatherMapParseTest, CurrentRejectsMistypedFields) {
    const char* bodies[] = {
        R"({"dt": 1, "name": null, "main": {"temp": 5}})",
        R"({"dt": 1, "main": {"temp": "11.4"}})",
        R"({"dt": 1, "main": {"temp": 5}, "weather": [null]})",
        R"({"dt": "yesterday", "main": {"temp": 5}})",
    };
    for (const char* body : bodies) {
        WeatherSnapshot snap;
        snap.location = "unchanged";
        std::string error;
        bool ok = true;
        EXPECT_NO_THROW(ok = OpenWeatherMapProvider::ParseCurrent(body, &snap, &error)) << body;
        EXPECT_FALSE(ok) << body;
        EXPECT_FALSE(error.empty()) << body;
        EXPECT_EQ(snap.location, "unchanged");
    }
}

TEST(OpenWeatherMapParseTest, ForecastKeepsOrderAndCityName) {
    const std::string body = R"({
        "list": [
            {"dt": 100, "main": {"temp": 1.0, "feels_like": 0.0, "humidity": 50}, "weather": [{"icon": "01n"}]},
            {"dt": 200, "main": {"temp": 2.0, "feels_like": 1.0, "humidity": 55}, "weather": [{"icon": "02n"}]}
        ],
        "city": {"name": "Ely"}
    })";

    ForecastSeries series;
    std::string error;
    ASSERT_TRUE(OpenWeatherMapProvider::ParseForecast(body, &series, &error)) << error;
    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series[0].timestamp, 100);
    EXPECT_EQ(series[1].timestamp, 200);
    EXPECT_EQ(series[1].icon_code, "02n");
    EXPECT_EQ(series[0].location, "Ely");
}

TEST(OpenWeatherMapParseTest, ForecastWithBadEntryFailsWhole) {
    const std::string body = R"({"list": [{"dt": 100, "main": {"temp": 1.0}}, {"dt": 200}]})";
    ForecastSeries series = { WeatherSnapshot{} };
    std::string error;
    EXPECT_FALSE(OpenWeatherMapProvider::ParseForecast(body, &series, &error));
    EXPECT_EQ(series.size(), 1u);
}

TEST(OpenWeatherMapParseTest, ForecastRejectsMistypedFields) {
    const char* bodies[] = {
        R"({"list": [{"dt": 100, "main": {"temp": 1.0}}], "city": {"name": 7}})",
        R"({"list": [{"dt": 100, "main": {"temp": null}}]})",
    };
    for (const char* body : bodies) {
        ForecastSeries series;
        std::string error;
        bool ok = true;
        EXPECT_NO_THROW(ok = OpenWeatherMapProvider::ParseForecast(body, &series, &error)) << body;
        EXPECT_FALSE(ok) << body;
        EXPECT_TRUE(series.empty());
    }
}

TEST(OpenWeatherMapParseTest, GeocodeRejectsMistypedCoordinates) {
    double lat = 1.0;
    double lon = 2.0;
    std::string error;
    bool ok = true;
    EXPECT_NO_THROW(ok = OpenWeatherMapProvider::ParseGeocode(R"([{"lat": "52.2", "lon": 0.12}])", &lat, &lon, &error));
    EXPECT_FALSE(ok);
    EXPECT_DOUBLE_EQ(lat, 1.0);
    EXPECT_DOUBLE_EQ(lon, 2.0);
}

TEST(OpenWeatherMapParseTest, Geocode) {
    double lat = 0.0;
    double lon = 0.0;
    std::string error;
    ASSERT_TRUE(OpenWeatherMapProvider::ParseGeocode(R"([{"name": "Cambridge", "lat": 52.2, "lon": 0.12}])", &lat, &lon, &error));
    EXPECT_DOUBLE_EQ(lat, 52.2);
    EXPECT_DOUBLE_EQ(lon, 0.12);

    EXPECT_FALSE(OpenWeatherMapProvider::ParseGeocode("[]", &lat, &lon, &error));
    EXPECT_EQ(error, "location not found");
}
