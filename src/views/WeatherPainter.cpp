#include "views/WeatherPainter.h"

#include "app/App.h"
#include "util/TimeUtil.h"

#include <sstream>

namespace WeatherPainter {

namespace {

const char* kDegreesC = "\xC2\xB0" "C";

void DrawIcon(App& app, int x, int y, const std::string& code) {
    Image icon;
    if (app.LoadIcon(code, &icon)) {
        app.Surface().DrawImage(x, y, icon);
    }
}

} // namespace

std::string FormatTemp(double temp_c) {
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out.precision(1);
    out << temp_c << kDegreesC;
    return out.str();
}

void PaintFull(App& app, const WeatherSnapshot& snap) {
    RenderSurface& surface = app.Surface();

    surface.DrawText(4, 30, TimeUtil::FormatLong(snap.timestamp), Colors::kGrey, FontSize::Small);
    DrawIcon(app, 4, 50, snap.icon_code);
    surface.DrawText(70, 52, FormatTemp(snap.temp_c), Colors::kWhite, FontSize::Large);
    if (!snap.description.empty()) {
        surface.DrawText(70, 100, snap.description, Colors::kWhite, FontSize::Normal);
    }
    surface.DrawText(4, 135, "Feels like " + FormatTemp(snap.feels_like_c), Colors::kWhite, FontSize::Normal);
    surface.DrawText(4, 160, "Humidity " + std::to_string(snap.humidity) + "%", Colors::kWhite, FontSize::Normal);
    if (!snap.location.empty()) {
        surface.DrawText(4, surface.Height() - 20, snap.location, Colors::kGrey, FontSize::Small);
    }
}

void PaintSmall(App& app, const WeatherSnapshot& snap, const Rect& area) {
    RenderSurface& surface = app.Surface();

    surface.DrawText(area.x + 4, area.y + 4, TimeUtil::FormatShort(snap.timestamp), Colors::kGrey, FontSize::Small);
    DrawIcon(app, area.x + 4, area.y + 22, snap.icon_code);
    surface.DrawText(area.x + 60, area.y + 34, FormatTemp(snap.temp_c), Colors::kWhite, FontSize::Normal);
    surface.DrawText(area.x + 4, area.y + area.h - 20, std::to_string(snap.humidity) + "% RH", Colors::kGrey, FontSize::Small);
}

void PaintPlaceholder(App& app, const Rect& area) {
    app.Surface().DrawText(area.x + 4, area.y + area.h / 2 - 8, "No data", Colors::kGrey, FontSize::Normal);
}

} // namespace WeatherPainter
