#pragma once

#include "model/Weather.h"
#include "render/RenderSurface.h"

#include <string>

class App;

namespace WeatherPainter {

std::string FormatTemp(double temp_c);

// Whole-screen layout used by the page view.
void PaintFull(App& app, const WeatherSnapshot& snap);
// Compact layout for one quadrant of the grid view.
void PaintSmall(App& app, const WeatherSnapshot& snap, const Rect& area);
void PaintPlaceholder(App& app, const Rect& area);

}
