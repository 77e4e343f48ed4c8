#include "views/GridView.h"

#include "app/App.h"
#include "render/RenderSurface.h"
#include "views/WeatherPainter.h"

#include <array>

void GridView::Render(App& app) {
    app.RefreshWeather();

    RenderSurface& surface = app.Surface();
    surface.Clear();

    int half_w = surface.Width() / 2;
    int half_h = surface.Height() / 2;
    const std::array<Rect, kCells> cells = {{
        { 0, 0, half_w, half_h },
        { half_w, 0, half_w, half_h },
        { 0, half_h, half_w, half_h },
        { half_w, half_h, half_w, half_h }
    }};

    auto timeline = app.Timeline();
    int first = app.CursorIndex();
    bool painted = false;
    for (int i = 0; i < kCells; ++i) {
        int idx = first + i;
        if (idx >= static_cast<int>(timeline.size()) || !timeline[idx]) {
            continue;
        }
        WeatherPainter::PaintSmall(app, *timeline[idx], cells[i]);
        painted = true;
    }
    if (!painted) {
        WeatherPainter::PaintPlaceholder(app, Rect{ 0, 0, surface.Width(), surface.Height() });
    }

    surface.Flush();
}

void GridView::OnButtonA(App& app) {
    app.SwitchTo(ViewKind::Page);
}

void GridView::OnButtonB(App& app) {
    app.SwitchTo(ViewKind::Errors);
}

void GridView::OnButtonX(App& app) {
    app.StepCursor(-PageSize());
    app.SwitchTo(ViewKind::Grid);
}

void GridView::OnButtonY(App& app) {
    app.StepCursor(PageSize());
    app.SwitchTo(ViewKind::Grid);
}

void GridView::OnTick(App& app) {
    app.Rerender();
}
