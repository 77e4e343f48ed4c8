#include "views/PageView.h"

#include "app/App.h"
#include "render/RenderSurface.h"
#include "views/WeatherPainter.h"

void PageView::Render(App& app) {
    app.RefreshWeather();

    RenderSurface& surface = app.Surface();
    surface.Clear();

    auto timeline = app.Timeline();
    int idx = app.CursorIndex();
    const WeatherSnapshot* snap = idx < static_cast<int>(timeline.size()) ? timeline[idx] : nullptr;
    if (snap) {
        WeatherPainter::PaintFull(app, *snap);
    } else {
        WeatherPainter::PaintPlaceholder(app, Rect{ 0, 0, surface.Width(), surface.Height() });
    }

    surface.DrawText(4, 4, idx == 0 ? "Current" : "Forecast", Colors::kWhite, FontSize::Normal);
    std::string position = std::to_string(idx) + "/" + std::to_string(app.Cache().Forecast().size());
    surface.DrawText(surface.Width() - 60, 6, position, Colors::kGrey, FontSize::Small);

    surface.Flush();
}

void PageView::OnButtonA(App& app) {
    app.SwitchTo(ViewKind::Grid);
}

void PageView::OnButtonB(App& app) {
    app.SwitchTo(ViewKind::Errors);
}

void PageView::OnButtonX(App& app) {
    app.StepCursor(-PageSize());
    app.SwitchTo(ViewKind::Page);
}

void PageView::OnButtonY(App& app) {
    app.StepCursor(PageSize());
    app.SwitchTo(ViewKind::Page);
}

void PageView::OnTick(App& app) {
    app.Rerender();
}
