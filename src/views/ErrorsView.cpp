#include "views/ErrorsView.h"

#include "app/App.h"
#include "render/RenderSurface.h"
#include "util/NetInfo.h"
#include "util/TimeUtil.h"

namespace {

const int kLineH = 16;
const int kClockW = 70;

} // namespace

std::chrono::milliseconds ErrorsView::TickPeriod(const AppOptions& options) const {
    return options.clock_period;
}

const std::vector<std::string>& ErrorsView::Interfaces() {
    if (!interfaces_loaded_) {
        interfaces_ = NetInfo::InterfaceSummary();
        interfaces_loaded_ = true;
    }
    return interfaces_;
}

void ErrorsView::PaintClock(App& app) {
    RenderSurface& surface = app.Surface();
    Rect strip{ surface.Width() - kClockW, 0, kClockW, kLineH + 2 };
    surface.FillRect(strip, Colors::kBlack);
    surface.DrawText(strip.x + 2, 2, TimeUtil::FormatTimeHHMMSS(app.Now()), Colors::kGrey, FontSize::Small);
}

void ErrorsView::Render(App& app) {
    app.ClearAlert();

    RenderSurface& surface = app.Surface();
    surface.Clear();

    std::vector<ErrorRecord> errors = app.Errors().Peek();
    const auto& interfaces = Interfaces();
    int footer_y = surface.Height() - static_cast<int>(interfaces.size()) * kLineH - 4;

    if (errors.empty()) {
        surface.DrawText(0, 0, "No errors!", Colors::kWhite, FontSize::Normal);
    } else {
        surface.DrawText(0, 0, "Errors", Colors::kRed, FontSize::Normal);
        int y = 24;
        size_t shown = 0;
        for (const auto& err : errors) {
            if (y + 2 * kLineH > footer_y && shown + 1 < errors.size()) {
                break;
            }
            std::string line = err.message;
            if (!err.cause.empty()) {
                line += ": " + err.cause;
            }
            surface.DrawText(10, y, line, Colors::kRed, FontSize::Small);
            y += kLineH;
            ++shown;
        }
        if (shown < errors.size()) {
            surface.DrawText(10, y, "+" + std::to_string(errors.size() - shown) + " more", Colors::kRed, FontSize::Small);
        }
    }

    int y = footer_y;
    for (const auto& line : interfaces) {
        surface.DrawText(10, y, line, Colors::kWhite, FontSize::Small);
        y += kLineH;
    }

    PaintClock(app);
    surface.Flush();

    app.Errors().Drain();
}

void ErrorsView::OnButtonA(App& app) {
    app.SwitchTo(ViewKind::Page);
}

void ErrorsView::OnButtonY(App& app) {
    app.Cache().ClearIcons();
    app.Surface().ClearImages();
    interfaces_loaded_ = false;
    interfaces_.clear();
    app.SwitchTo(ViewKind::Errors);
}

void ErrorsView::OnTick(App& app) {
    PaintClock(app);
    app.Surface().Flush();
}
