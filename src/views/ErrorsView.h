#pragma once

#include "views/View.h"

#include <string>
#include <vector>

// Lists and drains recorded errors, with network details and a live clock.
class ErrorsView : public View {
public:
    ViewKind Kind() const override { return ViewKind::Errors; }

    void Render(App& app) override;

    void OnButtonA(App& app) override;
    // Forgets the icon table and interface summary, then redraws.
    void OnButtonY(App& app) override;

    bool HasTick() const override { return true; }
    std::chrono::milliseconds TickPeriod(const AppOptions& options) const override;
    // Redraws only the clock strip.
    void OnTick(App& app) override;

private:
    const std::vector<std::string>& Interfaces();
    void PaintClock(App& app);

    bool interfaces_loaded_ = false;
    std::vector<std::string> interfaces_;
};
