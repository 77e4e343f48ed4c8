#pragma once

#include "views/View.h"

// One snapshot at a time; X/Y step through [current] + forecast.
class PageView : public View {
public:
    ViewKind Kind() const override { return ViewKind::Page; }

    void Render(App& app) override;

    void OnButtonA(App& app) override;
    void OnButtonB(App& app) override;
    void OnButtonX(App& app) override;
    void OnButtonY(App& app) override;

    bool HasTick() const override { return true; }
    void OnTick(App& app) override;
};
