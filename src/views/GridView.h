#pragma once

#include "views/View.h"

// Four consecutive snapshots in quadrants, paged four at a time.
class GridView : public View {
public:
    static constexpr int kCells = 4;

    ViewKind Kind() const override { return ViewKind::Grid; }
    int PageSize() const override { return kCells; }

    void Render(App& app) override;

    void OnButtonA(App& app) override;
    void OnButtonB(App& app) override;
    void OnButtonX(App& app) override;
    void OnButtonY(App& app) override;

    bool HasTick() const override { return true; }
    void OnTick(App& app) override;
};
