#pragma once

#include <chrono>
#include <string>

class App;
struct AppOptions;

enum class ViewKind {
    Page,
    Grid,
    Errors
};

const char* ViewKindName(ViewKind kind);
bool ViewKindFromName(const std::string& name, ViewKind* out);

// One display mode. Button and tick handlers default to no-ops; App routes
// the board's single button callback and the ticker to the active view.
class View {
public:
    virtual ~View() = default;

    virtual ViewKind Kind() const = 0;
    // Snapshots visible at once.
    virtual int PageSize() const { return 1; }

    // Full redraw: Clear(), paint, then exactly one Flush().
    virtual void Render(App& app) = 0;

    virtual void OnButtonA(App&) {}
    virtual void OnButtonB(App&) {}
    virtual void OnButtonX(App&) {}
    virtual void OnButtonY(App&) {}

    virtual bool HasTick() const { return false; }
    virtual std::chrono::milliseconds TickPeriod(const AppOptions& options) const;
    virtual void OnTick(App&) {}
};
