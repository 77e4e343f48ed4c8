#include "views/View.h"

#include "app/App.h"

const char* ViewKindName(ViewKind kind) {
    switch (kind) {
        case ViewKind::Page: return "page";
        case ViewKind::Grid: return "grid";
        case ViewKind::Errors: return "errors";
    }
    return "unknown";
}

bool ViewKindFromName(const std::string& name, ViewKind* out) {
    if (name == "page") {
        *out = ViewKind::Page;
    } else if (name == "grid") {
        *out = ViewKind::Grid;
    } else if (name == "errors") {
        *out = ViewKind::Errors;
    } else {
        return false;
    }
    return true;
}

std::chrono::milliseconds View::TickPeriod(const AppOptions& options) const {
    return options.refresh_period;
}
