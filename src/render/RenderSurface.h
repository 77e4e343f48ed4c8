#pragma once

#include "model/Weather.h"

#include <cstdint>
#include <stdexcept>
#include <string>

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

namespace Colors {

constexpr Color kBlack{ 0, 0, 0 };
constexpr Color kWhite{ 255, 255, 255 };
constexpr Color kRed{ 255, 0, 0 };
constexpr Color kGrey{ 150, 150, 150 };

}

enum class FontSize {
    Small,
    Normal,
    Large
};

struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

// Thrown when the surface cannot draw (font/texture/renderer failure).
class SurfaceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Off-screen frame buffer. Draw calls accumulate until Flush() pushes the
// frame to the physical display.
class RenderSurface {
public:
    virtual ~RenderSurface() = default;

    virtual int Width() const = 0;
    virtual int Height() const = 0;

    virtual void Clear() = 0;
    virtual void FillRect(const Rect& rect, Color color) = 0;
    virtual void DrawText(int x, int y, const std::string& text, Color color, FontSize size) = 0;
    // An image with no bytes is skipped.
    virtual void DrawImage(int x, int y, const Image& image) = 0;
    // Forgets decoded images so the next DrawImage decodes its bytes again.
    virtual void ClearImages() = 0;
    virtual void Flush() = 0;
};
