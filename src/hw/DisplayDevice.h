#pragma once

#include <functional>

// Button/LED/backlight side of the display board. The board accepts exactly
// one button callback for its lifetime.
class DisplayDevice {
public:
    using ButtonCallback = std::function<void(int pin)>;

    // BCM pin numbers of the Display HAT Mini buttons.
    static constexpr int kPinA = 5;
    static constexpr int kPinB = 6;
    static constexpr int kPinX = 16;
    static constexpr int kPinY = 24;

    static constexpr int kWidth = 320;
    static constexpr int kHeight = 240;

    virtual ~DisplayDevice() = default;

    // Returns false if a callback is already registered.
    virtual bool OnButtonPressed(ButtonCallback callback) = 0;
    virtual bool ReadButton(int pin) const = 0;
    // Channels are 0.0 - 1.0.
    virtual void SetLed(float r, float g, float b) = 0;
    virtual void SetBacklight(float value) = 0;
};

struct LedColor {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
};

namespace Led {

constexpr LedColor kOff{ 0.0f, 0.0f, 0.0f };
constexpr LedColor kYellow{ 0.1f, 0.1f, 0.0f };
constexpr LedColor kRed{ 0.1f, 0.0f, 0.0f };

}
