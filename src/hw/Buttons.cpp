#include "hw/Buttons.h"

#include "hw/DisplayDevice.h"

bool ButtonForPin(int pin, Button* out) {
    switch (pin) {
        case DisplayDevice::kPinA: *out = Button::A; return true;
        case DisplayDevice::kPinB: *out = Button::B; return true;
        case DisplayDevice::kPinX: *out = Button::X; return true;
        case DisplayDevice::kPinY: *out = Button::Y; return true;
        default: return false;
    }
}

int PinForButton(Button button) {
    switch (button) {
        case Button::A: return DisplayDevice::kPinA;
        case Button::B: return DisplayDevice::kPinB;
        case Button::X: return DisplayDevice::kPinX;
        case Button::Y: return DisplayDevice::kPinY;
        default: return -1;
    }
}

const char* ButtonName(Button button) {
    switch (button) {
        case Button::A: return "A";
        case Button::B: return "B";
        case Button::X: return "X";
        case Button::Y: return "Y";
        default: return "?";
    }
}
