#pragma once

#include <cstddef>

enum class Button {
    A = 0,
    B = 1,
    X = 2,
    Y = 3,
    Count = 4
};

constexpr size_t kButtonCount = static_cast<size_t>(Button::Count);

// Maps a board pin to its button; false for pins with no button.
bool ButtonForPin(int pin, Button* out);
int PinForButton(Button button);
const char* ButtonName(Button button);
