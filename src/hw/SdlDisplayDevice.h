#pragma once

#include "hw/DisplayDevice.h"

#include <SDL.h>

#include <map>

// Desktop stand-in for the display board: a window showing the frame buffer,
// keys A/B/X/Y as the four buttons and a strip below the frame for the LED.
class SdlDisplayDevice : public DisplayDevice {
public:
    explicit SdlDisplayDevice(int scale);
    ~SdlDisplayDevice() override;

    bool Open();
    void Close();

    // Handles queued window/keyboard events. Returns false once quit is requested.
    bool PumpEvents();
    // Commits the frame buffer as the displayed image.
    void Present();

    SDL_Renderer* Renderer() const { return renderer_; }
    SDL_Texture* Frame() const { return frame_; }

    bool OnButtonPressed(ButtonCallback callback) override;
    bool ReadButton(int pin) const override;
    void SetLed(float r, float g, float b) override;
    void SetBacklight(float value) override;

private:
    static int PinForKey(SDL_Keycode key);
    // Redraws the window from the last committed frame.
    void Show();

    int scale_;
    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    SDL_Texture* frame_ = nullptr;
    SDL_Texture* shown_ = nullptr;

    ButtonCallback on_button_;
    std::map<int, bool> down_;
    LedColor led_;
    float backlight_ = 1.0f;
};
