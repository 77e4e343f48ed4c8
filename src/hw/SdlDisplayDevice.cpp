#include "hw/SdlDisplayDevice.h"

#include <algorithm>
#include <initializer_list>
#include <iostream>
#include <utility>

namespace {

const int kLedStripH = 8;

Uint8 ToByte(float value) {
    return static_cast<Uint8>(std::clamp(value, 0.0f, 1.0f) * 255.0f);
}

} // namespace

SdlDisplayDevice::SdlDisplayDevice(int scale) : scale_(std::max(1, scale)) {}

SdlDisplayDevice::~SdlDisplayDevice() {
    Close();
}

bool SdlDisplayDevice::Open() {
    window_ = SDL_CreateWindow(
        "weatherscreen",
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        kWidth * scale_,
        (kHeight + kLedStripH) * scale_,
        SDL_WINDOW_SHOWN
    );
    if (!window_) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_TARGETTEXTURE);
    if (!renderer_) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        Close();
        return false;
    }
    SDL_RenderSetLogicalSize(renderer_, kWidth, kHeight + kLedStripH);

    frame_ = SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_ARGB8888, SDL_TEXTUREACCESS_TARGET, kWidth, kHeight);
    shown_ = SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_ARGB8888, SDL_TEXTUREACCESS_TARGET, kWidth, kHeight);
    if (!frame_ || !shown_) {
        std::cerr << "SDL_CreateTexture failed: " << SDL_GetError() << "\n";
        Close();
        return false;
    }
    for (SDL_Texture* texture : { shown_, frame_ }) {
        SDL_SetRenderTarget(renderer_, texture);
        SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
        SDL_RenderClear(renderer_);
    }
    return true;
}

void SdlDisplayDevice::Close() {
    if (shown_) {
        SDL_DestroyTexture(shown_);
        shown_ = nullptr;
    }
    if (frame_) {
        SDL_DestroyTexture(frame_);
        frame_ = nullptr;
    }
    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
}

int SdlDisplayDevice::PinForKey(SDL_Keycode key) {
    switch (key) {
        case SDLK_a: return kPinA;
        case SDLK_b: return kPinB;
        case SDLK_x: return kPinX;
        case SDLK_y: return kPinY;
        default: return -1;
    }
}

bool SdlDisplayDevice::PumpEvents() {
    SDL_Event ev;
    while (SDL_PollEvent(&ev)) {
        if (ev.type == SDL_QUIT) {
            return false;
        }
        if (ev.type == SDL_KEYDOWN) {
            if (ev.key.keysym.sym == SDLK_ESCAPE) {
                return false;
            }
            int pin = PinForKey(ev.key.keysym.sym);
            if (pin < 0 || ev.key.repeat) {
                continue;
            }
            down_[pin] = true;
            if (on_button_) {
                on_button_(pin);
            }
        } else if (ev.type == SDL_KEYUP) {
            int pin = PinForKey(ev.key.keysym.sym);
            if (pin >= 0) {
                down_[pin] = false;
            }
        } else if (ev.type == SDL_WINDOWEVENT && ev.window.event == SDL_WINDOWEVENT_EXPOSED) {
            Show();
        }
    }
    return true;
}

void SdlDisplayDevice::Present() {
    if (!renderer_ || !frame_ || !shown_) {
        return;
    }
    SDL_SetRenderTarget(renderer_, shown_);
    SDL_RenderCopy(renderer_, frame_, nullptr, nullptr);
    Show();
}

void SdlDisplayDevice::Show() {
    if (!renderer_ || !shown_) {
        return;
    }
    SDL_SetRenderTarget(renderer_, nullptr);
    SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
    SDL_RenderClear(renderer_);

    Uint8 level = ToByte(backlight_);
    SDL_SetTextureColorMod(shown_, level, level, level);
    SDL_Rect frame_rect{ 0, 0, kWidth, kHeight };
    SDL_RenderCopy(renderer_, shown_, nullptr, &frame_rect);

    // The board LED is dim (0.1 is already bright); scale it up for the window.
    SDL_SetRenderDrawColor(renderer_, ToByte(led_.r * 10.0f), ToByte(led_.g * 10.0f), ToByte(led_.b * 10.0f), 255);
    SDL_Rect led_rect{ kWidth - 24, kHeight + 1, 20, kLedStripH - 2 };
    SDL_RenderFillRect(renderer_, &led_rect);

    SDL_RenderPresent(renderer_);
    SDL_SetRenderTarget(renderer_, frame_);
}

bool SdlDisplayDevice::OnButtonPressed(ButtonCallback callback) {
    if (on_button_) {
        std::cerr << "SdlDisplayDevice: button callback already registered\n";
        return false;
    }
    on_button_ = std::move(callback);
    return true;
}

bool SdlDisplayDevice::ReadButton(int pin) const {
    auto it = down_.find(pin);
    return it != down_.end() && it->second;
}

void SdlDisplayDevice::SetLed(float r, float g, float b) {
    led_ = LedColor{ r, g, b };
    Show();
}

void SdlDisplayDevice::SetBacklight(float value) {
    if (value == backlight_) {
        return;
    }
    backlight_ = value;
    Show();
}
