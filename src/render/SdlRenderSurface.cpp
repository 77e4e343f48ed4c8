#include "render/SdlRenderSurface.h"

#include "hw/SdlDisplayDevice.h"

#include <SDL_image.h>

#include <initializer_list>
#include <iostream>

namespace {

SDL_Texture* RenderText(SDL_Renderer* renderer, TTF_Font* font, const std::string& text, SDL_Color color, int* w, int* h) {
    SDL_Surface* surface = TTF_RenderUTF8_Blended(font, text.c_str(), color);
    if (!surface) {
        throw SurfaceError(std::string("TTF_RenderUTF8_Blended failed: ") + TTF_GetError());
    }
    SDL_Texture* tex = SDL_CreateTextureFromSurface(renderer, surface);
    if (!tex) {
        SDL_FreeSurface(surface);
        throw SurfaceError(std::string("SDL_CreateTextureFromSurface failed: ") + SDL_GetError());
    }
    *w = surface->w;
    *h = surface->h;
    SDL_FreeSurface(surface);
    return tex;
}

void Check(int rc, const char* what) {
    if (rc != 0) {
        throw SurfaceError(std::string(what) + " failed: " + SDL_GetError());
    }
}

} // namespace

SdlRenderSurface::SdlRenderSurface(SdlDisplayDevice* device, const std::string& font_path)
    : device_(device), font_path_(font_path) {}

SdlRenderSurface::~SdlRenderSurface() {
    Close();
}

bool SdlRenderSurface::Open() {
    small_font_ = TTF_OpenFont(font_path_.c_str(), 12);
    normal_font_ = TTF_OpenFont(font_path_.c_str(), 20);
    large_font_ = TTF_OpenFont(font_path_.c_str(), 40);
    if (!small_font_ || !normal_font_ || !large_font_) {
        std::cerr << "Failed to load font: " << font_path_ << " (" << TTF_GetError() << ")\n";
        Close();
        return false;
    }
    return true;
}

void SdlRenderSurface::Close() {
    ClearImages();
    for (TTF_Font** font : { &small_font_, &normal_font_, &large_font_ }) {
        if (*font) {
            TTF_CloseFont(*font);
            *font = nullptr;
        }
    }
}

int SdlRenderSurface::Width() const {
    return DisplayDevice::kWidth;
}

int SdlRenderSurface::Height() const {
    return DisplayDevice::kHeight;
}

TTF_Font* SdlRenderSurface::FontFor(FontSize size) const {
    switch (size) {
        case FontSize::Small: return small_font_;
        case FontSize::Large: return large_font_;
        case FontSize::Normal:
        default:
            return normal_font_;
    }
}

void SdlRenderSurface::Clear() {
    SDL_Renderer* renderer = device_->Renderer();
    Check(SDL_SetRenderTarget(renderer, device_->Frame()), "SDL_SetRenderTarget");
    Check(SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255), "SDL_SetRenderDrawColor");
    Check(SDL_RenderClear(renderer), "SDL_RenderClear");
}

void SdlRenderSurface::FillRect(const Rect& rect, Color color) {
    SDL_Renderer* renderer = device_->Renderer();
    SDL_Rect dst{ rect.x, rect.y, rect.w, rect.h };
    Check(SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, 255), "SDL_SetRenderDrawColor");
    Check(SDL_RenderFillRect(renderer, &dst), "SDL_RenderFillRect");
}

void SdlRenderSurface::DrawText(int x, int y, const std::string& text, Color color, FontSize size) {
    if (text.empty()) {
        return;
    }
    TTF_Font* font = FontFor(size);
    if (!font) {
        throw SurfaceError("font not loaded");
    }
    int w = 0;
    int h = 0;
    SDL_Texture* tex = RenderText(device_->Renderer(), font, text, SDL_Color{ color.r, color.g, color.b, 255 }, &w, &h);
    SDL_Rect dst{ x, y, w, h };
    int rc = SDL_RenderCopy(device_->Renderer(), tex, nullptr, &dst);
    SDL_DestroyTexture(tex);
    Check(rc, "SDL_RenderCopy");
}

const SdlRenderSurface::ImageTexture& SdlRenderSurface::TextureFor(const Image& image) {
    auto it = images_.find(image.key);
    if (it != images_.end()) {
        return it->second;
    }

    SDL_RWops* rw = SDL_RWFromConstMem(image.bytes.data(), static_cast<int>(image.bytes.size()));
    if (!rw) {
        throw SurfaceError(std::string("SDL_RWFromConstMem failed: ") + SDL_GetError());
    }
    SDL_Surface* surface = IMG_Load_RW(rw, 1);
    if (!surface) {
        throw SurfaceError("IMG_Load_RW failed for " + image.key + ": " + IMG_GetError());
    }
    SDL_Texture* texture = SDL_CreateTextureFromSurface(device_->Renderer(), surface);
    if (!texture) {
        SDL_FreeSurface(surface);
        throw SurfaceError(std::string("SDL_CreateTextureFromSurface failed: ") + SDL_GetError());
    }
    ImageTexture entry;
    entry.texture = texture;
    entry.w = surface->w;
    entry.h = surface->h;
    SDL_FreeSurface(surface);
    return images_.emplace(image.key, entry).first->second;
}

void SdlRenderSurface::DrawImage(int x, int y, const Image& image) {
    if (image.bytes.empty()) {
        return;
    }
    const ImageTexture& entry = TextureFor(image);
    SDL_Rect dst{ x, y, entry.w, entry.h };
    Check(SDL_RenderCopy(device_->Renderer(), entry.texture, nullptr, &dst), "SDL_RenderCopy");
}

void SdlRenderSurface::ClearImages() {
    for (auto& [_, entry] : images_) {
        if (entry.texture) {
            SDL_DestroyTexture(entry.texture);
            entry.texture = nullptr;
        }
    }
    images_.clear();
}

void SdlRenderSurface::Flush() {
    device_->Present();
}
