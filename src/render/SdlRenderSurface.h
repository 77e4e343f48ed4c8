#pragma once

#include "render/RenderSurface.h"

#include <SDL.h>
#include <SDL_ttf.h>

#include <map>
#include <string>

class SdlDisplayDevice;

class SdlRenderSurface : public RenderSurface {
public:
    SdlRenderSurface(SdlDisplayDevice* device, const std::string& font_path);
    ~SdlRenderSurface() override;

    bool Open();
    void Close();

    int Width() const override;
    int Height() const override;

    void Clear() override;
    void FillRect(const Rect& rect, Color color) override;
    void DrawText(int x, int y, const std::string& text, Color color, FontSize size) override;
    void DrawImage(int x, int y, const Image& image) override;
    void ClearImages() override;
    void Flush() override;

private:
    struct ImageTexture {
        SDL_Texture* texture = nullptr;
        int w = 0;
        int h = 0;
    };

    TTF_Font* FontFor(FontSize size) const;
    const ImageTexture& TextureFor(const Image& image);

    SdlDisplayDevice* device_;
    std::string font_path_;
    TTF_Font* small_font_ = nullptr;
    TTF_Font* normal_font_ = nullptr;
    TTF_Font* large_font_ = nullptr;
    std::map<std::string, ImageTexture> images_;
};
