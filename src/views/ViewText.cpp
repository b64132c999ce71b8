#include "views/ViewText.h"

#include "util/TextUtil.h"

#include <iostream>

namespace ViewText {

namespace {

SDL_Texture* RenderText(SDL_Renderer* renderer, TTF_Font* font, const std::string& text, SDL_Color color, int* w, int* h) {
    SDL_Surface* surface = TTF_RenderUTF8_Blended(font, text.c_str(), color);
    if (!surface) {
        std::cerr << "TTF_RenderUTF8_Blended failed: " << TTF_GetError() << "\n";
        return nullptr;
    }
    SDL_Texture* tex = SDL_CreateTextureFromSurface(renderer, surface);
    if (!tex) {
        std::cerr << "SDL_CreateTextureFromSurface failed: " << SDL_GetError() << "\n";
        SDL_FreeSurface(surface);
        return nullptr;
    }
    *w = surface->w;
    *h = surface->h;
    SDL_FreeSurface(surface);
    return tex;
}

bool SameColor(const SDL_Color& a, const SDL_Color& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

} // namespace

void Update(SDL_Renderer* renderer, CachedText& cache, TTF_Font* font, const std::string& text, SDL_Color color) {
    if (text.empty()) {
        Destroy(cache);
        cache.text.clear();
        cache.w = 0;
        cache.h = 0;
        cache.color = color;
        return;
    }
    if (cache.texture && cache.text == text && SameColor(cache.color, color)) {
        return;
    }
    Destroy(cache);
    cache.text = text;
    cache.color = color;
    cache.texture = RenderText(renderer, font, text, color, &cache.w, &cache.h);
}

void Destroy(CachedText& cache) {
    if (cache.texture) {
        SDL_DestroyTexture(cache.texture);
        cache.texture = nullptr;
    }
}

void Draw(SDL_Renderer* renderer, const CachedText& cache, int x, int y, int align) {
    if (!cache.texture) {
        return;
    }
    int left = x;
    if (align == 1) {
        left = x - cache.w / 2;
    } else if (align == 2) {
        left = x - cache.w;
    }
    SDL_Rect dst{ left, y, cache.w, cache.h };
    SDL_RenderCopy(renderer, cache.texture, nullptr, &dst);
}

std::string Truncate(TTF_Font* font, const std::string& text, int max_width) {
    int w = 0;
    int h = 0;
    if (TTF_SizeUTF8(font, text.c_str(), &w, &h) == 0 && w <= max_width) {
        return text;
    }
    const std::string ellipsis = "...";
    size_t len = text.size();
    while (len > 0) {
        len = TextUtil::Utf8Boundary(text, len - 1);
        if (len == 0) {
            break;
        }
        std::string candidate = text.substr(0, len) + ellipsis;
        if (TTF_SizeUTF8(font, candidate.c_str(), &w, &h) == 0 && w <= max_width) {
            return candidate;
        }
    }
    return ellipsis;
}

} // namespace ViewText
