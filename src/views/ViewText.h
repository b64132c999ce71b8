#pragma once

#include <SDL.h>
#include <SDL_ttf.h>

#include <string>

struct CachedText {
    std::string text;
    SDL_Texture* texture = nullptr;
    int w = 0;
    int h = 0;
    SDL_Color color{ 0, 0, 0, 0 };
};

namespace ViewText {

// Re-renders only when text or colour changed. Empty text clears the cache.
void Update(SDL_Renderer* renderer, CachedText& cache, TTF_Font* font, const std::string& text, SDL_Color color);
void Destroy(CachedText& cache);

// Draws with the given anchor: align 0 = left, 1 = centre, 2 = right edge at x.
void Draw(SDL_Renderer* renderer, const CachedText& cache, int x, int y, int align = 0);

std::string Truncate(TTF_Font* font, const std::string& text, int max_width);
}
