#include "views/ChartDraw.h"

#include <algorithm>
#include <cmath>

namespace ChartDraw {

void SetColor(SDL_Renderer* renderer, const RgbColor& color, uint8_t alpha) {
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, alpha);
}

RgbColor Mix(const RgbColor& a, const RgbColor& b, double t) {
    t = std::clamp(t, 0.0, 1.0);
    auto channel = [t](uint8_t from, uint8_t to) {
        return static_cast<uint8_t>(std::lround(from + t * (to - from)));
    };
    return { channel(a.r, b.r), channel(a.g, b.g), channel(a.b, b.b) };
}

void DashedHLine(SDL_Renderer* renderer, int x1, int x2, int y, int dash, int gap) {
    if (x2 < x1) {
        std::swap(x1, x2);
    }
    int step = std::max(1, dash + gap);
    for (int x = x1; x <= x2; x += step) {
        SDL_RenderDrawLine(renderer, x, y, std::min(x + dash - 1, x2), y);
    }
}

void DashedVLine(SDL_Renderer* renderer, int x, int y1, int y2, int dash, int gap) {
    if (y2 < y1) {
        std::swap(y1, y2);
    }
    int step = std::max(1, dash + gap);
    for (int y = y1; y <= y2; y += step) {
        SDL_RenderDrawLine(renderer, x, y, x, std::min(y + dash - 1, y2));
    }
}

void Polyline(SDL_Renderer* renderer, const std::vector<PlotPoint>& points, int width) {
    if (points.size() < 2) {
        return;
    }
    std::vector<SDL_Point> pixels;
    pixels.reserve(points.size());
    for (const auto& p : points) {
        pixels.push_back({ static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)) });
    }
    int half = std::max(1, width) / 2;
    for (int offset = -half; offset <= half; ++offset) {
        if (offset == 0) {
            SDL_RenderDrawLines(renderer, pixels.data(), static_cast<int>(pixels.size()));
            continue;
        }
        std::vector<SDL_Point> shifted = pixels;
        for (auto& p : shifted) {
            p.y += offset;
        }
        SDL_RenderDrawLines(renderer, shifted.data(), static_cast<int>(shifted.size()));
    }
}

} // namespace ChartDraw
