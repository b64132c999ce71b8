#pragma once

#include "engine/ColorClassifier.h"
#include "engine/PathBuilder.h"

#include <SDL.h>

#include <vector>

namespace ChartDraw {

void SetColor(SDL_Renderer* renderer, const RgbColor& color, uint8_t alpha = 255);
RgbColor Mix(const RgbColor& a, const RgbColor& b, double t);

void DashedHLine(SDL_Renderer* renderer, int x1, int x2, int y, int dash, int gap);
void DashedVLine(SDL_Renderer* renderer, int x, int y1, int y2, int dash, int gap);

// Polyline in pixel space; width > 1 is drawn as vertically offset copies.
void Polyline(SDL_Renderer* renderer, const std::vector<PlotPoint>& points, int width);
}
