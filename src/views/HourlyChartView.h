#pragma once

#include "engine/MetricDeriver.h"
#include "model/RaceData.h"
#include "views/ViewText.h"

#include <SDL.h>
#include <SDL_ttf.h>

#include <vector>

// Overlay of one smoothed curve per year across the race window, with start
// and finish markers. A selected year is drawn on top and the rest faded.
class HourlyChartView {
public:
    HourlyChartView(SDL_Renderer* renderer, TTF_Font* label_font, TTF_Font* marker_font);
    ~HourlyChartView();

    HourlyChartView(const HourlyChartView&) = delete;
    HourlyChartView& operator=(const HourlyChartView&) = delete;

    void Render(const SDL_Rect& area,
                const RaceDataset& race,
                const ChartSettings& settings,
                const MetricDeriver::Domain& domain,
                int selected_year);

private:
    SDL_Renderer* renderer_;
    TTF_Font* label_font_;
    TTF_Font* marker_font_;

    std::vector<CachedText> value_tick_texts_;
    std::vector<CachedText> hour_tick_texts_;
    CachedText start_text_;
    CachedText finish_text_;
    CachedText threshold_text_;
};
