#pragma once

#include "engine/MetricDeriver.h"
#include "model/RaceData.h"
#include "views/HourlyChartView.h"
#include "views/ViewText.h"
#include "views/YearlyChartView.h"

#include <SDL.h>
#include <SDL_ttf.h>

class ConditionSprites;

class RaceColumnView {
public:
    RaceColumnView(SDL_Renderer* renderer,
                   TTF_Font* title_font,
                   TTF_Font* body_font,
                   TTF_Font* small_font,
                   ConditionSprites* sprites);
    ~RaceColumnView();

    RaceColumnView(const RaceColumnView&) = delete;
    RaceColumnView& operator=(const RaceColumnView&) = delete;

    void Render(const SDL_Rect& area,
                const RaceDataset& race,
                const ChartSettings& settings,
                ViewMode view_mode,
                const MetricDeriver::Domain& domain,
                int selected_year);

private:
    SDL_Renderer* renderer_;
    TTF_Font* title_font_;
    TTF_Font* body_font_;
    TTF_Font* small_font_;

    YearlyChartView yearly_view_;
    HourlyChartView hourly_view_;

    CachedText title_text_;
    CachedText subtitle_text_;
    CachedText chart_title_text_;
    CachedText footnote_text_;
    CachedText legend_text_;
    CachedText detail_text_;
};
