#pragma once

#include "engine/ConditionsSummary.h"
#include "engine/MetricDeriver.h"
#include "engine/WindowSummarizer.h"
#include "model/RaceData.h"
#include "views/ViewText.h"

#include <SDL.h>
#include <SDL_ttf.h>

#include <string>
#include <vector>

class ConditionSprites;

// One vertical bar per year spanning the metric range over the race window,
// coloured by heat-stress severity. The selected year is outlined.
class YearlyChartView {
public:
    YearlyChartView(SDL_Renderer* renderer, TTF_Font* label_font, ConditionSprites* sprites);
    ~YearlyChartView();

    YearlyChartView(const YearlyChartView&) = delete;
    YearlyChartView& operator=(const YearlyChartView&) = delete;

    void Render(const SDL_Rect& area,
                const RaceDataset& race,
                const ChartSettings& settings,
                const MetricDeriver::Domain& domain,
                int selected_year);

private:
    struct YearBar {
        int year = 0;
        std::string label;
        WindowSummary summary;
        ConditionIcon icon = ConditionIcon::Sun;
    };

    std::vector<YearBar> BuildBars(const RaceDataset& race, const ChartSettings& settings) const;
    void DrawBar(const SDL_Rect& bar, const WindowSummary& summary);

    SDL_Renderer* renderer_;
    TTF_Font* label_font_;
    ConditionSprites* sprites_;

    std::vector<CachedText> tick_texts_;
    std::vector<CachedText> year_texts_;
    CachedText threshold_text_;
};
