#include "views/HourlyChartView.h"

#include "engine/ChartScale.h"
#include "engine/ColorClassifier.h"
#include "engine/PathBuilder.h"
#include "util/TimeCodec.h"
#include "views/ChartDraw.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace {

constexpr int kCurveSteps = 12;
constexpr uint8_t kDefaultAlpha = 204;
constexpr uint8_t kFadedAlpha = 26;

void ResizeTexts(std::vector<CachedText>& texts, size_t count) {
    for (size_t i = count; i < texts.size(); ++i) {
        ViewText::Destroy(texts[i]);
    }
    texts.resize(count);
}

} // namespace

HourlyChartView::HourlyChartView(SDL_Renderer* renderer, TTF_Font* label_font, TTF_Font* marker_font)
    : renderer_(renderer), label_font_(label_font), marker_font_(marker_font) {}

HourlyChartView::~HourlyChartView() {
    for (auto& text : value_tick_texts_) {
        ViewText::Destroy(text);
    }
    for (auto& text : hour_tick_texts_) {
        ViewText::Destroy(text);
    }
    ViewText::Destroy(start_text_);
    ViewText::Destroy(finish_text_);
    ViewText::Destroy(threshold_text_);
}

void HourlyChartView::Render(const SDL_Rect& area,
                             const RaceDataset& race,
                             const ChartSettings& settings,
                             const MetricDeriver::Domain& domain,
                             int selected_year) {
    SDL_Color dim = { 148, 163, 184, 255 };
    SDL_Color fg = { 0, 0, 0, 255 };

    PlotArea plot{
        static_cast<double>(area.x + 30),
        static_cast<double>(area.y + 20),
        static_cast<double>(std::max(1, area.w - 50)),
        static_cast<double>(std::max(1, area.h - 50))
    };
    int plot_left = static_cast<int>(plot.x);
    int plot_right = static_cast<int>(plot.x + plot.w);
    int plot_top = static_cast<int>(plot.y);
    int plot_bottom = static_cast<int>(plot.y + plot.h);

    ViewWindow window = ChartScale::HourlyWindow(race, settings);
    auto map_x = [&](double hour) {
        return ChartScale::MapX(plot, hour, window.view_start_hour, window.view_end_hour);
    };
    auto map_y = [&](double value) {
        return ChartScale::MapY(plot, value, domain);
    };

    std::vector<int> value_ticks = ChartScale::ValueTicks(domain);
    ResizeTexts(value_tick_texts_, value_ticks.size());
    for (size_t i = 0; i < value_ticks.size(); ++i) {
        int y = static_cast<int>(std::lround(map_y(value_ticks[i])));
        ChartDraw::SetColor(renderer_, { 226, 232, 240 });
        ChartDraw::DashedHLine(renderer_, plot_left, plot_right, y, 4, 4);
        ViewText::Update(renderer_, value_tick_texts_[i], label_font_, std::to_string(value_ticks[i]) + "\xC2\xB0", dim);
        ViewText::Draw(renderer_, value_tick_texts_[i], plot_left - 5, y - value_tick_texts_[i].h / 2, 2);
    }

    std::vector<int> hour_ticks = ChartScale::HourTicks(window.view_start_hour, window.view_end_hour);
    ResizeTexts(hour_tick_texts_, hour_ticks.size());
    for (size_t i = 0; i < hour_ticks.size(); ++i) {
        int x = static_cast<int>(std::lround(map_x(hour_ticks[i])));
        ChartDraw::SetColor(renderer_, { 241, 245, 249 });
        SDL_RenderDrawLine(renderer_, x, plot_top, x, plot_bottom);
        ViewText::Update(renderer_, hour_tick_texts_[i], label_font_, TimeCodec::FormatHourTick(hour_ticks[i]), dim);
        ViewText::Draw(renderer_, hour_tick_texts_[i], x, plot_bottom + 6, 1);
    }

    if (MetricDeriver::ShowPaceThreshold(settings.metric, settings.unit, domain)) {
        int y = static_cast<int>(std::lround(map_y(MetricDeriver::PaceThreshold(settings.unit))));
        ChartDraw::SetColor(renderer_, { 0, 0, 0 }, 128);
        ChartDraw::DashedHLine(renderer_, plot_left, plot_right, y, 2, 2);
        ViewText::Update(renderer_, threshold_text_, label_font_, ">1% pace", fg);
        ViewText::Draw(renderer_, threshold_text_, plot_right, y - threshold_text_.h - 2, 2);
    }

    int start_x = static_cast<int>(std::lround(map_x(window.race_start_hour)));
    int finish_x = static_cast<int>(std::lround(map_x(window.race_end_hour)));
    ChartDraw::SetColor(renderer_, { 0, 0, 0 }, 150);
    ChartDraw::DashedVLine(renderer_, start_x, plot_top, plot_bottom, 4, 4);
    ChartDraw::DashedVLine(renderer_, finish_x, plot_top, plot_bottom, 4, 4);
    ViewText::Update(renderer_, start_text_, marker_font_, "Start (" + TimeCodec::Format(window.race_start_hour) + ")", fg);
    ViewText::Update(renderer_, finish_text_, marker_font_, "Finish (" + TimeCodec::Format(window.race_end_hour) + ")", fg);
    ViewText::Draw(renderer_, start_text_, start_x + 4, plot_top - start_text_.h - 2, 0);
    ViewText::Draw(renderer_, finish_text_, finish_x, plot_top - finish_text_.h - 2, 2);

    // Oldest year first so the darkest (newest) curve is drawn on top.
    std::vector<YearSeries> years = race.history;
    std::stable_sort(years.begin(), years.end(), [](const YearSeries& a, const YearSeries& b) {
        return a.year < b.year;
    });

    std::vector<PlotPoint> selected_strip;
    RgbColor selected_color;
    for (size_t i = 0; i < years.size(); ++i) {
        if (years[i].samples.empty()) {
            continue;
        }
        std::vector<HourlyPoint> raw = PathBuilder::Build(years[i], window.view_start_hour, window.view_end_hour);
        if (raw.empty()) {
            continue;
        }
        std::vector<PlotPoint> pixels;
        pixels.reserve(raw.size());
        for (const auto& value : PathBuilder::DeriveValues(raw, settings.metric, settings.unit)) {
            pixels.push_back({ map_x(value.x), map_y(value.y) });
        }
        std::vector<PlotPoint> strip = PathBuilder::Flatten(PathBuilder::SmoothSegments(pixels), kCurveSteps);

        RgbColor color = ColorClassifier::YearColor(static_cast<int>(i), static_cast<int>(years.size()));
        if (years[i].year == selected_year) {
            selected_strip = std::move(strip);
            selected_color = color;
            continue;
        }
        ChartDraw::SetColor(renderer_, color, selected_year != 0 ? kFadedAlpha : kDefaultAlpha);
        ChartDraw::Polyline(renderer_, strip, 2);
    }

    if (!selected_strip.empty()) {
        ChartDraw::SetColor(renderer_, selected_color);
        ChartDraw::Polyline(renderer_, selected_strip, 3);
    }
}
