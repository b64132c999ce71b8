#include "views/YearlyChartView.h"

#include "engine/ChartScale.h"
#include "engine/RaceMetadata.h"
#include "util/TimeCodec.h"
#include "views/ChartDraw.h"
#include "views/ConditionSprites.h"

#include <algorithm>
#include <cmath>

namespace {

void ResizeTexts(std::vector<CachedText>& texts, size_t count) {
    for (size_t i = count; i < texts.size(); ++i) {
        ViewText::Destroy(texts[i]);
    }
    texts.resize(count);
}

// Colour at `value` along stops ordered high to low.
RgbColor ColorAtValue(const std::vector<GradientStop>& stops, double value) {
    if (stops.empty()) {
        return ColorClassifier::SeverityColor(Severity::Ideal);
    }
    if (value >= stops.front().val) {
        return ColorClassifier::SeverityColor(stops.front().severity);
    }
    for (size_t i = 0; i + 1 < stops.size(); ++i) {
        const GradientStop& hi = stops[i];
        const GradientStop& lo = stops[i + 1];
        if (value <= hi.val && value >= lo.val) {
            double span = hi.val - lo.val;
            double t = span > 0.0 ? (hi.val - value) / span : 0.0;
            return ChartDraw::Mix(ColorClassifier::SeverityColor(hi.severity),
                                  ColorClassifier::SeverityColor(lo.severity), t);
        }
    }
    return ColorClassifier::SeverityColor(stops.back().severity);
}

} // namespace

YearlyChartView::YearlyChartView(SDL_Renderer* renderer, TTF_Font* label_font, ConditionSprites* sprites)
    : renderer_(renderer), label_font_(label_font), sprites_(sprites) {}

YearlyChartView::~YearlyChartView() {
    for (auto& text : tick_texts_) {
        ViewText::Destroy(text);
    }
    for (auto& text : year_texts_) {
        ViewText::Destroy(text);
    }
    ViewText::Destroy(threshold_text_);
}

std::vector<YearlyChartView::YearBar> YearlyChartView::BuildBars(const RaceDataset& race,
                                                                 const ChartSettings& settings) const {
    std::vector<YearSeries> years = race.history;
    std::stable_sort(years.begin(), years.end(), [](const YearSeries& a, const YearSeries& b) {
        return a.year < b.year;
    });

    std::vector<YearBar> bars;
    bars.reserve(years.size());
    for (const auto& year : years) {
        if (year.samples.empty()) {
            continue;
        }
        double start = TimeCodec::StartHour(year, settings.time_mode, settings.mass_offset_min);
        double end = start + settings.duration_hours;

        YearBar bar;
        bar.year = year.year;
        bar.label = RaceMetadata::YearLabel(race.id, year.year);
        bar.summary = WindowSummarizer::Summarize(year, start, end, settings.metric, settings.unit);
        bar.icon = ConditionsSummary::IconForWindow(year, start, end);
        bars.push_back(std::move(bar));
    }
    return bars;
}

void YearlyChartView::DrawBar(const SDL_Rect& bar, const WindowSummary& summary) {
    for (int row = 0; row < bar.h; ++row) {
        double t = bar.h > 1 ? static_cast<double>(row) / (bar.h - 1) : 0.0;
        double value = summary.max_val - t * (summary.max_val - summary.min_val);
        ChartDraw::SetColor(renderer_, ColorAtValue(summary.points, value));
        SDL_RenderDrawLine(renderer_, bar.x, bar.y + row, bar.x + bar.w - 1, bar.y + row);
    }
}

void YearlyChartView::Render(const SDL_Rect& area,
                             const RaceDataset& race,
                             const ChartSettings& settings,
                             const MetricDeriver::Domain& domain,
                             int selected_year) {
    SDL_Color dim = { 148, 163, 184, 255 };
    SDL_Color fg = { 28, 28, 28, 255 };
    const RgbColor grid = { 226, 232, 240 };

    PlotArea plot{
        static_cast<double>(area.x + 45),
        static_cast<double>(area.y + 20),
        static_cast<double>(std::max(1, area.w - 65)),
        static_cast<double>(std::max(1, area.h - 70))
    };

    std::vector<int> ticks = ChartScale::ValueTicks(domain);
    ResizeTexts(tick_texts_, ticks.size());
    ChartDraw::SetColor(renderer_, grid);
    for (size_t i = 0; i < ticks.size(); ++i) {
        int y = static_cast<int>(std::lround(ChartScale::MapY(plot, ticks[i], domain)));
        ChartDraw::DashedHLine(renderer_, static_cast<int>(plot.x), static_cast<int>(plot.x + plot.w), y, 4, 4);
        ViewText::Update(renderer_, tick_texts_[i], label_font_, std::to_string(ticks[i]) + "\xC2\xB0", dim);
        ViewText::Draw(renderer_, tick_texts_[i], static_cast<int>(plot.x) - 5, y - tick_texts_[i].h / 2, 2);
    }

    if (MetricDeriver::ShowPaceThreshold(settings.metric, settings.unit, domain)) {
        int y = static_cast<int>(std::lround(ChartScale::MapY(plot, MetricDeriver::PaceThreshold(settings.unit), domain)));
        ChartDraw::SetColor(renderer_, { 0, 0, 0 }, 128);
        ChartDraw::DashedHLine(renderer_, static_cast<int>(plot.x), static_cast<int>(plot.x + plot.w), y, 2, 2);
        ViewText::Update(renderer_, threshold_text_, label_font_, ">1% pace", fg);
        ViewText::Draw(renderer_, threshold_text_, static_cast<int>(plot.x + plot.w), y - threshold_text_.h - 2, 2);
    }

    std::vector<YearBar> bars = BuildBars(race, settings);
    ResizeTexts(year_texts_, bars.size());
    if (bars.empty()) {
        return;
    }

    double slot_w = plot.w / bars.size();
    int bar_w = ChartScale::BarWidth(slot_w);
    for (size_t i = 0; i < bars.size(); ++i) {
        const YearBar& bar = bars[i];
        int center_x = static_cast<int>(std::lround(plot.x + slot_w * (i + 0.5)));

        BarSpan span = ChartScale::PillSpan(
            static_cast<int>(std::lround(ChartScale::MapY(plot, bar.summary.max_val, domain))),
            static_cast<int>(std::lround(ChartScale::MapY(plot, bar.summary.min_val, domain))),
            bar_w);
        SDL_Rect rect{ center_x - bar_w / 2, span.top, bar_w, span.bottom - span.top };
        DrawBar(rect, bar.summary);
        if (bar.year == selected_year) {
            SDL_Rect outline{ rect.x - 2, rect.y - 2, rect.w + 4, rect.h + 4 };
            ChartDraw::SetColor(renderer_, { 15, 23, 42 });
            SDL_RenderDrawRect(renderer_, &outline);
        }

        int label_y = static_cast<int>(plot.y + plot.h) + 6;
        ViewText::Update(renderer_, year_texts_[i], label_font_, bar.label, dim);
        ViewText::Draw(renderer_, year_texts_[i], center_x, label_y, 1);

        if (sprites_) {
            SDL_Rect icon{ center_x - 8, label_y + year_texts_[i].h + 2, 16, 16 };
            sprites_->Draw(bar.icon, icon);
        }
    }
}
