#include "views/RaceColumnView.h"

#include "engine/ColorClassifier.h"
#include "engine/RaceMetadata.h"
#include "engine/YearDetail.h"
#include "util/TextUtil.h"
#include "util/TimeCodec.h"
#include "views/ChartDraw.h"

#include <algorithm>
#include <array>
#include <string>

namespace {

std::string MonthLabel(const RaceDataset& race) {
    static const std::array<const char*, 12> kMonths = {
        "JAN", "FEB", "MAR", "APR", "MAY", "JUN", "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"
    };
    if (race.history.empty()) {
        return "";
    }
    int month = TimeCodec::MonthOfDate(race.history.front().race_date);
    return month == 0 ? "" : kMonths[month - 1];
}

std::string YearRange(const RaceDataset& race) {
    if (race.history.empty()) {
        return "";
    }
    auto bounds = std::minmax_element(race.history.begin(), race.history.end(),
                                      [](const YearSeries& a, const YearSeries& b) {
                                          return a.year < b.year;
                                      });
    return std::to_string(bounds.first->year) + " (light) - " + std::to_string(bounds.second->year) + " (dark)";
}

std::string SeverityLegend() {
    static const char* kRanges[] = { "<100", "100-120", ">120" };
    const Severity severities[] = { Severity::Ideal, Severity::Caution, Severity::Danger };
    std::string legend;
    for (int i = 0; i < 3; ++i) {
        legend += std::string(kRanges[i]) + " " + ColorClassifier::SeverityName(severities[i]) + "   ";
    }
    return legend + "(temp+dew F)";
}

const YearSeries* FindYear(const RaceDataset& race, int year) {
    for (const auto& series : race.history) {
        if (series.year == year) {
            return &series;
        }
    }
    return nullptr;
}

} // namespace

RaceColumnView::RaceColumnView(SDL_Renderer* renderer,
                               TTF_Font* title_font,
                               TTF_Font* body_font,
                               TTF_Font* small_font,
                               ConditionSprites* sprites)
    : renderer_(renderer),
      title_font_(title_font),
      body_font_(body_font),
      small_font_(small_font),
      yearly_view_(renderer, small_font, sprites),
      hourly_view_(renderer, small_font, body_font) {}

RaceColumnView::~RaceColumnView() {
    ViewText::Destroy(title_text_);
    ViewText::Destroy(subtitle_text_);
    ViewText::Destroy(chart_title_text_);
    ViewText::Destroy(footnote_text_);
    ViewText::Destroy(legend_text_);
    ViewText::Destroy(detail_text_);
}

void RaceColumnView::Render(const SDL_Rect& area,
                            const RaceDataset& race,
                            const ChartSettings& settings,
                            ViewMode view_mode,
                            const MetricDeriver::Domain& domain,
                            int selected_year) {
    SDL_Color fg = { 28, 28, 28, 255 };
    SDL_Color dim = { 110, 110, 110, 255 };

    ChartDraw::SetColor(renderer_, { 200, 200, 200 });
    SDL_RenderDrawRect(renderer_, &area);

    CountryInfo country = RaceMetadata::CountryForLocation(race.location);
    std::string country_label = country.code.empty() ? country.name : country.code;
    std::string city = TextUtil::FirstToken(race.location);
    std::string subtitle = (city.empty() || city == country.name ? "" : city + ", ") + country_label + "  " + MonthLabel(race);

    ViewText::Update(renderer_, title_text_, title_font_, ViewText::Truncate(title_font_, race.race_name, area.w - 20), fg);
    ViewText::Update(renderer_, subtitle_text_, body_font_, ViewText::Truncate(body_font_, subtitle, area.w - 20), dim);
    ViewText::Update(renderer_, chart_title_text_, body_font_,
                     settings.metric == Metric::Temp ? "Temperature" : "Temperature + Dew Point", dim);

    int y = area.y + 10;
    ViewText::Draw(renderer_, title_text_, area.x + 10, y);
    y += title_text_.h + 2;
    ViewText::Draw(renderer_, subtitle_text_, area.x + 10, y);
    y += subtitle_text_.h + 8;
    ViewText::Draw(renderer_, chart_title_text_, area.x + 10, y);
    y += chart_title_text_.h + 4;

    RaceInfo info = RaceMetadata::Lookup(race.id);
    std::string footnote = view_mode == ViewMode::Yearly ? info.footnote : "";
    ViewText::Update(renderer_, footnote_text_, small_font_, ViewText::Truncate(small_font_, footnote, area.w - 20), dim);

    std::string legend = view_mode == ViewMode::Hourly
                             ? YearRange(race)
                             : SeverityLegend();
    ViewText::Update(renderer_, legend_text_, small_font_, ViewText::Truncate(small_font_, legend, area.w - 20), dim);

    const YearSeries* selected = FindYear(race, selected_year);
    std::string detail = selected == nullptr
                             ? ""
                             : YearDetail::Describe(YearDetail::Compute(*selected, settings), settings.unit);
    ViewText::Update(renderer_, detail_text_, small_font_, ViewText::Truncate(small_font_, detail, area.w - 20), fg);

    int footer_h = legend_text_.h + footnote_text_.h + detail_text_.h + 12;
    SDL_Rect chart{ area.x + 4, y, area.w - 8, std::max(40, area.y + area.h - y - footer_h) };
    if (view_mode == ViewMode::Yearly) {
        yearly_view_.Render(chart, race, settings, domain, selected_year);
    } else {
        hourly_view_.Render(chart, race, settings, domain, selected_year);
    }

    int footer_y = chart.y + chart.h + 4;
    ViewText::Draw(renderer_, detail_text_, area.x + 10, footer_y);
    footer_y += detail_text_.h;
    ViewText::Draw(renderer_, footnote_text_, area.x + 10, footer_y);
    footer_y += footnote_text_.h;
    if (view_mode == ViewMode::Yearly) {
        int swatch_x = area.x + 10;
        for (Severity severity : { Severity::Ideal, Severity::Caution, Severity::Danger }) {
            SDL_Rect swatch{ swatch_x, footer_y + 4, 8, 8 };
            ChartDraw::SetColor(renderer_, ColorClassifier::SeverityColor(severity));
            SDL_RenderFillRect(renderer_, &swatch);
            swatch_x += 12;
        }
        ViewText::Draw(renderer_, legend_text_, swatch_x + 4, footer_y);
    } else {
        ViewText::Draw(renderer_, legend_text_, area.x + 10, footer_y);
    }
}
