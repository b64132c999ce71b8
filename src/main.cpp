#include <SDL.h>
#include <SDL_ttf.h>
#include <SDL_image.h>

#include <nlohmann/json.hpp>

#include "data/RaceDataLoader.h"
#include "engine/MetricDeriver.h"
#include "engine/YearDetail.h"
#include "util/TimeCodec.h"
#include "views/ConditionSprites.h"
#include "views/RaceColumnView.h"
#include "views/ViewText.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

struct AppConfig {
    std::string data_path = "./data/marathon_data.json";
    std::string font_path = "./assets/DejaVuSans.ttf";
    std::string sprite_dir = "./assets/sprites";
    int window_width = 1280;
    int window_height = 720;
    bool fullscreen = false;
    ChartSettings settings;
    ViewMode view_mode = ViewMode::Yearly;
};

namespace {

constexpr int kMinDurationMin = 120;
constexpr int kMaxDurationMin = 420;

bool LoadConfig(const std::string& path, AppConfig* out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to open config: " << path << "\n";
        return false;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& ex) {
        std::cerr << "Failed to parse config: " << ex.what() << "\n";
        return false;
    }

    out->data_path = j.value("data_path", out->data_path);
    out->font_path = j.value("font_path", out->font_path);
    out->sprite_dir = j.value("sprite_dir", out->sprite_dir);
    out->window_width = j.value("window_width", out->window_width);
    out->window_height = j.value("window_height", out->window_height);
    out->fullscreen = j.value("fullscreen", out->fullscreen);
    out->settings.duration_hours = j.value("duration_hours", out->settings.duration_hours);
    out->settings.mass_offset_min = j.value("mass_offset_min", out->settings.mass_offset_min);

    std::string mode = j.value("time_mode", std::string(TimeCodec::TimeModeName(out->settings.time_mode)));
    if (!TimeCodec::TimeModeFromName(mode, &out->settings.time_mode)) {
        std::cerr << "Unknown time_mode '" << mode << "', using mass\n";
        out->settings.time_mode = TimeMode::Mass;
    }
    std::string metric = j.value("metric", std::string("temp"));
    if (!MetricDeriver::MetricFromName(metric, &out->settings.metric)) {
        std::cerr << "Unknown metric '" << metric << "', using temp\n";
    }
    std::string unit = j.value("unit", std::string("F"));
    if (!MetricDeriver::UnitFromName(unit, &out->settings.unit)) {
        std::cerr << "Unknown unit '" << unit << "', using F\n";
    }
    out->view_mode = j.value("view", std::string("yearly")) == "hourly" ? ViewMode::Hourly : ViewMode::Yearly;

    int duration_min = static_cast<int>(out->settings.duration_hours * 60.0 + 0.5);
    out->settings.duration_hours = std::clamp(duration_min, kMinDurationMin, kMaxDurationMin) / 60.0;
    return true;
}

TimeMode NextTimeMode(TimeMode mode) {
    switch (mode) {
        case TimeMode::Mass: return TimeMode::EliteMen;
        case TimeMode::EliteMen: return TimeMode::EliteWomen;
        case TimeMode::EliteWomen: return TimeMode::Mass;
    }
    return TimeMode::Mass;
}

std::string StatusLine(const ChartSettings& settings, ViewMode view_mode, int selected_year) {
    std::string mode;
    switch (settings.time_mode) {
        case TimeMode::Mass: mode = "Mass start"; break;
        case TimeMode::EliteMen: mode = "Elite men"; break;
        case TimeMode::EliteWomen: mode = "Elite women"; break;
    }
    return "Finish time " + TimeCodec::FormatDuration(settings.duration_hours) +
           "  |  " + (settings.metric == Metric::Temp ? "Temp" : "Temp + Dew") +
           "  |  " + MetricDeriver::UnitSymbol(settings.unit) +
           "  |  " + mode +
           "  |  " + (view_mode == ViewMode::Yearly ? "Yearly" : "Hourly") +
           (selected_year != 0 ? "  |  " + std::to_string(selected_year) : std::string()) +
           "    [<-/->] time  [Up/Down] year  [M]etric  [U]nit  [V]iew  [E] start";
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = "config/config.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    AppConfig config;
    if (!LoadConfig(config_path, &config)) {
        return 1;
    }

    std::vector<RaceDataset> races;
    std::string load_error;
    if (!RaceDataLoader::LoadFromFile(config.data_path, &races, &load_error)) {
        std::cerr << "Failed to load race data: " << load_error << "\n";
        return 1;
    }
    RaceDataLoader::SortByRaceMonth(&races);
    if (races.empty()) {
        std::cerr << "No races in " << config.data_path << "\n";
        return 1;
    }

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    if (TTF_Init() != 0) {
        std::cerr << "TTF_Init failed: " << TTF_GetError() << "\n";
        SDL_Quit();
        return 1;
    }

    if ((IMG_Init(IMG_INIT_PNG) & IMG_INIT_PNG) == 0) {
        std::cerr << "IMG_Init failed: " << IMG_GetError() << "\n";
    }

    Uint32 window_flags = SDL_WINDOW_SHOWN | (config.fullscreen ? SDL_WINDOW_FULLSCREEN_DESKTOP : SDL_WINDOW_RESIZABLE);
    SDL_Window* window = SDL_CreateWindow(
        "Race Day Conditions",
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        config.window_width,
        config.window_height,
        window_flags
    );

    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        IMG_Quit();
        TTF_Quit();
        SDL_Quit();
        return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window);
        IMG_Quit();
        TTF_Quit();
        SDL_Quit();
        return 1;
    }
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    TTF_Font* font_title = TTF_OpenFont(config.font_path.c_str(), 22);
    TTF_Font* font_body = TTF_OpenFont(config.font_path.c_str(), 14);
    TTF_Font* font_small = TTF_OpenFont(config.font_path.c_str(), 11);

    if (!font_title || !font_body || !font_small) {
        std::cerr << "Failed to load font: " << config.font_path << "\n";
        if (font_title) TTF_CloseFont(font_title);
        if (font_body) TTF_CloseFont(font_body);
        if (font_small) TTF_CloseFont(font_small);
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        IMG_Quit();
        TTF_Quit();
        SDL_Quit();
        return 1;
    }

    {
        ConditionSprites sprites(renderer, config.sprite_dir);
        if (!sprites.Loaded()) {
            std::cerr << "No condition sprites loaded from " << config.sprite_dir << ", icons disabled" << std::endl;
        }
        std::vector<std::unique_ptr<RaceColumnView>> columns;
        for (size_t i = 0; i < races.size(); ++i) {
            columns.push_back(std::make_unique<RaceColumnView>(renderer, font_title, font_body, font_small, &sprites));
        }

        ChartSettings& settings = config.settings;
        ViewMode view_mode = config.view_mode;
        MetricDeriver::Domain domain = MetricDeriver::ValueDomain(races, settings.metric, settings.unit);
        std::vector<int> all_years = YearDetail::AllYears(races);
        int selected_year = 0;
        CachedText status_text;
        bool capture_next_frame = false;

        bool running = true;
        while (running) {
            SDL_Event ev;
            while (SDL_PollEvent(&ev)) {
                if (ev.type == SDL_QUIT) {
                    running = false;
                } else if (ev.type == SDL_KEYDOWN) {
                    int step = (ev.key.keysym.mod & KMOD_SHIFT) ? 10 : 1;
                    int duration_min = static_cast<int>(settings.duration_hours * 60.0 + 0.5);
                    bool rescale = false;

                    switch (ev.key.keysym.sym) {
                        case SDLK_ESCAPE:
                            running = false;
                            break;
                        case SDLK_LEFT:
                            duration_min = std::max(kMinDurationMin, duration_min - step);
                            settings.duration_hours = duration_min / 60.0;
                            break;
                        case SDLK_RIGHT:
                            duration_min = std::min(kMaxDurationMin, duration_min + step);
                            settings.duration_hours = duration_min / 60.0;
                            break;
                        case SDLK_UP:
                            selected_year = YearDetail::StepSelection(all_years, selected_year, -1);
                            break;
                        case SDLK_DOWN:
                            selected_year = YearDetail::StepSelection(all_years, selected_year, 1);
                            break;
                        case SDLK_m:
                            settings.metric = settings.metric == Metric::Temp ? Metric::Sum : Metric::Temp;
                            rescale = true;
                            break;
                        case SDLK_u:
                            settings.unit = settings.unit == Unit::F ? Unit::C : Unit::F;
                            rescale = true;
                            break;
                        case SDLK_v:
                            view_mode = view_mode == ViewMode::Yearly ? ViewMode::Hourly : ViewMode::Yearly;
                            break;
                        case SDLK_e:
                            settings.time_mode = NextTimeMode(settings.time_mode);
                            break;
                        case SDLK_s:
                            capture_next_frame = true;
                            break;
                        default:
                            break;
                    }
                    if (rescale) {
                        domain = MetricDeriver::ValueDomain(races, settings.metric, settings.unit);
                    }
                }
            }

            SDL_SetRenderDrawColor(renderer, 248, 250, 252, 255);
            SDL_RenderClear(renderer);

            int w = 0, h = 0;
            SDL_GetRendererOutputSize(renderer, &w, &h);

            int margin = std::max(8, w / 100);
            int status_h = 28;
            int column_w = (w - margin * static_cast<int>(races.size() + 1)) / static_cast<int>(races.size());
            for (size_t i = 0; i < races.size(); ++i) {
                SDL_Rect area{
                    margin + static_cast<int>(i) * (column_w + margin),
                    margin,
                    column_w,
                    h - 2 * margin - status_h
                };
                columns[i]->Render(area, races[i], settings, view_mode, domain, selected_year);
            }

            ViewText::Update(renderer, status_text, font_body, StatusLine(settings, view_mode, selected_year), { 71, 85, 105, 255 });
            ViewText::Draw(renderer, status_text, margin, h - margin - status_text.h);

            if (capture_next_frame) {
                SDL_Surface* shot = SDL_CreateRGBSurfaceWithFormat(0, w, h, 32, SDL_PIXELFORMAT_ARGB8888);
                if (shot) {
                    if (SDL_RenderReadPixels(renderer, nullptr, SDL_PIXELFORMAT_ARGB8888, shot->pixels, shot->pitch) == 0) {
                        if (SDL_SaveBMP(shot, "data/preview.bmp") != 0) {
                            std::cerr << "SDL_SaveBMP failed: " << SDL_GetError() << "\n";
                        }
                    } else {
                        std::cerr << "SDL_RenderReadPixels failed: " << SDL_GetError() << "\n";
                    }
                    SDL_FreeSurface(shot);
                } else {
                    std::cerr << "SDL_CreateRGBSurfaceWithFormat failed: " << SDL_GetError() << "\n";
                }
                capture_next_frame = false;
            }

            SDL_RenderPresent(renderer);

            SDL_Delay(33);
        }

        ViewText::Destroy(status_text);
    }

    TTF_CloseFont(font_title);
    TTF_CloseFont(font_body);
    TTF_CloseFont(font_small);

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    IMG_Quit();
    TTF_Quit();
    SDL_Quit();

    return 0;
}
