#include "views/ConditionSprites.h"

#include <SDL_image.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <iostream>

namespace {

std::string JoinPath(const std::string& dir, const std::string& file) {
    if (dir.empty()) {
        return file;
    }
    char last = dir.back();
    if (last == '/' || last == '\\') {
        return dir + file;
    }
    return dir + "/" + file;
}

} // namespace

ConditionSprites::ConditionSprites(SDL_Renderer* renderer, const std::string& sprite_dir)
    : renderer_(renderer), sprite_dir_(sprite_dir) {
    Load();
}

ConditionSprites::~ConditionSprites() {
    Clear();
}

void ConditionSprites::Load() {
    loaded_ = false;
    sprites_.clear();
    if (sprite_dir_.empty()) {
        return;
    }

    const std::array<ConditionIcon, 5> icons = {
        ConditionIcon::Sun,
        ConditionIcon::PartlySunny,
        ConditionIcon::Overcast,
        ConditionIcon::Rain,
        ConditionIcon::Snow
    };

    for (ConditionIcon icon : icons) {
        std::string key = ConditionsSummary::IconKey(icon);
        std::string path = JoinPath(sprite_dir_, key + ".png");
        SDL_Surface* surface = IMG_Load(path.c_str());
        if (!surface) {
            std::cerr << "ConditionSprites: missing " << path << ": " << IMG_GetError() << "\n";
            continue;
        }
        SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer_, surface);
        if (!texture) {
            std::cerr << "SDL_CreateTextureFromSurface failed: " << SDL_GetError() << "\n";
            SDL_FreeSurface(surface);
            continue;
        }
        SpriteTexture sprite;
        sprite.texture = texture;
        sprite.w = surface->w;
        sprite.h = surface->h;
        sprites_[key] = sprite;
        SDL_FreeSurface(surface);
        loaded_ = true;
    }
}

void ConditionSprites::Clear() {
    for (auto& [_, sprite] : sprites_) {
        if (sprite.texture) {
            SDL_DestroyTexture(sprite.texture);
            sprite.texture = nullptr;
        }
    }
    sprites_.clear();
    loaded_ = false;
}

bool ConditionSprites::Draw(ConditionIcon icon, const SDL_Rect& area) {
    auto it = sprites_.find(ConditionsSummary::IconKey(icon));
    if (it == sprites_.end() || !it->second.texture) {
        return false;
    }

    const SpriteTexture& sprite = it->second;
    float scale = std::min(static_cast<float>(std::max(1, area.w)) / std::max(1, sprite.w),
                           static_cast<float>(std::max(1, area.h)) / std::max(1, sprite.h));
    int draw_w = static_cast<int>(std::round(sprite.w * scale));
    int draw_h = static_cast<int>(std::round(sprite.h * scale));
    SDL_Rect dst{
        area.x + (area.w - draw_w) / 2,
        area.y + (area.h - draw_h) / 2,
        draw_w,
        draw_h
    };
    SDL_RenderCopy(renderer_, sprite.texture, nullptr, &dst);
    return true;
}
