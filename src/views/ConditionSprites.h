#pragma once

#include "engine/ConditionsSummary.h"

#include <SDL.h>

#include <string>
#include <unordered_map>

// Weather-condition icons loaded from <sprite_dir>/<key>.png.
class ConditionSprites {
public:
    ConditionSprites(SDL_Renderer* renderer, const std::string& sprite_dir);
    ~ConditionSprites();

    ConditionSprites(const ConditionSprites&) = delete;
    ConditionSprites& operator=(const ConditionSprites&) = delete;

    bool Draw(ConditionIcon icon, const SDL_Rect& area);
    bool Loaded() const { return loaded_; }

private:
    struct SpriteTexture {
        SDL_Texture* texture = nullptr;
        int w = 0;
        int h = 0;
    };

    void Load();
    void Clear();

    SDL_Renderer* renderer_;
    std::string sprite_dir_;
    bool loaded_ = false;
    std::unordered_map<std::string, SpriteTexture> sprites_;
};
