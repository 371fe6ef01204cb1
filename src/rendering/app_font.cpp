/// @file app_font.cpp
/// @brief Font loading with fallback to raylib's default font

#include "rendering/app_font.hpp"

#include "core/config.hpp"

#include <cstdio>

namespace algoscope {

namespace {

/// Searched in order; the first that loads wins
constexpr const char* FONT_PATHS[] = {
    "resources/fonts/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
};

constexpr int FONT_BASE_SIZE = 48; // Rasterized once, scaled down when drawn
constexpr int FONT_GLYPHS = 256;

Font g_font = {};
bool g_owns_font = false;

float spacing_for(int font_size) {
    return static_cast<float>(font_size) / 10.0f;
}

} // namespace

void init_app_font() {
    for (const char* path : FONT_PATHS) {
        if (!FileExists(path)) {
            continue;
        }
        Font font = LoadFontEx(path, FONT_BASE_SIZE, nullptr, FONT_GLYPHS);
        if (font.glyphCount > 0) {
            SetTextureFilter(font.texture, TEXTURE_FILTER_BILINEAR);
            g_font = font;
            g_owns_font = true;
            return;
        }
    }
    g_font = GetFontDefault();
    g_owns_font = false;
    std::fprintf(stderr, "%s No TTF font found, using the raylib default font.\n", LOG_PREFIX);
}

void cleanup_app_font() {
    if (g_owns_font) {
        UnloadFont(g_font);
        g_owns_font = false;
    }
}

Font get_app_font() {
    return g_font;
}

void DrawAppText(const char* text, int posX, int posY, int fontSize, Color color) {
    DrawTextEx(g_font, text, {static_cast<float>(posX), static_cast<float>(posY)},
               static_cast<float>(fontSize), spacing_for(fontSize), color);
}

int MeasureAppText(const char* text, int fontSize) {
    Vector2 size =
        MeasureTextEx(g_font, text, static_cast<float>(fontSize), spacing_for(fontSize));
    return static_cast<int>(size.x);
}

} // namespace algoscope
