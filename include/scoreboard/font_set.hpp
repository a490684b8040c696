#pragma once

#include "scoreboard/bitmap.hpp"
#include <filesystem>
#include <memory>
#include <string_view>

namespace scoreboard {

enum class FontRole : uint8_t {
    Heading,
    Stats,
};

// The two typefaces of the scoreboard. Glyphs are rasterised once per
// (role, pixel size, code point) and shared between concurrent renders.
// A face that fails to load draws nothing.
class FontSet {
public:
    FontSet(const std::filesystem::path& heading, const std::filesystem::path& stats);
    ~FontSet();

    FontSet(const FontSet&) = delete;
    FontSet& operator=(const FontSet&) = delete;

    // Draws UTF-8 text with the top of its line box at y. Returns the advance.
    int draw_text(Bitmap& target, FontRole role, int size_px, std::string_view text,
                  int x, int y, Rgba color);

    int measure(FontRole role, int size_px, std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace scoreboard
