#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace scoreboard {

struct Rgba {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    bool operator==(const Rgba&) const = default;
};

constexpr Rgba with_alpha(Rgba c, float alpha) {
    return {c.r, c.g, c.b, static_cast<uint8_t>(alpha * 255.0f + 0.5f)};
}

// 8-bit RGBA raster, row-major, no padding. Drawing clips to the bounds and
// composites with source-over.
class Bitmap {
public:
    Bitmap() = default;
    Bitmap(int width, int height, Rgba fill = {});
    Bitmap(int width, int height, std::vector<uint8_t> pixels);

    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    const std::vector<uint8_t>& pixels() const { return pixels_; }

    Rgba pixel(int x, int y) const;

    void fill(Rgba color);
    void fill_rect(int x, int y, int w, int h, Rgba color);
    void stroke_rect(int x, int y, int w, int h, Rgba color);
    void blit(const Bitmap& src, int x, int y);

    // Tints color by an 8-bit coverage mask (glyph rendering).
    void blend_mask(const uint8_t* mask, int mask_stride, int w, int h,
                    int x, int y, Rgba color);

private:
    void blend_pixel(int x, int y, Rgba color, uint8_t coverage);

    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> pixels_;
};

// True when the bytes carry a header stb_image can decode.
bool is_decodable_image(std::string_view bytes);

// Decodes an image file and scales it to size x size.
std::expected<Bitmap, std::string> load_icon(const std::filesystem::path& path, int size);

std::expected<std::vector<uint8_t>, std::string> encode_png(const Bitmap& bitmap);

} // namespace scoreboard
