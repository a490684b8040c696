#include "scoreboard/bitmap.hpp"
#include <algorithm>
#include <memory>
#include <stb_image.h>
#include <stb_image_resize2.h>
#include <stb_image_write.h>

namespace scoreboard {

namespace {

constexpr int channels = 4;

uint8_t mul255(int a, int b) {
    return static_cast<uint8_t>((a * b + 127) / 255);
}

void append_bytes(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // namespace

Bitmap::Bitmap(int width, int height, Rgba fill)
    : width_(std::max(width, 0)), height_(std::max(height, 0)),
      pixels_(static_cast<size_t>(width_) * height_ * channels) {
    this->fill(fill);
}

Bitmap::Bitmap(int width, int height, std::vector<uint8_t> pixels)
    : width_(width), height_(height), pixels_(std::move(pixels)) {
    if (pixels_.size() != static_cast<size_t>(width_) * height_ * channels) {
        width_ = 0;
        height_ = 0;
        pixels_.clear();
    }
}

Rgba Bitmap::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return {0, 0, 0, 0};
    const uint8_t* p = pixels_.data() + (static_cast<size_t>(y) * width_ + x) * channels;
    return {p[0], p[1], p[2], p[3]};
}

void Bitmap::fill(Rgba color) {
    for (size_t i = 0; i < pixels_.size(); i += channels) {
        pixels_[i] = color.r;
        pixels_[i + 1] = color.g;
        pixels_[i + 2] = color.b;
        pixels_[i + 3] = color.a;
    }
}

void Bitmap::blend_pixel(int x, int y, Rgba color, uint8_t coverage) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
    int src_a = mul255(color.a, coverage);
    if (src_a == 0) return;

    uint8_t* p = pixels_.data() + (static_cast<size_t>(y) * width_ + x) * channels;
    if (src_a == 255) {
        p[0] = color.r;
        p[1] = color.g;
        p[2] = color.b;
        p[3] = 255;
        return;
    }

    int dst_a = p[3];
    int out_a = src_a + mul255(dst_a, 255 - src_a);
    if (out_a == 0) return;
    auto mix = [&](uint8_t src, uint8_t dst) {
        int premul = src * src_a + mul255(dst * dst_a / 255, 255 - src_a) * 255;
        return static_cast<uint8_t>(std::clamp((premul + out_a / 2) / out_a, 0, 255));
    };
    p[0] = mix(color.r, p[0]);
    p[1] = mix(color.g, p[1]);
    p[2] = mix(color.b, p[2]);
    p[3] = static_cast<uint8_t>(out_a);
}

void Bitmap::fill_rect(int x, int y, int w, int h, Rgba color) {
    int x0 = std::max(x, 0);
    int y0 = std::max(y, 0);
    int x1 = std::min(x + w, width_);
    int y1 = std::min(y + h, height_);
    for (int py = y0; py < y1; ++py) {
        for (int px = x0; px < x1; ++px) {
            blend_pixel(px, py, color, 255);
        }
    }
}

void Bitmap::stroke_rect(int x, int y, int w, int h, Rgba color) {
    if (w <= 0 || h <= 0) return;
    fill_rect(x, y, w, 1, color);
    fill_rect(x, y + h - 1, w, 1, color);
    fill_rect(x, y + 1, 1, h - 2, color);
    fill_rect(x + w - 1, y + 1, 1, h - 2, color);
}

void Bitmap::blit(const Bitmap& src, int x, int y) {
    for (int sy = 0; sy < src.height(); ++sy) {
        for (int sx = 0; sx < src.width(); ++sx) {
            blend_pixel(x + sx, y + sy, src.pixel(sx, sy), 255);
        }
    }
}

void Bitmap::blend_mask(const uint8_t* mask, int mask_stride, int w, int h,
                        int x, int y, Rgba color) {
    if (!mask) return;
    for (int my = 0; my < h; ++my) {
        const uint8_t* row = mask + static_cast<size_t>(my) * mask_stride;
        for (int mx = 0; mx < w; ++mx) {
            if (row[mx] != 0) blend_pixel(x + mx, y + my, color, row[mx]);
        }
    }
}

bool is_decodable_image(std::string_view bytes) {
    if (bytes.empty()) return false;
    int w = 0, h = 0, comp = 0;
    return stbi_info_from_memory(reinterpret_cast<const stbi_uc*>(bytes.data()),
                                 static_cast<int>(bytes.size()), &w, &h, &comp) != 0 &&
           w > 0 && h > 0;
}

std::expected<Bitmap, std::string> load_icon(const std::filesystem::path& path, int size) {
    if (size <= 0) return std::unexpected(std::string("Invalid icon size"));

    int w = 0, h = 0, comp = 0;
    std::unique_ptr<stbi_uc, decltype(&stbi_image_free)> decoded(
        stbi_load(path.c_str(), &w, &h, &comp, channels), &stbi_image_free);
    if (!decoded) {
        const char* reason = stbi_failure_reason();
        return std::unexpected("Cannot decode " + path.string() + ": " +
                               (reason ? reason : "unknown error"));
    }

    std::vector<uint8_t> pixels(static_cast<size_t>(size) * size * channels);
    if (w == size && h == size) {
        std::copy_n(decoded.get(), pixels.size(), pixels.begin());
    } else if (!stbir_resize_uint8_srgb(decoded.get(), w, h, 0,
                                        pixels.data(), size, size, 0, STBIR_RGBA)) {
        return std::unexpected("Cannot resize " + path.string());
    }
    return Bitmap(size, size, std::move(pixels));
}

std::expected<std::vector<uint8_t>, std::string> encode_png(const Bitmap& bitmap) {
    if (bitmap.empty()) return std::unexpected(std::string("Cannot encode an empty bitmap"));

    std::vector<uint8_t> out;
    int ok = stbi_write_png_to_func(&append_bytes, &out, bitmap.width(), bitmap.height(),
                                    channels, bitmap.pixels().data(),
                                    bitmap.width() * channels);
    if (!ok || out.empty()) return std::unexpected(std::string("PNG encoder failed"));
    return out;
}

} // namespace scoreboard
