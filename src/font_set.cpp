#include "scoreboard/font_set.hpp"
#include <array>
#include <cstring>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <ft2build.h>
#include FT_FREETYPE_H
#include <spdlog/spdlog.h>

namespace scoreboard {

namespace {

struct Glyph {
    int width = 0;
    int height = 0;
    int bearing_x = 0;
    int bearing_y = 0;
    int advance = 0;
    std::vector<uint8_t> alpha;
};

struct GlyphKey {
    uint8_t role = 0;
    uint16_t size_px = 0;
    uint32_t codepoint = 0;

    bool operator==(const GlyphKey&) const = default;
};

struct GlyphKeyHash {
    size_t operator()(const GlyphKey& key) const {
        size_t h = static_cast<size_t>(key.codepoint);
        h = (h * 1315423911u) ^ static_cast<size_t>(key.size_px + 0x9e3779b9);
        h = (h * 2654435761u) ^ static_cast<size_t>(key.role + 0x85ebca6b);
        return h;
    }
};

struct PlacedGlyph {
    std::shared_ptr<const Glyph> glyph;
    int pen_x = 0;
};

struct TextRun {
    int ascender = 0;
    int advance = 0;
    std::vector<PlacedGlyph> glyphs;
};

std::vector<uint32_t> decode_utf8(std::string_view text) {
    std::vector<uint32_t> out;
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        auto cont = [&](size_t k) { return static_cast<unsigned char>(text[i + k]) & 0x3Fu; };
        if (c < 0x80) {
            out.push_back(c);
            i += 1;
        } else if ((c >> 5) == 0x6 && i + 1 < text.size()) {
            out.push_back(((c & 0x1Fu) << 6) | cont(1));
            i += 2;
        } else if ((c >> 4) == 0xE && i + 2 < text.size()) {
            out.push_back(((c & 0x0Fu) << 12) | (cont(1) << 6) | cont(2));
            i += 3;
        } else if ((c >> 3) == 0x1E && i + 3 < text.size()) {
            out.push_back(((c & 0x07u) << 18) | (cont(1) << 12) | (cont(2) << 6) | cont(3));
            i += 4;
        } else {
            out.push_back(0xFFFD);
            i += 1;
        }
    }
    return out;
}

} // namespace

struct FontSet::Impl {
    FT_Library library = nullptr;
    std::array<FT_Face, 2> faces{};
    std::mutex mutex;
    std::unordered_map<GlyphKey, std::shared_ptr<const Glyph>, GlyphKeyHash> glyphs;

    Impl() {
        if (FT_Init_FreeType(&library) != 0) {
            library = nullptr;
            spdlog::warn("Failed to initialise FreeType; scoreboard text is disabled");
        }
    }

    ~Impl() {
        for (auto face : faces) {
            if (face) FT_Done_Face(face);
        }
        if (library) FT_Done_FreeType(library);
    }

    void load(FontRole role, const std::filesystem::path& path) {
        if (!library) return;
        FT_Face face = nullptr;
        if (FT_New_Face(library, path.c_str(), 0, &face) != 0 || !face) {
            spdlog::warn("Cannot load font {}; text drawn with it is skipped", path.string());
            return;
        }
        faces[static_cast<size_t>(role)] = face;
    }

    std::shared_ptr<const Glyph> glyph(FT_Face face, FontRole role, uint16_t size_px,
                                       uint32_t codepoint) {
        GlyphKey key{static_cast<uint8_t>(role), size_px, codepoint};
        if (auto it = glyphs.find(key); it != glyphs.end()) return it->second;

        auto g = std::make_shared<Glyph>();
        if (FT_Load_Char(face, codepoint, FT_LOAD_RENDER) == 0) {
            FT_GlyphSlot slot = face->glyph;
            const FT_Bitmap& bm = slot->bitmap;
            g->bearing_x = slot->bitmap_left;
            g->bearing_y = slot->bitmap_top;
            g->advance = static_cast<int>(slot->advance.x >> 6);
            if (bm.buffer && bm.pixel_mode == FT_PIXEL_MODE_GRAY) {
                g->width = static_cast<int>(bm.width);
                g->height = static_cast<int>(bm.rows);
                g->alpha.resize(static_cast<size_t>(g->width) * g->height);
                for (int y = 0; y < g->height; ++y) {
                    const uint8_t* src = bm.buffer + (bm.pitch >= 0
                        ? y * bm.pitch
                        : (g->height - 1 - y) * -bm.pitch);
                    std::memcpy(g->alpha.data() + static_cast<size_t>(y) * g->width, src,
                                static_cast<size_t>(g->width));
                }
            }
        }
        glyphs.emplace(key, g);
        return g;
    }

    TextRun shape(FontRole role, int size_px, std::string_view text) {
        TextRun run;
        std::lock_guard lock(mutex);
        FT_Face face = faces[static_cast<size_t>(role)];
        if (!face || size_px <= 0) return run;
        if (FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(size_px)) != 0) return run;

        run.ascender = static_cast<int>(face->size->metrics.ascender >> 6);
        for (uint32_t cp : decode_utf8(text)) {
            auto g = glyph(face, role, static_cast<uint16_t>(size_px), cp);
            run.glyphs.push_back({g, run.advance});
            run.advance += g->advance;
        }
        return run;
    }
};

FontSet::FontSet(const std::filesystem::path& heading, const std::filesystem::path& stats)
    : impl_(std::make_unique<Impl>()) {
    impl_->load(FontRole::Heading, heading);
    impl_->load(FontRole::Stats, stats);
}

FontSet::~FontSet() = default;

int FontSet::draw_text(Bitmap& target, FontRole role, int size_px, std::string_view text,
                       int x, int y, Rgba color) {
    auto run = impl_->shape(role, size_px, text);
    for (auto& placed : run.glyphs) {
        const Glyph& g = *placed.glyph;
        if (g.alpha.empty()) continue;
        target.blend_mask(g.alpha.data(), g.width, g.width, g.height,
                          x + placed.pen_x + g.bearing_x, y + run.ascender - g.bearing_y,
                          color);
    }
    return run.advance;
}

int FontSet::measure(FontRole role, int size_px, std::string_view text) {
    return impl_->shape(role, size_px, text).advance;
}

} // namespace scoreboard
