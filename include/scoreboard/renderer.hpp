#pragma once

#include "scoreboard/asset_cache.hpp"
#include "scoreboard/font_set.hpp"
#include "scoreboard/layout.hpp"
#include "scoreboard/render_queue.hpp"
#include "scoreboard/types.hpp"
#include <cstdint>
#include <expected>
#include <stop_token>
#include <vector>

namespace scoreboard {

struct RenderedImage {
    std::vector<uint8_t> png;
    int width = 0;
    int height = 0;
};

// Composes the post-match scoreboard PNG. At most config.concurrency renders
// compose at once; the rest wait for a slot up to the admission timeout.
class ScoreboardRenderer {
public:
    ScoreboardRenderer(AssetCache& cache, RenderConfig config);

    ScoreboardRenderer(const ScoreboardRenderer&) = delete;
    ScoreboardRenderer& operator=(const ScoreboardRenderer&) = delete;

    // Deadline is now + config.timeout.
    std::expected<RenderedImage, RenderError> render_summary(
        const TrackedAccount& account, const MatchData& match, std::stop_token stop = {});

    std::expected<RenderedImage, RenderError> render_summary(
        const TrackedAccount& account, const MatchData& match,
        Clock::time_point deadline, std::stop_token stop = {});

    const RenderConfig& config() const { return config_; }
    const RenderQueue& queue() const { return queue_; }

private:
    AssetCache& cache_;
    RenderConfig config_;
    RenderQueue queue_;
    FontSet fonts_;

    std::vector<PlayerAssets> load_assets(const MatchData& match, const ScoreboardLayout& layout,
                                          const FetchContext& ctx, std::stop_source& job_stop,
                                          bool& cancelled);

    std::expected<Bitmap, RenderError> draw(const ScoreboardLayout& layout, const MatchData& match,
                                            const std::vector<PlayerAssets>& assets,
                                            const FetchContext& ctx);
};

} // namespace scoreboard
