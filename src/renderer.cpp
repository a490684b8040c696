#include "scoreboard/renderer.hpp"
#include <algorithm>
#include <atomic>
#include <future>
#include <spdlog/spdlog.h>

namespace scoreboard {

namespace {

// -- Palette --

constexpr Rgba background_color{10, 20, 25};
constexpr Rgba victory_color{70, 130, 180};
constexpr Rgba defeat_color{180, 70, 70};
constexpr Rgba subtitle_color{140, 140, 140};
constexpr Rgba column_header_color{100, 100, 100};

constexpr Rgba tracked_win_row{35, 55, 75};
constexpr Rgba tracked_loss_row{65, 40, 45};
constexpr Rgba win_row{22, 32, 42};
constexpr Rgba loss_row{38, 28, 33};

constexpr Rgba tracked_text{255, 215, 0};
constexpr Rgba plain_text{255, 255, 255};
constexpr Rgba muted_text{160, 160, 160};
constexpr Rgba gold_text{200, 170, 90};
constexpr Rgba damage_text{200, 100, 100};

constexpr Rgba missing_icon{30, 35, 40};
constexpr Rgba broken_champion_icon{50, 50, 50};
constexpr Rgba broken_item_icon{60, 30, 30};
constexpr Rgba empty_slot_fill{18, 22, 28};
constexpr Rgba empty_slot_border{30, 35, 40};
constexpr Rgba level_badge{0, 0, 0, 204};
constexpr Rgba level_text{200, 200, 200};

constexpr int level_badge_size = 14;

RenderError cancellation_error(const std::stop_token& external) {
    return {RenderErrorKind::Cancelled,
            external.stop_requested() ? "render cancelled" : "render deadline exceeded"};
}

// Failed lookups fall back to an empty path so the tile becomes a placeholder.
std::filesystem::path resolve(std::expected<std::filesystem::path, AssetError> result,
                              std::atomic<bool>& cancelled) {
    if (result) return std::move(*result);
    if (result.error().kind == AssetErrorKind::Cancelled) {
        cancelled = true;
    } else {
        spdlog::warn("Using placeholder icon: {}", result.error().message);
    }
    return {};
}

void draw_icon(Bitmap& canvas, const std::filesystem::path& path, int x, int y, int size,
               Rgba missing, Rgba broken) {
    if (path.empty()) {
        canvas.fill_rect(x, y, size, size, missing);
        return;
    }
    auto icon = load_icon(path, size);
    if (!icon) {
        spdlog::debug("{}", icon.error());
        canvas.fill_rect(x, y, size, size, broken);
        return;
    }
    canvas.blit(*icon, x, y);
}

void draw_empty_slot(Bitmap& canvas, int x, int y, int size) {
    canvas.fill_rect(x, y, size, size, empty_slot_fill);
    canvas.stroke_rect(x, y, size, size, empty_slot_border);
}

void draw_item_bar(Bitmap& canvas, const RowLayout& row, const PlayerAssets& assets,
                   const LayoutConfig& config) {
    const int size = config.item_icon_size;
    const int y = row.y + (config.row_height - size) / 2;
    size_t next_main = 0;

    for (auto& cell : row.items) {
        switch (cell.kind) {
            case SlotKind::Empty:
                draw_empty_slot(canvas, cell.x, y, size);
                break;
            case SlotKind::Item: {
                std::filesystem::path path;
                if (next_main < assets.main_items.size()) path = assets.main_items[next_main];
                ++next_main;
                draw_icon(canvas, path, cell.x, y, size, broken_item_icon, broken_item_icon);
                break;
            }
            case SlotKind::Trinket:
                draw_icon(canvas, assets.trinket, cell.x, y, size, broken_item_icon, broken_item_icon);
                break;
            case SlotKind::RoleItem:
                draw_icon(canvas, assets.role_item, cell.x, y, size, broken_item_icon, broken_item_icon);
                break;
        }
    }
}

} // namespace

ScoreboardRenderer::ScoreboardRenderer(AssetCache& cache, RenderConfig config)
    : cache_(cache), config_(std::move(config)), queue_(config_.concurrency),
      fonts_(config_.heading_font, config_.stats_font) {
    spdlog::info("Scoreboard renderer ready ({} concurrent renders, {} main item slots)",
                 queue_.capacity(), config_.layout.main_item_slots);
}

std::expected<RenderedImage, RenderError> ScoreboardRenderer::render_summary(
    const TrackedAccount& account, const MatchData& match, std::stop_token stop) {
    return render_summary(account, match, Clock::now() + config_.timeout, std::move(stop));
}

std::expected<RenderedImage, RenderError> ScoreboardRenderer::render_summary(
    const TrackedAccount& account, const MatchData& match,
    Clock::time_point deadline, std::stop_token stop) {

    auto me = std::ranges::find(match.participants, account.puuid, &MatchParticipant::puuid);
    if (me == match.participants.end()) {
        return std::unexpected(RenderError{RenderErrorKind::InvalidInput,
                                           "Player not found in match data"});
    }

    auto admission_deadline = std::min(deadline, Clock::now() + config_.admission_timeout);
    auto slot = queue_.acquire(admission_deadline, stop);
    if (!slot) {
        if (slot.error() == AdmissionFailure::Cancelled) {
            return std::unexpected(cancellation_error(stop));
        }
        spdlog::warn("Render queue full, request timed out waiting for slot");
        return std::unexpected(RenderError{RenderErrorKind::AdmissionTimeout,
                                           "Render queue is full. Please try again later."});
    }

    std::stop_source job_stop;
    std::stop_callback forward_stop(stop, [&job_stop] { job_stop.request_stop(); });
    FetchContext ctx{deadline, job_stop.get_token()};

    auto layout = compute_layout(match, account.puuid, config_.layout);

    bool cancelled = false;
    auto assets = load_assets(match, layout, ctx, job_stop, cancelled);
    if (cancelled || ctx.expired()) return std::unexpected(cancellation_error(stop));

    auto bitmap = draw(layout, match, assets, ctx);
    if (!bitmap) return std::unexpected(bitmap.error());

    auto png = encode_png(*bitmap);
    if (!png) {
        return std::unexpected(RenderError{RenderErrorKind::EncodeFailure, png.error()});
    }

    spdlog::debug("Rendered match summary for {} with {} players",
                  account.game_name.empty() ? account.puuid : account.game_name,
                  match.participants.size());
    return RenderedImage{std::move(*png), layout.width, layout.height};
}

std::vector<PlayerAssets> ScoreboardRenderer::load_assets(
    const MatchData& match, const ScoreboardLayout& layout, const FetchContext& ctx,
    std::stop_source& job_stop, bool& cancelled) {

    std::vector<PlayerAssets> assets(match.participants.size());
    std::atomic<bool> any_cancelled{false};
    std::vector<std::future<void>> tasks;

    auto spawn = [&](const RowLayout& entry) {
        tasks.push_back(std::async(std::launch::async, [&, row_ptr = &entry] {
            const RowLayout& row = *row_ptr;
            const auto& p = match.participants[row.participant_index];
            PlayerAssets& out = assets[row.participant_index];

            out.champion = resolve(cache_.get_champion_icon(p.champion_name, ctx), any_cancelled);
            for (auto& cell : row.items) {
                switch (cell.kind) {
                    case SlotKind::Item:
                        out.main_items.push_back(
                            resolve(cache_.get_item_icon(cell.item_id, ctx), any_cancelled));
                        break;
                    case SlotKind::Trinket:
                        out.trinket = resolve(cache_.get_item_icon(cell.item_id, ctx), any_cancelled);
                        break;
                    case SlotKind::RoleItem:
                        out.role_item = resolve(cache_.get_item_icon(cell.item_id, ctx), any_cancelled);
                        break;
                    case SlotKind::Empty:
                        break;
                }
            }
        }));
    };
    for (auto& row : layout.winners.rows) spawn(row);
    for (auto& row : layout.losers.rows) spawn(row);

    // Full join. Past the deadline, stop in-flight downloads and keep joining.
    for (auto& task : tasks) {
        if (ctx.deadline && task.wait_until(*ctx.deadline) == std::future_status::timeout) {
            job_stop.request_stop();
        }
        task.get();
    }

    cancelled = any_cancelled;
    return assets;
}

std::expected<Bitmap, RenderError> ScoreboardRenderer::draw(
    const ScoreboardLayout& layout, const MatchData& match,
    const std::vector<PlayerAssets>& assets, const FetchContext& ctx) {

    const auto& cfg = config_.layout;
    Bitmap canvas(layout.width, layout.height, background_color);

    // -- Header --
    fonts_.draw_text(canvas, FontRole::Heading, 28, layout.title, 16, 12,
                     layout.tracked_won ? victory_color : defeat_color);
    fonts_.draw_text(canvas, FontRole::Stats, 13, layout.subtitle, 16, 48, subtitle_color);

    for (const TeamLayout* team : {&layout.winners, &layout.losers}) {
        Rgba team_color = team->won ? victory_color : defeat_color;

        canvas.fill_rect(0, team->banner_y, layout.width, cfg.team_header_height,
                         with_alpha(team_color, 0.15f));
        fonts_.draw_text(canvas, FontRole::Stats, 13, team->title, 10, team->banner_y + 9,
                         team_color);

        int header_y = team->column_header_y + 5;
        fonts_.draw_text(canvas, FontRole::Stats, 10, "CHAMPION", cfg.col_champion, header_y, column_header_color);
        fonts_.draw_text(canvas, FontRole::Stats, 10, "ITEMS", cfg.col_items, header_y, column_header_color);
        fonts_.draw_text(canvas, FontRole::Stats, 10, "KDA", cfg.col_kda, header_y, column_header_color);
        fonts_.draw_text(canvas, FontRole::Stats, 10, "CS", cfg.col_cs, header_y, column_header_color);
        fonts_.draw_text(canvas, FontRole::Stats, 10, "GOLD", cfg.col_gold, header_y, column_header_color);
        fonts_.draw_text(canvas, FontRole::Stats, 10, "DMG", cfg.col_damage, header_y, column_header_color);

        for (auto& row : team->rows) {
            if (ctx.expired()) return std::unexpected(cancellation_error(ctx.stop));

            const auto& player = match.participants[row.participant_index];
            const auto& player_assets = assets[row.participant_index];

            Rgba row_bg = row.tracked ? (row.won ? tracked_win_row : tracked_loss_row)
                                      : (row.won ? win_row : loss_row);
            canvas.fill_rect(0, row.y, layout.width, cfg.row_height, row_bg);

            Rgba text_color = row.tracked ? tracked_text : plain_text;
            int text_y = row.y + 15;

            // -- Champion icon and level badge --
            int icon_y = row.y + (cfg.row_height - cfg.champion_icon_size) / 2;
            draw_icon(canvas, player_assets.champion, cfg.col_champion, icon_y,
                      cfg.champion_icon_size, missing_icon, broken_champion_icon);

            int badge_y = icon_y + cfg.champion_icon_size - 12;
            canvas.fill_rect(cfg.col_champion, badge_y, level_badge_size, level_badge_size, level_badge);
            auto level = std::to_string(player.champion_level);
            int level_x = cfg.col_champion +
                          (level_badge_size - fonts_.measure(FontRole::Stats, 10, level)) / 2;
            fonts_.draw_text(canvas, FontRole::Stats, 10, level, level_x, badge_y + 1, level_text);

            // -- Name, items, stats --
            fonts_.draw_text(canvas, FontRole::Stats, 12, row.display_name, cfg.col_name, text_y, text_color);
            draw_item_bar(canvas, row, player_assets, cfg);
            fonts_.draw_text(canvas, FontRole::Stats, 12, row.kda, cfg.col_kda, text_y, text_color);
            fonts_.draw_text(canvas, FontRole::Stats, 12, row.creep_score, cfg.col_cs, text_y, muted_text);
            fonts_.draw_text(canvas, FontRole::Stats, 12, row.gold, cfg.col_gold, text_y, gold_text);
            fonts_.draw_text(canvas, FontRole::Stats, 12, row.damage, cfg.col_damage, text_y, damage_text);
        }
    }

    return canvas;
}

} // namespace scoreboard
