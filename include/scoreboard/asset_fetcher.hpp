#pragma once

#include "scoreboard/types.hpp"
#include <expected>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

namespace scoreboard {

// Deadline and cancellation shared by every suspension point of one render.
struct FetchContext {
    std::optional<Clock::time_point> deadline;
    std::stop_token stop;

    bool expired() const {
        return stop.stop_requested() || (deadline && Clock::now() >= *deadline);
    }
};

// Returns the body of GET {path} on the asset host.
using AssetFetcher = std::function<std::expected<std::string, AssetError>(
    const std::string& path, const FetchContext& ctx)>;

AssetFetcher make_http_fetcher(const AssetSourceConfig& config);

} // namespace scoreboard
