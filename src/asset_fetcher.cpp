#include "scoreboard/asset_fetcher.hpp"
#include <httplib.h>
#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace scoreboard {

namespace {

constexpr int max_attempts = 3;

std::chrono::milliseconds remaining(const FetchContext& ctx, std::chrono::milliseconds cap) {
    if (!ctx.deadline) return cap;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*ctx.deadline - Clock::now());
    return std::clamp(left, std::chrono::milliseconds(1), cap);
}

// Sleeps for the back-off period; false when the context expired first.
bool backoff(const FetchContext& ctx, std::chrono::milliseconds period) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, ctx.stop, remaining(ctx, period), [] { return false; });
    return !ctx.expired();
}

AssetError cancelled(const std::string& path) {
    return AssetError{AssetErrorKind::Cancelled, 0, "Download cancelled: " + path};
}

} // namespace

AssetFetcher make_http_fetcher(const AssetSourceConfig& config) {
    return [config](const std::string& path, const FetchContext& ctx)
               -> std::expected<std::string, AssetError> {
        for (int attempt = 0; attempt < max_attempts; ++attempt) {
            if (ctx.expired()) return std::unexpected(cancelled(path));

            httplib::SSLClient client(config.host);
            client.set_connection_timeout(remaining(ctx, config.connect_timeout));
            client.set_read_timeout(remaining(ctx, config.read_timeout));
            client.set_follow_location(true);

            auto res = client.Get(path, httplib::Headers{},
                                  [&ctx](uint64_t, uint64_t) { return !ctx.expired(); });
            if (!res) {
                if (res.error() == httplib::Error::Canceled || ctx.expired()) {
                    return std::unexpected(cancelled(path));
                }
                return std::unexpected(AssetError{
                    AssetErrorKind::FetchFailed, 0,
                    "Connection failed: " + httplib::to_string(res.error())});
            }

            if (res->status == 429) {
                if (!backoff(ctx, std::chrono::seconds(2 * (attempt + 1)))) {
                    return std::unexpected(cancelled(path));
                }
                continue;
            }

            if (res->status != 200) {
                return std::unexpected(AssetError{
                    AssetErrorKind::FetchFailed, res->status,
                    "HTTP " + std::to_string(res->status) + " for " + path});
            }

            return std::move(res->body);
        }

        return std::unexpected(AssetError{AssetErrorKind::FetchFailed, 429,
                                          "Rate limited after retries: " + path});
    };
}

} // namespace scoreboard
