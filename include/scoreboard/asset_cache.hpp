#pragma once

#include "scoreboard/asset_fetcher.hpp"
#include "scoreboard/types.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace scoreboard {

// Local store of provider icons under {root}/champions and {root}/items.
// Each destination file is downloaded at most once at a time; callers that
// arrive while a download is in flight share its outcome.
class AssetCache {
public:
    AssetCache(CacheConfig config, AssetSourceConfig source, AssetFetcher fetcher);

    AssetCache(const AssetCache&) = delete;
    AssetCache& operator=(const AssetCache&) = delete;

    std::expected<std::filesystem::path, AssetError> get_champion_icon(
        const std::string& champion_name, const FetchContext& ctx = {});

    // Item 0 is the empty slot: returns an empty path without any I/O.
    std::expected<std::filesystem::path, AssetError> get_item_icon(
        int item_id, const FetchContext& ctx = {});

    std::expected<std::filesystem::path, AssetError> get(
        const AssetKey& key, const FetchContext& ctx = {});

    CacheStats stats() const;

    // Deletes files not accessed within max_age. Returns the number deleted.
    int cleanup_older_than(std::chrono::seconds max_age);

    size_t indexed_count() const;
    const std::filesystem::path& root() const { return config_.root; }

    std::filesystem::path local_path(const AssetKey& key) const;
    std::string remote_path(const AssetKey& key) const;

private:
    struct DownloadGate {
        std::mutex mutex;
        std::condition_variable_any done;
        bool in_flight = false;
        uint64_t generation = 0;
        std::optional<AssetError> last_error;
    };

    CacheConfig config_;
    AssetSourceConfig source_;
    AssetFetcher fetcher_;

    mutable std::shared_mutex index_mutex_;
    std::unordered_set<std::string> index_;

    std::mutex gates_mutex_;
    std::unordered_map<std::string, std::shared_ptr<DownloadGate>> gates_;

    void scan_existing();
    bool is_cached(const std::filesystem::path& path);
    void mark_cached(const std::filesystem::path& path);
    void evict(const std::filesystem::path& path);
    std::shared_ptr<DownloadGate> gate_for(const std::filesystem::path& path);

    std::expected<std::filesystem::path, AssetError> download(
        const AssetKey& key, const std::filesystem::path& dest, const FetchContext& ctx);
    std::optional<AssetError> store(const std::filesystem::path& dest, const std::string& body);
};

} // namespace scoreboard
