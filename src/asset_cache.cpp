#include "scoreboard/asset_cache.hpp"
#include "scoreboard/bitmap.hpp"
#include <fstream>
#include <spdlog/spdlog.h>
#include <sys/stat.h>

namespace scoreboard {

namespace {

namespace fs = std::filesystem;

constexpr const char* champions_dir = "champions";
constexpr const char* items_dir = "items";

const char* subdir(AssetKind kind) {
    return kind == AssetKind::Champion ? champions_dir : items_dir;
}

const char* remote_segment(AssetKind kind) {
    return kind == AssetKind::Champion ? "champion" : "item";
}

bool is_safe_identifier(const std::string& id) {
    if (id.empty()) return false;
    if (id.find_first_of("/\\") != std::string::npos) return false;
    return id.find("..") == std::string::npos;
}

bool is_png(const fs::path& path) {
    return path.extension() == ".png";
}

// Releases the download gate on every exit path and publishes the outcome
// to callers waiting on it.
struct GateRelease {
    std::mutex& mutex;
    std::condition_variable_any& done;
    bool& in_flight;
    uint64_t& generation;
    std::optional<AssetError>& last_error;
    std::optional<AssetError> outcome =
        AssetError{AssetErrorKind::FetchFailed, 0, "Download aborted"};

    ~GateRelease() {
        {
            std::lock_guard lock(mutex);
            in_flight = false;
            ++generation;
            last_error = std::move(outcome);
        }
        done.notify_all();
    }
};

} // namespace

AssetCache::AssetCache(CacheConfig config, AssetSourceConfig source, AssetFetcher fetcher)
    : config_(std::move(config)), source_(std::move(source)), fetcher_(std::move(fetcher)) {

    std::error_code ec;
    fs::create_directories(config_.root / champions_dir, ec);
    if (!ec) fs::create_directories(config_.root / items_dir, ec);
    if (ec) {
        spdlog::warn("Cannot create cache directories under {}: {}",
                     config_.root.string(), ec.message());
    }

    scan_existing();
    spdlog::info("Asset cache initialised at {} ({} files)",
                 config_.root.string(), indexed_count());
}

fs::path AssetCache::local_path(const AssetKey& key) const {
    return config_.root / subdir(key.kind) / (key.identifier + ".png");
}

std::string AssetCache::remote_path(const AssetKey& key) const {
    return source_.path_prefix + "/" + source_.version + "/img/" +
           remote_segment(key.kind) + "/" + key.identifier + ".png";
}

void AssetCache::scan_existing() {
    size_t found = 0;
    for (auto* dir : {champions_dir, items_dir}) {
        std::error_code ec;
        for (fs::directory_iterator it(config_.root / dir, ec), end; !ec && it != end;
             it.increment(ec)) {
            if (!it->is_regular_file(ec) || !is_png(it->path())) continue;
            mark_cached(it->path());
            ++found;
        }
        if (ec) {
            spdlog::warn("Failed to scan cache directory {}: {}",
                         (config_.root / dir).string(), ec.message());
        }
    }
    spdlog::debug("Cache scanned: {} files found", found);
}

bool AssetCache::is_cached(const fs::path& path) {
    {
        std::shared_lock lock(index_mutex_);
        if (index_.contains(path.string())) return true;
    }
    std::error_code ec;
    if (fs::exists(path, ec)) {
        mark_cached(path);
        return true;
    }
    return false;
}

void AssetCache::mark_cached(const fs::path& path) {
    std::unique_lock lock(index_mutex_);
    index_.insert(path.string());
}

void AssetCache::evict(const fs::path& path) {
    std::unique_lock lock(index_mutex_);
    index_.erase(path.string());
}

size_t AssetCache::indexed_count() const {
    std::shared_lock lock(index_mutex_);
    return index_.size();
}

std::shared_ptr<AssetCache::DownloadGate> AssetCache::gate_for(const fs::path& path) {
    std::lock_guard lock(gates_mutex_);
    auto [it, inserted] = gates_.try_emplace(path.string());
    if (inserted) it->second = std::make_shared<DownloadGate>();
    return it->second;
}

std::expected<fs::path, AssetError> AssetCache::get_champion_icon(
    const std::string& champion_name, const FetchContext& ctx) {
    return get({AssetKind::Champion, champion_name}, ctx);
}

std::expected<fs::path, AssetError> AssetCache::get_item_icon(int item_id, const FetchContext& ctx) {
    if (item_id == 0) return fs::path{};
    if (item_id < 0) {
        return std::unexpected(AssetError{AssetErrorKind::InvalidKey, 0,
                                          "Invalid item id " + std::to_string(item_id)});
    }
    return get({AssetKind::Item, std::to_string(item_id)}, ctx);
}

std::expected<fs::path, AssetError> AssetCache::get(const AssetKey& key, const FetchContext& ctx) {
    if (!is_safe_identifier(key.identifier)) {
        return std::unexpected(AssetError{AssetErrorKind::InvalidKey, 0,
                                          "Invalid asset identifier '" + key.identifier + "'"});
    }

    auto dest = local_path(key);
    if (is_cached(dest)) return dest;
    return download(key, dest, ctx);
}

std::expected<fs::path, AssetError> AssetCache::download(
    const AssetKey& key, const fs::path& dest, const FetchContext& ctx) {

    auto gate = gate_for(dest);
    std::unique_lock lock(gate->mutex);

    while (gate->in_flight) {
        uint64_t seen = gate->generation;
        auto finished = [&] { return gate->generation != seen; };
        bool completed = ctx.deadline
            ? gate->done.wait_until(lock, ctx.stop, *ctx.deadline, finished)
            : gate->done.wait(lock, ctx.stop, finished);
        if (!completed) {
            return std::unexpected(AssetError{AssetErrorKind::Cancelled, 0,
                                              "Cancelled waiting for " + dest.string()});
        }
        if (!gate->last_error) return dest;
        if (gate->last_error->kind != AssetErrorKind::Cancelled) {
            return std::unexpected(*gate->last_error);
        }
        // The previous downloader gave up; take over unless someone else did.
    }

    if (is_cached(dest)) return dest;
    if (ctx.expired()) {
        return std::unexpected(AssetError{AssetErrorKind::Cancelled, 0,
                                          "Cancelled before downloading " + dest.string()});
    }

    gate->in_flight = true;
    lock.unlock();

    GateRelease release{gate->mutex, gate->done, gate->in_flight,
                        gate->generation, gate->last_error};

    auto body = fetcher_(remote_path(key), ctx);
    if (!body) {
        if (body.error().kind == AssetErrorKind::Cancelled) {
            spdlog::debug("Image download cancelled: {}", remote_path(key));
        } else {
            spdlog::warn("Error downloading image {}: {}", remote_path(key), body.error().message);
        }
        release.outcome = body.error();
        return std::unexpected(body.error());
    }

    if (auto error = store(dest, *body)) {
        spdlog::warn("{}", error->message);
        release.outcome = *error;
        return std::unexpected(*error);
    }

    mark_cached(dest);
    release.outcome.reset();
    spdlog::debug("Downloaded and cached: {}", dest.string());
    return dest;
}

std::optional<AssetError> AssetCache::store(const fs::path& dest, const std::string& body) {
    if (!is_decodable_image(body)) {
        return AssetError{AssetErrorKind::FetchFailed, 0,
                          "Downloaded data is not an image: " + dest.filename().string()};
    }

    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);

    auto tmp = dest;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return AssetError{AssetErrorKind::CacheIo, 0, "Cannot write " + tmp.string()};
        }
        file.write(body.data(), static_cast<std::streamsize>(body.size()));
        if (!file) {
            file.close();
            fs::remove(tmp, ec);
            return AssetError{AssetErrorKind::CacheIo, 0, "Short write to " + tmp.string()};
        }
    }

    fs::rename(tmp, dest, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return AssetError{AssetErrorKind::CacheIo, 0,
                          "Cannot move " + tmp.string() + " into place: " + ec.message()};
    }
    return std::nullopt;
}

CacheStats AssetCache::stats() const {
    CacheStats stats;
    for (auto* dir : {champions_dir, items_dir}) {
        std::error_code ec;
        for (fs::directory_iterator it(config_.root / dir, ec), end; !ec && it != end;
             it.increment(ec)) {
            std::error_code file_ec;
            if (!it->is_regular_file(file_ec) || !is_png(it->path())) continue;
            auto size = it->file_size(file_ec);
            if (file_ec) continue; // removed since listed
            ++stats.file_count;
            stats.total_size_bytes += size;
        }
        if (ec) {
            spdlog::warn("Failed to get cache stats for {}: {}",
                         (config_.root / dir).string(), ec.message());
        }
    }
    return stats;
}

int AssetCache::cleanup_older_than(std::chrono::seconds max_age) {
    int deleted = 0;
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch());
    time_t cutoff = max_age >= now ? 0 : static_cast<time_t>((now - max_age).count());

    for (auto* dir : {champions_dir, items_dir}) {
        std::error_code ec;
        std::vector<fs::path> candidates;
        for (fs::directory_iterator it(config_.root / dir, ec), end; !ec && it != end;
             it.increment(ec)) {
            std::error_code file_ec;
            // In-flight {dest}.tmp files belong to a running download.
            if (it->is_regular_file(file_ec) && is_png(it->path())) {
                candidates.push_back(it->path());
            }
        }
        if (ec) {
            spdlog::error("Cache cleanup failed for {}: {}", (config_.root / dir).string(),
                          ec.message());
            continue;
        }

        for (auto& path : candidates) {
            struct stat st{};
            if (::stat(path.c_str(), &st) != 0) continue; // already gone
            if (st.st_atim.tv_sec >= cutoff) continue;

            std::error_code remove_ec;
            if (fs::remove(path, remove_ec)) {
                evict(path);
                ++deleted;
            } else if (remove_ec) {
                spdlog::warn("Failed to delete cache file {}: {}", path.string(),
                             remove_ec.message());
            }
        }
    }

    if (deleted > 0) {
        spdlog::info("Cache cleanup: deleted {} old files", deleted);
    }
    return deleted;
}

} // namespace scoreboard
