#include "statuskit/cache.hpp"

#include <cctype>
#include <chrono>
#include <system_error>
#include <utility>
#include <vector>

#include "statuskit/file_io.hpp"
#include "statuskit/logging.hpp"
#include "statuskit/strings.hpp"

namespace statuskit {

    namespace {

        constexpr std::string_view kCacheExtension = ".cache";

    } // namespace

    std::int64_t system_clock_seconds() {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::seconds>(now).count();
    }

    std::string CacheStore::get_or_compute(std::string_view key, std::int64_t ttl_seconds, const std::function<std::string()>& compute) {
        if (auto cached = get(key, ttl_seconds)) {
            return std::move(*cached);
        }
        auto value = compute();
        if (!value.empty()) {
            if (const auto error = set(key, value)) {
                debug_log("cache", *error);
            }
        }
        return value;
    }

    std::string sanitize_cache_key(std::string_view key) {
        std::string sanitized;
        sanitized.reserve(key.size());
        for (const char ch : key) {
            const bool safe = std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-' || ch == '.';
            sanitized.push_back(safe ? ch : '_');
        }
        if (sanitized.empty() || sanitized.front() == '.') {
            sanitized.insert(sanitized.begin(), '_');
        }
        return sanitized;
    }

    FileCacheStore::FileCacheStore(std::filesystem::path directory, Clock clock) : directory_(std::move(directory)), clock_(std::move(clock)) {
        if (!clock_) {
            clock_ = system_clock_seconds;
        }
    }

    std::filesystem::path FileCacheStore::path_for(std::string_view key) const {
        return directory_ / (sanitize_cache_key(key) + std::string(kCacheExtension));
    }

    std::optional<FileCacheStore::Entry> FileCacheStore::read_entry(std::string_view key) const {
        const auto contents = read_file_contents(path_for(key));
        if (!contents) {
            return std::nullopt;
        }
        const auto newline = contents->find('\n');
        if (newline == std::string::npos) {
            debug_log("cache", "malformed entry for " + std::string(key));
            return std::nullopt;
        }
        const auto written_at = parse_int(std::string_view(*contents).substr(0, newline));
        if (!written_at) {
            debug_log("cache", "malformed timestamp for " + std::string(key));
            return std::nullopt;
        }
        return Entry{.written_at = *written_at, .value = contents->substr(newline + 1)};
    }

    std::optional<std::string> FileCacheStore::get(std::string_view key, std::int64_t ttl_seconds) {
        if (ttl_seconds <= 0) {
            return std::nullopt;
        }
        auto entry = read_entry(key);
        if (!entry) {
            return std::nullopt;
        }
        if (clock_() - entry->written_at >= ttl_seconds) {
            return std::nullopt;
        }
        return std::move(entry->value);
    }

    std::optional<std::string> FileCacheStore::set(std::string_view key, std::string_view value) {
        std::string contents = std::to_string(clock_());
        contents.push_back('\n');
        contents.append(value);
        return write_file_atomic(path_for(key), contents);
    }

    bool FileCacheStore::invalidate(std::string_view key) {
        std::error_code ec;
        const bool      removed = std::filesystem::remove(path_for(key), ec);
        if (ec) {
            debug_log("cache", "failed to remove " + std::string(key) + ": " + ec.message());
            return false;
        }
        return removed;
    }

    std::size_t FileCacheStore::clear_all() {
        std::error_code                    ec;
        std::vector<std::filesystem::path> targets;
        for (auto it = std::filesystem::directory_iterator(directory_, ec); !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && it->path().extension().string() == kCacheExtension) {
                targets.push_back(it->path());
            }
        }
        std::size_t removed = 0;
        for (const auto& target : targets) {
            if (std::filesystem::remove(target, ec)) {
                ++removed;
            }
        }
        return removed;
    }

    std::optional<std::int64_t> FileCacheStore::age(std::string_view key) const {
        const auto entry = read_entry(key);
        if (!entry) {
            return std::nullopt;
        }
        return clock_() - entry->written_at;
    }

} // namespace statuskit
