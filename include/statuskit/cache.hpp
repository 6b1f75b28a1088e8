#ifndef STATUSKIT_CACHE_HPP
#define STATUSKIT_CACHE_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace statuskit {

    using Clock = std::function<std::int64_t()>;

    // Wall clock in epoch seconds.
    std::int64_t system_clock_seconds();

    class CacheStore {
      public:
        virtual ~CacheStore() = default;

        // A miss is reported when the key is absent or its age is >= ttl.
        virtual std::optional<std::string> get(std::string_view key, std::int64_t ttl_seconds) = 0;
        virtual std::optional<std::string> set(std::string_view key, std::string_view value)   = 0;

        // compute runs only on a miss; non-empty results are stored.
        std::string get_or_compute(std::string_view key, std::int64_t ttl_seconds, const std::function<std::string()>& compute);
    };

    // One file per key: "<written_at epoch seconds>\n<value>". Writes go
    // through write_file_atomic so concurrent renders never observe a
    // partial value.
    class FileCacheStore final : public CacheStore {
      public:
        explicit FileCacheStore(std::filesystem::path directory, Clock clock = system_clock_seconds);

        std::optional<std::string> get(std::string_view key, std::int64_t ttl_seconds) override;
        std::optional<std::string> set(std::string_view key, std::string_view value) override;

        bool                        invalidate(std::string_view key);
        std::size_t                 clear_all();
        std::optional<std::int64_t> age(std::string_view key) const;
        std::filesystem::path       path_for(std::string_view key) const;
        const std::filesystem::path& directory() const {
            return directory_;
        }

      private:
        struct Entry {
            std::int64_t written_at = 0;
            std::string  value;
        };

        std::optional<Entry> read_entry(std::string_view key) const;

        std::filesystem::path directory_;
        Clock                 clock_;
    };

    std::string sanitize_cache_key(std::string_view key);

} // namespace statuskit

#endif // STATUSKIT_CACHE_HPP
