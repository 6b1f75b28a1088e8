#ifndef STATUSKIT_PATHS_HPP
#define STATUSKIT_PATHS_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace statuskit {

    inline constexpr std::string_view kDefaultCacheDirectoryName = "tmux-statuskit";

    struct EnvConfig {
        std::optional<std::string> home;
        std::optional<std::string> xdg_config_home;
        std::optional<std::string> xdg_cache_home;
    };

    struct Paths {
        std::filesystem::path config_dir;
        std::filesystem::path themes_dir;
        std::filesystem::path cache_dir;
        std::filesystem::path log_path;
        std::filesystem::path proc_root;
        std::filesystem::path sys_root;
    };

    EnvConfig            env_config_from_environment();
    Paths                resolve_paths(const EnvConfig& env, std::string_view cache_directory_name = kDefaultCacheDirectoryName);
    std::optional<Paths> try_resolve_paths(const EnvConfig& env, std::string_view cache_directory_name = kDefaultCacheDirectoryName);

} // namespace statuskit

#endif // STATUSKIT_PATHS_HPP
