#include "statuskit/paths.hpp"

#include <cstdlib>
#include <stdexcept>

namespace statuskit {

    namespace {

        std::optional<std::string> get_env(const char* name) {
            if (const char* value = std::getenv(name)) {
                if (*value != '\0') {
                    return std::string(value);
                }
            }
            return std::nullopt;
        }

        std::filesystem::path config_root(const EnvConfig& env) {
            if (env.xdg_config_home) {
                return std::filesystem::path(*env.xdg_config_home);
            }
            if (env.home) {
                return std::filesystem::path(*env.home) / ".config";
            }
            throw std::runtime_error("missing HOME for config root");
        }

        std::filesystem::path cache_root(const EnvConfig& env) {
            if (env.xdg_cache_home) {
                return std::filesystem::path(*env.xdg_cache_home);
            }
            if (env.home) {
                return std::filesystem::path(*env.home) / ".cache";
            }
            throw std::runtime_error("missing HOME for cache root");
        }

    } // namespace

    EnvConfig env_config_from_environment() {
        return EnvConfig{
            .home            = get_env("HOME"),
            .xdg_config_home = get_env("XDG_CONFIG_HOME"),
            .xdg_cache_home  = get_env("XDG_CACHE_HOME"),
        };
    }

    Paths resolve_paths(const EnvConfig& env, std::string_view cache_directory_name) {
        const auto config_dir = config_root(env) / "statuskit";
        const auto cache_dir  = cache_root(env) / (cache_directory_name.empty() ? kDefaultCacheDirectoryName : cache_directory_name);
        return Paths{
            .config_dir = config_dir,
            .themes_dir = config_dir / "themes",
            .cache_dir  = cache_dir,
            .log_path   = cache_dir / "statuskit.log",
            .proc_root  = "/proc",
            .sys_root   = "/sys",
        };
    }

    std::optional<Paths> try_resolve_paths(const EnvConfig& env, std::string_view cache_directory_name) {
        if (!env.home && (!env.xdg_config_home || !env.xdg_cache_home)) {
            return std::nullopt;
        }
        return resolve_paths(env, cache_directory_name);
    }

} // namespace statuskit
