#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace statuskit {

    std::optional<std::string> read_file_contents(const std::filesystem::path& path);

    // Writes through a per-process temporary sibling and renames it over the
    // target, so readers see either the old or the new contents. Returns an
    // error message on failure.
    std::optional<std::string> write_file_atomic(const std::filesystem::path& path, std::string_view contents);

}
