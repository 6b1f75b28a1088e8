#include "statuskit/file_io.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include <unistd.h>

namespace statuskit {

    std::optional<std::string> read_file_contents(const std::filesystem::path& path) {
        std::ifstream input(path, std::ios::binary);
        if (!input.good()) {
            return std::nullopt;
        }
        return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    }

    std::optional<std::string> write_file_atomic(const std::filesystem::path& path, std::string_view contents) {
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                return "failed to create directory " + path.parent_path().string();
            }
        }

        const auto tempname = path.string() + ".tmp." + std::to_string(::getpid());
        {
            std::ofstream output(tempname, std::ios::binary | std::ios::trunc);
            if (!output.good()) {
                return "failed to open " + tempname;
            }
            output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
            output.close();
            if (!output.good()) {
                std::filesystem::remove(tempname, ec);
                return "failed to write " + tempname;
            }
        }
        std::filesystem::rename(tempname, path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tempname, ignored);
            return "failed to finalize " + path.string();
        }
        return std::nullopt;
    }

}
