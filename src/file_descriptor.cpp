#include "statuskit/file_descriptor.hpp"

#include <fcntl.h>

namespace statuskit {

    std::optional<PipeEnds> open_pipe() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return std::nullopt;
        }
        return PipeEnds{.read_end = FileDescriptor(fds[0]), .write_end = FileDescriptor(fds[1])};
    }

} // namespace statuskit
