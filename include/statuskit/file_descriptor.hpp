#ifndef STATUSKIT_FILE_DESCRIPTOR_HPP
#define STATUSKIT_FILE_DESCRIPTOR_HPP

#include <optional>

#include <unistd.h>

namespace statuskit {

    class FileDescriptor {
      public:
        FileDescriptor() = default;
        explicit FileDescriptor(int fd) : fd_(fd) {}
        ~FileDescriptor() {
            reset();
        }

        FileDescriptor(const FileDescriptor&)            = delete;
        FileDescriptor& operator=(const FileDescriptor&) = delete;

        FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
        FileDescriptor& operator=(FileDescriptor&& other) noexcept {
            if (this != &other) {
                reset(other.release());
            }
            return *this;
        }

        int get() const {
            return fd_;
        }
        explicit operator bool() const {
            return fd_ >= 0;
        }

        int release() {
            const int fd = fd_;
            fd_          = -1;
            return fd;
        }

        void reset(int fd = -1) {
            if (fd_ >= 0) {
                ::close(fd_);
            }
            fd_ = fd;
        }

      private:
        int fd_ = -1;
    };

    struct PipeEnds {
        FileDescriptor read_end;
        FileDescriptor write_end;
    };

    // Both ends are created close-on-exec.
    std::optional<PipeEnds> open_pipe();

} // namespace statuskit

#endif // STATUSKIT_FILE_DESCRIPTOR_HPP
