#include "ByteStream.h"

#include <cerrno>
#include <cstring>
#include <istream>
#include <ostream>
#include <unistd.h>

namespace LTextSanitizer {

namespace {

std::string errnoMessage(const char* op, int fd, int err) {
    return std::string(op) + " failed on fd " + std::to_string(fd) + ": " + std::strerror(err);
}

} // namespace

std::size_t IstreamByteSource::read(uint8_t* dst, std::size_t len) {
    if (len == 0) return 0;
    if (stream_.bad()) throw IoError("input stream is in a bad state");
    if (stream_.eof()) return 0;

    // A short read sets eof|fail together; only badbit means the device failed.
    stream_.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(len));
    if (stream_.bad()) throw IoError("read from input stream failed");

    const std::streamsize got = stream_.gcount();
    return got > 0 ? static_cast<std::size_t>(got) : 0;
}

void OstreamByteSink::write(const uint8_t* src, std::size_t len) {
    if (len == 0) return;
    stream_.write(reinterpret_cast<const char*>(src), static_cast<std::streamsize>(len));
    if (!stream_) throw IoError("write to output stream failed");
}

void OstreamByteSink::flush() {
    stream_.flush();
    if (!stream_) throw IoError("flush of output stream failed");
}

std::size_t FdByteSource::read(uint8_t* dst, std::size_t len) {
    if (len == 0) return 0;
    for (;;) {
        const ssize_t got = ::read(fd_, dst, len);
        if (got >= 0) return static_cast<std::size_t>(got);
        if (errno == EINTR) continue;
        throw IoError(errnoMessage("read", fd_, errno));
    }
}

void FdByteSink::write(const uint8_t* src, std::size_t len) {
    std::size_t done = 0;
    while (done < len) {
        const ssize_t put = ::write(fd_, src + done, len - done);
        if (put < 0) {
            if (errno == EINTR) continue;
            throw IoError(errnoMessage("write", fd_, errno));
        }
        done += static_cast<std::size_t>(put);
    }
}

} // namespace LTextSanitizer
