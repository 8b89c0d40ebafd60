#ifndef LTEXTSANITIZER_BYTESTREAM_H
#define LTEXTSANITIZER_BYTESTREAM_H

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>

namespace LTextSanitizer {

// Raised by sources and sinks on any failure other than a clean end of stream.
// Nothing inside the pipeline catches it.
class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& what) : std::runtime_error(what) {}
};

class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Blocks until at least one byte is available or the stream ends.
    // Returns the number of bytes stored in dst (<= len); 0 means end of stream.
    virtual std::size_t read(uint8_t* dst, std::size_t len) = 0;
};

class ByteSink {
public:
    virtual ~ByteSink() = default;

    // Writes all len bytes or throws.
    virtual void write(const uint8_t* src, std::size_t len) = 0;
    virtual void flush() = 0;
};

class IstreamByteSource final : public ByteSource {
public:
    explicit IstreamByteSource(std::istream& stream) noexcept : stream_(stream) {}
    std::size_t read(uint8_t* dst, std::size_t len) override;

private:
    std::istream& stream_;
};

class OstreamByteSink final : public ByteSink {
public:
    explicit OstreamByteSink(std::ostream& stream) noexcept : stream_(stream) {}
    void write(const uint8_t* src, std::size_t len) override;
    void flush() override;

private:
    std::ostream& stream_;
};

// POSIX descriptor adapters. The descriptor is borrowed, never closed.
class FdByteSource final : public ByteSource {
public:
    explicit FdByteSource(int fd) noexcept : fd_(fd) {}
    std::size_t read(uint8_t* dst, std::size_t len) override;

private:
    int fd_;
};

class FdByteSink final : public ByteSink {
public:
    explicit FdByteSink(int fd) noexcept : fd_(fd) {}
    void write(const uint8_t* src, std::size_t len) override;
    void flush() override {} // unbuffered

private:
    int fd_;
};

} // namespace LTextSanitizer

#endif // LTEXTSANITIZER_BYTESTREAM_H
