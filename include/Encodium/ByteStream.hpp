#pragma once
// ByteStream.hpp – Bounds-checked big-endian byte I/O for Encodium buffers.
//
// Wire format rules:
//   • Multi-byte integers (lengths, integer payloads) are big-endian.
//   • Every read is checked against the end of the buffer; running out of
//     bytes raises WireError(TruncatedData) instead of reading past the end.

#include "Error.hpp"

#include <cstdint>
#include <span>
#include <utility>
#include <string>
#include <vector>

namespace encodium {

using Bytes = std::vector<std::uint8_t>;

// ─────────────────────────────────────────────────────────────────────────────
//  ByteReader
// ─────────────────────────────────────────────────────────────────────────────
// Reads bytes sequentially from a read-only span. The reader never owns the
// memory it walks.
//
// Example – reading a 2-byte length after a 0xFB prefix:
//   readU8() → 0xFB   readUBE(2) → 300
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> buf) noexcept
        : buf_(buf), pos_(0) {}

    // ── Position queries ─────────────────────────────────────────────────────

    [[nodiscard]] std::size_t position()  const noexcept { return pos_; }
    [[nodiscard]] std::size_t available() const noexcept { return buf_.size() - pos_; }
    [[nodiscard]] bool        atEnd()     const noexcept { return pos_ >= buf_.size(); }
    [[nodiscard]] bool canRead(std::size_t n) const noexcept { return available() >= n; }

    // ── Read operations ──────────────────────────────────────────────────────

    [[nodiscard]] std::uint8_t readU8() {
        boundsCheck(1, "readU8");
        return buf_[pos_++];
    }

    // Read n bytes as an unsigned big-endian integer. Preconditions: n ≤ 8.
    [[nodiscard]] std::uint64_t readUBE(std::size_t n) {
        if (n > 8)
            throw WireError(ErrorKind::MalformedData,
                            "integer field wider than 8 bytes (" + std::to_string(n) + ")");
        boundsCheck(n, "readUBE");
        std::uint64_t v = 0;
        for (std::size_t i = 0; i < n; ++i)
            v = (v << 8) | buf_[pos_++];
        return v;
    }

    // Return a view over the next n bytes and advance past them.
    [[nodiscard]] std::span<const std::uint8_t> readSpan(std::size_t n) {
        boundsCheck(n, "readSpan");
        auto out = buf_.subspan(pos_, n);
        pos_ += n;
        return out;
    }

private:
    std::span<const std::uint8_t> buf_;
    std::size_t pos_{0};

    void boundsCheck(std::size_t n, const char* where) const {
        if (!canRead(n))
            throw WireError(ErrorKind::TruncatedData,
                            std::string("ByteReader::") + where + " – needs " +
                                std::to_string(n) + " byte(s), " +
                                std::to_string(available()) + " left");
    }
};

// ─────────────────────────────────────────────────────────────────────────────
//  ByteWriter
// ─────────────────────────────────────────────────────────────────────────────
// Appends bytes into an internal buffer that grows as needed.
class ByteWriter {
public:
    ByteWriter() = default;

    void writeU8(std::uint8_t b) { buf_.push_back(b); }

    // Write the low n bytes of value, most significant first. n ≤ 8.
    void writeUBE(std::uint64_t value, std::size_t n) {
        for (std::size_t i = n; i > 0; --i)
            buf_.push_back(static_cast<std::uint8_t>(value >> ((i - 1) * 8)));
    }

    void writeBytes(std::span<const std::uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    [[nodiscard]] const Bytes& buffer() const noexcept { return buf_; }
    [[nodiscard]] Bytes        take()         noexcept { return std::move(buf_); }
    [[nodiscard]] std::size_t  size()   const noexcept { return buf_.size(); }

private:
    Bytes buf_;
};

// Number of bytes needed to hold value as an unsigned big-endian integer
// (0 for value == 0).
[[nodiscard]] inline std::size_t byteWidth(std::uint64_t value) noexcept {
    std::size_t n = 0;
    while (value != 0) {
        ++n;
        value >>= 8;
    }
    return n;
}

} // namespace encodium
