// LengthCodec.cpp – Length-of-length framing.
//
// Examples:
//   5    → 05
//   249  → F9
//   250  → FA FA
//   300  → FB 01 2C

#include "Encodium/LengthCodec.hpp"

#include <string>

namespace encodium {

void encodeLength(ByteWriter& out, std::uint64_t length) {
    if (length <= kMaxShortLength) {
        out.writeU8(static_cast<std::uint8_t>(length));
        return;
    }
    const std::size_t k = byteWidth(length);
    if (k > kMaxLengthBytes)
        throw WireError(ErrorKind::LengthTooLarge,
                        "length " + std::to_string(length) + " needs " + std::to_string(k) +
                            " length bytes (max " + std::to_string(kMaxLengthBytes) + ")");
    out.writeU8(static_cast<std::uint8_t>(kMaxShortLength + k));
    out.writeUBE(length, k);
}

Bytes encodeLength(std::uint64_t length) {
    ByteWriter w;
    encodeLength(w, length);
    return w.take();
}

std::uint64_t decodeLength(ByteReader& in) {
    const std::uint8_t first = in.readU8();
    if (first <= kMaxShortLength)
        return first;
    // 0xFA..0xFF → 1..6 trailing length bytes
    const std::size_t k = static_cast<std::size_t>(first - kMaxShortLength);
    return in.readUBE(k);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Chunks
// ─────────────────────────────────────────────────────────────────────────────

void writeAbsentChunk(ByteWriter& out) {
    out.writeU8(kAbsentChunk);
}

void writeChunk(ByteWriter& out, std::span<const std::uint8_t> payload) {
    encodeLength(out, payload.size());
    out.writeBytes(payload);
}

std::vector<Chunk> readChunks(ByteReader& in) {
    std::vector<Chunk> chunks;
    while (!in.atEnd()) {
        const std::size_t  at     = in.position();
        const std::uint64_t length = decodeLength(in);
        if (length == 0) {
            chunks.emplace_back(std::nullopt);
            continue;
        }
        if (!in.canRead(length))
            throw WireError(ErrorKind::TruncatedData,
                            "chunk " + std::to_string(chunks.size()) + " at offset " +
                                std::to_string(at) + " declares " + std::to_string(length) +
                                " byte(s), " + std::to_string(in.available()) + " left");
        chunks.emplace_back(in.readSpan(static_cast<std::size_t>(length)));
    }
    return chunks;
}

} // namespace encodium
