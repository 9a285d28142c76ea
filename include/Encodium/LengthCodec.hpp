#pragma once
// LengthCodec.hpp – Length-of-length framing and chunk sequences.
//
// Length prefix:
//   length ≤ 0xF9           → [length]
//   length ≥ 0xFA           → [0xF9 + k][k bytes, big-endian]   (1 ≤ k ≤ 6)
//
// Chunk:
//   absent                  → [0x00]
//   present                 → [length prefix][payload]
//
// A chunk sequence is a run of chunks terminated by the end of the enclosing
// buffer. Records and lists both use it.

#include "ByteStream.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace encodium {

constexpr std::uint8_t  kMaxShortLength   = 0xF9;
constexpr std::size_t   kMaxLengthBytes   = 6;
constexpr std::uint64_t kMaxChunkLength   = (std::uint64_t{1} << (8 * kMaxLengthBytes)) - 1;
constexpr std::uint8_t  kAbsentChunk      = 0x00;

// One parsed chunk: std::nullopt when absent, otherwise a view of its payload.
using Chunk = std::optional<std::span<const std::uint8_t>>;

// Append the length prefix for a payload of the given size.
// Throws WireError(LengthTooLarge) when more than 6 length bytes are needed.
void encodeLength(ByteWriter& out, std::uint64_t length);

[[nodiscard]] Bytes encodeLength(std::uint64_t length);

// Read one length prefix. Throws WireError(TruncatedData) on a short buffer.
[[nodiscard]] std::uint64_t decodeLength(ByteReader& in);

// ── Chunk helpers ────────────────────────────────────────────────────────────

void writeAbsentChunk(ByteWriter& out);
void writeChunk(ByteWriter& out, std::span<const std::uint8_t> payload);

// Split everything left in the reader into chunks, in wire order.
[[nodiscard]] std::vector<Chunk> readChunks(ByteReader& in);

} // namespace encodium
