#pragma once

/** \file graph_codec.hpp
 *  \brief Binary snapshot of one adjacency map (pure, in-memory).
 *
 * Layout (little-endian regardless of host byte order):
 *   magic u32 | version u16 | reserved u16 | m_max u64 | node_count u64
 *   node_count x { id u64 | degree u32 | degree x neighbor u64 }
 *   crc32c u32 over every preceding byte
 *
 * Nodes and neighbors are written in ascending id order, so equal graphs encode to
 * equal bytes.
 * Thread-safety: functions are stateless and thread-safe.
 * Errors: returned via std::expected with tessera::core::error.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "tessera/error.hpp"
#include "tessera/index/undirected_graph.hpp"

namespace tessera::index {

constexpr std::uint32_t GRAPH_SNAPSHOT_MAGIC = 0x47555354u; // "TSUG"
constexpr std::uint16_t GRAPH_SNAPSHOT_VERSION = 1;
constexpr std::size_t GRAPH_SNAPSHOT_HEADER_SIZE = 4 + 2 + 2 + 8 + 8; // 24 bytes

// CRC32C (Castagnoli) over the given bytes
auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

// Encode a snapshot; fails with invalid_argument if a degree does not fit in 32 bits
auto encode_graph(const UndirectedGraph& graph)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

// Decode and verify a snapshot; duplicate ids or an asymmetric adjacency are rejected as data_integrity
auto decode_graph(std::span<const std::uint8_t> bytes)
    -> std::expected<UndirectedGraph, core::error>;

} // namespace tessera::index
