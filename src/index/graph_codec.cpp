#include "tessera/index/graph_codec.hpp"
#include "tessera/index/graph_params.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstdio>
#include <cstring>
#include <limits>
#include <utility>

namespace tessera::index {

// Reflected CRC-32C (Castagnoli) table using reversed polynomial 0x82F63B78
static constexpr std::array<std::uint32_t, 256> CRC32C_TABLE = []{
  std::array<std::uint32_t, 256> t{};
  const std::uint32_t poly = 0x82F63B78u;
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1u) ? (poly ^ (c >> 1)) : (c >> 1);
    }
    t[i] = c;
  }
  return t;
}();

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t {
  std::uint32_t c = ~0u;
  for (auto b : bytes) {
    c = CRC32C_TABLE[(c ^ b) & 0xFFu] ^ (c >> 8);
  }
  return ~c;
}

// Host <-> little-endian; a no-op on little-endian hosts
template <typename T>
static constexpr auto to_le(T v) -> T {
  if constexpr (std::endian::native == std::endian::big) return std::byteswap(v);
  else return v;
}

static auto load_le16(const std::uint8_t* p) -> std::uint16_t {
  std::uint16_t v;
  std::memcpy(&v, p, 2);
  return to_le(v);
}
static auto load_le32(const std::uint8_t* p) -> std::uint32_t {
  std::uint32_t v;
  std::memcpy(&v, p, 4);
  return to_le(v);
}
static auto load_le64(const std::uint8_t* p) -> std::uint64_t {
  std::uint64_t v;
  std::memcpy(&v, p, 8);
  return to_le(v);
}

static auto sorted_ids(const EdgeSet& s) -> std::vector<ElementId> {
  std::vector<ElementId> v(s.begin(), s.end());
  std::sort(v.begin(), v.end());
  return v;
}

auto encode_graph(const UndirectedGraph& graph)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  using core::error; using core::error_code;

  const auto& nodes = graph.nodes();
  std::vector<ElementId> ids;
  ids.reserve(nodes.size());
  std::size_t total = GRAPH_SNAPSHOT_HEADER_SIZE + 4;
  for (const auto& [id, edges] : nodes) {
    if (edges.size() > std::numeric_limits<std::uint32_t>::max()) {
      return std::unexpected(error{error_code::invalid_argument, "degree too large", "index.graph_codec"});
    }
    ids.push_back(id);
    total += 8 + 4 + 8 * edges.size();
  }
  std::sort(ids.begin(), ids.end());

  std::vector<std::uint8_t> out(total);
  std::uint8_t* p = out.data();
  auto store_le16 = [&](std::uint16_t v){ v = to_le(v); std::memcpy(p, &v, 2); p += 2; };
  auto store_le32 = [&](std::uint32_t v){ v = to_le(v); std::memcpy(p, &v, 4); p += 4; };
  auto store_le64 = [&](std::uint64_t v){ v = to_le(v); std::memcpy(p, &v, 8); p += 8; };

  store_le32(GRAPH_SNAPSHOT_MAGIC);
  store_le16(GRAPH_SNAPSHOT_VERSION);
  store_le16(0);
  store_le64(static_cast<std::uint64_t>(graph.m_max()));
  store_le64(static_cast<std::uint64_t>(ids.size()));
  for (ElementId id : ids) {
    const auto neighbors = sorted_ids(nodes.at(id));
    store_le64(id);
    store_le32(static_cast<std::uint32_t>(neighbors.size()));
    for (ElementId n : neighbors) store_le64(n);
  }
  const std::uint32_t c = crc32c({out.data(), out.size() - 4});
  store_le32(c);
  return out;
}

static auto decode_impl(std::span<const std::uint8_t> bytes)
    -> std::expected<UndirectedGraph, core::error> {
  using core::error; using core::error_code;

  if (bytes.size() < GRAPH_SNAPSHOT_HEADER_SIZE + 4) {
    return std::unexpected(error{error_code::precondition_failed, "snapshot too short", "index.graph_codec"});
  }
  const std::uint8_t* p = bytes.data();
  const std::uint8_t* const body_end = bytes.data() + bytes.size() - 4;

  const std::uint32_t magic = load_le32(p); p += 4;
  if (magic != GRAPH_SNAPSHOT_MAGIC) {
    return std::unexpected(error{error_code::data_integrity, "bad magic", "index.graph_codec"});
  }
  if (crc32c(bytes.first(bytes.size() - 4)) != load_le32(body_end)) {
    return std::unexpected(error{error_code::data_integrity, "crc mismatch", "index.graph_codec"});
  }
  const std::uint16_t version = load_le16(p); p += 2;
  const std::uint16_t reserved = load_le16(p); p += 2;
  if (version != GRAPH_SNAPSHOT_VERSION) {
    return std::unexpected(error{error_code::unsupported, "unknown snapshot version", "index.graph_codec"});
  }
  if (reserved != 0) {
    return std::unexpected(error{error_code::precondition_failed, "reserved != 0", "index.graph_codec"});
  }
  const std::uint64_t m_max = load_le64(p); p += 8;
  const std::uint64_t node_count = load_le64(p); p += 8;

  auto remaining = [&]{ return static_cast<std::size_t>(body_end - p); };
  // Each node needs at least id + degree
  if (node_count > remaining() / 12) {
    return std::unexpected(error{error_code::precondition_failed, "node count exceeds payload", "index.graph_codec"});
  }

  UndirectedGraph::NodeMap nodes;
  nodes.reserve(static_cast<std::size_t>(node_count));
  for (std::uint64_t i = 0; i < node_count; ++i) {
    if (remaining() < 12) {
      return std::unexpected(error{error_code::precondition_failed, "truncated node header", "index.graph_codec"});
    }
    const ElementId id = load_le64(p); p += 8;
    const std::uint32_t degree = load_le32(p); p += 4;
    if (static_cast<std::size_t>(degree) > remaining() / 8) {
      return std::unexpected(error{error_code::precondition_failed, "truncated neighbor list", "index.graph_codec"});
    }
    EdgeSet edges;
    edges.reserve(degree);
    for (std::uint32_t k = 0; k < degree; ++k) {
      if (!edges.insert(load_le64(p)).second) {
        return std::unexpected(error{error_code::data_integrity, "duplicate neighbor id", "index.graph_codec"});
      }
      p += 8;
    }
    if (!nodes.emplace(id, std::move(edges)).second) {
      return std::unexpected(error{error_code::data_integrity, "duplicate node id", "index.graph_codec"});
    }
  }
  if (p != body_end) {
    return std::unexpected(error{error_code::precondition_failed, "trailing bytes after last node", "index.graph_codec"});
  }

  auto g = UndirectedGraph::from_nodes(static_cast<std::size_t>(m_max), std::move(nodes));
  if (!g) {
    auto err = g.error();
    err.component = "index.graph_codec";
    return std::unexpected(std::move(err));
  }
  return std::move(*g);
}

auto decode_graph(std::span<const std::uint8_t> bytes)
    -> std::expected<UndirectedGraph, core::error> {
  auto g = decode_impl(bytes);
  if (!g && graph_debug_from_env()) {
    std::fprintf(stderr, "[tessera.graph] snapshot rejected (%u): %s\n",
                 static_cast<unsigned>(g.error().code), g.error().message.c_str());
  }
  return g;
}

} // namespace tessera::index
