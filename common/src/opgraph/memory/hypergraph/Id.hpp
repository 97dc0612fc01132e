#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <functional>
#include <limits>

namespace opgraph::memory {

namespace details {

template <typename Tag> struct GraphId {
public:
  static constexpr std::uint64_t NullId{
      std::numeric_limits<std::uint64_t>::max()};

  explicit constexpr GraphId() : m_id(NullId) {}
  explicit constexpr GraphId(std::uint64_t id) : m_id(id) {}

  constexpr explicit operator std::uint64_t() const { return m_id; }
  constexpr explicit operator bool() const { return m_id != NullId; }
  constexpr std::uint64_t operator*() const { return m_id; }

  friend constexpr bool operator==(const GraphId &lhs, const GraphId &rhs) {
    return lhs.m_id == rhs.m_id;
  }
  friend constexpr bool operator!=(const GraphId &lhs, const GraphId &rhs) {
    return lhs.m_id != rhs.m_id;
  }
  friend constexpr bool operator<(const GraphId &lhs, const GraphId &rhs) {
    return lhs.m_id < rhs.m_id;
  }
  friend constexpr bool operator>(const GraphId &lhs, const GraphId &rhs) {
    return lhs.m_id > rhs.m_id;
  }

private:
  std::uint64_t m_id;
};

struct NodeTag {};
struct EdgeTag {};

} // namespace details

// Data nodes of a hypergraph.
using NodeId = details::GraphId<details::NodeTag>;
// Hyperedges, many sources to many destinations.
using EdgeId = details::GraphId<details::EdgeTag>;

} // namespace opgraph::memory

template <typename Tag> struct std::hash<opgraph::memory::details::GraphId<Tag>> {
  std::size_t
  operator()(const opgraph::memory::details::GraphId<Tag> &id) const noexcept {
    return std::hash<std::uint64_t>{}(*id);
  }
};

template <> struct fmt::formatter<opgraph::memory::NodeId> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const opgraph::memory::NodeId &nid, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "<{}>", *nid);
  }
};

template <> struct fmt::formatter<opgraph::memory::EdgeId> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const opgraph::memory::EdgeId &eid, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "#{}", *eid);
  }
};
