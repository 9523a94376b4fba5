#ifndef ELF_MODEL_RANGE_HPP
#define ELF_MODEL_RANGE_HPP

#include <algorithm>
#include <cstdint>
#include <type_traits>

#include "utility.hpp"

namespace elf_model {

// half open interval [start, start + count)
template<typename W> struct Range
{
  static_assert(std::is_unsigned_v<W>);

  W start{};
  W count{};
};

template<typename W> Range(W, W)->Range<W>;

// values below `start` are never in range, the subtraction is not allowed to wrap
template<typename W>[[nodiscard]] constexpr bool in_range(const W t_value, const Range<W> &t_range) noexcept
{
  return t_range.start <= t_value && (t_value - t_range.start) < t_range.count;
}

// at most `count` bytes starting at `start`, clamped to the end of `t_data`
template<typename W>[[nodiscard]] constexpr auto slice(const Range<W> &t_range, const Byte_View t_data) noexcept -> Byte_View
{
  if (static_cast<std::uint64_t>(t_range.start) >= t_data.size()) { return {}; }

  const auto start = static_cast<std::size_t>(t_range.start);
  const auto count = static_cast<std::size_t>(std::min<std::uint64_t>(t_range.count, t_data.size() - start));
  return t_data.substr(start, count);
}

template<typename W>[[nodiscard]] auto slice_copy(const Range<W> &t_range, const Bytes &t_data) -> Bytes
{
  const auto view = slice(t_range, Byte_View{ t_data.data(), t_data.size() });
  return Bytes{ view.begin(), view.end() };
}

}  // namespace elf_model

#endif
