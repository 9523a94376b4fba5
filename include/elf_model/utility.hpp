#ifndef ELF_MODEL_UTILITY_HPP
#define ELF_MODEL_UTILITY_HPP

#include <climits>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

namespace elf_model {

// raw, uninterpreted file contents
using Bytes     = std::vector<std::uint8_t>;
using Byte_View = std::basic_string_view<std::uint8_t>;

}  // namespace elf_model

namespace elf_model::utility {

constexpr inline void runtime_assert(bool condition)
{
  if (!condition) { abort(); }
}

// true if every bit set in `t_required` is also set in `t_value`
template<typename Bits>[[nodiscard]] constexpr bool has_permissions(const Bits t_value, const Bits t_required) noexcept
{
  return (t_value & t_required) == t_required;
}

// "0x" followed by lowercase hex digits, zero padded to the width of `Int`
// when that width is a whole number of nibbles
template<typename Int>[[nodiscard]] std::string pp_hex(const Int t_value)
{
  static_assert(std::is_integral_v<Int> && !std::is_same_v<Int, bool>);

  if constexpr (std::is_signed_v<Int>) { runtime_assert(t_value >= 0); }

  using Unsigned         = std::make_unsigned_t<Int>;
  constexpr auto bits    = sizeof(Int) * CHAR_BIT;
  const auto as_unsigned = static_cast<std::uint64_t>(static_cast<Unsigned>(t_value));

  if constexpr (bits % 4 == 0) {
    return fmt::format("0x{:0{}x}", as_unsigned, bits / 4);
  } else {
    return fmt::format("0x{:x}", as_unsigned);
  }
}

// Renders a bit mask as `t_base` when empty, otherwise as the names of the set
// bits joined by " | ". Bits with no name are appended as a single hex value.
// `t_names` is a sequence of {mask, name} pairs.
template<typename Int, typename Names>[[nodiscard]] std::string show_flags(const std::string_view t_base, const Names &t_names, const Int t_value)
{
  if (t_value == 0) { return std::string{ t_base }; }

  std::string result;
  auto remaining = t_value;

  const auto append = [&result](const std::string_view t_token) {
    if (!result.empty()) { result += " | "; }
    result += t_token;
  };

  for (const auto &[mask, name] : t_names) {
    const auto bits = static_cast<Int>(mask);
    if (bits != 0 && (t_value & bits) == bits) {
      append(name);
      remaining = static_cast<Int>(remaining & static_cast<Int>(~bits));
    }
  }

  if (remaining != 0) { append(fmt::format("{:#x}", static_cast<std::uint64_t>(remaining))); }

  return result;
}

}  // namespace elf_model::utility

#endif
