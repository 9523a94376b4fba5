#ifndef ELF_MODEL_ELF_CLASS_HPP
#define ELF_MODEL_ELF_CLASS_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <type_traits>

#include "utility.hpp"

namespace elf_model {

// EI_CLASS, selects the width of addresses and offsets for a whole file
enum class Elf_Class : std::uint8_t { ELFCLASS32 = 1, ELFCLASS64 = 2 };

template<Elf_Class Class> struct Class_Traits;

template<> struct Class_Traits<Elf_Class::ELFCLASS32>
{
  using word_type                         = std::uint32_t;
  static constexpr std::size_t byte_width = 4;
  static constexpr std::size_t bit_width  = 32;
};

template<> struct Class_Traits<Elf_Class::ELFCLASS64>
{
  using word_type                         = std::uint64_t;
  static constexpr std::size_t byte_width = 8;
  static constexpr std::size_t bit_width  = 64;
};

// the unsigned word used for every address/size field of a file of class `Class`
template<Elf_Class Class> using Word = typename Class_Traits<Class>::word_type;

template<Elf_Class Class> constexpr bool is_valid_word()
{
  using W = Word<Class>;
  return std::is_integral_v<W> && std::is_unsigned_v<W> && std::numeric_limits<W>::is_bounded
         && std::numeric_limits<W>::digits == static_cast<int>(Class_Traits<Class>::bit_width) && sizeof(W) == Class_Traits<Class>::byte_width;
}

static_assert(is_valid_word<Elf_Class::ELFCLASS32>());
static_assert(is_valid_word<Elf_Class::ELFCLASS64>());

[[nodiscard]] constexpr auto byte_width(const Elf_Class t_class) noexcept -> std::size_t
{
  switch (t_class) {
  case Elf_Class::ELFCLASS32: return Class_Traits<Elf_Class::ELFCLASS32>::byte_width;
  case Elf_Class::ELFCLASS64: return Class_Traits<Elf_Class::ELFCLASS64>::byte_width;
  }

  utility::runtime_assert(false);
  return 0;
}

[[nodiscard]] constexpr auto bit_width(const Elf_Class t_class) noexcept -> std::size_t
{
  switch (t_class) {
  case Elf_Class::ELFCLASS32: return Class_Traits<Elf_Class::ELFCLASS32>::bit_width;
  case Elf_Class::ELFCLASS64: return Class_Traits<Elf_Class::ELFCLASS64>::bit_width;
  }

  utility::runtime_assert(false);
  return 0;
}

[[nodiscard]] constexpr auto to_elf_class(const std::uint8_t t_value) noexcept -> std::optional<Elf_Class>
{
  switch (t_value) {
  case 1: return Elf_Class::ELFCLASS32;
  case 2: return Elf_Class::ELFCLASS64;
  default: return std::nullopt;
  }
}

[[nodiscard]] constexpr auto from_elf_class(const Elf_Class t_class) noexcept -> std::uint8_t { return static_cast<std::uint8_t>(t_class); }

[[nodiscard]] constexpr auto to_string(const Elf_Class t_class) noexcept -> std::string_view
{
  switch (t_class) {
  case Elf_Class::ELFCLASS32: return "ELFCLASS32";
  case Elf_Class::ELFCLASS64: return "ELFCLASS64";
  }

  return "ELFCLASS_INVALID";
}

// Calls `t_func` with a std::integral_constant naming the class, which lets
// width generic code recover `Word<Class>` from a value only known at runtime.
// Both instantiations of `t_func` must return the same type.
template<typename Func> constexpr auto visit_class(const Elf_Class t_class, Func &&t_func)
{
  if (t_class == Elf_Class::ELFCLASS32) { return t_func(std::integral_constant<Elf_Class, Elf_Class::ELFCLASS32>{}); }

  utility::runtime_assert(t_class == Elf_Class::ELFCLASS64);
  return t_func(std::integral_constant<Elf_Class, Elf_Class::ELFCLASS64>{});
}

}  // namespace elf_model

#endif
