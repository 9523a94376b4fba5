#ifndef ELF_MODEL_GOT_HPP
#define ELF_MODEL_GOT_HPP

#include <string>

#include "section.hpp"

namespace elf_model {

// A global offset table section.
template<typename W> struct Got
{
  Section_Index index{};
  std::string name;
  W addr{};
  W addr_align{};
  W ent_size{};
  Bytes data;

  [[nodiscard]] friend bool operator==(const Got &lhs, const Got &rhs)
  {
    return lhs.index == rhs.index && lhs.name == rhs.name && lhs.addr == rhs.addr && lhs.addr_align == rhs.addr_align
           && lhs.ent_size == rhs.ent_size && lhs.data == rhs.data;
  }

  [[nodiscard]] friend bool operator!=(const Got &lhs, const Got &rhs) { return !(lhs == rhs); }
};

template<typename W>[[nodiscard]] auto got_size(const Got<W> &t_got) noexcept -> W { return static_cast<W>(t_got.data.size()); }

template<typename W>[[nodiscard]] constexpr auto got_section_flags() noexcept -> Section_Flags<W> { return SHF_WRITE<W> | SHF_ALLOC<W>; }

template<typename W>[[nodiscard]] auto got_section(const Got<W> &t_got) -> Section<W>
{
  return Section<W>{ t_got.index,
                     t_got.name,
                     Section_Type::SHT_PROGBITS,
                     got_section_flags<W>(),
                     t_got.addr,
                     got_size(t_got),
                     0,
                     0,
                     t_got.addr_align,
                     t_got.ent_size,
                     t_got.data };
}

}  // namespace elf_model

#endif
