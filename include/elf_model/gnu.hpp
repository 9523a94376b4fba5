#ifndef ELF_MODEL_GNU_HPP
#define ELF_MODEL_GNU_HPP

#include "elf_class.hpp"
#include "segment.hpp"

namespace elf_model {

// PT_GNU_STACK
struct Gnu_Stack
{
  Segment_Index segment_index{};  // index given to the generated segment
  bool is_executable{ false };

  [[nodiscard]] constexpr friend bool operator==(const Gnu_Stack &lhs, const Gnu_Stack &rhs) noexcept
  {
    return lhs.segment_index == rhs.segment_index && lhs.is_executable == rhs.is_executable;
  }

  [[nodiscard]] constexpr friend bool operator!=(const Gnu_Stack &lhs, const Gnu_Stack &rhs) noexcept { return !(lhs == rhs); }
};

// PT_GNU_RELRO
template<Elf_Class Class> struct Gnu_Relro_Region
{
  Segment_Index segment_index{};      // index given to the generated segment
  Segment_Index ref_segment_index{};  // the loadable segment being protected

  // Start of the region made read-only, usually the base address of the
  // referenced segment. Consumers round it down to the page alignment.
  Word<Class> addr_start{};
  Word<Class> size{};

  [[nodiscard]] constexpr friend bool operator==(const Gnu_Relro_Region &lhs, const Gnu_Relro_Region &rhs) noexcept
  {
    return lhs.segment_index == rhs.segment_index && lhs.ref_segment_index == rhs.ref_segment_index && lhs.addr_start == rhs.addr_start
           && lhs.size == rhs.size;
  }

  [[nodiscard]] constexpr friend bool operator!=(const Gnu_Relro_Region &lhs, const Gnu_Relro_Region &rhs) noexcept { return !(lhs == rhs); }
};

}  // namespace elf_model

#endif
