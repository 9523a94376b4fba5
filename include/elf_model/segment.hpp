#ifndef ELF_MODEL_SEGMENT_HPP
#define ELF_MODEL_SEGMENT_HPP

#include <cstdint>
#include <string>
#include <variant>

namespace elf_model {

// index of a segment in the program header table
using Segment_Index = std::uint16_t;

// p_type, any 32 bit code is a valid value
enum class Segment_Type : std::uint32_t {
  PT_NULL         = 0,           // Unused entry
  PT_LOAD         = 1,           // Loadable program segment
  PT_DYNAMIC      = 2,           // Dynamic linking information
  PT_INTERP       = 3,           // Program interpreter path name
  PT_NOTE         = 4,           // Note sections
  PT_SHLIB        = 5,           // Reserved
  PT_PHDR         = 6,           // Program header table
  PT_TLS          = 7,           // Thread local storage, see https://www.akkadia.org/drepper/tls.pdf
  PT_NUM          = 8,           // Number of defined types
  PT_LOOS         = 0x60000000,  // Start of OS-specific
  PT_GNU_EH_FRAME = 0x6474e550,  // The GCC '.eh_frame_hdr' segment
  PT_GNU_STACK    = 0x6474e551,  // Indicates if stack should be executable
  PT_GNU_RELRO    = 0x6474e552,  // Writable at load, read-only once relocations are applied
  PT_PAX_FLAGS    = 0x65041580,  // Binary uses PAX
  PT_HIOS         = 0x6fffffff,  // End of OS-specific
  PT_LOPROC       = 0x70000000,  // Start of processor-specific
  PT_HIPROC       = 0x7fffffff   // End of processor-specific
};

// "PT_<NAME>" for the named segment kinds, hex for everything else
[[nodiscard]] std::string to_string(Segment_Type t_type);

// p_flags permission bits
enum class Segment_Flags : std::uint32_t { PF_NONE = 0, PF_X = 1, PF_W = 2, PF_R = 4 };

[[nodiscard]] constexpr auto operator|(const Segment_Flags lhs, const Segment_Flags rhs) noexcept -> Segment_Flags
{
  return static_cast<Segment_Flags>(static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
}

[[nodiscard]] constexpr auto operator&(const Segment_Flags lhs, const Segment_Flags rhs) noexcept -> Segment_Flags
{
  return static_cast<Segment_Flags>(static_cast<std::uint32_t>(lhs) & static_cast<std::uint32_t>(rhs));
}

[[nodiscard]] constexpr auto operator^(const Segment_Flags lhs, const Segment_Flags rhs) noexcept -> Segment_Flags
{
  return static_cast<Segment_Flags>(static_cast<std::uint32_t>(lhs) ^ static_cast<std::uint32_t>(rhs));
}

[[nodiscard]] constexpr auto operator~(const Segment_Flags t_flags) noexcept -> Segment_Flags
{
  return static_cast<Segment_Flags>(~static_cast<std::uint32_t>(t_flags));
}

constexpr auto operator|=(Segment_Flags &lhs, const Segment_Flags rhs) noexcept -> Segment_Flags & { return lhs = lhs | rhs; }

[[nodiscard]] std::string to_string(Segment_Flags t_flags);

// In memory size of a segment. The writer resolves it against the size of
// the segment contents: an absolute size only wins when it is larger, a
// relative size is added on top.
template<typename W> struct Absolute_Size
{
  W value{};

  [[nodiscard]] constexpr friend bool operator==(const Absolute_Size &lhs, const Absolute_Size &rhs) noexcept { return lhs.value == rhs.value; }
  [[nodiscard]] constexpr friend bool operator!=(const Absolute_Size &lhs, const Absolute_Size &rhs) noexcept { return lhs.value != rhs.value; }
};

template<typename W> struct Relative_Size
{
  W value{};

  [[nodiscard]] constexpr friend bool operator==(const Relative_Size &lhs, const Relative_Size &rhs) noexcept { return lhs.value == rhs.value; }
  [[nodiscard]] constexpr friend bool operator!=(const Relative_Size &lhs, const Relative_Size &rhs) noexcept { return lhs.value != rhs.value; }
};

template<typename W> using Mem_Size = std::variant<Absolute_Size<W>, Relative_Size<W>>;

}  // namespace elf_model

#endif
