#ifndef ELF_MODEL_SECTION_HPP
#define ELF_MODEL_SECTION_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "enums.hpp"
#include "utility.hpp"

namespace elf_model {

enum class Section_Type : std::uint32_t {
  SHT_NULL          = 0x00,        // Section header table entry unused
  SHT_PROGBITS      = 0x01,        // Program data
  SHT_SYMTAB        = 0x02,        // Symbol table
  SHT_STRTAB        = 0x03,        // String table
  SHT_RELA          = 0x04,        // Relocation entries with addends
  SHT_HASH          = 0x05,        // Symbol hash table
  SHT_DYNAMIC       = 0x06,        // Dynamic linking information
  SHT_NOTE          = 0x07,        // Notes
  SHT_NOBITS        = 0x08,        // Program space with no data (bss)
  SHT_REL           = 0x09,        // Relocation entries, no addends
  SHT_SHLIB         = 0x0A,        // Reserved
  SHT_DYNSYM        = 0x0B,        // Dynamic linker symbol table
  SHT_INIT_ARRAY    = 0x0E,        // Array of constructors
  SHT_FINI_ARRAY    = 0x0F,        // Array of destructors
  SHT_PREINIT_ARRAY = 0x10,        // Array of pre-constructors
  SHT_GROUP         = 0x11,        // Section group
  SHT_SYMTAB_SHNDX  = 0x12,        // Extended section indices
  SHT_NUM           = 0x13,        // Number of defined types.
  SHT_LOOS          = 0x60000000   // Start OS-specific.
};

[[nodiscard]] std::string to_string(Section_Type t_type);

// sh_flags, word sized so the mask follows the class of the file
template<typename W> struct Section_Flags
{
  W value{};

  [[nodiscard]] constexpr friend auto operator|(const Section_Flags lhs, const Section_Flags rhs) noexcept -> Section_Flags
  {
    return Section_Flags{ static_cast<W>(lhs.value | rhs.value) };
  }

  [[nodiscard]] constexpr friend auto operator&(const Section_Flags lhs, const Section_Flags rhs) noexcept -> Section_Flags
  {
    return Section_Flags{ static_cast<W>(lhs.value & rhs.value) };
  }

  [[nodiscard]] constexpr friend bool operator==(const Section_Flags lhs, const Section_Flags rhs) noexcept { return lhs.value == rhs.value; }
  [[nodiscard]] constexpr friend bool operator!=(const Section_Flags lhs, const Section_Flags rhs) noexcept { return lhs.value != rhs.value; }
};

template<typename W> inline constexpr Section_Flags<W> SHF_NONE{ 0x0 };
template<typename W> inline constexpr Section_Flags<W> SHF_WRITE{ 0x1 };                   // Writable
template<typename W> inline constexpr Section_Flags<W> SHF_ALLOC{ 0x2 };                   // Occupies memory during execution
template<typename W> inline constexpr Section_Flags<W> SHF_EXECINSTR{ 0x4 };               // Executable
template<typename W> inline constexpr Section_Flags<W> SHF_MERGE{ 0x10 };                   // Might be merged
template<typename W> inline constexpr Section_Flags<W> SHF_STRINGS{ 0x20 };                 // Contains nul-terminated strings
template<typename W> inline constexpr Section_Flags<W> SHF_INFO_LINK{ 0x40 };               // 'sh_info' contains SHT index
template<typename W> inline constexpr Section_Flags<W> SHF_LINK_ORDER{ 0x80 };              // Preserve order after combining
template<typename W> inline constexpr Section_Flags<W> SHF_OS_NONCONFORMING{ 0x100 };       // Non-standard OS specific handling required
template<typename W> inline constexpr Section_Flags<W> SHF_GROUP{ 0x200 };                  // Section is member of a group
template<typename W> inline constexpr Section_Flags<W> SHF_TLS{ 0x400 };                    // Section hold thread-local data
template<typename W> inline constexpr Section_Flags<W> SHF_ORDERED{ 0x4000000 };            // Special ordering requirement (Solaris)
template<typename W> inline constexpr Section_Flags<W> SHF_EXCLUDE{ 0x8000000 };            // Excluded unless referenced or allocated (Solaris)

template<typename W>[[nodiscard]] std::string to_string(const Section_Flags<W> t_flags)
{
  constexpr std::array<std::pair<std::uint32_t, std::string_view>, 12> names{ { { 0x1, "shf_write" },
                                                                                 { 0x2, "shf_alloc" },
                                                                                 { 0x4, "shf_execinstr" },
                                                                                 { 0x10, "shf_merge" },
                                                                                 { 0x20, "shf_strings" },
                                                                                 { 0x40, "shf_info_link" },
                                                                                 { 0x80, "shf_link_order" },
                                                                                 { 0x100, "shf_os_nonconforming" },
                                                                                 { 0x200, "shf_group" },
                                                                                 { 0x400, "shf_tls" },
                                                                                 { 0x4000000, "shf_ordered" },
                                                                                 { 0x8000000, "shf_exclude" } } };
  return utility::show_flags("shf_none", names, t_flags.value);
}

// A section with no special interpretation. `name` holds the raw bytes of the
// section name, the format does not define an encoding for it.
template<typename W> struct Section
{
  Section_Index index{};
  std::string name;
  Section_Type type{ Section_Type::SHT_NULL };
  Section_Flags<W> flags{};
  W addr{};
  W size{};
  std::uint32_t link{};
  std::uint32_t info{};
  W addr_align{};
  W ent_size{};
  Bytes data;

  [[nodiscard]] friend bool operator==(const Section &lhs, const Section &rhs)
  {
    return lhs.index == rhs.index && lhs.name == rhs.name && lhs.type == rhs.type && lhs.flags == rhs.flags && lhs.addr == rhs.addr
           && lhs.size == rhs.size && lhs.link == rhs.link && lhs.info == rhs.info && lhs.addr_align == rhs.addr_align
           && lhs.ent_size == rhs.ent_size && lhs.data == rhs.data;
  }

  [[nodiscard]] friend bool operator!=(const Section &lhs, const Section &rhs) { return !(lhs == rhs); }
};

}  // namespace elf_model

#endif
