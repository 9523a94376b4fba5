#ifndef ELF_MODEL_SYMBOL_HPP
#define ELF_MODEL_SYMBOL_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "enums.hpp"

namespace elf_model {

// https://docs.oracle.com/cd/E23824_01/html/819-0690/chapter6-79797.html#chapter6-tbl-23

enum class Symbol_Binding : std::uint8_t {
  STB_LOCAL  = 0,
  STB_GLOBAL = 1,
  STB_WEAK   = 2,
  STB_LOOS   = 10,
  STB_HIOS   = 12,
  STB_LOPROC = 13,
  STB_HIPROC = 15,
};

enum class Symbol_Type : std::uint8_t {
  STT_NOTYPE         = 0,
  STT_OBJECT         = 1,
  STT_FUNC           = 2,
  STT_SECTION        = 3,
  STT_FILE           = 4,
  STT_COMMON         = 5,
  STT_TLS            = 6,
  STT_LOOS           = 10,
  STT_HIOS           = 12,
  STT_LOPROC         = 13,
  STT_SPARC_REGISTER = 13,
  STT_HIPROC         = 15
};

[[nodiscard]] std::string to_string(Symbol_Binding t_binding);
[[nodiscard]] std::string to_string(Symbol_Type t_type);

// st_info keeps the type in the low nibble and the binding in the high nibble
[[nodiscard]] constexpr auto info_to_type_and_bind(const std::uint8_t t_info) noexcept -> std::pair<Symbol_Type, Symbol_Binding>
{
  return { static_cast<Symbol_Type>(t_info & 0x0F), static_cast<Symbol_Binding>((t_info >> 4) & 0x0F) };
}

// no range check, values wider than a nibble bleed into the neighbouring field
[[nodiscard]] constexpr auto type_and_bind_to_info(const Symbol_Type t_type, const Symbol_Binding t_binding) noexcept -> std::uint8_t
{
  return static_cast<std::uint8_t>(static_cast<std::uint8_t>(t_type) | (static_cast<std::uint8_t>(t_binding) << 4));
}

// One decoded symbol. `name` is the raw byte string from the string table,
// the format only promises it was null terminated.
template<typename W> struct Symbol_Table_Entry
{
  std::string name;
  Symbol_Type type{ Symbol_Type::STT_NOTYPE };
  Symbol_Binding binding{ Symbol_Binding::STB_LOCAL };
  std::uint8_t other{};
  Section_Index section_index{};  // section in which the symbol is defined
  W value{};
  W size{};

  [[nodiscard]] friend bool operator==(const Symbol_Table_Entry &lhs, const Symbol_Table_Entry &rhs)
  {
    return lhs.name == rhs.name && lhs.type == rhs.type && lhs.binding == rhs.binding && lhs.other == rhs.other
           && lhs.section_index == rhs.section_index && lhs.value == rhs.value && lhs.size == rhs.size;
  }

  [[nodiscard]] friend bool operator!=(const Symbol_Table_Entry &lhs, const Symbol_Table_Entry &rhs) { return !(lhs == rhs); }
};

template<typename W> struct Symbol_Table
{
  Section_Index index{};  // section storing the table

  // local entries come first, the first entry is expected to be local
  std::vector<Symbol_Table_Entry<W>> entries;

  // number of local entries, never more than entries.size()
  std::uint32_t local_entries{};

  [[nodiscard]] friend bool operator==(const Symbol_Table &lhs, const Symbol_Table &rhs)
  {
    return lhs.index == rhs.index && lhs.entries == rhs.entries && lhs.local_entries == rhs.local_entries;
  }

  [[nodiscard]] friend bool operator!=(const Symbol_Table &lhs, const Symbol_Table &rhs) { return !(lhs == rhs); }
};

}  // namespace elf_model

#endif
