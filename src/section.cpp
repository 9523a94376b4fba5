#include "../include/elf_model/section.hpp"

namespace elf_model {

std::string to_string(const Section_Type t_type)
{
  switch (t_type) {
  case Section_Type::SHT_NULL: return "SHT_NULL";
  case Section_Type::SHT_PROGBITS: return "SHT_PROGBITS";
  case Section_Type::SHT_SYMTAB: return "SHT_SYMTAB";
  case Section_Type::SHT_STRTAB: return "SHT_STRTAB";
  case Section_Type::SHT_RELA: return "SHT_RELA";
  case Section_Type::SHT_HASH: return "SHT_HASH";
  case Section_Type::SHT_DYNAMIC: return "SHT_DYNAMIC";
  case Section_Type::SHT_NOTE: return "SHT_NOTE";
  case Section_Type::SHT_NOBITS: return "SHT_NOBITS";
  case Section_Type::SHT_REL: return "SHT_REL";
  case Section_Type::SHT_SHLIB: return "SHT_SHLIB";
  case Section_Type::SHT_DYNSYM: return "SHT_DYNSYM";
  case Section_Type::SHT_INIT_ARRAY: return "SHT_INIT_ARRAY";
  case Section_Type::SHT_FINI_ARRAY: return "SHT_FINI_ARRAY";
  case Section_Type::SHT_PREINIT_ARRAY: return "SHT_PREINIT_ARRAY";
  case Section_Type::SHT_GROUP: return "SHT_GROUP";
  case Section_Type::SHT_SYMTAB_SHNDX: return "SHT_SYMTAB_SHNDX";
  case Section_Type::SHT_NUM: return "SHT_NUM";
  case Section_Type::SHT_LOOS: return "SHT_LOOS";
  }

  return utility::pp_hex(static_cast<std::uint32_t>(t_type));
}

}  // namespace elf_model
