#include "../include/elf_model/symbol.hpp"
#include "../include/elf_model/utility.hpp"

namespace elf_model {

std::string to_string(const Symbol_Binding t_binding)
{
  switch (t_binding) {
  case Symbol_Binding::STB_LOCAL: return "STB_LOCAL";
  case Symbol_Binding::STB_GLOBAL: return "STB_GLOBAL";
  case Symbol_Binding::STB_WEAK: return "STB_WEAK";
  case Symbol_Binding::STB_LOOS: return "STB_LOOS";
  case Symbol_Binding::STB_HIOS: return "STB_HIOS";
  case Symbol_Binding::STB_LOPROC: return "STB_LOPROC";
  case Symbol_Binding::STB_HIPROC: return "STB_HIPROC";
  }

  return utility::pp_hex(static_cast<std::uint8_t>(t_binding));
}

std::string to_string(const Symbol_Type t_type)
{
  // STT_SPARC_REGISTER shares its code with STT_LOPROC
  switch (t_type) {
  case Symbol_Type::STT_NOTYPE: return "STT_NOTYPE";
  case Symbol_Type::STT_OBJECT: return "STT_OBJECT";
  case Symbol_Type::STT_FUNC: return "STT_FUNC";
  case Symbol_Type::STT_SECTION: return "STT_SECTION";
  case Symbol_Type::STT_FILE: return "STT_FILE";
  case Symbol_Type::STT_COMMON: return "STT_COMMON";
  case Symbol_Type::STT_TLS: return "STT_TLS";
  case Symbol_Type::STT_LOOS: return "STT_LOOS";
  case Symbol_Type::STT_HIOS: return "STT_HIOS";
  case Symbol_Type::STT_LOPROC: return "STT_LOPROC";
  case Symbol_Type::STT_HIPROC: return "STT_HIPROC";
  }

  return utility::pp_hex(static_cast<std::uint8_t>(t_type));
}

}  // namespace elf_model
