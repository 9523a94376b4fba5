#include "../include/elf_model/enums.hpp"
#include "../include/elf_model/utility.hpp"

namespace elf_model {

std::string to_string(const OS_ABI t_abi)
{
  switch (t_abi) {
  case OS_ABI::System_V: return "System_V";
  case OS_ABI::HP_UX: return "HP_UX";
  case OS_ABI::NetBSD: return "NetBSD";
  case OS_ABI::Linux: return "Linux";
  case OS_ABI::GNU_Hurd: return "GNU_Hurd";
  case OS_ABI::Solaris: return "Solaris";
  case OS_ABI::AIX: return "AIX";
  case OS_ABI::IRIX: return "IRIX";
  case OS_ABI::FreeBSD: return "FreeBSD";
  case OS_ABI::Tru64: return "Tru64";
  case OS_ABI::Novell_Modesto: return "Novell_Modesto";
  case OS_ABI::OpenBSD: return "OpenBSD";
  case OS_ABI::OpenVMS: return "OpenVMS";
  case OS_ABI::NonStop_Kernel: return "NonStop_Kernel";
  case OS_ABI::AROS: return "AROS";
  case OS_ABI::Fenix_OS: return "Fenix_OS";
  case OS_ABI::CloudABI: return "CloudABI";
  case OS_ABI::ARM_AEABI: return "ARM_AEABI";
  case OS_ABI::ARM: return "ARM";
  case OS_ABI::Standalone: return "Standalone";
  }

  return utility::pp_hex(static_cast<std::uint8_t>(t_abi));
}

std::string to_string(const Object_Type t_type)
{
  switch (t_type) {
  case Object_Type::ET_NONE: return "ET_NONE";
  case Object_Type::ET_REL: return "ET_REL";
  case Object_Type::ET_EXEC: return "ET_EXEC";
  case Object_Type::ET_DYN: return "ET_DYN";
  case Object_Type::ET_CORE: return "ET_CORE";
  case Object_Type::ET_LOOS: return "ET_LOOS";
  case Object_Type::ET_HIOS: return "ET_HIOS";
  case Object_Type::ET_LOPROC: return "ET_LOPROC";
  case Object_Type::ET_HIPROC: return "ET_HIPROC";
  }

  return utility::pp_hex(static_cast<std::uint16_t>(t_type));
}

std::string to_string(const Machine t_machine)
{
  switch (t_machine) {
  case Machine::None: return "None";
  case Machine::SPARC: return "SPARC";
  case Machine::x86: return "x86";
  case Machine::MIPS: return "MIPS";
  case Machine::PowerPC: return "PowerPC";
  case Machine::PPC64: return "PPC64";
  case Machine::S390: return "S390";
  case Machine::ARM: return "ARM";
  case Machine::SuperH: return "SuperH";
  case Machine::IA_64: return "IA_64";
  case Machine::x86_64: return "x86_64";
  case Machine::AArch64: return "AArch64";
  case Machine::RISC_V: return "RISC_V";
  }

  return utility::pp_hex(static_cast<std::uint16_t>(t_machine));
}

}  // namespace elf_model
