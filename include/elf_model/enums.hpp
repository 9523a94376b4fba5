#ifndef ELF_MODEL_ENUMS_HPP
#define ELF_MODEL_ENUMS_HPP

#include <cstdint>
#include <string>

namespace elf_model {

// The version of elf files this model describes (EI_VERSION / e_version)
constexpr std::uint8_t expected_elf_version = 1;

// index of a section in the section header table
using Section_Index = std::uint16_t;

// All of these are open: any code read from a file is representable, the
// enumerators only name the well known ones.

enum class OS_ABI : std::uint8_t {
  System_V       = 0x00,
  HP_UX          = 0x01,
  NetBSD         = 0x02,
  Linux          = 0x03,
  GNU_Hurd       = 0x04,
  Solaris        = 0x06,
  AIX            = 0x07,
  IRIX           = 0x08,
  FreeBSD        = 0x09,
  Tru64          = 0x0A,
  Novell_Modesto = 0x0B,
  OpenBSD        = 0x0C,
  OpenVMS        = 0x0D,
  NonStop_Kernel = 0x0E,
  AROS           = 0x0F,
  Fenix_OS       = 0x10,
  CloudABI       = 0x11,
  ARM_AEABI      = 0x40,
  ARM            = 0x61,
  Standalone     = 0xFF
};

enum class Object_Type : std::uint16_t {
  ET_NONE   = 0x00,
  ET_REL    = 0x01,
  ET_EXEC   = 0x02,
  ET_DYN    = 0x03,
  ET_CORE   = 0x04,
  ET_LOOS   = 0xFE00,
  ET_HIOS   = 0xFEFF,
  ET_LOPROC = 0xFF00,
  ET_HIPROC = 0xFFFF
};

enum class Machine : std::uint16_t {
  None    = 0x00,
  SPARC   = 0x02,
  x86     = 0x03,
  MIPS    = 0x08,
  PowerPC = 0x14,
  PPC64   = 0x15,
  S390    = 0x16,
  ARM     = 0x28,
  SuperH  = 0x2A,
  IA_64   = 0x32,
  x86_64  = 0x3E,
  AArch64 = 0xB7,
  RISC_V  = 0xF3
};

[[nodiscard]] std::string to_string(OS_ABI t_abi);
[[nodiscard]] std::string to_string(Object_Type t_type);
[[nodiscard]] std::string to_string(Machine t_machine);

}  // namespace elf_model

#endif
