#include "../include/elf_model/segment.hpp"
#include "../include/elf_model/utility.hpp"

#include <array>
#include <string_view>
#include <utility>

namespace elf_model {

std::string to_string(const Segment_Type t_type)
{
  // the range markers (PT_LOOS, PT_HIPROC...) and PT_NUM are not segment kinds and print as hex
  switch (t_type) {
  case Segment_Type::PT_NULL: return "PT_NULL";
  case Segment_Type::PT_LOAD: return "PT_LOAD";
  case Segment_Type::PT_DYNAMIC: return "PT_DYNAMIC";
  case Segment_Type::PT_INTERP: return "PT_INTERP";
  case Segment_Type::PT_NOTE: return "PT_NOTE";
  case Segment_Type::PT_SHLIB: return "PT_SHLIB";
  case Segment_Type::PT_PHDR: return "PT_PHDR";
  case Segment_Type::PT_TLS: return "PT_TLS";
  case Segment_Type::PT_GNU_EH_FRAME: return "PT_GNU_EH_FRAME";
  case Segment_Type::PT_GNU_STACK: return "PT_GNU_STACK";
  case Segment_Type::PT_GNU_RELRO: return "PT_GNU_RELRO";
  case Segment_Type::PT_PAX_FLAGS: return "PT_PAX_FLAGS";
  default: return utility::pp_hex(static_cast<std::uint32_t>(t_type));
  }
}

std::string to_string(const Segment_Flags t_flags)
{
  constexpr std::array<std::pair<Segment_Flags, std::string_view>, 3> names{ { { Segment_Flags::PF_X, "pf_x" },
                                                                               { Segment_Flags::PF_W, "pf_w" },
                                                                               { Segment_Flags::PF_R, "pf_r" } } };
  return utility::show_flags("pf_none", names, static_cast<std::uint32_t>(t_flags));
}

}  // namespace elf_model
