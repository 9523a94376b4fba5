#ifndef ELF_MODEL_PRINT_UTILITIES_HPP
#define ELF_MODEL_PRINT_UTILITIES_HPP

#include <ostream>

#include <fmt/format.h>

#include <rang.hpp>

#include "render.hpp"

namespace elf_model::utility {

// 16 bytes per line, coloured when `t_os` is a terminal
inline void dump_bytes(std::ostream &t_os, const Byte_View t_bytes)
{
  std::size_t loc = 0;
  t_os << rang::fg::yellow << fmt::format("Dumping {} bytes\n", t_bytes.size()) << rang::style::dim;

  for (const auto byte : t_bytes) {
    t_os << fmt::format(" {:02x}", byte);
    if ((++loc % 16) == 0) { t_os << '\n'; }
  }
  if ((loc % 16) != 0) { t_os << '\n'; }
  t_os << rang::style::reset << rang::fg::reset;
}

template<Elf_Class Class> void dump_elf(std::ostream &t_os, const Elf<Class> &t_elf)
{
  t_os << rang::fg::yellow << rang::style::bold << fmt::format("ELF image ({}, {} regions)\n", to_string(Class), t_elf.file_data().size())
       << rang::style::reset << rang::fg::reset;
  t_os << pp_header(header(t_elf)) << '\n';

  std::size_t count = 0;
  for (const auto &region : t_elf.file_data()) {
    t_os << rang::fg::cyan << fmt::format("region {}:\n", count++) << rang::fg::reset;
    t_os << indent(pp_region(region), 2) << '\n';
  }
}

}  // namespace elf_model::utility

#endif
