#include "../include/elf_model/render.hpp"

#include <fmt/format.h>

namespace elf_model {

namespace {
  template<class... Ts> struct Overloaded : Ts...
  {
    using Ts::operator()...;
  };
  template<class... Ts> Overloaded(Ts...)->Overloaded<Ts...>;
}  // namespace

std::string indent(const std::string_view t_text, const std::size_t t_amount)
{
  const std::string padding(t_amount, ' ');
  std::string result;

  std::size_t start = 0;
  while (start <= t_text.size()) {
    const auto end  = t_text.find('\n', start);
    const auto line = t_text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    if (!line.empty()) { result += padding; }
    result += line;
    if (end == std::string_view::npos) { break; }
    result += '\n';
    start = end + 1;
  }

  return result;
}

std::string to_string(const Byte_View t_bytes)
{
  std::string result = fmt::format("[{}]", t_bytes.size());
  for (const auto byte : t_bytes) { result += fmt::format(" {:02x}", byte); }
  return result;
}

template<typename W> std::string to_string(const Mem_Size<W> &t_size)
{
  return std::visit(Overloaded{ [](const Absolute_Size<W> &t_absolute) { return fmt::format("absolute {}", t_absolute.value); },
                                [](const Relative_Size<W> &t_relative) { return fmt::format("relative {}", t_relative.value); } },
                    t_size);
}

template<typename W> std::string to_string(const Section<W> &t_section)
{
  return fmt::format("index: {} name: {:?} type: {} flags: {} addr: {} size: {} link: {} info: {} align: {} entsize: {} data: {}",
                     t_section.index,
                     t_section.name,
                     to_string(t_section.type),
                     to_string(t_section.flags),
                     utility::pp_hex(t_section.addr),
                     t_section.size,
                     t_section.link,
                     t_section.info,
                     t_section.addr_align,
                     t_section.ent_size,
                     to_string(Byte_View{ t_section.data.data(), t_section.data.size() }));
}

template<typename W> std::string to_string(const Got<W> &t_got)
{
  return fmt::format("index: {} name: {:?} addr: {} align: {} entsize: {} data: {}",
                     t_got.index,
                     t_got.name,
                     utility::pp_hex(t_got.addr),
                     t_got.addr_align,
                     t_got.ent_size,
                     to_string(Byte_View{ t_got.data.data(), t_got.data.size() }));
}

template<typename W> std::string to_string(const Symbol_Table_Entry<W> &t_entry)
{
  return fmt::format("name: {:?} type: {} bind: {} other: {} shndx: {} value: {} size: {}",
                     t_entry.name,
                     to_string(t_entry.type),
                     to_string(t_entry.binding),
                     t_entry.other,
                     t_entry.section_index,
                     utility::pp_hex(t_entry.value),
                     t_entry.size);
}

template<typename W> std::string to_string(const Symbol_Table<W> &t_table)
{
  auto result = fmt::format("index: {} entries: {} locals: {}", t_table.index, t_table.entries.size(), t_table.local_entries);
  for (const auto &entry : t_table.entries) { result += '\n' + indent(to_string(entry), 2); }
  return result;
}

template<Elf_Class Class> std::string pp_segment(const Segment<Class> &t_segment)
{
  auto result = fmt::format("type: {}\nflags: {}\nindex: {}\nvaddr: {}\npaddr: {}\nalign: {}\nmsize: {}\ndata:",
                            to_string(t_segment.type),
                            to_string(t_segment.flags),
                            t_segment.index,
                            utility::pp_hex(t_segment.virt_addr),
                            utility::pp_hex(t_segment.phys_addr),
                            t_segment.align,
                            to_string(t_segment.mem_size));

  for (const auto &region : t_segment.data) { result += '\n' + indent(pp_region(region), 2); }

  return result;
}

template<Elf_Class Class> std::string pp_region(const Data_Region<Class> &t_region)
{
  using W = Word<Class>;

  return std::visit(
    Overloaded{ [](const Elf_Header_Region &) -> std::string { return "ELF header"; },
                [](const Segment_Headers_Region &) -> std::string { return "segment header table"; },
                [](const Segment<Class> &t_segment) { return "contained segment\n" + indent(pp_segment(t_segment), 2); },
                [](const Section_Headers_Region &) -> std::string { return "section header table"; },
                [](const Section_Name_Table &t_table) { return fmt::format("section name table (section number {})", t_table.index); },
                [](const Got<W> &t_got) { return "global offset table: " + to_string(t_got); },
                [](const Strtab &t_strtab) { return fmt::format("strtab section (section number {})", t_strtab.index); },
                [](const Symbol_Table<W> &t_table) { return "symtab section: " + to_string(t_table); },
                [](const Section<W> &t_section) { return "other section: " + to_string(t_section); },
                [](const Raw_Data &t_raw) { return "raw bytes: " + to_string(Byte_View{ t_raw.bytes.data(), t_raw.bytes.size() }); } },
    t_region.value);
}

template<Elf_Class Class> std::string pp_header(const Header<Class> &t_header)
{
  return fmt::format("data: {}\nclass: {}\nosabi: {}\nabi version: {}\ntype: {}\nmachine: {}\nentry: {}\nflags: {}",
                     to_string(t_header.data),
                     to_string(t_header.elf_class),
                     to_string(t_header.os_abi),
                     t_header.abi_version,
                     to_string(t_header.type),
                     to_string(t_header.machine),
                     utility::pp_hex(t_header.entry),
                     utility::pp_hex(t_header.flags));
}

template<Elf_Class Class> std::string pp_elf(const Elf<Class> &t_elf)
{
  auto result = pp_header(header(t_elf));

  if (t_elf.gnu_stack) {
    result += fmt::format("\ngnu stack: index: {} executable: {}", t_elf.gnu_stack->segment_index, t_elf.gnu_stack->is_executable);
  }

  for (const auto &relro : t_elf.gnu_relro_regions) {
    result += fmt::format("\ngnu relro: index: {} segment: {} start: {} size: {}",
                          relro.segment_index,
                          relro.ref_segment_index,
                          utility::pp_hex(relro.addr_start),
                          relro.size);
  }

  result += "\nregions:";
  for (const auto &region : t_elf.file_data()) { result += '\n' + indent(pp_region(region), 2); }

  return result;
}

template std::string to_string(const Mem_Size<std::uint32_t> &);
template std::string to_string(const Mem_Size<std::uint64_t> &);
template std::string to_string(const Section<std::uint32_t> &);
template std::string to_string(const Section<std::uint64_t> &);
template std::string to_string(const Got<std::uint32_t> &);
template std::string to_string(const Got<std::uint64_t> &);
template std::string to_string(const Symbol_Table_Entry<std::uint32_t> &);
template std::string to_string(const Symbol_Table_Entry<std::uint64_t> &);
template std::string to_string(const Symbol_Table<std::uint32_t> &);
template std::string to_string(const Symbol_Table<std::uint64_t> &);

template std::string pp_segment(const Segment<Elf_Class::ELFCLASS32> &);
template std::string pp_segment(const Segment<Elf_Class::ELFCLASS64> &);
template std::string pp_region(const Data_Region<Elf_Class::ELFCLASS32> &);
template std::string pp_region(const Data_Region<Elf_Class::ELFCLASS64> &);
template std::string pp_header(const Header<Elf_Class::ELFCLASS32> &);
template std::string pp_header(const Header<Elf_Class::ELFCLASS64> &);
template std::string pp_elf(const Elf<Elf_Class::ELFCLASS32> &);
template std::string pp_elf(const Elf<Elf_Class::ELFCLASS64> &);

}  // namespace elf_model
