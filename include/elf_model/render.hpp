#ifndef ELF_MODEL_RENDER_HPP
#define ELF_MODEL_RENDER_HPP

#include <string>
#include <string_view>

#include "elf.hpp"

// Human readable dumps of the model. Output is a block of lines joined by
// '\n' with no trailing newline; nested content is indented by two spaces.

namespace elf_model {

[[nodiscard]] std::string indent(std::string_view t_text, std::size_t t_amount);

[[nodiscard]] std::string to_string(Byte_View t_bytes);

template<typename W>[[nodiscard]] std::string to_string(const Mem_Size<W> &t_size);
template<typename W>[[nodiscard]] std::string to_string(const Section<W> &t_section);
template<typename W>[[nodiscard]] std::string to_string(const Got<W> &t_got);
template<typename W>[[nodiscard]] std::string to_string(const Symbol_Table_Entry<W> &t_entry);
template<typename W>[[nodiscard]] std::string to_string(const Symbol_Table<W> &t_table);

template<Elf_Class Class>[[nodiscard]] std::string pp_segment(const Segment<Class> &t_segment);
template<Elf_Class Class>[[nodiscard]] std::string pp_region(const Data_Region<Class> &t_region);
template<Elf_Class Class>[[nodiscard]] std::string pp_header(const Header<Class> &t_header);
template<Elf_Class Class>[[nodiscard]] std::string pp_elf(const Elf<Class> &t_elf);

}  // namespace elf_model

#endif
