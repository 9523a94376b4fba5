#ifndef ELF_MODEL_ELF_HPP
#define ELF_MODEL_ELF_HPP

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "elf_class.hpp"
#include "elf_data.hpp"
#include "enums.hpp"
#include "gnu.hpp"
#include "region.hpp"

namespace elf_model {

// The file identifying fields of an Elf, see header()
template<Elf_Class Class> struct Header
{
  Elf_Data data{ Elf_Data::ELFDATA2LSB };
  Elf_Class elf_class{ Class };
  OS_ABI os_abi{ OS_ABI::System_V };
  std::uint8_t abi_version{};
  Object_Type type{ Object_Type::ET_NONE };
  Machine machine{ Machine::None };
  Word<Class> entry{};
  std::uint32_t flags{};
};

// The contents of an elf file. `Class` fixes the width of every address and
// size held anywhere in the file.
template<Elf_Class Class> struct Elf
{
  using Word_Type   = Word<Class>;
  using Region      = Data_Region<Class>;
  using Region_List = std::vector<Region>;

  Elf(const Elf_Data t_data, const Object_Type t_type, const Machine t_machine) noexcept
    : data{ t_data }, type{ t_type }, machine{ t_machine }
  {
  }

  Elf_Data data;
  OS_ABI os_abi{ OS_ABI::System_V };
  std::uint8_t abi_version{ 0 };
  Object_Type type;
  Machine machine;
  Word_Type entry{ 0 };  // 0 for files that are not executable
  std::uint32_t flags{ 0 };
  std::optional<Gnu_Stack> gnu_stack{};
  std::vector<Gnu_Relro_Region<Class>> gnu_relro_regions{};

  [[nodiscard]] static constexpr auto elf_class() noexcept -> Elf_Class { return Class; }

  // top level regions in file order
  [[nodiscard]] auto file_data() const noexcept -> const Region_List & { return m_file_data; }

  void set_file_data(Region_List t_regions) { m_file_data = std::move(t_regions); }

  void add_data_region(Region t_region) { m_file_data.push_back(std::move(t_region)); }

  // copy of this file with the top level regions replaced
  [[nodiscard]] auto with_file_data(Region_List t_regions) const -> Elf
  {
    auto result        = *this;
    result.m_file_data = std::move(t_regions);
    return result;
  }

private:
  Region_List m_file_data;
};

template<Elf_Class Class>[[nodiscard]] auto empty_elf(const Elf_Data t_data, const Object_Type t_type, const Machine t_machine) -> Elf<Class>
{
  return Elf<Class>{ t_data, t_type, t_machine };
}

// snapshot of the live header fields, nothing is validated
template<Elf_Class Class>[[nodiscard]] auto header(const Elf<Class> &t_elf) noexcept -> Header<Class>
{
  return Header<Class>{ t_elf.data, Class, t_elf.os_abi, t_elf.abi_version, t_elf.type, t_elf.machine, t_elf.entry, t_elf.flags };
}

template<Elf_Class Class, typename Func> void for_each_data_region(const Elf<Class> &t_elf, Func &&t_func)
{
  for_each_data_region(t_elf.file_data(), std::forward<Func>(t_func));
}

template<Elf_Class Class, typename Func>[[nodiscard]] auto find_data_region(const Elf<Class> &t_elf, Func &&t_func)
{
  return find_data_region(t_elf.file_data(), std::forward<Func>(t_func));
}

template<Elf_Class Class, typename Func>[[nodiscard]] auto collect_data_regions(const Elf<Class> &t_elf, Func &&t_func)
{
  return collect_data_regions(t_elf.file_data(), std::forward<Func>(t_func));
}

// number of segments described by the regions, nested ones included
template<Elf_Class Class>[[nodiscard]] auto segment_count(const Elf<Class> &t_elf) -> std::size_t
{
  std::size_t count = 0;
  for_each_data_region(t_elf, [&count](const Data_Region<Class> &t_region) {
    if (t_region.template is<Segment<Class>>()) { ++count; }
  });
  return count;
}

template<Elf_Class Class>[[nodiscard]] auto find_segment(const Elf<Class> &t_elf, const Segment_Index t_index) -> std::optional<Segment<Class>>
{
  return find_data_region(t_elf, [t_index](const Data_Region<Class> &t_region) -> std::optional<Segment<Class>> {
    if (const auto *segment = t_region.template get_if<Segment<Class>>(); segment != nullptr && segment->index == t_index) { return *segment; }
    return std::nullopt;
  });
}

}  // namespace elf_model

#endif
