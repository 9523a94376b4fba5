#ifndef ELF_MODEL_REGION_HPP
#define ELF_MODEL_REGION_HPP

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "elf_class.hpp"
#include "got.hpp"
#include "section.hpp"
#include "segment.hpp"
#include "symbol.hpp"

namespace elf_model {

template<Elf_Class Class> struct Data_Region;

// A segment and, in file order, the regions it covers. Children are owned by
// value so a file forms a strict tree with no links back to a parent.
template<Elf_Class Class> struct Segment
{
  Segment_Type type{ Segment_Type::PT_NULL };
  Segment_Flags flags{ Segment_Flags::PF_NONE };

  // position in the program header table, unique within a file and in 0..count-1
  Segment_Index index{};

  Word<Class> virt_addr{};
  Word<Class> phys_addr{};

  // p_align; 0 or 1 for none, otherwise a power of two with
  // virt_addr % align == file offset % align. The writer does not pad to meet it.
  Word<Class> align{};

  Mem_Size<Word<Class>> mem_size{ Relative_Size<Word<Class>>{ 0 } };
  std::vector<Data_Region<Class>> data;

  [[nodiscard]] friend bool operator==(const Segment &lhs, const Segment &rhs)
  {
    return lhs.type == rhs.type && lhs.flags == rhs.flags && lhs.index == rhs.index && lhs.virt_addr == rhs.virt_addr
           && lhs.phys_addr == rhs.phys_addr && lhs.align == rhs.align && lhs.mem_size == rhs.mem_size && lhs.data == rhs.data;
  }

  [[nodiscard]] friend bool operator!=(const Segment &lhs, const Segment &rhs) { return !(lhs == rhs); }
};

// Markers for the parts of the file the writer generates itself. They are
// regions so that a segment can state that it contains them.
struct Elf_Header_Region
{
};

struct Segment_Headers_Region
{
};

struct Section_Headers_Region
{
};

// .shstrtab, contents are generated, only its index is kept
struct Section_Name_Table
{
  Section_Index index{};
};

// .strtab, contents are generated from the symbol table
struct Strtab
{
  Section_Index index{};
};

struct Raw_Data
{
  Bytes bytes;
};

[[nodiscard]] constexpr bool operator==(const Elf_Header_Region &, const Elf_Header_Region &) noexcept { return true; }
[[nodiscard]] constexpr bool operator==(const Segment_Headers_Region &, const Segment_Headers_Region &) noexcept { return true; }
[[nodiscard]] constexpr bool operator==(const Section_Headers_Region &, const Section_Headers_Region &) noexcept { return true; }
[[nodiscard]] constexpr bool operator==(const Section_Name_Table &lhs, const Section_Name_Table &rhs) noexcept { return lhs.index == rhs.index; }
[[nodiscard]] constexpr bool operator==(const Strtab &lhs, const Strtab &rhs) noexcept { return lhs.index == rhs.index; }
[[nodiscard]] inline bool operator==(const Raw_Data &lhs, const Raw_Data &rhs) { return lhs.bytes == rhs.bytes; }

[[nodiscard]] constexpr bool operator!=(const Elf_Header_Region &, const Elf_Header_Region &) noexcept { return false; }
[[nodiscard]] constexpr bool operator!=(const Segment_Headers_Region &, const Segment_Headers_Region &) noexcept { return false; }
[[nodiscard]] constexpr bool operator!=(const Section_Headers_Region &, const Section_Headers_Region &) noexcept { return false; }
[[nodiscard]] constexpr bool operator!=(const Section_Name_Table &lhs, const Section_Name_Table &rhs) noexcept { return !(lhs == rhs); }
[[nodiscard]] constexpr bool operator!=(const Strtab &lhs, const Strtab &rhs) noexcept { return !(lhs == rhs); }
[[nodiscard]] inline bool operator!=(const Raw_Data &lhs, const Raw_Data &rhs) { return !(lhs == rhs); }

// One unit of file content, either at the top level of a file or inside a segment.
template<Elf_Class Class> struct Data_Region
{
  using Word_Type = Word<Class>;

  using Value = std::variant<Elf_Header_Region,
                             Segment_Headers_Region,
                             Segment<Class>,
                             Section_Headers_Region,
                             Section_Name_Table,
                             Got<Word_Type>,
                             Strtab,
                             Symbol_Table<Word_Type>,
                             Section<Word_Type>,
                             Raw_Data>;

  Value value;

  template<typename T,
           typename = std::enable_if_t<
             std::conjunction_v<std::negation<std::is_same<std::decay_t<T>, Data_Region>>, std::is_constructible<Value, T>>>>
  Data_Region(T &&t_value) : value{ std::forward<T>(t_value) }  // NOLINT
  {
  }

  template<typename T>[[nodiscard]] constexpr bool is() const noexcept { return std::holds_alternative<T>(value); }

  template<typename T>[[nodiscard]] constexpr const T *get_if() const noexcept { return std::get_if<T>(&value); }

  template<typename T>[[nodiscard]] constexpr T *get_if() noexcept { return std::get_if<T>(&value); }

  [[nodiscard]] friend bool operator==(const Data_Region &lhs, const Data_Region &rhs) { return lhs.value == rhs.value; }
  [[nodiscard]] friend bool operator!=(const Data_Region &lhs, const Data_Region &rhs) { return !(lhs == rhs); }
};

// Pre-order walk: every region is offered to `t_func`, a segment before its
// children, and the children before the segment's next sibling.
template<Elf_Class Class, typename Func> void for_each_data_region(const std::vector<Data_Region<Class>> &t_regions, Func &&t_func)
{
  for (const auto &region : t_regions) {
    t_func(region);
    if (const auto *segment = region.template get_if<Segment<Class>>(); segment != nullptr) { for_each_data_region(segment->data, t_func); }
  }
}

// Same order as for_each_data_region, stops at the first region for which
// `t_func` returns an engaged optional and returns that value.
template<Elf_Class Class, typename Func>
[[nodiscard]] auto find_data_region(const std::vector<Data_Region<Class>> &t_regions, Func &&t_func)
  -> std::invoke_result_t<Func &, const Data_Region<Class> &>
{
  for (const auto &region : t_regions) {
    if (auto result = t_func(region); result) { return result; }
    if (const auto *segment = region.template get_if<Segment<Class>>(); segment != nullptr) {
      if (auto result = find_data_region(segment->data, t_func); result) { return result; }
    }
  }

  return {};
}

// Same order as for_each_data_region, concatenates the vectors `t_func` returns.
template<Elf_Class Class, typename Func>
[[nodiscard]] auto collect_data_regions(const std::vector<Data_Region<Class>> &t_regions, Func &&t_func)
  -> std::invoke_result_t<Func &, const Data_Region<Class> &>
{
  std::invoke_result_t<Func &, const Data_Region<Class> &> results;

  for_each_data_region(t_regions, [&](const Data_Region<Class> &t_region) {
    auto found = t_func(t_region);
    results.insert(results.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
  });

  return results;
}

}  // namespace elf_model

#endif
