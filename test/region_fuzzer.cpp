#include <elf_model/elf.hpp>
#include <elf_model/range.hpp>
#include <elf_model/render.hpp>
#include <elf_model/validate.hpp>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

using namespace elf_model;

namespace {

constexpr int max_depth             = 8;
constexpr Segment_Index max_segment = 1024;

// Reads the input as a list of opcodes describing a region tree:
//   0: raw bytes, the next byte is the length
//   1: open a segment
//   2: close the current segment
//   3: strtab
//   4: symbol table, the next byte is the info of its only entry
//   5: section header table
template<Elf_Class Class> std::vector<Data_Region<Class>> build_regions(Byte_View &t_input, Segment_Index &t_next_index, const int t_depth)
{
  std::vector<Data_Region<Class>> regions;

  while (!t_input.empty()) {
    const auto op = t_input.front();
    t_input.remove_prefix(1);

    switch (op % 6) {
    case 0: {
      const std::size_t length = t_input.empty() ? 0 : t_input.front();
      if (!t_input.empty()) { t_input.remove_prefix(1); }
      const auto bytes = slice(Range<std::size_t>{ 0, length }, t_input);
      regions.push_back(Raw_Data{ Bytes{ bytes.begin(), bytes.end() } });
      t_input.remove_prefix(bytes.size());
      break;
    }
    case 1:
      if (t_depth < max_depth && t_next_index < max_segment) {
        Segment<Class> segment;
        segment.index = t_next_index++;
        segment.type  = static_cast<Segment_Type>(op);
        segment.flags = static_cast<Segment_Flags>(op >> 4);
        segment.align = op;
        segment.data  = build_regions<Class>(t_input, t_next_index, t_depth + 1);
        regions.push_back(std::move(segment));
      }
      break;
    case 2: return regions;
    case 3: regions.push_back(Strtab{ op }); break;
    case 4: {
      const std::uint8_t info = t_input.empty() ? 0 : t_input.front();
      if (!t_input.empty()) { t_input.remove_prefix(1); }
      const auto [type, binding] = info_to_type_and_bind(info);
      utility::runtime_assert(type_and_bind_to_info(type, binding) == info);

      Symbol_Table<Word<Class>> table;
      table.index         = op;
      table.local_entries = 1;
      table.entries.push_back({ "sym", type, binding, 0, 0, op, 0 });
      regions.push_back(std::move(table));
      break;
    }
    default: regions.push_back(Section_Headers_Region{}); break;
    }
  }

  return regions;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, std::size_t size)
{
  static const auto logger = std::make_shared<spdlog::logger>("fuzz", std::make_shared<spdlog::sinks::null_sink_st>());

  if (size < 2) { return 0; }

  const auto elf_class = to_elf_class(data[0]);
  const auto elf_data  = to_elf_data(data[1]);
  if (!elf_class || !elf_data) { return 0; }

  Byte_View input{ data + 2, size - 2 };

  return visit_class(*elf_class, [&](auto t_class) {
    constexpr auto Class = decltype(t_class)::value;

    auto elf                 = empty_elf<Class>(*elf_data, Object_Type::ET_EXEC, Machine::None);
    Segment_Index next_index = 0;
    elf.set_file_data(build_regions<Class>(input, next_index, 0));

    utility::runtime_assert(segment_count(elf) == next_index);

    const auto rendered = pp_elf(elf);
    const auto issues   = validate(elf, *logger);
    std::cout << "rendered: " << rendered.size() << " bytes, issues: " << issues.size() << '\n';
    return 0;
  });
}
