#include "../include/elf_model/validate.hpp"

#include <map>
#include <set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace elf_model {

namespace {
  template<typename W> constexpr bool valid_alignment(const W t_align) noexcept { return t_align <= 1 || (t_align & (t_align - 1)) == 0; }

  template<typename W> void check_symbol_table(const Symbol_Table<W> &t_table, std::vector<Validation_Issue> &t_issues)
  {
    const auto &entries = t_table.entries;

    if (t_table.local_entries > entries.size()) {
      t_issues.push_back({ Validation_Issue::Kinds::Local_Count_Exceeds_Entries,
                           fmt::format("symbol table {} claims {} local entries but holds {}", t_table.index, t_table.local_entries, entries.size()) });
    }

    if (!entries.empty() && entries.front().binding != Symbol_Binding::STB_LOCAL) {
      t_issues.push_back({ Validation_Issue::Kinds::First_Symbol_Not_Local,
                           fmt::format("symbol table {} starts with non local symbol {:?}", t_table.index, entries.front().name) });
    }

    // entries [0, local_entries) are local, everything after is not.
    // A non local entry 0 is already reported above.
    for (std::size_t idx = 0; idx < entries.size(); ++idx) {
      const bool local = entries[idx].binding == Symbol_Binding::STB_LOCAL;
      if (idx < t_table.local_entries && !local) {
        if (idx == 0) { continue; }
        t_issues.push_back({ Validation_Issue::Kinds::Global_In_Local_Range,
                             fmt::format("symbol table {} entry {} ({:?}) is not local but lies in the local range", t_table.index, idx, entries[idx].name) });
      } else if (idx >= t_table.local_entries && local) {
        t_issues.push_back({ Validation_Issue::Kinds::Local_After_Global,
                             fmt::format("symbol table {} entry {} ({:?}) is local but follows the local range", t_table.index, idx, entries[idx].name) });
      }
    }
  }
}  // namespace

template<Elf_Class Class> std::vector<Validation_Issue> validate(const Elf<Class> &t_elf, spdlog::logger &logger)
{
  logger.info("Validating {} image with {} top level regions", to_string(Class), t_elf.file_data().size());

  std::vector<Validation_Issue> issues;

  // index -> number of segments using it
  std::map<Segment_Index, std::size_t> used_indices;
  std::set<Segment_Index> segment_indices;

  for_each_data_region(t_elf, [&](const Data_Region<Class> &t_region) {
    if (const auto *segment = t_region.template get_if<Segment<Class>>(); segment != nullptr) {
      logger.trace("Segment {} type: {}", segment->index, to_string(segment->type));
      ++used_indices[segment->index];
      segment_indices.insert(segment->index);
      if (!valid_alignment(segment->align)) {
        issues.push_back({ Validation_Issue::Kinds::Invalid_Alignment,
                           fmt::format("segment {} alignment {} is not a power of two", segment->index, segment->align) });
      }
    } else if (const auto *table = t_region.template get_if<Symbol_Table<Word<Class>>>(); table != nullptr) {
      logger.trace("Symbol table in section {} with {} entries", table->index, table->entries.size());
      check_symbol_table(*table, issues);
    }
  });

  if (t_elf.gnu_stack) { ++used_indices[t_elf.gnu_stack->segment_index]; }

  for (const auto &relro : t_elf.gnu_relro_regions) {
    ++used_indices[relro.segment_index];
    if (segment_indices.count(relro.ref_segment_index) == 0) {
      issues.push_back({ Validation_Issue::Kinds::Unknown_Relro_Segment,
                         fmt::format("relro segment {} refers to missing segment {}", relro.segment_index, relro.ref_segment_index) });
    }
  }

  std::size_t total = 0;
  for (const auto &[index, uses] : used_indices) { total += uses; }

  for (const auto &[index, uses] : used_indices) {
    if (uses > 1) {
      issues.push_back({ Validation_Issue::Kinds::Duplicate_Segment_Index, fmt::format("segment index {} is used {} times", index, uses) });
    }
    if (index >= total) {
      issues.push_back(
        { Validation_Issue::Kinds::Segment_Index_Out_Of_Range, fmt::format("segment index {} is outside of 0..{}", index, total == 0 ? 0 : total - 1) });
    }
  }

  for (const auto &issue : issues) { logger.warn("{}", issue.message); }
  logger.info("Validation found {} issue(s) across {} segment(s)", issues.size(), total);

  return issues;
}

template std::vector<Validation_Issue> validate(const Elf<Elf_Class::ELFCLASS32> &, spdlog::logger &);
template std::vector<Validation_Issue> validate(const Elf<Elf_Class::ELFCLASS64> &, spdlog::logger &);

}  // namespace elf_model
