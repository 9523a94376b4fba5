#ifndef ELF_MODEL_VALIDATE_HPP
#define ELF_MODEL_VALIDATE_HPP

#include <string>
#include <vector>

#include "elf.hpp"

namespace spdlog {
class logger;
}  // namespace spdlog

namespace elf_model {

struct Validation_Issue
{
  enum class Kinds {
    Duplicate_Segment_Index,
    Segment_Index_Out_Of_Range,
    Invalid_Alignment,
    Local_Count_Exceeds_Entries,
    First_Symbol_Not_Local,
    Global_In_Local_Range,
    Local_After_Global,
    Unknown_Relro_Segment
  };

  Kinds kind;
  std::string message;
};

// Checks the layout invariants the model documents but does not enforce.
// Segment indices are counted over the region tree plus the GNU stack and
// relro segments a writer would generate. Nothing is modified, every issue
// found is logged as a warning and returned.
template<Elf_Class Class>[[nodiscard]] std::vector<Validation_Issue> validate(const Elf<Class> &t_elf, spdlog::logger &logger);

}  // namespace elf_model

#endif
