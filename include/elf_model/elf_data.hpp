#ifndef ELF_MODEL_ELF_DATA_HPP
#define ELF_MODEL_ELF_DATA_HPP

#include <cstdint>
#include <optional>
#include <string_view>

namespace elf_model {

// EI_DATA, byte order of every multi byte field in the file
enum class Elf_Data : std::uint8_t {
  ELFDATA2LSB = 1,  // least significant byte first
  ELFDATA2MSB = 2   // most significant byte first
};

[[nodiscard]] constexpr auto to_elf_data(const std::uint8_t t_value) noexcept -> std::optional<Elf_Data>
{
  switch (t_value) {
  case 1: return Elf_Data::ELFDATA2LSB;
  case 2: return Elf_Data::ELFDATA2MSB;
  default: return std::nullopt;
  }
}

[[nodiscard]] constexpr auto from_elf_data(const Elf_Data t_data) noexcept -> std::uint8_t { return static_cast<std::uint8_t>(t_data); }

[[nodiscard]] constexpr auto to_string(const Elf_Data t_data) noexcept -> std::string_view
{
  switch (t_data) {
  case Elf_Data::ELFDATA2LSB: return "ELFDATA2LSB";
  case Elf_Data::ELFDATA2MSB: return "ELFDATA2MSB";
  }

  return "ELFDATA_INVALID";
}

}  // namespace elf_model

#endif
