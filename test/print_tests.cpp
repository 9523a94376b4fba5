#define CATCH_CONFIG_MAIN  // This tells Catch to provide a main()
#include <catch2/catch.hpp>

#include <elf_model/print_utilities.hpp>

#include <sstream>

using namespace elf_model;

TEST_CASE("byte dumps wrap every 16 bytes")
{
  Bytes data;
  for (std::uint8_t byte = 0; byte < 18; ++byte) { data.push_back(byte); }

  std::ostringstream os;
  utility::dump_bytes(os, Byte_View{ data.data(), data.size() });

  // string streams are not terminals, so no colour codes are written
  REQUIRE(os.str()
          == "Dumping 18 bytes\n"
             " 00 01 02 03 04 05 06 07 08 09 0a 0b 0c 0d 0e 0f\n"
             " 10 11\n");
}

TEST_CASE("empty byte dump")
{
  std::ostringstream os;
  utility::dump_bytes(os, Byte_View{});
  REQUIRE(os.str() == "Dumping 0 bytes\n");
}

TEST_CASE("elf dump lists every top level region")
{
  auto elf = empty_elf<Elf_Class::ELFCLASS64>(Elf_Data::ELFDATA2LSB, Object_Type::ET_EXEC, Machine::x86_64);
  elf.add_data_region(Elf_Header_Region{});
  elf.add_data_region(Raw_Data{ { 0x90 } });

  std::ostringstream os;
  utility::dump_elf(os, elf);

  REQUIRE(os.str()
          == "ELF image (ELFCLASS64, 2 regions)\n"
             "data: ELFDATA2LSB\n"
             "class: ELFCLASS64\n"
             "osabi: System_V\n"
             "abi version: 0\n"
             "type: ET_EXEC\n"
             "machine: x86_64\n"
             "entry: 0x0000000000000000\n"
             "flags: 0x00000000\n"
             "region 0:\n"
             "  ELF header\n"
             "region 1:\n"
             "  raw bytes: [1] 90\n");
}
