#define CATCH_CONFIG_MAIN  // This tells Catch to provide a main()
#include <catch2/catch.hpp>

#include <elf_model/elf_class.hpp>
#include <elf_model/elf_data.hpp>
#include <elf_model/range.hpp>
#include <elf_model/segment.hpp>
#include <elf_model/symbol.hpp>
#include <elf_model/utility.hpp>

#include <array>

template<bool B> bool static_test()
{
  static_assert(B);
  return B;
}

#if defined(RELAXED_CONSTEXPR)
#define TEST(X) X
#define CONSTEXPR
#else
#define TEST(X) static_test<X>()
#define CONSTEXPR constexpr
#endif

using elf_model::Elf_Class;
using elf_model::Elf_Data;
using elf_model::Range;
using elf_model::Segment_Flags;
using elf_model::Symbol_Binding;
using elf_model::Symbol_Type;

template<std::size_t N> constexpr auto make_view(const std::array<std::uint8_t, N> &t_data)
{
  return elf_model::Byte_View{ t_data.data(), t_data.size() };
}

constexpr auto word_size = [](auto t_class) { return sizeof(elf_model::Word<decltype(t_class)::value>); };

CONSTEXPR std::array<std::uint8_t, 8> test_bytes{ 0x7f, 0x45, 0x4c, 0x46, 0x02, 0x01, 0x01, 0x00 };

// every byte holds a type nibble and a binding nibble
constexpr bool info_round_trips() noexcept
{
  for (unsigned info = 0; info < 256; ++info) {
    const auto [type, binding] = elf_model::info_to_type_and_bind(static_cast<std::uint8_t>(info));
    if (elf_model::type_and_bind_to_info(type, binding) != info) { return false; }
  }
  return true;
}

constexpr bool type_and_bind_round_trip() noexcept
{
  for (std::uint8_t type = 0; type < 16; ++type) {
    for (std::uint8_t binding = 0; binding < 16; ++binding) {
      const auto info = elf_model::type_and_bind_to_info(static_cast<Symbol_Type>(type), static_cast<Symbol_Binding>(binding));
      if (elf_model::info_to_type_and_bind(info) != std::pair{ static_cast<Symbol_Type>(type), static_cast<Symbol_Binding>(binding) }) { return false; }
    }
  }
  return true;
}

constexpr bool only_known_class_bytes() noexcept
{
  for (unsigned value = 0; value < 256; ++value) {
    const bool known = value == 1 || value == 2;
    const auto elf_class = elf_model::to_elf_class(static_cast<std::uint8_t>(value));
    if (elf_class.has_value() != known) { return false; }
    if (elf_class && elf_model::from_elf_class(*elf_class) != value) { return false; }
  }
  return true;
}

constexpr bool only_known_data_bytes() noexcept
{
  for (unsigned value = 0; value < 256; ++value) {
    const bool known = value == 1 || value == 2;
    const auto data  = elf_model::to_elf_data(static_cast<std::uint8_t>(value));
    if (data.has_value() != known) { return false; }
    if (data && elf_model::from_elf_data(*data) != value) { return false; }
  }
  return true;
}

TEST_CASE("class byte widths")
{
  REQUIRE(TEST(elf_model::byte_width(Elf_Class::ELFCLASS32) == 4));
  REQUIRE(TEST(elf_model::bit_width(Elf_Class::ELFCLASS32) == 32));
  REQUIRE(TEST(elf_model::byte_width(Elf_Class::ELFCLASS64) == 8));
  REQUIRE(TEST(elf_model::bit_width(Elf_Class::ELFCLASS64) == 64));
  REQUIRE(TEST(sizeof(elf_model::Word<Elf_Class::ELFCLASS32>) == 4));
  REQUIRE(TEST(sizeof(elf_model::Word<Elf_Class::ELFCLASS64>) == 8));
}

TEST_CASE("class and data byte tags")
{
  REQUIRE(TEST(only_known_class_bytes()));
  REQUIRE(TEST(only_known_data_bytes()));
  REQUIRE(TEST(*elf_model::to_elf_class(1) == Elf_Class::ELFCLASS32));
  REQUIRE(TEST(*elf_model::to_elf_class(2) == Elf_Class::ELFCLASS64));
  REQUIRE(TEST(*elf_model::to_elf_data(1) == Elf_Data::ELFDATA2LSB));
  REQUIRE(TEST(*elf_model::to_elf_data(2) == Elf_Data::ELFDATA2MSB));
  REQUIRE(TEST(!elf_model::to_elf_class(0).has_value()));
  REQUIRE(TEST(!elf_model::to_elf_data(3).has_value()));
}

TEST_CASE("class names")
{
  REQUIRE(TEST(elf_model::to_string(Elf_Class::ELFCLASS32) == "ELFCLASS32"));
  REQUIRE(TEST(elf_model::to_string(Elf_Class::ELFCLASS64) == "ELFCLASS64"));
  REQUIRE(TEST(elf_model::to_string(Elf_Data::ELFDATA2MSB) == "ELFDATA2MSB"));
}

TEST_CASE("width generic code through visit_class")
{
  REQUIRE(TEST(elf_model::visit_class(Elf_Class::ELFCLASS32, word_size) == 4));
  REQUIRE(TEST(elf_model::visit_class(Elf_Class::ELFCLASS64, word_size) == 8));
}

TEST_CASE("symbol info packing")
{
  REQUIRE(TEST(info_round_trips()));
  REQUIRE(TEST(type_and_bind_round_trip()));
  REQUIRE(TEST(elf_model::type_and_bind_to_info(Symbol_Type::STT_FUNC, Symbol_Binding::STB_GLOBAL) == 0x12));
  REQUIRE(TEST(elf_model::info_to_type_and_bind(0x21).first == Symbol_Type::STT_OBJECT));
  REQUIRE(TEST(elf_model::info_to_type_and_bind(0x21).second == Symbol_Binding::STB_WEAK));
}

TEST_CASE("symbol info packing does not range check")
{
  // a binding wider than a nibble loses its high bits
  REQUIRE(TEST(elf_model::type_and_bind_to_info(Symbol_Type::STT_NOTYPE, static_cast<Symbol_Binding>(0x1F)) == 0xF0));
  // a type wider than a nibble spills into the binding
  REQUIRE(TEST(elf_model::type_and_bind_to_info(static_cast<Symbol_Type>(0x12), Symbol_Binding::STB_LOCAL) == 0x12));
}

TEST_CASE("segment flag permissions")
{
  CONSTEXPR auto read_write = Segment_Flags::PF_R | Segment_Flags::PF_W;
  REQUIRE(TEST(elf_model::utility::has_permissions(read_write, Segment_Flags::PF_R)));
  REQUIRE(TEST(elf_model::utility::has_permissions(read_write, Segment_Flags::PF_R | Segment_Flags::PF_W)));
  REQUIRE(TEST(!elf_model::utility::has_permissions(Segment_Flags::PF_R, Segment_Flags::PF_W)));
  REQUIRE(TEST(!elf_model::utility::has_permissions(read_write, Segment_Flags::PF_X)));
  REQUIRE(TEST(elf_model::utility::has_permissions(Segment_Flags::PF_X, Segment_Flags::PF_NONE)));
  REQUIRE(TEST((read_write & ~Segment_Flags::PF_W) == Segment_Flags::PF_R));
  REQUIRE(TEST((read_write ^ Segment_Flags::PF_R) == Segment_Flags::PF_W));
}

TEST_CASE("plain integer permissions")
{
  REQUIRE(TEST(elf_model::utility::has_permissions(0b110u, 0b100u)));
  REQUIRE(TEST(!elf_model::utility::has_permissions(0b010u, 0b011u)));
}

TEST_CASE("range containment")
{
  CONSTEXPR Range<std::uint32_t> range{ 3, 4 };
  REQUIRE(TEST(elf_model::in_range(3u, range)));
  REQUIRE(TEST(elf_model::in_range(5u, range)));
  REQUIRE(TEST(elf_model::in_range(6u, range)));
  REQUIRE(TEST(!elf_model::in_range(7u, range)));
  REQUIRE(TEST(!elf_model::in_range(2u, range)));
  REQUIRE(TEST(!elf_model::in_range(0u, range)));
  REQUIRE(TEST(!elf_model::in_range(3u, Range<std::uint32_t>{ 3, 0 })));
}

TEST_CASE("range containment near the top of the word")
{
  CONSTEXPR Range<std::uint64_t> range{ 0xFFFF'FFFF'FFFF'FFF0, 0x10 };
  REQUIRE(TEST(elf_model::in_range(std::uint64_t{ 0xFFFF'FFFF'FFFF'FFFF }, range)));
  REQUIRE(TEST(!elf_model::in_range(std::uint64_t{ 0x10 }, range)));
}

TEST_CASE("slices are clamped to the buffer")
{
  REQUIRE(TEST(elf_model::slice(Range<std::uint32_t>{ 1, 3 }, make_view(test_bytes)).size() == 3));
  REQUIRE(TEST(elf_model::slice(Range<std::uint32_t>{ 1, 3 }, make_view(test_bytes))[0] == 0x45));
  REQUIRE(TEST(elf_model::slice(Range<std::uint32_t>{ 6, 100 }, make_view(test_bytes)).size() == 2));
  REQUIRE(TEST(elf_model::slice(Range<std::uint32_t>{ 8, 1 }, make_view(test_bytes)).empty()));
  REQUIRE(TEST(elf_model::slice(Range<std::uint64_t>{ 0xFFFF'FFFF'FFFF, 1 }, make_view(test_bytes)).empty()));
}
