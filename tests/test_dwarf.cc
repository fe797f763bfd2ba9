#include <gtest/gtest.h>

#include <dwarf.h>

#include "dwarf.hh"
#include "dwarf_writer.hh"
#include "errors.hh"

static std::vector<dwarf_entry> read_all(Dwarf& dwarf)
{
    std::vector<dwarf_entry> entries;
    dwarf_entry entry;

    while (dwarf.next(entry))
        entries.push_back(entry);

    return entries;
}

TEST(Dwarf, WalksEntriesOfVersion4Units)
{
    info_writer writer;

    writer.begin_unit(4);
    writer.add_die(DW_TAG_compile_unit, true)
        .string(DW_AT_name, "main.c")
        .strp(DW_AT_producer, "GNU C17 12.2.0")
        .data1(DW_AT_language, DW_LANG_C99)
        .addr(DW_AT_low_pc, 0x1000)
        .data8(DW_AT_high_pc, 0x80);
    writer.add_die(DW_TAG_subprogram)
        .strp(DW_AT_name, "main")
        .addr(DW_AT_low_pc, 0x1000)
        .addr(DW_AT_high_pc, 0x1040);
    writer.end_children();

    writer.begin_unit(4);
    writer.add_die(DW_TAG_compile_unit)
        .string(DW_AT_name, "util.c");

    Dwarf dwarf(writer.sections());
    std::vector<dwarf_entry> entries = read_all(dwarf);

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].tag, static_cast<std::uint64_t>(DW_TAG_compile_unit));
    EXPECT_TRUE(entries[0].has_children);
    // 4-byte length, version, abbrev offset, address size
    EXPECT_EQ(entries[0].offset, 11u);
    EXPECT_EQ(entries[1].tag, static_cast<std::uint64_t>(DW_TAG_subprogram));
    EXPECT_EQ(entries[2].tag, static_cast<std::uint64_t>(DW_TAG_compile_unit));
    EXPECT_NE(entries[0].unit, entries[2].unit);

    std::string str;
    ASSERT_TRUE(dwarf.attr_string(entries[0], DW_AT_name, str));
    EXPECT_EQ(str, "main.c");
    ASSERT_TRUE(dwarf.attr_string(entries[0], DW_AT_producer, str));
    EXPECT_EQ(str, "GNU C17 12.2.0");
    ASSERT_TRUE(dwarf.attr_string(entries[1], DW_AT_name, str));
    EXPECT_EQ(str, "main");
    ASSERT_TRUE(dwarf.attr_string(entries[2], DW_AT_name, str));
    EXPECT_EQ(str, "util.c");
    EXPECT_FALSE(dwarf.attr_string(entries[2], DW_AT_comp_dir, str));

    std::uint64_t lang = 0;
    ASSERT_TRUE(dwarf.attr_unsigned(entries[0], DW_AT_language, lang));
    EXPECT_EQ(lang, static_cast<std::uint64_t>(DW_LANG_C99));

    // high_pc as a length
    std::vector<addr_range> ranges = dwarf.ranges(entries[0]);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], addr_range(0x1000, 0x1080));

    // high_pc as an address
    ranges = dwarf.ranges(entries[1]);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], addr_range(0x1000, 0x1040));

    EXPECT_TRUE(dwarf.ranges(entries[2]).empty());
    EXPECT_EQ(entries[0].unit->low_pc, 0x1000u);
}

TEST(Dwarf, IndexedFormsOfVersion5)
{
    info_writer writer;

    writer.begin_unit(5, DW_UT_compile);
    writer.add_die(DW_TAG_compile_unit, true)
        .strx1(DW_AT_name, "a.go")
        .strx1(DW_AT_comp_dir, "/src")
        .addrx(DW_AT_low_pc, 0x4000)
        .data4(DW_AT_high_pc, 0x100);
    writer.add_die(DW_TAG_variable)
        .strx1(DW_AT_name, "main.counter")
        .implicit_const(DW_AT_decl_line, -3)
        .indirect_udata(DW_AT_decl_file, 7)
        .exprloc(DW_AT_location, { DW_OP_addr, 0x10, 0x20, 0, 0, 0, 0, 0, 0 });
    writer.add_die(DW_TAG_subprogram)
        .strx1(DW_AT_name, "main.main")
        .addrx(DW_AT_low_pc, 0x4010)
        .data4(DW_AT_high_pc, 0x20)
        .flag_present(DW_AT_external)
        .sdata(DW_AT_frame_base, -16);
    writer.end_children();

    Dwarf dwarf(writer.sections());
    std::vector<dwarf_entry> entries = read_all(dwarf);
    ASSERT_EQ(entries.size(), 3u);

    std::string str;
    ASSERT_TRUE(dwarf.attr_string(entries[0], DW_AT_name, str));
    EXPECT_EQ(str, "a.go");
    ASSERT_TRUE(dwarf.attr_string(entries[0], DW_AT_comp_dir, str));
    EXPECT_EQ(str, "/src");
    ASSERT_TRUE(dwarf.attr_string(entries[1], DW_AT_name, str));
    EXPECT_EQ(str, "main.counter");

    std::uint64_t value = 0;
    ASSERT_TRUE(dwarf.attr_address(entries[0], DW_AT_low_pc, value));
    EXPECT_EQ(value, 0x4000u);

    ASSERT_TRUE(dwarf.attr_unsigned(entries[1], DW_AT_decl_line, value));
    EXPECT_EQ(static_cast<std::int64_t>(value), -3);
    ASSERT_TRUE(dwarf.attr_unsigned(entries[1], DW_AT_decl_file, value));
    EXPECT_EQ(value, 7u);

    const unsigned char* block = nullptr;
    std::size_t size = 0;
    ASSERT_TRUE(dwarf.attr_block(entries[1], DW_AT_location, block, size));
    ASSERT_EQ(size, 9u);
    EXPECT_EQ(block[0], DW_OP_addr);
    EXPECT_EQ(block[1], 0x10);

    ASSERT_TRUE(dwarf.attr_unsigned(entries[2], DW_AT_external, value));
    EXPECT_EQ(value, 1u);
    EXPECT_EQ(dwarf.find_attr(entries[2], DW_AT_frame_base)->sdata, -16);

    std::vector<addr_range> ranges = dwarf.ranges(entries[2]);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], addr_range(0x4010, 0x4030));
}

TEST(Dwarf, UnitsInThe64BitFormat)
{
    info_writer writer(true);

    writer.begin_unit(4);
    writer.add_die(DW_TAG_compile_unit, true)
        .strp(DW_AT_name, "main.c")
        .sec_offset(DW_AT_stmt_list, 0x40)
        .addr(DW_AT_low_pc, 0x1000)
        .data8(DW_AT_high_pc, 0x80);
    writer.add_die(DW_TAG_subprogram)
        .strp(DW_AT_name, "main");
    writer.end_children();

    writer.begin_unit(4);
    writer.add_die(DW_TAG_compile_unit)
        .strp(DW_AT_name, "util.c");

    dwarf_sections sections = writer.sections();
    std::size_t info_size = sections.info.size();

    Dwarf dwarf(sections);
    std::vector<dwarf_entry> entries = read_all(dwarf);
    ASSERT_EQ(entries.size(), 3u);

    // 12-byte initial length, version, 8-byte abbrev offset, address size
    EXPECT_EQ(entries[0].offset, 23u);
    EXPECT_EQ(entries[0].unit->offset_size, 8);
    EXPECT_EQ(entries[2].offset, entries[2].unit->offset + 23);
    EXPECT_EQ(entries[2].unit->end, info_size);

    std::string str;
    ASSERT_TRUE(dwarf.attr_string(entries[0], DW_AT_name, str));
    EXPECT_EQ(str, "main.c");
    ASSERT_TRUE(dwarf.attr_string(entries[1], DW_AT_name, str));
    EXPECT_EQ(str, "main");
    ASSERT_TRUE(dwarf.attr_string(entries[2], DW_AT_name, str));
    EXPECT_EQ(str, "util.c");

    std::uint64_t value = 0;
    ASSERT_TRUE(dwarf.attr_unsigned(entries[0], DW_AT_stmt_list, value));
    EXPECT_EQ(value, 0x40u);

    std::vector<addr_range> ranges = dwarf.ranges(entries[0]);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], addr_range(0x1000, 0x1080));
}

TEST(Dwarf, IndexedFormsIn64BitVersion5Unit)
{
    info_writer writer(true);

    writer.begin_unit(5, DW_UT_compile);
    writer.add_die(DW_TAG_compile_unit, true)
        .strx1(DW_AT_name, "a.go")
        .addrx(DW_AT_low_pc, 0x4000)
        .data4(DW_AT_high_pc, 0x100);
    writer.add_die(DW_TAG_subprogram)
        .strx1(DW_AT_name, "main.main")
        .addrx(DW_AT_low_pc, 0x4010)
        .data4(DW_AT_high_pc, 0x20);
    writer.end_children();

    Dwarf dwarf(writer.sections());
    std::vector<dwarf_entry> entries = read_all(dwarf);
    ASSERT_EQ(entries.size(), 2u);

    const unit_header& unit = *entries[0].unit;
    EXPECT_EQ(entries[0].offset, 24u);
    // both tables start after a 16-byte 64-bit header
    EXPECT_EQ(unit.str_offsets_base, 16u);
    EXPECT_EQ(unit.addr_base, 16u);
    EXPECT_EQ(unit.rnglists_base, 20u);
    EXPECT_EQ(unit.low_pc, 0x4000u);

    std::string str;
    ASSERT_TRUE(dwarf.attr_string(entries[1], DW_AT_name, str));
    EXPECT_EQ(str, "main.main");

    std::vector<addr_range> ranges = dwarf.ranges(entries[1]);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], addr_range(0x4010, 0x4030));
}

TEST(Dwarf, TypeAndSkeletonUnitHeaders)
{
    info_writer writer;

    writer.begin_unit(5, DW_UT_type);
    writer.add_die(DW_TAG_type_unit, true)
        .data1(DW_AT_language, DW_LANG_C99);
    writer.add_die(DW_TAG_base_type)
        .string(DW_AT_name, "int")
        .data1(DW_AT_byte_size, 4);
    writer.end_children();

    writer.begin_unit(5, DW_UT_skeleton);
    writer.add_die(DW_TAG_skeleton_unit)
        .string(DW_AT_dwo_name, "main.dwo");

    writer.begin_unit(5, DW_UT_split_type);
    writer.add_die(DW_TAG_type_unit);

    writer.begin_unit(5, DW_UT_compile);
    writer.add_die(DW_TAG_compile_unit)
        .string(DW_AT_name, "main.c");

    Dwarf dwarf(writer.sections());
    std::vector<dwarf_entry> entries = read_all(dwarf);
    ASSERT_EQ(entries.size(), 5u);

    // signature and type_offset follow the abbrev offset
    EXPECT_EQ(entries[0].offset, 24u);
    EXPECT_EQ(entries[0].unit->unit_type,
            static_cast<std::uint8_t>(DW_UT_type));
    EXPECT_EQ(entries[1].tag, static_cast<std::uint64_t>(DW_TAG_base_type));

    std::string str;
    ASSERT_TRUE(dwarf.attr_string(entries[1], DW_AT_name, str));
    EXPECT_EQ(str, "int");

    // dwo_id only
    EXPECT_EQ(entries[2].tag, static_cast<std::uint64_t>(DW_TAG_skeleton_unit));
    EXPECT_EQ(entries[2].unit->unit_type,
            static_cast<std::uint8_t>(DW_UT_skeleton));
    EXPECT_EQ(entries[2].offset, entries[2].unit->offset + 20);
    ASSERT_TRUE(dwarf.attr_string(entries[2], DW_AT_dwo_name, str));
    EXPECT_EQ(str, "main.dwo");

    EXPECT_EQ(entries[3].unit->unit_type,
            static_cast<std::uint8_t>(DW_UT_split_type));
    EXPECT_EQ(entries[3].offset, entries[3].unit->offset + 24);

    EXPECT_EQ(entries[4].unit->unit_type,
            static_cast<std::uint8_t>(DW_UT_compile));
    EXPECT_EQ(entries[4].offset, entries[4].unit->offset + 12);
    ASSERT_TRUE(dwarf.attr_string(entries[4], DW_AT_name, str));
    EXPECT_EQ(str, "main.c");
}

TEST(Dwarf, RangesWithBaseSelection)
{
    byte_writer ranges;
    ranges.u64(0x10);
    ranges.u64(0x20);
    // base address selection
    ranges.u64(~static_cast<std::uint64_t>(0));
    ranges.u64(0x5000);
    ranges.u64(0x0);
    ranges.u64(0x8);
    // empty, dropped
    ranges.u64(0x30);
    ranges.u64(0x30);
    ranges.u64(0);
    ranges.u64(0);

    info_writer writer;
    writer.begin_unit(4);
    writer.add_die(DW_TAG_compile_unit)
        .string(DW_AT_name, "x.c")
        .addr(DW_AT_low_pc, 0x1000)
        .sec_offset(DW_AT_ranges, 0);

    dwarf_sections sections = writer.sections();
    sections.ranges = ranges.data();

    Dwarf dwarf(sections);
    dwarf_entry entry;
    ASSERT_TRUE(dwarf.next(entry));

    std::vector<addr_range> result = dwarf.ranges(entry);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], addr_range(0x1010, 0x1020));
    EXPECT_EQ(result[1], addr_range(0x5000, 0x5008));
}

// header of a .debug_rnglists contribution with count offsets
static void rnglists_header(byte_writer& out, std::uint32_t length,
        std::uint32_t count)
{
    out.u32(length);
    out.u16(5);
    out.u8(8);
    out.u8(0);
    out.u32(count);
}

TEST(Dwarf, RangeListsOfVersion5)
{
    info_writer writer;
    writer.begin_unit(5, DW_UT_compile);
    writer.add_die(DW_TAG_compile_unit)
        .string(DW_AT_name, "x.c")
        .addr(DW_AT_low_pc, 0)
        .sec_offset(DW_AT_ranges, 12);

    std::uint64_t index = writer.add_addr_index(0x9000);

    byte_writer lists;
    rnglists_header(lists, 0, 0);

    // at 12: list of the unit
    lists.u8(DW_RLE_base_address);
    lists.u64(0x2000);
    lists.u8(DW_RLE_offset_pair);
    lists.uleb(0x10);
    lists.uleb(0x20);
    lists.u8(DW_RLE_start_length);
    lists.u64(0x3000);
    lists.uleb(0x40);
    lists.u8(DW_RLE_startx_length);
    lists.uleb(index);
    lists.uleb(0x10);
    lists.u8(DW_RLE_start_end);
    lists.u64(0x7000);
    lists.u64(0x7100);
    lists.u8(DW_RLE_end_of_list);
    lists.patch_u32(0, lists.size() - 4);

    dwarf_sections sections = writer.sections();
    sections.rnglists = lists.data();

    Dwarf dwarf(sections);
    dwarf_entry entry;
    ASSERT_TRUE(dwarf.next(entry));

    std::vector<addr_range> result = dwarf.ranges(entry);
    ASSERT_EQ(result.size(), 4u);
    EXPECT_EQ(result[0], addr_range(0x2010, 0x2020));
    EXPECT_EQ(result[1], addr_range(0x3000, 0x3040));
    EXPECT_EQ(result[2], addr_range(0x9000, 0x9010));
    EXPECT_EQ(result[3], addr_range(0x7000, 0x7100));
}

TEST(Dwarf, RangeListIndex)
{
    info_writer writer;
    writer.begin_unit(5, DW_UT_compile);
    writer.add_die(DW_TAG_compile_unit, true)
        .string(DW_AT_name, "x.c")
        .addr(DW_AT_low_pc, 0x1000);
    writer.add_die(DW_TAG_lexical_block)
        .rnglistx(DW_AT_ranges, 1);
    writer.end_children();

    byte_writer lists;
    rnglists_header(lists, 0, 2);
    // offsets from the end of the header
    lists.u32(8);
    lists.u32(12);
    // list 0
    lists.u8(DW_RLE_offset_pair);
    lists.uleb(0);
    lists.uleb(1);
    lists.u8(DW_RLE_end_of_list);
    // list 1
    lists.u8(DW_RLE_offset_pair);
    lists.uleb(0x40);
    lists.uleb(0x50);
    lists.u8(DW_RLE_end_of_list);
    lists.patch_u32(0, lists.size() - 4);

    dwarf_sections sections = writer.sections();
    sections.rnglists = lists.data();

    Dwarf dwarf(sections);
    dwarf_entry entry;
    ASSERT_TRUE(dwarf.next(entry));
    ASSERT_TRUE(dwarf.next(entry));
    ASSERT_EQ(entry.tag, static_cast<std::uint64_t>(DW_TAG_lexical_block));

    std::vector<addr_range> result = dwarf.ranges(entry);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], addr_range(0x1040, 0x1050));
}

TEST(Dwarf, TruncatedUnit)
{
    info_writer writer;
    writer.begin_unit(4);
    writer.add_die(DW_TAG_compile_unit)
        .string(DW_AT_name, "truncated.c");

    dwarf_sections sections = writer.sections();
    sections.info.resize(sections.info.size() - 3);

    Dwarf dwarf(sections);
    dwarf_entry entry;
    EXPECT_THROW(dwarf.next(entry), dwarf_error);
}

TEST(Dwarf, UnsupportedVersion)
{
    info_writer writer;
    writer.begin_unit(6);
    writer.add_die(DW_TAG_compile_unit);

    Dwarf dwarf(writer.sections());
    dwarf_entry entry;
    EXPECT_THROW(dwarf.next(entry), dwarf_error);
}

TEST(Dwarf, UnknownAbbreviation)
{
    info_writer writer;
    writer.begin_unit(4);
    writer.add_die(DW_TAG_compile_unit);

    dwarf_sections sections = writer.sections();
    // abbreviation code of the only entry
    sections.info[11] = 42;

    Dwarf dwarf(sections);
    dwarf_entry entry;
    EXPECT_THROW(dwarf.next(entry), dwarf_error);
}

TEST(Dwarf, EmptyInfo)
{
    Dwarf dwarf((dwarf_sections()));
    dwarf_entry entry;

    EXPECT_FALSE(dwarf.next(entry));
}
