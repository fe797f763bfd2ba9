#ifndef DWARF_HH
# define DWARF_HH

# include <cstdint>
# include <map>
# include <memory>
# include <string>
# include <unordered_map>
# include <utility>
# include <vector>

class byte_reader;

// raw contents of the debug sections; absent sections stay empty
struct dwarf_sections
{
    std::vector<unsigned char> info;
    std::vector<unsigned char> abbrev;
    std::vector<unsigned char> str;
    std::vector<unsigned char> line_str;
    std::vector<unsigned char> str_offsets;
    std::vector<unsigned char> addr;
    std::vector<unsigned char> ranges;
    std::vector<unsigned char> rnglists;
    std::vector<unsigned char> line;
};

struct unit_header
{
    std::uint64_t offset;       // of the header in .debug_info
    std::uint64_t end;          // one past the last byte of the unit
    std::uint64_t first_die;
    std::uint16_t version;
    std::uint8_t unit_type;
    std::uint8_t addr_size;
    std::uint8_t offset_size;   // 4 or 8
    std::uint64_t abbrev_offset;

    // read from the root entry
    std::uint64_t str_offsets_base;
    std::uint64_t addr_base;
    std::uint64_t rnglists_base;
    std::uint64_t low_pc;
};

// One attribute as encoded. Strings, addresses and range lists given by
// index or section offset are only resolved on query.
struct attr_value
{
    std::uint64_t form;
    std::uint64_t udata;
    std::int64_t sdata;
    const unsigned char* block;
    std::size_t block_size;
};

struct dwarf_entry
{
    std::uint64_t offset;
    std::uint64_t tag;
    bool has_children;
    const unit_header* unit;
    std::vector<std::pair<std::uint64_t, attr_value> > attrs;
};

// [low, high)
typedef std::pair<std::uint64_t, std::uint64_t> addr_range;

struct abbrev_attr
{
    std::uint64_t name;
    std::uint64_t form;
    std::int64_t implicit_const;
};

struct abbrev
{
    std::uint64_t tag;
    bool has_children;
    std::vector<abbrev_attr> attrs;
};

typedef std::unordered_map<std::uint64_t, abbrev> abbrev_table;

// Forward-only reader over the entries of .debug_info, in file order,
// across every unit. Null entries are skipped.
class Dwarf
{
public:
    explicit Dwarf(dwarf_sections sections);

    Dwarf(const Dwarf&) = delete;
    Dwarf& operator=(const Dwarf&) = delete;

    // false once every unit has been read
    bool next(dwarf_entry& entry);

    const attr_value* find_attr(const dwarf_entry& entry,
            std::uint64_t name) const;

    bool attr_string(const dwarf_entry& entry, std::uint64_t name,
            std::string& value) const;
    // constants, flags and section offsets
    bool attr_unsigned(const dwarf_entry& entry, std::uint64_t name,
            std::uint64_t& value) const;
    bool attr_address(const dwarf_entry& entry, std::uint64_t name,
            std::uint64_t& value) const;
    bool attr_block(const dwarf_entry& entry, std::uint64_t name,
            const unsigned char*& data, std::size_t& size) const;

    // address ranges of an entry, from low_pc/high_pc and DW_AT_ranges
    std::vector<addr_range> ranges(const dwarf_entry& entry) const;

    const dwarf_sections& sections() const;

private:
    void read_unit_header(std::uint64_t offset);
    const abbrev_table& get_abbrev_table(std::uint64_t offset);
    attr_value read_form(byte_reader& reader, std::uint64_t form,
            std::int64_t implicit_const, const unit_header& unit) const;
    void read_unit_bases(const dwarf_entry& root, unit_header& unit) const;

    std::string string_at(const std::vector<unsigned char>& section,
            const char* name, std::uint64_t offset) const;
    std::string indexed_string(const unit_header& unit,
            std::uint64_t index) const;
    std::uint64_t indexed_address(const unit_header& unit,
            std::uint64_t index) const;

    void read_ranges(const unit_header& unit, std::uint64_t offset,
            std::vector<addr_range>& result) const;
    void read_rnglists(const unit_header& unit, std::uint64_t offset,
            std::vector<addr_range>& result) const;

    dwarf_sections m_sections;

    // unit headers outlive the entries that point at them
    std::vector<std::unique_ptr<unit_header> > m_units;
    std::map<std::uint64_t, abbrev_table> m_abbrevs;

    unit_header* m_unit;
    const abbrev_table* m_abbrev_table;
    std::uint64_t m_offset;
    std::uint64_t m_next_unit;
    bool m_root_pending;
};

#endif /* !DWARF_HH */
