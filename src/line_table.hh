#ifndef LINE_TABLE_HH
# define LINE_TABLE_HH

# include <cstdint>
# include <map>
# include <string>
# include <unordered_map>
# include <vector>

# include "dwarf.hh"

struct line_row
{
    std::uint64_t address;
    std::uint32_t file;
    int line;
    bool is_stmt;
    bool end_sequence;
};

struct line_header
{
    std::uint64_t unit_length;
    std::uint16_t version;
    std::uint8_t offset_size;
    std::uint8_t address_size;
    std::uint64_t header_length;
    std::uint8_t min_inst_length;
    std::uint8_t max_ops_per_inst;
    bool default_is_stmt;
    std::int8_t line_base;
    std::uint8_t line_range;
    std::uint8_t opcode_base;
    std::vector<std::uint8_t> standard_opcode_lengths;
};

// Decoded line-number program of one compile unit: source file ->
// {line -> address} and address -> {file, line}.
class LineTable
{
public:
    // program points at the start of the unit's program in .debug_line;
    // strings provides .debug_line_str and .debug_str for DWARF 5 headers
    LineTable(const unsigned char* program, std::size_t size,
            const std::string& comp_dir, const dwarf_sections& strings);

    // absolute paths, in header order
    const std::vector<std::string>& file_names() const;

    bool has_file(const std::string& path) const;

    // First statement row for path:line in program order, or the first row
    // of any kind when no statement row exists. 0 when the line has no code.
    std::uint64_t line_to_pc(const std::string& path, int line) const;

    // row covering pc; false when pc is outside every sequence
    bool pc_to_line(std::uint64_t pc, std::string& file, int& line) const;

    // line -> line_to_pc(path, line) for every line of path with code
    std::map<int, std::uint64_t> lines(const std::string& path) const;

    const line_header& header() const;
    const std::vector<line_row>& rows() const;

private:
    struct line_entry
    {
        bool has_stmt;
        bool has_any;
        std::uint64_t stmt_pc;
        std::uint64_t any_pc;
    };

    void parse_header(byte_reader& reader, const dwarf_sections& strings);
    void parse_v5_entries(byte_reader& reader, const dwarf_sections& strings,
            bool directories);
    void run_program(byte_reader& reader);

    void add_file(const std::string& name, std::uint64_t dir_index);
    const std::string* file_name(std::uint32_t file) const;
    void emit_row(std::uint64_t address, std::uint32_t file, int line,
            bool is_stmt, bool end_sequence);

    std::string m_comp_dir;

    line_header m_header;
    // resolved directories, indexed as the program's directory indexes
    std::vector<std::string> m_include_dirs;
    std::vector<std::string> m_file_names;

    std::vector<line_row> m_rows;
    // [first, last] row indexes of each sequence, sorted by start address
    std::vector<std::pair<std::size_t, std::size_t> > m_sequences;
    std::size_t m_sequence_start;

    std::unordered_map<std::string, std::map<int, line_entry> > m_lookup;
};

#endif /* !LINE_TABLE_HH */
