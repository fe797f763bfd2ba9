#include "line_table.hh"
#include "byte_reader.hh"
#include "errors.hh"
#include "path.hh"

#include <algorithm>
#include <climits>
#include <sstream>

#include <dwarf.h>

// state machine registers, DWARF 5 section 6.2.2
struct line_registers
{
    std::uint64_t address;
    std::uint64_t op_index;
    std::uint32_t file;
    int line;
    std::uint64_t column;
    bool is_stmt;
    bool basic_block;
    bool end_sequence;
    bool prologue_end;
    bool epilogue_begin;
    std::uint64_t isa;
    std::uint64_t discriminator;

    void reset(bool default_is_stmt)
    {
        address = 0;
        op_index = 0;
        file = 1;
        line = 1;
        column = 0;
        is_stmt = default_is_stmt;
        basic_block = false;
        end_sequence = false;
        prologue_end = false;
        epilogue_begin = false;
        isa = 0;
        discriminator = 0;
    }
};

LineTable::LineTable(const unsigned char* program, std::size_t size,
        const std::string& comp_dir, const dwarf_sections& strings)
    : m_comp_dir(comp_dir), m_sequence_start(0)
{
    byte_reader reader(program, size, ".debug_line");

    parse_header(reader, strings);
    run_program(reader);

    std::sort(m_sequences.begin(), m_sequences.end(),
            [this](const std::pair<std::size_t, std::size_t>& a,
                const std::pair<std::size_t, std::size_t>& b)
            {
                return m_rows[a.first].address < m_rows[b.first].address;
            });
}

void LineTable::parse_header(byte_reader& reader,
        const dwarf_sections& strings)
{
    m_header.offset_size = 4;
    m_header.unit_length = reader.u32();

    if (m_header.unit_length == 0xffffffff)
    {
        m_header.unit_length = reader.u64();
        m_header.offset_size = 8;
    }

    if (m_header.unit_length > reader.size() - reader.offset())
        throw dwarf_error("line program runs past the end of .debug_line");

    reader.limit(reader.offset() + m_header.unit_length);

    m_header.version = reader.u16();
    if (m_header.version < 2 || m_header.version > 5)
    {
        std::ostringstream msg;
        msg << "unsupported line table version " << m_header.version;
        throw dwarf_error(msg.str());
    }

    m_header.address_size = 8;
    if (m_header.version >= 5)
    {
        m_header.address_size = reader.u8();
        // segment_selector_size
        reader.u8();
    }

    m_header.header_length = reader.uint(m_header.offset_size);
    std::size_t program_start = reader.offset();
    if (m_header.header_length > reader.size() - program_start)
        throw dwarf_error("line table header runs past the end of its unit");
    program_start += m_header.header_length;

    m_header.min_inst_length = reader.u8();
    m_header.max_ops_per_inst = 1;
    if (m_header.version >= 4)
        m_header.max_ops_per_inst = reader.u8();
    if (m_header.max_ops_per_inst == 0)
        throw dwarf_error("line table with zero maximum_operations_per_instruction");

    m_header.default_is_stmt = reader.u8() != 0;
    m_header.line_base = static_cast<std::int8_t>(reader.u8());
    m_header.line_range = reader.u8();
    if (m_header.line_range == 0)
        throw dwarf_error("line table with zero line_range");

    m_header.opcode_base = reader.u8();
    for (int i = 1; i < m_header.opcode_base; ++i)
        m_header.standard_opcode_lengths.push_back(reader.u8());

    if (m_header.version >= 5)
    {
        parse_v5_entries(reader, strings, true);
        parse_v5_entries(reader, strings, false);
    }
    else
    {
        m_include_dirs.push_back(m_comp_dir);

        while (true)
        {
            std::string dir = reader.cstring();
            if (dir.empty())
                break;
            m_include_dirs.push_back(path_join(m_comp_dir, dir));
        }

        while (true)
        {
            std::string name = reader.cstring();
            if (name.empty())
                break;

            std::uint64_t dir_index = reader.uleb();
            // modification time, length
            reader.uleb();
            reader.uleb();

            add_file(name, dir_index);
        }
    }

    reader.seek(program_start);
}

void LineTable::parse_v5_entries(byte_reader& reader,
        const dwarf_sections& strings, bool directories)
{
    std::vector<std::pair<std::uint64_t, std::uint64_t> > formats;
    std::uint8_t format_count = reader.u8();

    for (std::uint8_t i = 0; i < format_count; ++i)
    {
        std::uint64_t content = reader.uleb();
        std::uint64_t form = reader.uleb();
        formats.push_back(std::make_pair(content, form));
    }

    std::uint64_t count = reader.uleb();

    for (std::uint64_t i = 0; i < count; ++i)
    {
        std::string name;
        std::uint64_t dir_index = 0;

        for (auto& format : formats)
        {
            std::string str;
            std::uint64_t num = 0;
            bool is_string = false;

            switch (format.second)
            {
            case DW_FORM_string:
                str = reader.cstring();
                is_string = true;
                break;

            case DW_FORM_line_strp:
            {
                byte_reader str_reader(strings.line_str.data(),
                        strings.line_str.size(), ".debug_line_str");
                str_reader.seek(reader.uint(m_header.offset_size));
                str = str_reader.cstring();
                is_string = true;
                break;
            }

            case DW_FORM_strp:
            {
                byte_reader str_reader(strings.str.data(), strings.str.size(),
                        ".debug_str");
                str_reader.seek(reader.uint(m_header.offset_size));
                str = str_reader.cstring();
                is_string = true;
                break;
            }

            case DW_FORM_udata:
                num = reader.uleb();
                break;

            case DW_FORM_data1:
                num = reader.u8();
                break;

            case DW_FORM_data2:
                num = reader.u16();
                break;

            case DW_FORM_data4:
                num = reader.u32();
                break;

            case DW_FORM_data8:
                num = reader.u64();
                break;

            case DW_FORM_data16:
                reader.skip(16);
                break;

            case DW_FORM_block:
                reader.skip(reader.uleb());
                break;

            default:
            {
                std::ostringstream msg;
                msg << "unsupported form 0x" << std::hex << format.second
                    << " in line table header";
                throw dwarf_error(msg.str());
            }
            }

            if (format.first == DW_LNCT_path && is_string)
                name = str;

            else if (format.first == DW_LNCT_directory_index)
                dir_index = num;
        }

        // directory 0 is the compilation directory itself
        if (directories)
            m_include_dirs.push_back(path_join(m_comp_dir, name));
        else
            add_file(name, dir_index);
    }
}

void LineTable::add_file(const std::string& name, std::uint64_t dir_index)
{
    std::string path = name;

    if (!path_is_absolute(path))
    {
        if (dir_index < m_include_dirs.size())
            path = path_join(m_include_dirs[dir_index], path);
        else
            path = path_join(m_comp_dir, path);
    }
    else
        path = path_clean(path);

    m_file_names.push_back(path);
    m_lookup[path];
}

const std::string* LineTable::file_name(std::uint32_t file) const
{
    // file registers count from 1 before DWARF 5
    std::size_t index = file;
    if (m_header.version < 5)
    {
        if (index == 0)
            return nullptr;
        --index;
    }

    if (index >= m_file_names.size())
        return nullptr;

    return &m_file_names[index];
}

void LineTable::emit_row(std::uint64_t address, std::uint32_t file,
        int line, bool is_stmt, bool end_sequence)
{
    line_row row = { address, file, line, is_stmt, end_sequence };
    m_rows.push_back(row);

    if (end_sequence)
    {
        m_sequences.push_back(std::make_pair(m_sequence_start,
                    m_rows.size() - 1));
        m_sequence_start = m_rows.size();
        return;
    }

    const std::string* path = file_name(file);
    if (!path)
        return;

    line_entry& entry = m_lookup[*path][line];

    if (is_stmt && !entry.has_stmt)
    {
        entry.has_stmt = true;
        entry.stmt_pc = address;
    }

    if (!entry.has_any)
    {
        entry.has_any = true;
        entry.any_pc = address;
    }
}

static void advance_line(int& line, std::int64_t delta)
{
    if (delta > static_cast<std::int64_t>(INT_MAX) - line
            || delta < static_cast<std::int64_t>(INT_MIN) - line)
        throw dwarf_error("line number out of range in line program");

    line += static_cast<int>(delta);
}

void LineTable::run_program(byte_reader& reader)
{
    line_registers regs;
    regs.reset(m_header.default_is_stmt);

    std::uint64_t min_inst = m_header.min_inst_length;
    std::uint64_t max_ops = m_header.max_ops_per_inst;

    auto advance = [&regs, min_inst, max_ops](std::uint64_t operation_advance)
    {
        regs.address += min_inst
            * ((regs.op_index + operation_advance) / max_ops);
        regs.op_index = (regs.op_index + operation_advance) % max_ops;
    };

    while (!reader.at_end())
    {
        std::uint8_t opcode = reader.u8();

        // special opcode
        if (opcode >= m_header.opcode_base)
        {
            std::uint8_t adjusted_opcode = opcode - m_header.opcode_base;

            advance(adjusted_opcode / m_header.line_range);
            advance_line(regs.line, m_header.line_base
                    + adjusted_opcode % m_header.line_range);

            emit_row(regs.address, regs.file, regs.line, regs.is_stmt, false);
            regs.basic_block = false;
            regs.prologue_end = false;
            regs.epilogue_begin = false;
            regs.discriminator = 0;
            continue;
        }

        if (opcode == 0)
        {
            std::uint64_t length = reader.uleb();
            if (length == 0)
                throw dwarf_error("length for extended opcode is null");

            std::size_t next = reader.offset();
            reader.skip(length);
            reader.seek(next);

            std::uint8_t extended_opcode = reader.u8();

            switch (extended_opcode)
            {
            case DW_LNE_end_sequence:
                regs.end_sequence = true;
                emit_row(regs.address, regs.file, regs.line, regs.is_stmt,
                        true);
                regs.reset(m_header.default_is_stmt);
                break;

            case DW_LNE_set_address:
                regs.address = reader.uint(length - 1);
                regs.op_index = 0;
                break;

            case DW_LNE_define_file:
            {
                std::string name = reader.cstring();
                std::uint64_t dir_index = reader.uleb();
                reader.uleb();
                reader.uleb();
                add_file(name, dir_index);
                break;
            }

            case DW_LNE_set_discriminator:
                regs.discriminator = reader.uleb();
                break;

            default:
                break;
            }

            reader.seek(next + length);
            continue;
        }

        switch (opcode)
        {
        case DW_LNS_copy:
            emit_row(regs.address, regs.file, regs.line, regs.is_stmt, false);
            regs.discriminator = 0;
            regs.basic_block = false;
            regs.prologue_end = false;
            regs.epilogue_begin = false;
            break;

        case DW_LNS_advance_pc:
            advance(reader.uleb());
            break;

        case DW_LNS_advance_line:
            advance_line(regs.line, reader.sleb());
            break;

        case DW_LNS_set_file:
            regs.file = reader.uleb();
            break;

        case DW_LNS_set_column:
            regs.column = reader.uleb();
            break;

        case DW_LNS_negate_stmt:
            regs.is_stmt = !regs.is_stmt;
            break;

        case DW_LNS_set_basic_block:
            regs.basic_block = true;
            break;

        case DW_LNS_const_add_pc:
            advance((255 - m_header.opcode_base) / m_header.line_range);
            break;

        case DW_LNS_fixed_advance_pc:
            regs.address += reader.u16();
            regs.op_index = 0;
            break;

        case DW_LNS_set_prologue_end:
            regs.prologue_end = true;
            break;

        case DW_LNS_set_epilogue_begin:
            regs.epilogue_begin = true;
            break;

        case DW_LNS_set_isa:
            regs.isa = reader.uleb();
            break;

        default:
            // unknown standard opcode: skip its LEB128 operands
            for (std::uint8_t i = 0;
                    i < m_header.standard_opcode_lengths[opcode - 1]; ++i)
                reader.uleb();
            break;
        }
    }
}

const std::vector<std::string>& LineTable::file_names() const
{
    return m_file_names;
}

bool LineTable::has_file(const std::string& path) const
{
    return m_lookup.find(path) != m_lookup.end();
}

std::uint64_t LineTable::line_to_pc(const std::string& path, int line) const
{
    auto file = m_lookup.find(path);
    if (file == m_lookup.end())
        return 0;

    auto entry = file->second.find(line);
    if (entry == file->second.end())
        return 0;

    if (entry->second.has_stmt)
        return entry->second.stmt_pc;

    return entry->second.any_pc;
}

bool LineTable::pc_to_line(std::uint64_t pc, std::string& file,
        int& line) const
{
    // last sequence starting at or before pc
    auto seq = std::upper_bound(m_sequences.begin(), m_sequences.end(), pc,
            [this](std::uint64_t addr,
                const std::pair<std::size_t, std::size_t>& s)
            {
                return addr < m_rows[s.first].address;
            });

    if (seq == m_sequences.begin())
        return false;
    --seq;

    const line_row& last = m_rows[seq->second];
    if (pc >= last.address)
        return false;

    auto first = m_rows.begin() + seq->first;
    auto end = m_rows.begin() + seq->second;

    auto row = std::upper_bound(first, end, pc,
            [](std::uint64_t addr, const line_row& r)
            {
                return addr < r.address;
            });
    --row;

    const std::string* path = file_name(row->file);
    if (!path)
        return false;

    file = *path;
    line = row->line;
    return true;
}

std::map<int, std::uint64_t> LineTable::lines(const std::string& path) const
{
    std::map<int, std::uint64_t> result;

    auto file = m_lookup.find(path);
    if (file == m_lookup.end())
        return result;

    for (auto& entry : file->second)
        result[entry.first] = entry.second.has_stmt ? entry.second.stmt_pc
            : entry.second.any_pc;

    return result;
}

const line_header& LineTable::header() const
{
    return m_header;
}

const std::vector<line_row>& LineTable::rows() const
{
    return m_rows;
}
