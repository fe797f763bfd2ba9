#include "dwarf.hh"
#include "byte_reader.hh"
#include "errors.hh"

#include <sstream>

#include <dwarf.h>

static const std::uint64_t max_address = ~static_cast<std::uint64_t>(0);

Dwarf::Dwarf(dwarf_sections sections)
    : m_sections(std::move(sections)), m_unit(nullptr),
    m_abbrev_table(nullptr), m_offset(0), m_next_unit(0),
    m_root_pending(false)
{
}

const dwarf_sections& Dwarf::sections() const
{
    return m_sections;
}

void Dwarf::read_unit_header(std::uint64_t offset)
{
    byte_reader reader(m_sections.info.data(), m_sections.info.size(),
            ".debug_info", offset);

    std::unique_ptr<unit_header> unit(new unit_header());
    unit->offset = offset;
    unit->offset_size = 4;

    std::uint64_t length = reader.u32();
    if (length == 0xffffffff)
    {
        length = reader.u64();
        unit->offset_size = 8;
    }
    else if (length >= 0xfffffff0)
        throw dwarf_error("reserved unit length at .debug_info offset "
                + hex(offset));

    if (length > reader.size() - reader.offset())
        throw dwarf_error("unit at .debug_info offset " + hex(offset)
                + " runs past the end of the section");

    unit->end = reader.offset() + length;
    reader.limit(unit->end);

    unit->version = reader.u16();
    if (unit->version < 2 || unit->version > 5)
    {
        std::ostringstream msg;
        msg << "unsupported DWARF version " << unit->version
            << " at .debug_info offset " << hex(offset);
        throw dwarf_error(msg.str());
    }

    if (unit->version >= 5)
    {
        unit->unit_type = reader.u8();
        unit->addr_size = reader.u8();
        unit->abbrev_offset = reader.uint(unit->offset_size);

        switch (unit->unit_type)
        {
        case DW_UT_compile:
        case DW_UT_partial:
            break;

        case DW_UT_skeleton:
        case DW_UT_split_compile:
            // dwo_id
            reader.skip(8);
            break;

        case DW_UT_type:
        case DW_UT_split_type:
            // type_signature, type_offset
            reader.skip(8 + unit->offset_size);
            break;

        default:
            throw dwarf_error("unknown unit type at .debug_info offset "
                    + hex(offset));
        }

        unit->str_offsets_base = unit->offset_size == 8 ? 16 : 8;
        unit->addr_base = unit->offset_size == 8 ? 16 : 8;
        unit->rnglists_base = unit->offset_size == 8 ? 20 : 12;
    }
    else
    {
        unit->unit_type = DW_UT_compile;
        unit->abbrev_offset = reader.uint(unit->offset_size);
        unit->addr_size = reader.u8();
        unit->str_offsets_base = 0;
        unit->addr_base = 0;
        unit->rnglists_base = 0;
    }

    if (unit->addr_size != 4 && unit->addr_size != 8)
        throw dwarf_error("unsupported address size at .debug_info offset "
                + hex(offset));

    unit->first_die = reader.offset();
    unit->low_pc = 0;

    m_abbrev_table = &get_abbrev_table(unit->abbrev_offset);
    m_offset = unit->first_die;
    m_next_unit = unit->end;
    m_root_pending = true;

    m_units.push_back(std::move(unit));
    m_unit = m_units.back().get();
}

const abbrev_table& Dwarf::get_abbrev_table(std::uint64_t offset)
{
    std::map<std::uint64_t, abbrev_table>::const_iterator it =
        m_abbrevs.find(offset);

    if (it != m_abbrevs.end())
        return it->second;

    byte_reader reader(m_sections.abbrev.data(), m_sections.abbrev.size(),
            ".debug_abbrev", offset);
    abbrev_table table;

    while (true)
    {
        std::uint64_t code = reader.uleb();
        if (code == 0)
            break;

        abbrev entry;
        entry.tag = reader.uleb();
        entry.has_children = reader.u8() == DW_CHILDREN_yes;

        while (true)
        {
            abbrev_attr attr;
            attr.name = reader.uleb();
            attr.form = reader.uleb();
            attr.implicit_const = 0;

            if (attr.form == DW_FORM_implicit_const)
                attr.implicit_const = reader.sleb();

            if (attr.name == 0 && attr.form == 0)
                break;

            entry.attrs.push_back(attr);
        }

        table[code] = entry;
    }

    return m_abbrevs[offset] = table;
}

attr_value Dwarf::read_form(byte_reader& reader, std::uint64_t form,
        std::int64_t implicit_const, const unit_header& unit) const
{
    attr_value value;
    value.form = form;
    value.udata = 0;
    value.sdata = 0;
    value.block = nullptr;
    value.block_size = 0;

    switch (form)
    {
    case DW_FORM_addr:
        value.udata = reader.uint(unit.addr_size);
        break;

    case DW_FORM_flag_present:
        value.udata = 1;
        break;

    case DW_FORM_implicit_const:
        value.sdata = implicit_const;
        value.udata = implicit_const;
        break;

    case DW_FORM_flag:
    case DW_FORM_data1:
    case DW_FORM_ref1:
    case DW_FORM_strx1:
    case DW_FORM_addrx1:
        value.udata = reader.u8();
        break;

    case DW_FORM_data2:
    case DW_FORM_ref2:
    case DW_FORM_strx2:
    case DW_FORM_addrx2:
        value.udata = reader.u16();
        break;

    case DW_FORM_strx3:
    case DW_FORM_addrx3:
        value.udata = reader.uint(3);
        break;

    case DW_FORM_data4:
    case DW_FORM_ref4:
    case DW_FORM_ref_sup4:
    case DW_FORM_strx4:
    case DW_FORM_addrx4:
        value.udata = reader.u32();
        break;

    case DW_FORM_data8:
    case DW_FORM_ref8:
    case DW_FORM_ref_sig8:
    case DW_FORM_ref_sup8:
        value.udata = reader.u64();
        break;

    case DW_FORM_data16:
        value.block_size = 16;
        value.block = reader.bytes(16);
        break;

    case DW_FORM_sdata:
        value.sdata = reader.sleb();
        value.udata = value.sdata;
        break;

    case DW_FORM_udata:
    case DW_FORM_ref_udata:
    case DW_FORM_strx:
    case DW_FORM_addrx:
    case DW_FORM_loclistx:
    case DW_FORM_rnglistx:
    case DW_FORM_GNU_addr_index:
    case DW_FORM_GNU_str_index:
        value.udata = reader.uleb();
        break;

    case DW_FORM_strp:
    case DW_FORM_line_strp:
    case DW_FORM_sec_offset:
    case DW_FORM_strp_sup:
    case DW_FORM_GNU_ref_alt:
    case DW_FORM_GNU_strp_alt:
        value.udata = reader.uint(unit.offset_size);
        break;

    case DW_FORM_ref_addr:
        value.udata = reader.uint(unit.version == 2 ? unit.addr_size
                : unit.offset_size);
        break;

    case DW_FORM_block1:
        value.block_size = reader.u8();
        value.block = reader.bytes(value.block_size);
        break;

    case DW_FORM_block2:
        value.block_size = reader.u16();
        value.block = reader.bytes(value.block_size);
        break;

    case DW_FORM_block4:
        value.block_size = reader.u32();
        value.block = reader.bytes(value.block_size);
        break;

    case DW_FORM_block:
    case DW_FORM_exprloc:
        value.block_size = reader.uleb();
        value.block = reader.bytes(value.block_size);
        break;

    case DW_FORM_string:
    {
        std::size_t start = reader.offset();
        std::string str = reader.cstring();
        value.block = m_sections.info.data() + start;
        value.block_size = str.size();
        break;
    }

    case DW_FORM_indirect:
        return read_form(reader, reader.uleb(), implicit_const, unit);

    default:
        throw dwarf_error("unknown attribute form " + hex(form)
                + " at .debug_info offset " + hex(reader.offset()));
    }

    return value;
}

void Dwarf::read_unit_bases(const dwarf_entry& root, unit_header& unit) const
{
    std::uint64_t base;

    if (attr_unsigned(root, DW_AT_str_offsets_base, base))
        unit.str_offsets_base = base;

    if (attr_unsigned(root, DW_AT_addr_base, base)
            || attr_unsigned(root, DW_AT_GNU_addr_base, base))
        unit.addr_base = base;

    if (attr_unsigned(root, DW_AT_rnglists_base, base))
        unit.rnglists_base = base;

    // needs addr_base when low_pc is an index
    if (attr_address(root, DW_AT_low_pc, base))
        unit.low_pc = base;
}

bool Dwarf::next(dwarf_entry& entry)
{
    while (true)
    {
        if (!m_unit || m_offset >= m_unit->end)
        {
            if (m_next_unit >= m_sections.info.size())
                return false;

            read_unit_header(m_next_unit);
            continue;
        }

        byte_reader reader(m_sections.info.data(), m_unit->end,
                ".debug_info", m_offset);

        std::uint64_t entry_offset = m_offset;
        std::uint64_t code = reader.uleb();

        if (code == 0)
        {
            m_offset = reader.offset();
            continue;
        }

        abbrev_table::const_iterator it = m_abbrev_table->find(code);
        if (it == m_abbrev_table->end())
        {
            std::ostringstream msg;
            msg << "unknown abbreviation code " << code
                << " at .debug_info offset " << hex(entry_offset);
            throw dwarf_error(msg.str());
        }

        const abbrev& ab = it->second;

        entry.offset = entry_offset;
        entry.tag = ab.tag;
        entry.has_children = ab.has_children;
        entry.unit = m_unit;
        entry.attrs.clear();

        for (auto& attr : ab.attrs)
            entry.attrs.push_back(std::make_pair(attr.name,
                        read_form(reader, attr.form, attr.implicit_const,
                            *m_unit)));

        m_offset = reader.offset();

        if (m_root_pending)
        {
            read_unit_bases(entry, *m_unit);
            m_root_pending = false;
        }

        return true;
    }
}

const attr_value* Dwarf::find_attr(const dwarf_entry& entry,
        std::uint64_t name) const
{
    for (auto& attr : entry.attrs)
        if (attr.first == name)
            return &attr.second;

    return nullptr;
}

std::string Dwarf::string_at(const std::vector<unsigned char>& section,
        const char* name, std::uint64_t offset) const
{
    byte_reader reader(section.data(), section.size(), name);
    reader.seek(offset);

    return reader.cstring();
}

std::string Dwarf::indexed_string(const unit_header& unit,
        std::uint64_t index) const
{
    byte_reader reader(m_sections.str_offsets.data(),
            m_sections.str_offsets.size(), ".debug_str_offsets");

    reader.seek(unit.str_offsets_base);
    reader.skip(index * unit.offset_size);

    return string_at(m_sections.str, ".debug_str",
            reader.uint(unit.offset_size));
}

std::uint64_t Dwarf::indexed_address(const unit_header& unit,
        std::uint64_t index) const
{
    byte_reader reader(m_sections.addr.data(), m_sections.addr.size(),
            ".debug_addr");

    reader.seek(unit.addr_base);
    reader.skip(index * unit.addr_size);

    return reader.uint(unit.addr_size);
}

bool Dwarf::attr_string(const dwarf_entry& entry, std::uint64_t name,
        std::string& value) const
{
    const attr_value* attr = find_attr(entry, name);
    if (!attr)
        return false;

    switch (attr->form)
    {
    case DW_FORM_string:
        value.assign(reinterpret_cast<const char*>(attr->block),
                attr->block_size);
        return true;

    case DW_FORM_strp:
        value = string_at(m_sections.str, ".debug_str", attr->udata);
        return true;

    case DW_FORM_line_strp:
        value = string_at(m_sections.line_str, ".debug_line_str",
                attr->udata);
        return true;

    case DW_FORM_strx:
    case DW_FORM_strx1:
    case DW_FORM_strx2:
    case DW_FORM_strx3:
    case DW_FORM_strx4:
    case DW_FORM_GNU_str_index:
        value = indexed_string(*entry.unit, attr->udata);
        return true;
    }

    return false;
}

bool Dwarf::attr_unsigned(const dwarf_entry& entry, std::uint64_t name,
        std::uint64_t& value) const
{
    const attr_value* attr = find_attr(entry, name);
    if (!attr)
        return false;

    switch (attr->form)
    {
    case DW_FORM_data1:
    case DW_FORM_data2:
    case DW_FORM_data4:
    case DW_FORM_data8:
    case DW_FORM_udata:
    case DW_FORM_sdata:
    case DW_FORM_implicit_const:
    case DW_FORM_sec_offset:
    case DW_FORM_flag:
    case DW_FORM_flag_present:
        value = attr->udata;
        return true;
    }

    return false;
}

bool Dwarf::attr_address(const dwarf_entry& entry, std::uint64_t name,
        std::uint64_t& value) const
{
    const attr_value* attr = find_attr(entry, name);
    if (!attr)
        return false;

    switch (attr->form)
    {
    case DW_FORM_addr:
        value = attr->udata;
        return true;

    case DW_FORM_addrx:
    case DW_FORM_addrx1:
    case DW_FORM_addrx2:
    case DW_FORM_addrx3:
    case DW_FORM_addrx4:
    case DW_FORM_GNU_addr_index:
        value = indexed_address(*entry.unit, attr->udata);
        return true;
    }

    return false;
}

bool Dwarf::attr_block(const dwarf_entry& entry, std::uint64_t name,
        const unsigned char*& data, std::size_t& size) const
{
    const attr_value* attr = find_attr(entry, name);
    if (!attr)
        return false;

    switch (attr->form)
    {
    case DW_FORM_block:
    case DW_FORM_block1:
    case DW_FORM_block2:
    case DW_FORM_block4:
    case DW_FORM_exprloc:
        data = attr->block;
        size = attr->block_size;
        return true;
    }

    return false;
}

void Dwarf::read_ranges(const unit_header& unit, std::uint64_t offset,
        std::vector<addr_range>& result) const
{
    byte_reader reader(m_sections.ranges.data(), m_sections.ranges.size(),
            ".debug_ranges");
    reader.seek(offset);

    std::uint64_t base = unit.low_pc;
    std::uint64_t selection = unit.addr_size == 8 ? max_address
        : 0xffffffff;

    while (true)
    {
        std::uint64_t begin = reader.uint(unit.addr_size);
        std::uint64_t end = reader.uint(unit.addr_size);

        if (begin == 0 && end == 0)
            break;

        if (begin == selection)
        {
            base = end;
            continue;
        }

        if (begin < end)
            result.push_back(addr_range(base + begin, base + end));
    }
}

void Dwarf::read_rnglists(const unit_header& unit, std::uint64_t offset,
        std::vector<addr_range>& result) const
{
    byte_reader reader(m_sections.rnglists.data(),
            m_sections.rnglists.size(), ".debug_rnglists");
    reader.seek(offset);

    std::uint64_t base = unit.low_pc;

    while (true)
    {
        std::uint8_t kind = reader.u8();
        std::uint64_t begin = 0;
        std::uint64_t end = 0;

        switch (kind)
        {
        case DW_RLE_end_of_list:
            return;

        case DW_RLE_base_addressx:
            base = indexed_address(unit, reader.uleb());
            continue;

        case DW_RLE_base_address:
            base = reader.uint(unit.addr_size);
            continue;

        case DW_RLE_startx_endx:
            begin = indexed_address(unit, reader.uleb());
            end = indexed_address(unit, reader.uleb());
            break;

        case DW_RLE_startx_length:
            begin = indexed_address(unit, reader.uleb());
            end = begin + reader.uleb();
            break;

        case DW_RLE_offset_pair:
            begin = base + reader.uleb();
            end = base + reader.uleb();
            break;

        case DW_RLE_start_end:
            begin = reader.uint(unit.addr_size);
            end = reader.uint(unit.addr_size);
            break;

        case DW_RLE_start_length:
            begin = reader.uint(unit.addr_size);
            end = begin + reader.uleb();
            break;

        default:
            throw dwarf_error("unknown range list entry kind at "
                    ".debug_rnglists offset " + hex(reader.offset() - 1));
        }

        if (begin < end)
            result.push_back(addr_range(begin, end));
    }
}

std::vector<addr_range> Dwarf::ranges(const dwarf_entry& entry) const
{
    std::vector<addr_range> result;
    const unit_header& unit = *entry.unit;

    std::uint64_t low = 0;
    if (attr_address(entry, DW_AT_low_pc, low))
    {
        std::uint64_t high = 0;
        bool has_high = attr_address(entry, DW_AT_high_pc, high);

        // a constant high_pc is the length of the range
        if (!has_high && attr_unsigned(entry, DW_AT_high_pc, high))
        {
            high += low;
            has_high = true;
        }

        if (has_high && low < high)
            result.push_back(addr_range(low, high));
    }

    const attr_value* attr = find_attr(entry, DW_AT_ranges);
    if (!attr)
        return result;

    if (unit.version < 5)
    {
        read_ranges(unit, attr->udata, result);
        return result;
    }

    std::uint64_t offset = attr->udata;

    if (attr->form == DW_FORM_rnglistx)
    {
        byte_reader reader(m_sections.rnglists.data(),
                m_sections.rnglists.size(), ".debug_rnglists");
        reader.seek(unit.rnglists_base);
        reader.skip(attr->udata * unit.offset_size);
        offset = unit.rnglists_base + reader.uint(unit.offset_size);
    }

    read_rnglists(unit, offset, result);
    return result;
}
