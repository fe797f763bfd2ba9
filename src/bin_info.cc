#include "bin_info.hh"
#include "auxv.hh"
#include "byte_reader.hh"
#include "elf.hh"
#include "errors.hh"
#include "path.hh"
#include "producer.hh"

#include <algorithm>
#include <climits>
#include <sstream>
#include <utility>

#include <dwarf.h>

static const std::size_t max_candidate_files = 3;

// decimal digits only, fitting in an int
static bool parse_line_number(const std::string& text, int& line)
{
    if (text.empty())
        return false;

    long long value = 0;
    for (char c : text)
    {
        if (c < '0' || c > '9')
            return false;

        value = value * 10 + (c - '0');
        if (value > INT_MAX)
            return false;
    }

    line = static_cast<int>(value);
    return true;
}

bool CompileUnit::contains(std::uint64_t pc) const
{
    for (auto& range : ranges)
        if (pc >= range.first && pc < range.second)
            return true;

    return false;
}

BinaryInfo::BinaryInfo(const std::string& path, pid_t pid, Logger& logger)
    : m_path(path), m_last_modified(0), m_entry_point(0)
{
    if (pid >= 0)
    {
        Logger::line(logger, log_level::info) << "read /proc/" << pid
            << "/auxv";
        m_entry_point = entry_point_from_auxv(read_auxv(pid));
        Logger::line(logger, log_level::info) << "entry point "
            << hex(m_entry_point);
    }

    Elf elf(path);
    m_last_modified = elf.last_modified();
    Logger::line(logger, log_level::info) << "opened " << path;

    dwarf_sections sections;
    sections.info = elf.debug_section("info");
    sections.abbrev = elf.debug_section("abbrev");
    sections.line = elf.debug_section("line");
    elf.find_debug_section("str", sections.str);
    elf.find_debug_section("line_str", sections.line_str);
    elf.find_debug_section("str_offsets", sections.str_offsets);
    elf.find_debug_section("addr", sections.addr);
    elf.find_debug_section("ranges", sections.ranges);
    elf.find_debug_section("rnglists", sections.rnglists);

    Dwarf dwarf(std::move(sections));
    load_debug_info_maps(dwarf, logger);

    Logger::line(logger, log_level::info) << m_compile_units.size()
        << " compile units, " << m_functions.size() << " functions, "
        << m_sources.size() << " sources";
}

std::unique_ptr<CompileUnit> BinaryInfo::open_compile_unit(
        const Dwarf& dwarf, const dwarf_entry& entry, Logger& logger) const
{
    std::unique_ptr<CompileUnit> cu(new CompileUnit());
    cu->start_offset = entry.offset;
    cu->end_offset = 0;
    cu->low_pc = 0;
    cu->is_go = false;
    cu->optimized = false;

    std::uint64_t lang = 0;
    if (dwarf.attr_unsigned(entry, DW_AT_language, lang)
            && lang == DW_LANG_Go)
        cu->is_go = true;

    dwarf.attr_string(entry, DW_AT_name, cu->name);

    std::string comp_dir;
    dwarf.attr_string(entry, DW_AT_comp_dir, comp_dir);
    if (!comp_dir.empty())
        cu->name = path_join(comp_dir, cu->name);

    cu->ranges = dwarf.ranges(entry);
    if (!cu->ranges.empty())
        cu->low_pc = cu->ranges[0].first;

    const std::vector<unsigned char>& debug_line = dwarf.sections().line;
    std::uint64_t line_offset = 0;

    if (dwarf.attr_unsigned(entry, DW_AT_stmt_list, line_offset))
    {
        if (line_offset < debug_line.size())
            cu->line_info.reset(new LineTable(debug_line.data() + line_offset,
                        debug_line.size() - line_offset, comp_dir,
                        dwarf.sections()));
        else
            Logger::line(logger, log_level::warning) << "compile unit "
                << cu->name << ": line table offset " << hex(line_offset)
                << " out of bounds";
    }

    dwarf.attr_string(entry, DW_AT_producer, cu->producer);
    if (cu->is_go && !cu->producer.empty())
    {
        std::string stripped;
        cu->optimized = producer_optimized(cu->producer, stripped);
        cu->producer = stripped;
    }

    return cu;
}

void BinaryInfo::load_debug_info_maps(Dwarf& dwarf, Logger& logger)
{
    CompileUnit* cu = nullptr;
    dwarf_entry entry;

    while (dwarf.next(entry))
    {
        switch (entry.tag)
        {
        case DW_TAG_compile_unit:
        {
            if (cu)
                cu->end_offset = entry.offset;

            m_compile_units.push_back(open_compile_unit(dwarf, entry, logger));
            cu = m_compile_units.back().get();

            Logger::line(logger, log_level::debug) << "compile unit "
                << cu->name << " at " << hex(cu->start_offset)
                << " low_pc " << hex(cu->low_pc)
                << (cu->is_go ? " go" : "")
                << (cu->optimized ? " optimized" : "");
            break;
        }

        case DW_TAG_partial_unit:
            throw load_error("DW_TAG_partial_unit at " + hex(entry.offset)
                    + " is not supported");

        case DW_TAG_imported_unit:
            throw load_error("DW_TAG_imported_unit at " + hex(entry.offset)
                    + " is not supported");

        case DW_TAG_variable:
        {
            std::string name;
            if (!dwarf.attr_string(entry, DW_AT_name, name))
                break;

            std::uint64_t addr = 0;
            const unsigned char* loc = nullptr;
            std::size_t size = 0;

            if (dwarf.attr_block(entry, DW_AT_location, loc, size)
                    && size == sizeof (std::uint64_t) + 1
                    && loc[0] == DW_OP_addr)
            {
                addr = read_le64(loc + 1);
                Logger::line(logger, log_level::debug) << "variable "
                    << name << " at " << hex(addr);
            }

            PackageVariable var = { name, entry.offset, addr };
            m_package_vars.push_back(var);
            break;
        }

        case DW_TAG_subprogram:
        {
            std::string name;
            if (!dwarf.attr_string(entry, DW_AT_name, name))
                throw load_error("DW_TAG_subprogram without DW_AT_name at "
                        + hex(entry.offset));

            if (!cu)
                throw load_error("DW_TAG_subprogram " + name + " at "
                        + hex(entry.offset) + " is outside of a compile unit");

            std::uint64_t lowpc = 0;
            std::uint64_t highpc = 0;
            std::vector<addr_range> ranges = dwarf.ranges(entry);

            if (ranges.size() == 1)
            {
                lowpc = ranges[0].first;
                highpc = ranges[0].second;
            }

            Function fn = { name, lowpc, highpc, entry.offset, cu };
            m_functions.push_back(fn);
            break;
        }
        }
    }

    if (cu)
        cu->end_offset = dwarf.sections().info.size();

    build_sources();
    build_lookup();
}

void BinaryInfo::build_sources()
{
    m_sources.clear();

    for (auto& cu : m_compile_units)
    {
        if (!cu->line_info)
            continue;

        const std::vector<std::string>& names = cu->line_info->file_names();
        m_sources.insert(m_sources.end(), names.begin(), names.end());
    }

    std::sort(m_sources.begin(), m_sources.end());
    uniq(m_sources);
}

void BinaryInfo::build_lookup()
{
    std::stable_sort(m_functions.begin(), m_functions.end(),
            [](const Function& a, const Function& b)
            {
                return a.entry < b.entry;
            });

    m_lookup_func.clear();

    for (auto& fn : m_functions)
    {
        auto it = m_lookup_func.find(fn.name);

        if (it == m_lookup_func.end())
            m_lookup_func[fn.name] = &fn;

        // a declaration without code gives way to a definition
        else if (it->second->entry == 0 && fn.entry != 0)
            it->second = &fn;
    }
}

const std::string& BinaryInfo::path() const
{
    return m_path;
}

std::time_t BinaryInfo::last_modified() const
{
    return m_last_modified;
}

std::uint64_t BinaryInfo::entry_point() const
{
    return m_entry_point;
}

const std::vector<Function>& BinaryInfo::functions() const
{
    return m_functions;
}

const std::vector<std::string>& BinaryInfo::sources() const
{
    return m_sources;
}

const std::unordered_map<std::string, const Function*>&
BinaryInfo::lookup_func() const
{
    return m_lookup_func;
}

const std::vector<std::unique_ptr<CompileUnit> >&
BinaryInfo::compile_units() const
{
    return m_compile_units;
}

const std::vector<PackageVariable>& BinaryInfo::package_vars() const
{
    return m_package_vars;
}

std::uint64_t BinaryInfo::find_location(const std::string& filename,
        const std::string& lineno) const
{
    int line = 0;
    if (!parse_line_number(lineno, line))
        throw location_error("invalid line number " + lineno);

    std::vector<std::string> candidate_files;

    for (auto& file : m_sources)
    {
        if (!partial_path_match(filename, file))
            continue;

        candidate_files.push_back(file);
        if (candidate_files.size() >= max_candidate_files)
            break;
    }

    if (candidate_files.empty())
        throw location_error("could not find source file " + filename);

    if (candidate_files.size() > 1)
    {
        std::string names;
        for (auto& file : candidate_files)
        {
            if (!names.empty())
                names += ";";
            names += file;
        }

        throw location_error("ambiguous file name " + filename + ": "
                + names);
    }

    const std::string& absfilename = candidate_files[0];

    for (auto& cu : m_compile_units)
    {
        if (!cu->line_info || !cu->line_info->has_file(absfilename))
            continue;

        std::uint64_t pc = cu->line_info->line_to_pc(absfilename, line);
        if (pc != 0)
            return pc;
    }

    throw location_error("could not find " + filename + ":" + lineno);
}

const Function* BinaryInfo::find_function(const std::string& name) const
{
    auto it = m_lookup_func.find(name);

    if (it == m_lookup_func.end())
        return nullptr;

    return it->second;
}

const Function* BinaryInfo::pc_to_func(std::uint64_t pc) const
{
    // first function starting after pc
    auto it = std::upper_bound(m_functions.begin(), m_functions.end(), pc,
            [](std::uint64_t addr, const Function& fn)
            {
                return addr < fn.entry;
            });

    if (it == m_functions.begin())
        return nullptr;

    // functions do not nest, only the closest one below pc can hold it
    --it;
    if (it->entry == 0 || pc >= it->end)
        return nullptr;

    return &*it;
}

const CompileUnit* BinaryInfo::find_compile_unit(std::uint64_t pc) const
{
    for (auto& cu : m_compile_units)
        if (cu->contains(pc))
            return cu.get();

    return nullptr;
}

bool BinaryInfo::pc_to_line(std::uint64_t pc, std::string& file,
        int& line) const
{
    const CompileUnit* cu = find_compile_unit(pc);

    if (cu && cu->line_info && cu->line_info->pc_to_line(pc, file, line))
        return true;

    // units without ranges still have line tables
    for (auto& unit : m_compile_units)
        if (unit->line_info && unit->line_info->pc_to_line(pc, file, line))
            return true;

    return false;
}
