#ifndef BIN_INFO_HH
# define BIN_INFO_HH

# include <cstdint>
# include <ctime>
# include <memory>
# include <string>
# include <unordered_map>
# include <vector>
# include <sys/types.h>

# include "dwarf.hh"
# include "line_table.hh"
# include "logger.hh"

struct CompileUnit
{
    // comp_dir joined with DW_AT_name
    std::string name;
    std::uint64_t low_pc;
    std::vector<addr_range> ranges;

    bool is_go;
    bool optimized;
    std::string producer;

    // null when the unit has no usable DW_AT_stmt_list
    std::unique_ptr<LineTable> line_info;

    // .debug_info offsets covered by this unit, [start, end)
    std::uint64_t start_offset;
    std::uint64_t end_offset;

    bool contains(std::uint64_t pc) const;
};

struct Function
{
    std::string name;
    // both 0 unless the function has exactly one address range
    std::uint64_t entry;
    std::uint64_t end;
    std::uint64_t offset;
    const CompileUnit* cu;
};

// A package level variable (or a C global). addr is 0 when the variable
// has no fixed address, e.g. it lives in a register.
struct PackageVariable
{
    std::string name;
    std::uint64_t offset;
    std::uint64_t addr;
};

// Index over the debug information of one executable, built once and
// read-only afterwards. A recompiled binary needs a new BinaryInfo.
class BinaryInfo
{
public:
    // Loads path eagerly. When pid is not negative, the entry point is read
    // from /proc/<pid>/auxv. Throws elf_error, dwarf_error or load_error;
    // no partially loaded index is ever returned.
    explicit BinaryInfo(const std::string& path, pid_t pid = -1,
            Logger& logger = Logger::null());

    BinaryInfo(const BinaryInfo&) = delete;
    BinaryInfo& operator=(const BinaryInfo&) = delete;

    const std::string& path() const;
    std::time_t last_modified() const;
    std::uint64_t entry_point() const;

    // sorted by entry address
    const std::vector<Function>& functions() const;
    // sorted, without duplicates
    const std::vector<std::string>& sources() const;
    const std::unordered_map<std::string, const Function*>& lookup_func() const;
    const std::vector<std::unique_ptr<CompileUnit> >& compile_units() const;
    const std::vector<PackageVariable>& package_vars() const;

    // Address of the first statement generated for filename:lineno.
    // filename may be any suffix of a source path starting after a '/'.
    // Throws location_error.
    std::uint64_t find_location(const std::string& filename,
            const std::string& lineno) const;

    const Function* find_function(const std::string& name) const;
    const Function* pc_to_func(std::uint64_t pc) const;
    const CompileUnit* find_compile_unit(std::uint64_t pc) const;
    bool pc_to_line(std::uint64_t pc, std::string& file, int& line) const;

private:
    void load_debug_info_maps(Dwarf& dwarf, Logger& logger);
    std::unique_ptr<CompileUnit> open_compile_unit(const Dwarf& dwarf,
            const dwarf_entry& entry, Logger& logger) const;
    void build_sources();
    void build_lookup();

    std::string m_path;
    std::time_t m_last_modified;
    std::uint64_t m_entry_point;

    std::vector<Function> m_functions;
    std::vector<std::string> m_sources;
    std::unordered_map<std::string, const Function*> m_lookup_func;
    std::vector<std::unique_ptr<CompileUnit> > m_compile_units;
    std::vector<PackageVariable> m_package_vars;
};

#endif /* !BIN_INFO_HH */
