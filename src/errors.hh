#ifndef ERRORS_HH
# define ERRORS_HH

# include <stdexcept>
# include <string>

// container open/map/format errors, missing sections, decompression
class elf_error : public std::runtime_error
{
public:
    explicit elf_error(const std::string& what)
        : std::runtime_error(what)
    {}
};

// malformed DWARF: truncated sections, unknown forms, bad versions
class dwarf_error : public std::runtime_error
{
public:
    explicit dwarf_error(const std::string& what)
        : std::runtime_error(what)
    {}
};

// debug information we refuse to index
class load_error : public std::runtime_error
{
public:
    explicit load_error(const std::string& what)
        : std::runtime_error(what)
    {}
};

// bad file:line query; the index is left untouched
class location_error : public std::runtime_error
{
public:
    explicit location_error(const std::string& what)
        : std::runtime_error(what)
    {}
};

#endif /* !ERRORS_HH */
