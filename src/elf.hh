#ifndef ELF_HH
# define ELF_HH

# include <cstdint>
# include <ctime>
# include <string>
# include <vector>
# include <elf.h>

// Inflates a zlib stream that must produce exactly expected_size bytes.
// what names the data in error messages.
std::vector<unsigned char> zlib_inflate(const unsigned char* data,
        std::size_t size, std::uint64_t expected_size,
        const std::string& what);

// .zdebug_ payload: "ZLIB" + big-endian 64-bit size + zlib stream.
// Data without the magic is returned unchanged.
std::vector<unsigned char> decompress_maybe(const unsigned char* data,
        std::size_t size, const std::string& what);

// Read-only view of an ELF64 little-endian file, mapped for the lifetime
// of the object.
class Elf
{
public:
    explicit Elf(const std::string& elf_path);
    ~Elf();

    Elf(const Elf&) = delete;
    Elf& operator=(const Elf&) = delete;

    const Elf64_Shdr* find_section_by_name(const std::string&) const;

    // section contents, inflated when the section is SHF_COMPRESSED
    std::vector<unsigned char> section_data(const Elf64_Shdr* shdr) const;

    // .debug_<name>, or .zdebug_<name> decompressed; false if neither
    // exists
    bool find_debug_section(const std::string& name,
            std::vector<unsigned char>& data) const;

    // same, but a missing section is an error
    std::vector<unsigned char> debug_section(const std::string& name) const;

    std::time_t last_modified() const;

private:
    const Elf64_Shdr* section_header(std::size_t index) const;
    std::string section_name(const Elf64_Shdr* shdr) const;

    std::string m_path;
    const Elf64_Ehdr* m_ehdr;
    const unsigned char* m_buf;
    int m_fd_elf_file;
    std::size_t m_elf_size;
    std::time_t m_last_modified;

    std::size_t m_shnum;
    const Elf64_Shdr* m_shstrtab;
};

#endif /* !ELF_HH */
