#include "elf.hh"
#include "errors.hh"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <sys/mman.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include <zlib.h>

// zlib cannot expand data by more than ~1032:1
static const std::uint64_t max_inflate_ratio = 1032;

static const char zlib_magic[] = "ZLIB";
static const std::size_t zlib_header_size = 4 + sizeof (std::uint64_t);

std::vector<unsigned char> zlib_inflate(const unsigned char* data,
        std::size_t size, std::uint64_t expected_size, const std::string& what)
{
    if (expected_size > size * max_inflate_ratio + 64)
    {
        std::ostringstream msg;
        msg << what << ": declared size " << expected_size
            << " is impossible for " << size << " compressed bytes";
        throw elf_error(msg.str());
    }

    // one extra byte so that an oversized stream is detected
    std::vector<unsigned char> buf(expected_size + 1);
    uLongf dest_len = buf.size();

    int err = uncompress(buf.data(), &dest_len, data, size);

    if (err != Z_OK && err != Z_BUF_ERROR)
    {
        std::ostringstream msg;
        msg << what << ": uncompress failed, err " << err;
        throw elf_error(msg.str());
    }

    if (err == Z_BUF_ERROR || dest_len != expected_size)
    {
        std::ostringstream msg;
        msg << what << ": decompressed size does not match the declared "
            << expected_size << " bytes";
        throw elf_error(msg.str());
    }

    buf.resize(expected_size);
    return buf;
}

std::vector<unsigned char> decompress_maybe(const unsigned char* data,
        std::size_t size, const std::string& what)
{
    if (size < zlib_header_size || std::memcmp(data, zlib_magic, 4))
        return std::vector<unsigned char>(data, data + size);

    std::uint64_t dlen = 0;
    for (std::size_t i = 4; i < zlib_header_size; ++i)
        dlen = (dlen << 8) | data[i];

    return zlib_inflate(data + zlib_header_size, size - zlib_header_size,
            dlen, what);
}

Elf::Elf(const std::string& elf_path)
    : m_path(elf_path), m_ehdr(nullptr), m_buf(nullptr),
    m_fd_elf_file(-1), m_elf_size(0), m_last_modified(0), m_shnum(0),
    m_shstrtab(nullptr)
{
    struct stat buf;

    if ((m_fd_elf_file = open(elf_path.c_str(), O_RDONLY)) == -1)
        throw elf_error("error opening elf file " + elf_path + ": "
                + std::strerror(errno));

    if (fstat(m_fd_elf_file, &buf) == -1)
    {
        int saved = errno;
        close(m_fd_elf_file);
        throw elf_error("cannot stat " + elf_path + ": "
                + std::strerror(saved));
    }

    m_elf_size = buf.st_size;
    m_last_modified = buf.st_mtime;

    if (m_elf_size < sizeof (Elf64_Ehdr))
    {
        close(m_fd_elf_file);
        throw elf_error(elf_path + " is too small to be an elf file");
    }

    void* map = mmap(NULL, m_elf_size, PROT_READ, MAP_PRIVATE,
            m_fd_elf_file, 0);

    if (map == MAP_FAILED)
    {
        int saved = errno;
        close(m_fd_elf_file);
        throw elf_error("cannot map " + elf_path + ": "
                + std::strerror(saved));
    }

    m_buf = static_cast<const unsigned char*>(map);
    m_ehdr = reinterpret_cast<const Elf64_Ehdr*>(m_buf);

    try
    {
        if (std::memcmp(m_ehdr->e_ident, ELFMAG, SELFMAG))
            throw elf_error(elf_path + " is not an elf file");

        if (m_ehdr->e_ident[EI_CLASS] != ELFCLASS64
                || m_ehdr->e_ident[EI_DATA] != ELFDATA2LSB)
            throw elf_error(elf_path + " is not a 64-bit little-endian elf");

        m_shnum = m_ehdr->e_shnum;

        if (m_ehdr->e_shoff != 0
                && m_ehdr->e_shentsize < sizeof (Elf64_Shdr))
            throw elf_error(elf_path + ": bad section header size");

        // extended numbering keeps the real count in section 0
        if (m_shnum == 0 && m_ehdr->e_shoff != 0)
            m_shnum = section_header(0)->sh_size;

        std::size_t shstrndx = m_ehdr->e_shstrndx;
        if (shstrndx == SHN_XINDEX)
            shstrndx = section_header(0)->sh_link;

        if (shstrndx != SHN_UNDEF)
        {
            if (shstrndx >= m_shnum)
                throw elf_error(elf_path + ": bad section name table index");
            m_shstrtab = section_header(shstrndx);
        }
    }
    catch (...)
    {
        munmap(const_cast<unsigned char*>(m_buf), m_elf_size);
        close(m_fd_elf_file);
        throw;
    }
}

Elf::~Elf()
{
    munmap(const_cast<unsigned char*>(m_buf), m_elf_size);
    close(m_fd_elf_file);
}

const Elf64_Shdr* Elf::section_header(std::size_t index) const
{
    std::uint64_t offset = m_ehdr->e_shoff
        + static_cast<std::uint64_t>(index) * m_ehdr->e_shentsize;

    if (m_ehdr->e_shoff == 0 || offset < m_ehdr->e_shoff
            || offset + sizeof (Elf64_Shdr) > m_elf_size)
        throw elf_error(m_path + ": section header out of bounds");

    return reinterpret_cast<const Elf64_Shdr*>(&m_buf[offset]);
}

std::string Elf::section_name(const Elf64_Shdr* shdr) const
{
    if (!m_shstrtab)
        return "";

    std::uint64_t begin = m_shstrtab->sh_offset;
    std::uint64_t end = begin + m_shstrtab->sh_size;

    if (end > m_elf_size || end < begin || shdr->sh_name >= m_shstrtab->sh_size)
        throw elf_error(m_path + ": section name out of bounds");

    const char* name = reinterpret_cast<const char*>(&m_buf[begin + shdr->sh_name]);
    return std::string(name, strnlen(name, end - begin - shdr->sh_name));
}

const Elf64_Shdr* Elf::find_section_by_name(const std::string& name) const
{
    for (std::size_t i = 0; i < m_shnum; ++i)
    {
        const Elf64_Shdr* shdr = section_header(i);

        if (section_name(shdr) == name)
            return shdr;
    }

    return nullptr;
}

std::vector<unsigned char> Elf::section_data(const Elf64_Shdr* shdr) const
{
    if (shdr->sh_type == SHT_NOBITS)
        return std::vector<unsigned char>();

    std::string name = section_name(shdr);

    if (shdr->sh_offset > m_elf_size
            || shdr->sh_size > m_elf_size - shdr->sh_offset)
        throw elf_error(m_path + ": section " + name + " out of bounds");

    const unsigned char* data = &m_buf[shdr->sh_offset];

    if (!(shdr->sh_flags & SHF_COMPRESSED))
        return std::vector<unsigned char>(data, data + shdr->sh_size);

    if (shdr->sh_size < sizeof (Elf64_Chdr))
        throw elf_error(m_path + ": compressed section " + name
                + " is too short");

    Elf64_Chdr chdr;
    std::memcpy(&chdr, data, sizeof (chdr));

    if (chdr.ch_type != ELFCOMPRESS_ZLIB)
    {
        std::ostringstream msg;
        msg << m_path << ": compressed section " << name
            << " has unknown type " << chdr.ch_type;
        throw elf_error(msg.str());
    }

    return zlib_inflate(data + sizeof (chdr), shdr->sh_size - sizeof (chdr),
            chdr.ch_size, name);
}

bool Elf::find_debug_section(const std::string& name,
        std::vector<unsigned char>& data) const
{
    const Elf64_Shdr* shdr = find_section_by_name(".debug_" + name);

    if (shdr)
    {
        data = section_data(shdr);
        return true;
    }

    shdr = find_section_by_name(".zdebug_" + name);
    if (!shdr)
        return false;

    std::vector<unsigned char> raw = section_data(shdr);
    data = decompress_maybe(raw.data(), raw.size(), ".zdebug_" + name);

    return true;
}

std::vector<unsigned char> Elf::debug_section(const std::string& name) const
{
    std::vector<unsigned char> data;

    if (!find_debug_section(name, data))
        throw elf_error("could not find .debug_" + name + " section in "
                + m_path);

    return data;
}

std::time_t Elf::last_modified() const
{
    return m_last_modified;
}
