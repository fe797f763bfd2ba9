#ifndef BYTE_READER_HH
# define BYTE_READER_HH

# include <cstdint>
# include <cstring>
# include <sstream>
# include <string>

# include "errors.hh"

// Bounds-checked little-endian reader over one debug section. Reading past
// the end throws dwarf_error naming the section.
class byte_reader
{
public:
    byte_reader(const unsigned char* data, std::size_t size,
            const char* section, std::size_t offset = 0)
        : m_data(data), m_size(size), m_offset(offset), m_section(section)
    {
        if (offset > size)
            fail(offset);
    }

    std::size_t offset() const
    {
        return m_offset;
    }

    std::size_t size() const
    {
        return m_size;
    }

    bool at_end() const
    {
        return m_offset >= m_size;
    }

    void seek(std::size_t offset)
    {
        if (offset > m_size)
            fail(offset);
        m_offset = offset;
    }

    void skip(std::uint64_t n)
    {
        if (n > m_size - m_offset)
            fail(m_offset);
        m_offset += n;
    }

    // shrinks the readable window, e.g. to the end of a unit
    void limit(std::size_t end)
    {
        if (end > m_size || end < m_offset)
            fail(end);
        m_size = end;
    }

    std::uint64_t uint(std::size_t n)
    {
        if (n > m_size - m_offset || n > 8)
            fail(m_offset);

        std::uint64_t value = 0;
        for (std::size_t i = n; i > 0; --i)
            value = (value << 8) | m_data[m_offset + i - 1];

        m_offset += n;
        return value;
    }

    std::uint8_t u8()
    {
        return uint(1);
    }

    std::uint16_t u16()
    {
        return uint(2);
    }

    std::uint32_t u32()
    {
        return uint(4);
    }

    std::uint64_t u64()
    {
        return uint(8);
    }

    std::uint64_t leb128(bool sign)
    {
        std::uint64_t result = 0;
        std::uint32_t shift = 0;
        unsigned char byte;

        do
        {
            if (m_offset >= m_size)
                fail(m_offset);

            byte = m_data[m_offset++];
            if (shift < 64)
                result |= (static_cast<std::uint64_t>(byte & 0x7F)) << shift;
            shift += 7;
        } while (byte & 0x80);

        if (sign && (shift < 8 * sizeof (result)) && (byte & 0x40))
            result |= ~static_cast<std::uint64_t>(0) << shift;

        return result;
    }

    std::uint64_t uleb()
    {
        return leb128(false);
    }

    std::int64_t sleb()
    {
        return static_cast<std::int64_t>(leb128(true));
    }

    // NUL-terminated string; the terminator is consumed
    std::string cstring()
    {
        const void* nul = std::memchr(m_data + m_offset, 0, m_size - m_offset);

        if (!nul)
            fail(m_size);

        const char* begin = reinterpret_cast<const char*>(m_data + m_offset);
        std::size_t len = static_cast<const unsigned char*>(nul)
            - (m_data + m_offset);

        m_offset += len + 1;
        return std::string(begin, len);
    }

    // n bytes in place; the pointer stays valid as long as the section
    const unsigned char* bytes(std::uint64_t n)
    {
        const unsigned char* p = m_data + m_offset;
        skip(n);
        return p;
    }

private:
    [[noreturn]] void fail(std::size_t offset) const
    {
        std::ostringstream msg;
        msg << "unexpected end of " << m_section << " at offset 0x"
            << std::hex << offset;
        throw dwarf_error(msg.str());
    }

    const unsigned char* m_data;
    std::size_t m_size;
    std::size_t m_offset;
    const char* m_section;
};

// "0x" followed by lowercase hex digits
inline std::string hex(std::uint64_t value)
{
    std::ostringstream stream;
    stream << "0x" << std::hex << value;
    return stream.str();
}

inline std::uint64_t read_le64(const unsigned char* p)
{
    std::uint64_t value = 0;

    for (int i = 7; i >= 0; --i)
        value = (value << 8) | p[i];

    return value;
}

#endif /* !BYTE_READER_HH */
