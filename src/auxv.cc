#include "auxv.hh"
#include "byte_reader.hh"
#include "errors.hh"

#include <elf.h>

#include <fstream>
#include <iterator>
#include <sstream>

std::uint64_t entry_point_from_auxv(const std::vector<unsigned char>& auxv)
{
    std::size_t offset = 0;

    while (offset + 16 <= auxv.size())
    {
        std::uint64_t tag = read_le64(&auxv[offset]);
        std::uint64_t val = read_le64(&auxv[offset + 8]);
        offset += 16;

        if (tag == AT_NULL)
            return 0;

        if (tag == AT_ENTRY)
            return val;
    }

    return 0;
}

std::vector<unsigned char> read_auxv(pid_t pid)
{
    std::ostringstream file_path;
    file_path << "/proc/" << pid << "/auxv";

    std::ifstream file_stream(file_path.str(), std::ios::binary);

    if (!file_stream)
        throw load_error("could not read " + file_path.str());

    std::vector<unsigned char> auxv(
            (std::istreambuf_iterator<char>(file_stream)),
            std::istreambuf_iterator<char>());

    if (file_stream.bad())
        throw load_error("error reading " + file_path.str());

    return auxv;
}
