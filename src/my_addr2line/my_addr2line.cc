#include <iostream> // std::cout, std::cerr
#include <cstdlib> // std::strtoull
#include <cerrno>
#include <string>

#include "my_addr2line.hh"
#include "../bin_info.hh"

int my_addr2line(char** argv, Logger& logger)
{
    if (!argv[2])
    {
        std::cerr << "Usage: dbginfo --addr2line <binary> <address>..."
            << std::endl;
        return EXIT_FAILURE;
    }

    BinaryInfo bi(argv[1], -1, logger);
    int status = EXIT_SUCCESS;

    for (char** arg = &argv[2]; *arg; ++arg)
    {
        char* end = nullptr;
        errno = 0;
        std::uint64_t pc = std::strtoull(*arg, &end, 16);

        if (end == *arg || *end || errno == ERANGE)
        {
            std::cerr << "invalid address '" << *arg << "'" << std::endl;
            status = EXIT_FAILURE;
            continue;
        }

        std::cout << std::hex << "0x" << pc << std::dec << ": ";

        const Function* fn = bi.pc_to_func(pc);
        std::cout << (fn ? fn->name : "??") << " ";

        std::string file;
        int line = 0;

        if (bi.pc_to_line(pc, file, line))
            std::cout << file << ":" << line;
        else
            std::cout << "??:0";

        std::cout << std::endl;
    }

    return status;
}
