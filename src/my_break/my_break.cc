#include <iostream> // std::cout, std::cerr
#include <cstdlib> // EXIT_SUCCESS
#include <string>

#include "my_break.hh"
#include "../bin_info.hh"
#include "../errors.hh"

int my_break(char** argv, Logger& logger)
{
    if (!argv[2])
    {
        std::cerr << "Usage: dbginfo --break <binary> <file:line>..."
            << std::endl;
        return EXIT_FAILURE;
    }

    BinaryInfo bi(argv[1], -1, logger);
    int status = EXIT_SUCCESS;

    for (char** arg = &argv[2]; *arg; ++arg)
    {
        std::string location(*arg);
        std::size_t colon = location.rfind(':');

        if (colon == std::string::npos)
        {
            std::cerr << location << ": expected file:line" << std::endl;
            status = EXIT_FAILURE;
            continue;
        }

        try
        {
            std::uint64_t pc = bi.find_location(location.substr(0, colon),
                    location.substr(colon + 1));

            std::cout << location << " 0x" << std::hex << pc << std::dec;

            const Function* fn = bi.pc_to_func(pc);
            if (fn)
                std::cout << " " << fn->name;

            std::cout << std::endl;
        }
        catch (const location_error& e)
        {
            std::cerr << location << ": " << e.what() << std::endl;
            status = EXIT_FAILURE;
        }
    }

    return status;
}
