#include <iostream> // std::cout
#include <cstdlib> // std::strtol
#include <climits> // INT_MAX

#include <sys/types.h> // pid_t

#include "my_symbols.hh"
#include "../bin_info.hh"

static void print_compile_units(const BinaryInfo& bi)
{
    std::cout << "compile units:" << std::endl;

    for (auto& cu : bi.compile_units())
    {
        std::cout << "  " << cu->name << " [0x" << std::hex
            << cu->start_offset << ", 0x" << cu->end_offset << ") low_pc 0x"
            << cu->low_pc << std::dec;

        if (cu->is_go)
            std::cout << (cu->optimized ? " optimized" : " not optimized");

        if (!cu->producer.empty())
            std::cout << " (" << cu->producer << ")";

        if (!cu->line_info)
            std::cout << " no line table";

        std::cout << std::endl;
    }
}

static void print_functions(const BinaryInfo& bi)
{
    std::cout << "functions:" << std::endl;

    for (auto& fn : bi.functions())
        std::cout << "  0x" << std::hex << fn.entry << "-0x" << fn.end
            << std::dec << " " << fn.name << std::endl;
}

int my_symbols(char** argv, Logger& logger)
{
    pid_t pid = -1;

    if (argv[2])
    {
        char* end = nullptr;
        long value = std::strtol(argv[2], &end, 10);

        if (end == argv[2] || *end || value < 0 || value > INT_MAX)
        {
            std::cerr << "invalid pid '" << argv[2] << "'" << std::endl;
            return EXIT_FAILURE;
        }

        pid = value;
    }

    BinaryInfo bi(argv[1], pid, logger);

    if (pid >= 0)
        std::cout << "entry point: 0x" << std::hex << bi.entry_point()
            << std::dec << std::endl;

    print_compile_units(bi);
    print_functions(bi);

    std::cout << "sources:" << std::endl;
    for (auto& source : bi.sources())
        std::cout << "  " << source << std::endl;

    return EXIT_SUCCESS;
}
