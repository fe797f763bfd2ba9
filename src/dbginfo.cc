#include <iostream>
#include <cstdlib>
#include <exception>
#include <string>

#include "dbginfo.hh"
#include "logger.hh"
#include "my_symbols/my_symbols.hh"
#include "my_break/my_break.hh"
#include "my_addr2line/my_addr2line.hh"

static void usage(const char* custom_usage = nullptr)
{
    if (custom_usage)
        std::cout << custom_usage;

    else
        std::cout << "Usage: ./dbginfo [-v] {--symbols|--break|--addr2line}"
            " /path/to/binary [args]";

    std::cout << std::endl;
    std::exit(EXIT_FAILURE);
}

int dbginfo_main(int argc, char* argv[], std::ostream& log_stream)
{
    Logger logger(log_stream, log_level::warning);

    const char* env_level = std::getenv("DBGINFO_LOG");
    if (env_level)
    {
        log_level level;
        if (!parse_log_level(env_level, level))
            usage("DBGINFO_LOG must be one of error, warning, info, debug");
        logger.set_level(level);
    }

    int arg = 1;
    if (argc > 1 && std::string(argv[1]) == "-v")
    {
        logger.set_level(log_level::debug);
        ++arg;
    }

    if (argc - arg < 2)
        usage();

    std::string command = argv[arg];

    try
    {
        if (command == "--symbols")
            return my_symbols(&argv[arg], logger);

        else if (command == "--break")
            return my_break(&argv[arg], logger);

        else if (command == "--addr2line")
            return my_addr2line(&argv[arg], logger);
    }
    catch (const std::exception& e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    usage();
    return EXIT_FAILURE;
}
