#include <iostream>

#include "dbginfo.hh"

int main(int argc, char *argv[])
{
    return dbginfo_main(argc, argv, std::cerr);
}
