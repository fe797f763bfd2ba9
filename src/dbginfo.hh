#ifndef DBGINFO_HH
# define DBGINFO_HH

# include <ostream>

// Command line front end: [-v] {--symbols|--break|--addr2line} <binary>
// [args]. Diagnostics go to log_stream at the level given by -v or by
// DBGINFO_LOG. Prints usage and exits on malformed arguments.
int dbginfo_main(int argc, char* argv[], std::ostream& log_stream);

#endif /* !DBGINFO_HH */
