#ifndef MY_ADDR2LINE_HH
# define MY_ADDR2LINE_HH

# include "../logger.hh"

// argv: --addr2line <binary> <address>...
int my_addr2line(char** argv, Logger& logger);

#endif /* !MY_ADDR2LINE_HH */
