#ifndef MY_BREAK_HH
# define MY_BREAK_HH

# include "../logger.hh"

// argv: --break <binary> <file:line>...
int my_break(char** argv, Logger& logger);

#endif /* !MY_BREAK_HH */
