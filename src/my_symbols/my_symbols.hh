#ifndef MY_SYMBOLS_HH
# define MY_SYMBOLS_HH

# include "../logger.hh"

// argv: --symbols <binary> [pid]
int my_symbols(char** argv, Logger& logger);

#endif /* !MY_SYMBOLS_HH */
