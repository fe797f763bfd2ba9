#ifndef AUXV_HH
# define AUXV_HH

# include <cstdint>
# include <vector>
# include <sys/types.h>

// Scans 8-byte tag / 8-byte value pairs (little-endian) for AT_ENTRY.
// Returns 0 on AT_NULL or truncated input.
std::uint64_t entry_point_from_auxv(const std::vector<unsigned char>& auxv);

// contents of /proc/<pid>/auxv, throws load_error when unreadable
std::vector<unsigned char> read_auxv(pid_t pid);

#endif /* !AUXV_HH */
