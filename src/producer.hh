#ifndef PRODUCER_HH
# define PRODUCER_HH

# include <string>

struct producer_version
{
    int major;
    int minor;
    int patch;
};

// Finds the first "go<major>.<minor>[.<patch>]" or "v<major>..." token.
// Returns false when the producer carries no parsable version.
bool parse_producer_version(const std::string& producer,
        producer_version& version);

// A producer without a version is a development toolchain and compares
// as newer than anything.
bool producer_after_or_equal(const std::string& producer, int major,
        int minor);

// Splits "<version>; <flags>" and tells whether the unit was optimized.
// Without flags, toolchains from 1.10 on optimize by default. With flags,
// the unit counts as unoptimized only when both "-N" and "-l" are given.
// stripped receives the producer without the flags.
bool producer_optimized(const std::string& producer, std::string& stripped);

#endif /* !PRODUCER_HH */
