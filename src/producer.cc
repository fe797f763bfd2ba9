#include "producer.hh"

#include <cctype>
#include <cstddef>

static bool is_digit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static int parse_number(const std::string& str, std::size_t& i)
{
    int value = 0;

    while (i < str.size() && is_digit(str[i]))
    {
        if (value < 100000)
            value = value * 10 + (str[i] - '0');
        ++i;
    }

    return value;
}

static bool version_start(const std::string& str, std::size_t i,
        std::size_t& start)
{
    if (i > 0 && std::isalnum(static_cast<unsigned char>(str[i - 1])))
        return false;

    if (str.compare(i, 2, "go") == 0 && i + 2 < str.size()
            && is_digit(str[i + 2]))
    {
        start = i + 2;
        return true;
    }

    if (str[i] == 'v' && i + 1 < str.size() && is_digit(str[i + 1]))
    {
        start = i + 1;
        return true;
    }

    return false;
}

bool parse_producer_version(const std::string& producer,
        producer_version& version)
{
    for (std::size_t i = 0; i < producer.size(); ++i)
    {
        std::size_t pos = 0;
        if (!version_start(producer, i, pos))
            continue;

        version.major = parse_number(producer, pos);
        version.minor = 0;
        version.patch = 0;

        if (pos + 1 < producer.size() && producer[pos] == '.'
                && is_digit(producer[pos + 1]))
        {
            ++pos;
            version.minor = parse_number(producer, pos);

            if (pos + 1 < producer.size() && producer[pos] == '.'
                    && is_digit(producer[pos + 1]))
            {
                ++pos;
                version.patch = parse_number(producer, pos);
            }
        }

        return true;
    }

    return false;
}

bool producer_after_or_equal(const std::string& producer, int major,
        int minor)
{
    producer_version version;

    if (!parse_producer_version(producer, version))
        return true;

    if (version.major != major)
        return version.major > major;

    return version.minor >= minor;
}

bool producer_optimized(const std::string& producer, std::string& stripped)
{
    std::size_t semicolon = producer.find(';');

    if (semicolon == std::string::npos)
    {
        stripped = producer;
        return producer_after_or_equal(producer, 1, 10);
    }

    std::string flags = producer.substr(semicolon);
    stripped = producer.substr(0, semicolon);

    return flags.find("-N") == std::string::npos
        || flags.find("-l") == std::string::npos;
}
