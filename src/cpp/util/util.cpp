/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "util.hpp"

#include <boost/algorithm/string.hpp>

//-------------------------------------------------------------------------

namespace eurocheck::util
{

//-------------------------------------------------------------------------

std::string csvEscape(std::string_view field, char delim)
{
    const bool needsQuotes = field.find_first_of(std::string{delim, '"', '\n', '\r'})
        != std::string_view::npos;
    if (!needsQuotes) {
        return std::string{field};
    }
    std::string escaped{field};
    boost::algorithm::replace_all(escaped, "\"", "\"\"");
    return '"' + escaped + '"';
}

//-------------------------------------------------------------------------

fs::path resolvePath(const fs::path& path, const fs::path& baseDir)
{
    if (path.empty() || path.is_absolute() || baseDir.empty()) {
        return path;
    }
    return baseDir / path;
}

//-------------------------------------------------------------------------

}  // namespace eurocheck::util

//-------------------------------------------------------------------------
