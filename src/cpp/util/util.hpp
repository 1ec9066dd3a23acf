/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <concepts>
#include <filesystem>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

namespace eurocheck::util
{

//-------------------------------------------------------------------------

template<typename... Args>
[[nodiscard]] std::string captureOutput(std::invocable<Args...> auto fn, Args&&... args) noexcept
{
    std::streambuf* coutBuffer = std::cout.rdbuf();
    std::stringstream sstream;
    std::cout.rdbuf(sstream.rdbuf());
    fn(std::forward<Args>(args)...);
    std::cout.rdbuf(coutBuffer);
    return sstream.str();
}

// Quotes a CSV field when it holds the delimiter, a quote or a line break.
[[nodiscard]] std::string csvEscape(std::string_view field, char delim = ',');

[[nodiscard]] fs::path resolvePath(const fs::path& path, const fs::path& baseDir);

//-------------------------------------------------------------------------

}  // namespace eurocheck::util

//-------------------------------------------------------------------------
