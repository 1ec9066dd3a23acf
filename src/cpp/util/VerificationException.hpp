/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

//-------------------------------------------------------------------------

namespace eurocheck
{

//-------------------------------------------------------------------------

class VerificationException : public std::runtime_error
{
public:
    VerificationException(const std::string& message) : std::runtime_error(message) {}
    VerificationException(const VerificationException& exception) = default;
    VerificationException(VerificationException&& exception) = default;
};

//-------------------------------------------------------------------------

// A run that cannot start: nothing has been compared when this is thrown.
class ConfigurationError : public VerificationException
{
public:
    using VerificationException::VerificationException;
};

//-------------------------------------------------------------------------

class UnknownColumnError : public ConfigurationError
{
public:
    UnknownColumnError(const std::string& message, std::string column, std::string gridName)
        : ConfigurationError(message),
          m_column{std::move(column)},
          m_gridName{std::move(gridName)}
    {}

    [[nodiscard]] const std::string& column() const noexcept { return m_column; }
    [[nodiscard]] const std::string& gridName() const noexcept { return m_gridName; }

private:
    std::string m_column;
    std::string m_gridName;
};

//-------------------------------------------------------------------------

class AmbiguousColumnError : public ConfigurationError
{
public:
    AmbiguousColumnError(const std::string& message, std::string column, std::string gridName)
        : ConfigurationError(message),
          m_column{std::move(column)},
          m_gridName{std::move(gridName)}
    {}

    [[nodiscard]] const std::string& column() const noexcept { return m_column; }
    [[nodiscard]] const std::string& gridName() const noexcept { return m_gridName; }

private:
    std::string m_column;
    std::string m_gridName;
};

//-------------------------------------------------------------------------

}  // namespace eurocheck

//-------------------------------------------------------------------------
