/**
 * @file TomlReader.hpp
 * @brief Reads the TOML subset used by project configuration files into a JSON tree.
 *
 * Supported: comments, [table] and [[array-of-tables]] headers, dotted and quoted keys,
 * basic/literal strings (single and multi-line), integers, floats, booleans,
 * arrays spanning lines, inline tables. Date/time values are rejected.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace shipwright::infrastructure {

class TomlParseError : public std::runtime_error {
public:
    TomlParseError(const std::string& message, std::size_t line)
        : std::runtime_error("line " + std::to_string(line) + ": " + message), m_line(line) {}

    std::size_t line() const { return m_line; }

private:
    std::size_t m_line;
};

class TomlReader {
public:
    /**
     * @brief Parses a TOML document.
     * @return A JSON object mirroring the document's tables.
     * @throws TomlParseError with the offending line.
     */
    static nlohmann::json Parse(const std::string& text);
};

} // namespace shipwright::infrastructure
