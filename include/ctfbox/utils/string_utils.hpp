/**
 * @file string_utils.hpp
 * @brief String helpers shared by the control plane, supervisor and allocator
 *
 * Small set of static helpers for trimming, splitting and quoting strings
 * that travel between the host and a container shell.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace ctfbox {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * std::string cmd = "bash -c " + StringUtils::ShellQuote("echo 'hi'");
 * auto fields = StringUtils::SplitWhitespace("  42   1 /bin/bash  ");
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Manipulation
     ***************************************************************************/

    /// Trim leading and trailing whitespace
    static std::string Trim(const std::string& str);

    /// Lowercase copy
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     * @param str Input
     * @param delimiter Separator
     * @param keep_empty Keep empty tokens (default: drop them)
     * @return Tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter,
                                          bool keep_empty = false);

    /// Split by any run of whitespace
    static std::vector<std::string> SplitWhitespace(const std::string& str);

    /// Split into lines, dropping a trailing '\r' from each
    static std::vector<std::string> SplitLines(const std::string& str);

    /// Join with delimiter
    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Shell
     ***************************************************************************/

    /**
     * @brief Quote a single argument for POSIX sh
     *
     * Wraps the argument in single quotes and rewrites embedded single
     * quotes as `'\''`, so the shell passes it through byte for byte.
     *
     * @param arg Raw argument
     * @return Quoted argument
     */
    static std::string ShellQuote(const std::string& arg);

    /// Quote every argument and join with spaces
    static std::string ShellJoin(const std::vector<std::string>& args);

    /***************************************************************************
     * Misc
     ***************************************************************************/

    /**
     * @brief Random lowercase hex string
     * @param length Number of hex digits
     * @return Hex string suitable for resource-name suffixes
     */
    static std::string RandomHex(std::size_t length);

    /// Truncate with "..." marker when longer than max_length
    static std::string Truncate(const std::string& str, std::size_t max_length);
};

} // namespace utils
} // namespace ctfbox
