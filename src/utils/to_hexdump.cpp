/**
 * @file to_hexdump.cpp
 * @brief Hexdump rendering into a single string for log messages.
 */

#include "to_hexdump.hpp"

/**
 * @brief Joins the remaining lines of a hexdump into one string.
 *
 * Lines are indented and separated by newlines, no trailing newline.
 *
 * @param hd Sequence to render, taken by value so the caller's copy is untouched.
 * @param indent Number of spaces before each line.
 * @param prefix String to put before the first line.
 * @return Formatted hex dump string.
 */
std::string hexdump_to_string(Hexdump hd, int indent, const std::string& prefix) {
    std::string output = prefix;
    output.reserve(prefix.size() + hd.size() * (HEXDUMP_LINE_WIDTH + indent + 1));

    bool first = true;
    for( const Line& line : hd ){
        if( !first ){
            output += '\n';
        }
        first = false;
        output.append((size_t)indent, ' ');
        output.append(line.data(), line.size());
    }
    return output;
}
