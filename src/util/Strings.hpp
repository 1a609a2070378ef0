#pragma once

#include <string>
#include <vector>

namespace trackr {

namespace Strings {

/// Strip leading and trailing whitespace
std::string trim(const std::string& s);

/// Split on a delimiter; empty fields are kept
std::vector<std::string> split(const std::string& s, char delim);

/// Join parts with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

/**
 * @brief Split text into lines
 *
 * Handles "\n" and "\r\n". A single trailing newline does not produce an
 * extra empty line, so "a\nb\n" yields {"a", "b"}.
 */
std::vector<std::string> lines(const std::string& text);

/// Lowercase ASCII copy
std::string toLower(const std::string& s);

}

}
