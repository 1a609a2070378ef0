#include "util/Strings.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace trackr {

std::string Strings::trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::vector<std::string> Strings::split(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string field;
    std::istringstream iss(s);
    while (std::getline(iss, field, delim)) {
        out.push_back(field);
    }
    // getline drops a trailing empty field ("a," -> {"a"})
    if (!s.empty() && s.back() == delim) {
        out.emplace_back();
    }
    return out;
}

std::string Strings::join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::vector<std::string> Strings::lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(line);
    }
    return out;
}

std::string Strings::toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}
