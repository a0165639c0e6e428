#include "string_utils.h"
#include <algorithm>
#include <cctype>

size_t replaceAllInPlace(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return 0;
    size_t count = 0;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
        count++;
    }
    return count;
}

size_t replaceCharInPlace(std::string& s, char from, char to) {
    size_t count = 0;
    for (auto& ch : s) {
        if (ch == from) {
            ch = to;
            count++;
        }
    }
    return count;
}

std::string toLowerCopy(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trimCopy(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        start++;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return s.substr(start, end - start);
}

std::vector<std::string> splitString(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

std::string sanitizePathComponent(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || c == ':' || uc < 0x20 || uc == 0x7F) {
            result += '_';
        } else {
            result += c;
        }
    }
    size_t firstNonDot = result.find_first_not_of('.');
    if (firstNonDot == std::string::npos) {
        return "_";
    }
    result.erase(0, firstNonDot);
    result = trimCopy(result);
    return result.empty() ? "_" : result;
}
