#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <string>
#include <vector>

// Helper functions for string manipulation
size_t replaceAllInPlace(std::string& s, const std::string& from, const std::string& to);
size_t replaceCharInPlace(std::string& s, char from, char to);
std::string toLowerCopy(const std::string& s);
std::string trimCopy(const std::string& s);
std::vector<std::string> splitString(const std::string& s, char delimiter);

// Make a single path component safe for the filesystem:
// separators and control characters become '_', leading dots are dropped,
// an empty result becomes "_"
std::string sanitizePathComponent(const std::string& name);

#endif // STRING_UTILS_H
