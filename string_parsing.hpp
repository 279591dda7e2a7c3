#pragma once

#include <string>
#include <vector>

// Whole file, bytes as they are on disk. Throws std::runtime_error on failure.
std::string read_text_file(const std::string &path);
void write_text_file(const std::string &path, const std::string &text);

// Integer from a line of user input, surrounding whitespace allowed.
// Throws std::runtime_error if there's anything else on the line.
int parse_int(std::string s);

// invalid lead bytes are skipped
std::vector<char32_t> utf8_decode(const std::string &s);
std::string utf8_encode(char32_t cp);
