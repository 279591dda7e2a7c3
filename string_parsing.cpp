#include "string_parsing.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

std::string read_text_file(const std::string &path) {
    std::ifstream infile(path, std::ios::binary);
    if (!infile) throw std::runtime_error("Failed to open " + path + " for reading.");
    std::ostringstream contents;
    contents << infile.rdbuf();
    if (infile.bad()) throw std::runtime_error("Failed while reading " + path + ".");
    return contents.str();
}

void write_text_file(const std::string &path, const std::string &text) {
    std::ofstream outfile(path, std::ios::binary | std::ios::trunc);
    if (!outfile) throw std::runtime_error("Failed to open " + path + " for writing.");
    outfile.write(text.data(), (std::streamsize)text.size());
    outfile.flush();
    if (!outfile) throw std::runtime_error("Failed while writing " + path + ".");
}

int parse_int(std::string s) {
    // get rid of possible newline
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();

    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(s, &used);
    } catch (std::exception &) {
        throw std::runtime_error("Expected an integer, got \"" + s + "\".");
    }
    while (used < s.length() && isspace((unsigned char)s[used])) used++;
    if (used != s.length()) throw std::runtime_error("Expected an integer, got \"" + s + "\".");
    return value;
}

std::vector<char32_t> utf8_decode(const std::string &s) {
    std::vector<char32_t> out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ) {
        unsigned char c = s[i];
        char32_t cp;
        size_t len;
        if      (c < 0x80)           { cp = c;        len = 1; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; len = 2; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; len = 3; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; len = 4; }
        else { ++i; continue; }
        for (size_t j = 1; j < len && i + j < s.size(); ++j)
            cp = (cp << 6) | (s[i + j] & 0x3F);
        out.push_back(cp);
        i += len;
    }
    return out;
}

std::string utf8_encode(char32_t cp) {
    std::string r;
    if      (cp < 0x80)    { r += (char)cp; }
    else if (cp < 0x800)   { r += (char)(0xC0 | (cp >> 6));  r += (char)(0x80 | (cp & 0x3F)); }
    else if (cp < 0x10000) { r += (char)(0xE0 | (cp >> 12)); r += (char)(0x80 | ((cp >> 6) & 0x3F)); r += (char)(0x80 | (cp & 0x3F)); }
    else                   { r += (char)(0xF0 | (cp >> 18)); r += (char)(0x80 | ((cp >> 12) & 0x3F)); r += (char)(0x80 | ((cp >> 6) & 0x3F)); r += (char)(0x80 | (cp & 0x3F)); }
    return r;
}
