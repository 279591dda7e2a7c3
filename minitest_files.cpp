// Mini-tests for file I/O, the file pipeline and shift input parsing.
// Writes scratch files under the system temp directory.

#include <iostream>
#include <string>
#include <stdexcept>
#include <filesystem>

#include "SplitShiftCipher.hpp"
#include "CipherFiles.hpp"
#include "string_parsing.hpp"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

namespace fs = std::filesystem;

static std::string scratch(const std::string &name){
    return (fs::temp_directory_path() / ("splitshift_minitest_" + name)).string();
}

static bool test_read_write_exact(){
    std::string path = scratch("bytes.txt");
    std::string text = "line one\r\nline two\n\xC3\xA9t\xC3\xA9\n";
    write_text_file(path, text);
    T_ASSERT(read_text_file(path) == text);

    write_text_file(path, "");
    T_ASSERT(read_text_file(path).empty());
    fs::remove(path);
    return true;
}

static bool test_missing_file_throws(){
    bool threw = false;
    try {
        read_text_file(scratch("does_not_exist.txt"));
    } catch (std::runtime_error &) {
        threw = true;
    }
    T_ASSERT(threw);

    threw = false;
    try {
        write_text_file((fs::temp_directory_path() / "splitshift_no_such_dir" / "out.txt").string(), "x");
    } catch (std::runtime_error &) {
        threw = true;
    }
    T_ASSERT(threw);
    return true;
}

static bool test_pipeline(){
    ShiftParameters p(2, 3);
    std::string raw = scratch("raw.txt");
    std::string enc = scratch("encrypted.txt");
    std::string dec = scratch("decrypted.txt");
    write_text_file(raw, "Hello, World!\n");

    T_ASSERT(encrypt_file(raw, enc, p) == "Fkrrj, Fjmrj!\n");
    T_ASSERT(read_text_file(enc) == "Fkrrj, Fjmrj!\n");
    T_ASSERT(decrypt_file(enc, dec, p) == "Helld, Hdgld!\n");
    T_ASSERT(read_text_file(dec) == "Helld, Hdgld!\n");
    T_ASSERT(verify_roundtrip_file(enc, p));

    StrictMatch strict = verify_strict_file(raw, dec);
    T_ASSERT(!strict.ok);
    T_ASSERT(strict.mismatches.size() == 4);
    T_ASSERT(strict.mismatches[1].position == 7);

    T_ASSERT(verify_strict_file(raw, raw).ok);

    fs::remove(raw);
    fs::remove(enc);
    fs::remove(dec);
    return true;
}

static bool test_parse_int(){
    T_ASSERT(parse_int("42") == 42);
    T_ASSERT(parse_int(" 42 ") == 42);
    T_ASSERT(parse_int("-7\n") == -7);
    T_ASSERT(parse_int("3\r\n") == 3);

    for(const char *bad : {"", "abc", "4x", "1 2", "99999999999"}){
        bool threw = false;
        try {
            parse_int(bad);
        } catch (std::runtime_error &) {
            threw = true;
        }
        T_ASSERT(threw);
    }
    return true;
}

int main(){
    bool ok = true;

    ok &= test_read_write_exact();
    ok &= test_missing_file_throws();
    ok &= test_parse_int();
    std::cout << "[A] text files and input : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_pipeline();
    std::cout << "[B] file pipeline : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
