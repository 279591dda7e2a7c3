#pragma once

#include <string>
#include <vector>

#include "SplitShiftCipher.hpp"

// One differing code point between an original and a decrypted text.
struct Mismatch {
    size_t position = 0;  // code point index
    std::string expected; // utf-8 of the original code point
    std::string actual;   // utf-8 of the decrypted code point
};

struct StrictMatch {
    bool ok = true;
    std::vector<Mismatch> mismatches;
    // set when the texts differ in length and the report cap wasn't hit
    bool length_differs = false;
    size_t original_length = 0;  // in code points
    size_t decrypted_length = 0;
};

// recover then forward again, must give back the cipher text
bool check_round_trip(const std::string &cipher_text, ShiftParameters params);

// Compares code point by code point, collecting at most max_reports mismatches.
StrictMatch check_strict_match(const std::string &original, const std::string &decrypted,
                               size_t max_reports = 5);

std::string describe_mismatch(const Mismatch &m);
