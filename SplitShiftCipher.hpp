#pragma once

#include <string>

#include "ToggleCipher.hpp"

// The two shift values shared by the forward and recovery passes.
// Any integers are accepted, all shift arithmetic is mod 26.
struct ShiftParameters {
    int shift1 = 0;
    int shift2 = 0;

    ShiftParameters() {};
    ShiftParameters(int s1, int s2) : shift1(s1), shift2(s2) {};
};

enum TransformDirection {
    ForwardPass,
    RecoverPass
};

// Letters are split by case and by alphabet half, each part gets its own rule:
//   a-m  forward by  (shift1 * shift2) mod 26
//   n-z  backward by (shift1 + shift2) mod 26
//   A-M  backward by shift1 mod 26
//   N-Z  forward by  (shift2 * shift2) mod 26
// Everything else is returned unchanged.
char forward_char(char ch, ShiftParameters params);

// Lowest letter of the same case that forward_char maps onto ch.
// Returns false and leaves out == ch if there is none.
bool try_recover_char(char ch, ShiftParameters params, char &out);

// forward_char(recover_char(c)) == c whenever c is in the image of forward_char.
char recover_char(char ch, ShiftParameters params);

// Applies one pass to every character, keeping order and length.
// misses (if given) receives the number of letters recover found no candidate for.
std::string apply_shift(const std::string &text, TransformDirection dir, ShiftParameters params,
                        size_t *misses = nullptr);

struct SplitShiftCipher : ToggleCipher {
    int default_shift1 = 0;
    int default_shift2 = 0;

    SplitShiftCipher() {
        features["shift1"].i = 0;
        features["shift2"].i = 0;
    };
    SplitShiftCipher(std::string n) {
        name = n;
        features["shift1"].i = 0;
        features["shift2"].i = 0;
    };
    SplitShiftCipher(std::string n, int shift1, int shift2) {
        name = n;
        features["shift1"].i = shift1;
        features["shift2"].i = shift2;
        default_shift1 = shift1;
        default_shift2 = shift2;
    };

    ShiftParameters parameters(CipherFeatureMap &cfm);

    virtual std::string encode_with_features(std::string text, CipherFeatureMap &cfm) override;

    virtual std::string decode_with_features(std::string text, CipherFeatureMap &cfm) override;

    virtual void reset_features() override;

    virtual std::string cipher_type() override;
};
