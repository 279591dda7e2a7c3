#include "SplitShiftCipher.hpp"

#include <iostream>

#include "ToggleCipher.hpp"

static int mod26(int v) {
    return ((v % 26) + 26) % 26;
}

// offset within the 26 letter alphabet starting at base, moved by shift and wrapped
static char shift_within(char ch, char base, int shift) {
    return (char)(base + mod26(ch - base + shift));
}

char forward_char(char ch, ShiftParameters params) {
    // reduce first so the products can't overflow
    int s1 = mod26(params.shift1);
    int s2 = mod26(params.shift2);

    if (ch >= 'a' && ch <= 'z') {
        if (ch <= 'm') return shift_within(ch, 'a', (s1 * s2) % 26);
        return shift_within(ch, 'a', -((s1 + s2) % 26));
    }
    if (ch >= 'A' && ch <= 'Z') {
        if (ch <= 'M') return shift_within(ch, 'A', -s1);
        return shift_within(ch, 'A', (s2 * s2) % 26);
    }
    return ch;
}

bool try_recover_char(char ch, ShiftParameters params, char &out) {
    out = ch;
    char base;
    if (ch >= 'a' && ch <= 'z') base = 'a';
    else if (ch >= 'A' && ch <= 'Z') base = 'A';
    else return true;

    // several letters can encode to ch, the earliest one wins
    for (int i = 0; i < 26; i++) {
        char cand = (char)(base + i);
        if (forward_char(cand, params) == ch) {
            out = cand;
            return true;
        }
    }
    return false;
}

char recover_char(char ch, ShiftParameters params) {
    char res;
    try_recover_char(ch, params, res);
    return res;
}

std::string apply_shift(const std::string &text, TransformDirection dir, ShiftParameters params,
                        size_t *misses) {
    std::string res = text;
    size_t missed = 0;
    for (size_t i = 0; i < text.length(); i++) {
        if (dir == ForwardPass) {
            res[i] = forward_char(text[i], params);
        } else if (!try_recover_char(text[i], params, res[i])) {
            missed++;
        }
    }
    if (missed > 0) {
        std::cerr << "warning: " << missed << " character(s) have no preimage for shifts ("
                  << params.shift1 << ", " << params.shift2 << "), left unchanged" << std::endl;
    }
    if (misses) *misses = missed;
    return res;
}

ShiftParameters SplitShiftCipher::parameters(CipherFeatureMap &cfm) {
    return ShiftParameters(feature_int("shift1", cfm), feature_int("shift2", cfm));
}

std::string SplitShiftCipher::encode_with_features(std::string text, CipherFeatureMap &cfm) {
    return apply_shift(text, ForwardPass, parameters(cfm));
}

std::string SplitShiftCipher::decode_with_features(std::string text, CipherFeatureMap &cfm) {
    return apply_shift(text, RecoverPass, parameters(cfm));
}

void SplitShiftCipher::reset_features() {
    features["shift1"].i = default_shift1;
    features["shift2"].i = default_shift2;
}

std::string SplitShiftCipher::cipher_type() {
    return "split-shift";
}
