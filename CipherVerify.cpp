#include "CipherVerify.hpp"

#include <algorithm>

#include "string_parsing.hpp"

bool check_round_trip(const std::string &cipher_text, ShiftParameters params) {
    std::string recovered = apply_shift(cipher_text, RecoverPass, params);
    return apply_shift(recovered, ForwardPass, params) == cipher_text;
}

StrictMatch check_strict_match(const std::string &original, const std::string &decrypted,
                               size_t max_reports) {
    StrictMatch res;
    if (original == decrypted) return res;
    res.ok = false;

    std::vector<char32_t> a = utf8_decode(original);
    std::vector<char32_t> b = utf8_decode(decrypted);
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n && res.mismatches.size() < max_reports; i++) {
        if (a[i] != b[i]) {
            Mismatch m;
            m.position = i;
            m.expected = utf8_encode(a[i]);
            m.actual = utf8_encode(b[i]);
            res.mismatches.push_back(m);
        }
    }
    if (res.mismatches.size() < max_reports && a.size() != b.size()) {
        res.length_differs = true;
        res.original_length = a.size();
        res.decrypted_length = b.size();
    }
    return res;
}

std::string describe_mismatch(const Mismatch &m) {
    return "(" + std::to_string(m.position) + ", '" + m.expected + "', '" + m.actual + "')";
}
