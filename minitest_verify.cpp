// Mini-tests for the round-trip and strict-equality checks.

#include <iostream>
#include <string>

#include "SplitShiftCipher.hpp"
#include "CipherVerify.hpp"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static bool same(const Mismatch &m, size_t pos, const std::string &expected, const std::string &actual){
    return m.position == pos && m.expected == expected && m.actual == actual;
}

static bool test_round_trip_on_cipher_text(){
    std::string plain = "Attack at Dawn, 0600 hours! zebra XYZ";
    for(int s1 = -13; s1 <= 13; ++s1){
        for(int s2 = -13; s2 <= 13; ++s2){
            ShiftParameters p(s1, s2);
            T_ASSERT(check_round_trip(apply_shift(plain, ForwardPass, p), p));
        }
    }
    T_ASSERT(check_round_trip("", ShiftParameters(2, 3)));
    return true;
}

static bool test_round_trip_outside_image(){
    // 'a' has no preimage for (2, 3), so the fallback leaves it and forward moves it
    T_ASSERT(!check_round_trip("abc", ShiftParameters(2, 3)));
    T_ASSERT(check_round_trip("ghi", ShiftParameters(2, 3)));
    return true;
}

static bool test_strict_after_round_trip(){
    ShiftParameters p(2, 3);
    std::string original = "Hello, World!";
    std::string decrypted = apply_shift(apply_shift(original, ForwardPass, p), RecoverPass, p);
    StrictMatch res = check_strict_match(original, decrypted);
    T_ASSERT(!res.ok);
    T_ASSERT(res.mismatches.size() == 4);
    T_ASSERT(same(res.mismatches[0], 4, "o", "d"));
    T_ASSERT(same(res.mismatches[1], 7, "W", "H"));
    T_ASSERT(same(res.mismatches[2], 8, "o", "d"));
    T_ASSERT(same(res.mismatches[3], 9, "r", "g"));
    T_ASSERT(!res.length_differs);
    T_ASSERT(describe_mismatch(res.mismatches[0]) == "(4, 'o', 'd')");

    // the colliding pair itself
    std::string pair = "TE";
    StrictMatch te = check_strict_match(pair, apply_shift(apply_shift(pair, ForwardPass, p), RecoverPass, p));
    T_ASSERT(!te.ok);
    T_ASSERT(te.mismatches.size() == 1);
    T_ASSERT(same(te.mismatches[0], 0, "T", "E"));
    return true;
}

static bool test_strict_equal(){
    StrictMatch res = check_strict_match("same text", "same text");
    T_ASSERT(res.ok);
    T_ASSERT(res.mismatches.empty());
    T_ASSERT(!res.length_differs);

    T_ASSERT(check_strict_match("", "").ok);
    return true;
}

static bool test_strict_cap_and_length(){
    StrictMatch capped = check_strict_match("aaaaaaa", "bbbbbbbbbb");
    T_ASSERT(!capped.ok);
    T_ASSERT(capped.mismatches.size() == 5);
    T_ASSERT(capped.mismatches[4].position == 4);
    T_ASSERT(!capped.length_differs);

    StrictMatch longer = check_strict_match("ab", "abcd");
    T_ASSERT(!longer.ok);
    T_ASSERT(longer.mismatches.empty());
    T_ASSERT(longer.length_differs);
    T_ASSERT(longer.original_length == 2);
    T_ASSERT(longer.decrypted_length == 4);

    StrictMatch few = check_strict_match("abcdef", "xbc", 2);
    T_ASSERT(few.mismatches.size() == 1);
    T_ASSERT(few.length_differs);

    StrictMatch none = check_strict_match("abc", "abcd", 0);
    T_ASSERT(!none.ok);
    T_ASSERT(none.mismatches.empty());
    T_ASSERT(!none.length_differs);
    return true;
}

static bool test_strict_code_points(){
    // "Grüße" vs "Grüse": position counts code points, not bytes
    std::string original = "Gr\xC3\xBC\xC3\x9F" "e";
    std::string decrypted = "Gr\xC3\xBC" "se";
    StrictMatch res = check_strict_match(original, decrypted);
    T_ASSERT(!res.ok);
    T_ASSERT(res.mismatches.size() == 1);
    T_ASSERT(same(res.mismatches[0], 3, "\xC3\x9F", "s"));
    T_ASSERT(!res.length_differs);

    StrictMatch shorter = check_strict_match("\xCE\xA9\xCE\xA9", "\xCE\xA9");
    T_ASSERT(shorter.length_differs);
    T_ASSERT(shorter.original_length == 2);
    T_ASSERT(shorter.decrypted_length == 1);
    return true;
}

int main(){
    bool ok = true;

    ok &= test_round_trip_on_cipher_text();
    ok &= test_round_trip_outside_image();
    std::cout << "[A] round-trip check : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_strict_after_round_trip();
    ok &= test_strict_equal();
    ok &= test_strict_cap_and_length();
    ok &= test_strict_code_points();
    std::cout << "[B] strict check : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
