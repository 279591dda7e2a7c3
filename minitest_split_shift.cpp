// Mini-tests for the split-shift engine and cipher object.
//   ./minitest_split_shift  -> prints one line per group, exit status 0 if all pass

#include <iostream>
#include <string>
#include <climits>

#include "ToggleCipher.hpp"
#include "SplitShiftCipher.hpp"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static const std::string LOWER = "abcdefghijklmnopqrstuvwxyz";
static const std::string UPPER = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

static std::string printable_ascii(){
    std::string s;
    for(char c = ' '; c <= '~'; ++c) s += c;
    return s;
}

static bool test_rule_table(){
    ShiftParameters p(2, 3);
    // a-m +6, n-z -5, A-M -2, N-Z +9
    T_ASSERT(forward_char('a', p) == 'g');
    T_ASSERT(forward_char('m', p) == 's');
    T_ASSERT(forward_char('n', p) == 'i');
    T_ASSERT(forward_char('z', p) == 'u');
    T_ASSERT(forward_char('A', p) == 'Y');
    T_ASSERT(forward_char('M', p) == 'K');
    T_ASSERT(forward_char('N', p) == 'W');
    T_ASSERT(forward_char('Z', p) == 'I');
    return true;
}

static bool test_negative_and_large_shifts(){
    T_ASSERT(forward_char('a', ShiftParameters(-1, 3)) == 'x');
    T_ASSERT(forward_char('A', ShiftParameters(-1, 0)) == 'B');
    T_ASSERT(forward_char('c', ShiftParameters(1000000, 1000000)) == 'q');

    for(int s1 = -30; s1 <= 30; ++s1){
        for(int s2 = -30; s2 <= 30; ++s2){
            ShiftParameters p(s1, s2);
            ShiftParameters q(s1 + 26, s2 - 52);
            for(char c : LOWER + UPPER){
                T_ASSERT(forward_char(c, p) == forward_char(c, q));
            }
        }
    }

    ShiftParameters extreme(INT_MAX, INT_MIN);
    ShiftParameters reduced(INT_MAX % 26, INT_MIN % 26 + 26);
    for(char c : LOWER + UPPER){
        T_ASSERT(forward_char(c, extreme) == forward_char(c, reduced));
        T_ASSERT(recover_char(c, extreme) == recover_char(c, reduced));
    }
    return true;
}

static bool test_unclassified_identity(){
    for(int s1 = -27; s1 <= 27; s1 += 3){
        for(int s2 = -27; s2 <= 27; s2 += 5){
            ShiftParameters p(s1, s2);
            for(int v = 0; v < 256; ++v){
                char c = (char)v;
                if((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) continue;
                T_ASSERT(forward_char(c, p) == c);
                T_ASSERT(recover_char(c, p) == c);
            }
        }
    }
    return true;
}

static bool test_collision_witness(){
    ShiftParameters p(2, 3);
    T_ASSERT(forward_char('T', p) == 'C');
    T_ASSERT(forward_char('E', p) == 'C');
    T_ASSERT(recover_char('C', p) == 'E');
    return true;
}

// recover picks the earliest letter of the same case that encodes to c
static bool test_recover_lowest_candidate(){
    for(int s1 = -5; s1 <= 30; ++s1){
        for(int s2 = -5; s2 <= 30; ++s2){
            ShiftParameters p(s1, s2);
            for(const std::string &alpha : {LOWER, UPPER}){
                for(char plain : alpha){
                    char c = forward_char(plain, p);
                    char r = 0;
                    T_ASSERT(try_recover_char(c, p, r));
                    T_ASSERT(forward_char(r, p) == c);
                    T_ASSERT(r <= plain);
                    T_ASSERT(r >= alpha.front() && r <= alpha.back());
                    for(char lower = alpha.front(); lower < r; ++lower){
                        T_ASSERT(forward_char(lower, p) != c);
                    }
                }
            }
        }
    }
    return true;
}

static bool test_round_trip_law(){
    std::string plain = printable_ascii() + "\n\tThe quick brown fox jumps over the lazy dog.";
    for(int s1 = -40; s1 <= 40; s1 += 7){
        for(int s2 = -40; s2 <= 40; s2 += 3){
            ShiftParameters p(s1, s2);
            std::string cipher = apply_shift(plain, ForwardPass, p);
            size_t misses = 99;
            std::string recovered = apply_shift(cipher, RecoverPass, p, &misses);
            T_ASSERT(misses == 0);
            T_ASSERT(apply_shift(recovered, ForwardPass, p) == cipher);
        }
    }
    return true;
}

static bool test_missing_preimage(){
    ShiftParameters p(2, 3);
    // lowercase image is g..u here, nothing encodes to 'a'
    char out = 0;
    T_ASSERT(!try_recover_char('a', p, out));
    T_ASSERT(out == 'a');
    T_ASSERT(recover_char('a', p) == 'a');

    size_t misses = 0;
    std::string res = apply_shift("abc-g", RecoverPass, p, &misses);
    T_ASSERT(misses == 3);
    T_ASSERT(res == "abc-a");
    return true;
}

static bool test_hello_world(){
    ShiftParameters p(2, 3);
    std::string cipher = apply_shift("Hello, World!", ForwardPass, p);
    T_ASSERT(cipher == "Fkrrj, Fjmrj!");
    T_ASSERT(apply_shift(cipher, RecoverPass, p) == "Helld, Hdgld!");
    return true;
}

static bool test_length_and_determinism(){
    std::string text = "Gr\xC3\xBC\xC3\x9F" "e, \xCE\xA9mega 123!";
    ShiftParameters p(7, -11);
    std::string enc = apply_shift(text, ForwardPass, p);
    T_ASSERT(enc.size() == text.size());
    T_ASSERT(apply_shift(enc, RecoverPass, p).size() == text.size());
    for(size_t i = 0; i < text.size(); ++i){
        if((unsigned char)text[i] >= 0x80) T_ASSERT(enc[i] == text[i]);
    }
    T_ASSERT(apply_shift(text, ForwardPass, p) == enc);
    T_ASSERT(apply_shift(enc, RecoverPass, p) == apply_shift(enc, RecoverPass, p));

    T_ASSERT(apply_shift("", ForwardPass, p).empty());
    T_ASSERT(apply_shift("", RecoverPass, p).empty());
    return true;
}

static bool test_cipher_object(){
    SplitShiftCipher cipher("test", 2, 3);
    T_ASSERT(cipher.cipher_type() == "split-shift");
    T_ASSERT(cipher.encode("Hello, World!") == "Fkrrj, Fjmrj!");
    T_ASSERT(cipher.decode("Fkrrj, Fjmrj!") == "Helld, Hdgld!");

    CipherFeatureMap zero;
    zero["shift1"].i = 0;
    zero["shift2"].i = 0;
    T_ASSERT(cipher.encode_with_features("Hello", zero) == "Hello");

    // missing keys fall back to the stored shift1 = 2
    CipherFeatureMap partial;
    partial["shift2"].i = 0;
    T_ASSERT(cipher.encode_with_features("Hello", partial) == "Fellm");

    CipherFeature f;
    f.i = 5;
    cipher.set_feature("shift1", f);
    T_ASSERT(cipher.get_feature("shift1").i == 5);
    cipher.set_feature("bogus", f);
    T_ASSERT(cipher.features.count("bogus") == 0);

    cipher.reset_features();
    T_ASSERT(cipher.get_feature("shift1").i == 2);
    T_ASSERT(cipher.get_feature("shift2").i == 3);

    ToggleCipher *base = &cipher;
    T_ASSERT(base->encode("TE") == "CC");
    T_ASSERT(base->decode("CC") == "EE");

    ToggleCipher identity("plain");
    T_ASSERT(identity.encode("Hello") == "Hello");
    T_ASSERT(identity.decode("Hello") == "Hello");
    T_ASSERT(identity.cipher_type() == "identity");
    return true;
}

int main(){
    bool ok = true;

    ok &= test_rule_table();
    ok &= test_negative_and_large_shifts();
    ok &= test_unclassified_identity();
    std::cout << "[A] forward rules : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_collision_witness();
    ok &= test_recover_lowest_candidate();
    ok &= test_round_trip_law();
    ok &= test_missing_preimage();
    std::cout << "[B] recovery : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_hello_world();
    ok &= test_length_and_determinism();
    std::cout << "[C] batch passes : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_cipher_object();
    std::cout << "[D] cipher object : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
