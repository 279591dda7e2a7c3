#include <iostream>
#include <string>
#include <stdexcept>

#include "SplitShiftCipher.hpp"
#include "CipherVerify.hpp"
#include "CipherFiles.hpp"
#include "string_parsing.hpp"

static void print_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [raw_file [encrypted_file [decrypted_file]]]\n"
              << "  defaults: raw_text.txt encrypted_text.txt decrypted_text.txt\n"
              << "  shift1 and shift2 are read from stdin." << std::endl;
}

static int prompt_shift(const std::string &label) {
    std::cout << "Enter " << label << ": " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) throw std::runtime_error("No value given for " + label + ".");
    return parse_int(line);
}

int main(int argc, char **argv) {
    std::string raw_file = "raw_text.txt";
    std::string encrypted_file = "encrypted_text.txt";
    std::string decrypted_file = "decrypted_text.txt";

    if (argc > 1) {
        std::string first = argv[1];
        if (first == "-h" || first == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }
    if (argc > 4) {
        print_usage(argv[0]);
        return 1;
    }
    if (argc > 1) raw_file = argv[1];
    if (argc > 2) encrypted_file = argv[2];
    if (argc > 3) decrypted_file = argv[3];

    try {
        int shift1 = prompt_shift("shift1");
        int shift2 = prompt_shift("shift2");
        SplitShiftCipher cipher("cli", shift1, shift2);
        ShiftParameters params = cipher.parameters(cipher.blank);

        encrypt_file(raw_file, encrypted_file, params);
        std::cout << "Encryption complete. Check '" << encrypted_file << "'." << std::endl;

        decrypt_file(encrypted_file, decrypted_file, params);
        std::cout << "Decryption complete. Check '" << decrypted_file << "'." << std::endl;

        if (!verify_roundtrip_file(encrypted_file, params)) {
            std::cerr << "Round-trip verification failed (unexpected)." << std::endl;
            return 2;
        }
        std::cout << "Round-trip verification passed: encrypt(decrypt) == encrypted." << std::endl;

        StrictMatch strict = verify_strict_file(raw_file, decrypted_file);
        if (strict.ok) {
            std::cout << "Strict verification passed: original and decrypted texts match exactly." << std::endl;
        } else {
            std::cout << "Strict verification: mismatch detected (expected with these rules)." << std::endl;
            for (const Mismatch &m : strict.mismatches) {
                std::cout << "   Mismatch: " << describe_mismatch(m) << std::endl;
            }
            if (strict.length_differs) {
                std::cout << "   Mismatch: (length, " << strict.original_length << ", "
                          << strict.decrypted_length << ")" << std::endl;
            }
            std::cout << "   Note: several letters can encrypt to the same one, e.g. 'T' and 'E' both give 'C'"
                      << " when shift1=2, shift2=3." << std::endl;
        }
    } catch (std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
