#include "CipherFiles.hpp"

#include "string_parsing.hpp"

std::string encrypt_file(const std::string &input_file, const std::string &output_file, ShiftParameters params) {
    std::string encrypted = apply_shift(read_text_file(input_file), ForwardPass, params);
    write_text_file(output_file, encrypted);
    return encrypted;
}

std::string decrypt_file(const std::string &input_file, const std::string &output_file, ShiftParameters params) {
    std::string decrypted = apply_shift(read_text_file(input_file), RecoverPass, params);
    write_text_file(output_file, decrypted);
    return decrypted;
}

bool verify_roundtrip_file(const std::string &encrypted_file, ShiftParameters params) {
    return check_round_trip(read_text_file(encrypted_file), params);
}

StrictMatch verify_strict_file(const std::string &original_file, const std::string &decrypted_file,
                               size_t max_reports) {
    std::string original = read_text_file(original_file);
    std::string decrypted = read_text_file(decrypted_file);
    return check_strict_match(original, decrypted, max_reports);
}
