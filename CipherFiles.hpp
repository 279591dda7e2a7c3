#pragma once

#include <string>

#include "SplitShiftCipher.hpp"
#include "CipherVerify.hpp"

// Each of these reads its inputs from disk and throws std::runtime_error if it can't.
// encrypt/decrypt return what they wrote.
std::string encrypt_file(const std::string &input_file, const std::string &output_file, ShiftParameters params);
std::string decrypt_file(const std::string &input_file, const std::string &output_file, ShiftParameters params);

bool verify_roundtrip_file(const std::string &encrypted_file, ShiftParameters params);

StrictMatch verify_strict_file(const std::string &original_file, const std::string &decrypted_file,
                               size_t max_reports = 5);
