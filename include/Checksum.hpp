#pragma once
#include <string>
#include <vector>

// Pure check-digit algorithms over decimal digit strings.
// Every function rejects non-digit input instead of throwing.
namespace Checksum {

bool luhn_validate(const std::string& digits);

bool verhoeff_validate(const std::string& digits);
// Returns the check digit as a one-char string, "" on invalid input.
std::string verhoeff_generate(const std::string& digits);

// s = sum(d_i * w_i); r = s % 11; 0 if r < 2 else 11 - r.
// Returns -1 if digits is not numeric or sizes differ.
int mod11_check_digit(const std::string& digits, const std::vector<int>& weights);

// ISO 7064 mod 97-10: numeric % 97 == 1, any length.
bool iso7064_mod97_10(const std::string& numeric);

// IBAN rearrangement: first four chars moved to the end, A..Z -> 10..35.
// Returns "" if a character is neither digit nor letter.
std::string iban_to_numeric(const std::string& iban);

bool all_digits(const std::string& s);

} // namespace Checksum
