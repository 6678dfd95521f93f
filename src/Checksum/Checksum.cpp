#include "Checksum.hpp"
#include <cctype>
#include <cstddef>

namespace {

// Dihedral group D5 multiplication table
const int kVerhoeffD[10][10] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
    {1, 2, 3, 4, 0, 6, 7, 8, 9, 5},
    {2, 3, 4, 0, 1, 7, 8, 9, 5, 6},
    {3, 4, 0, 1, 2, 8, 9, 5, 6, 7},
    {4, 0, 1, 2, 3, 9, 5, 6, 7, 8},
    {5, 9, 8, 7, 6, 0, 4, 3, 2, 1},
    {6, 5, 9, 8, 7, 1, 0, 4, 3, 2},
    {7, 6, 5, 9, 8, 2, 1, 0, 4, 3},
    {8, 7, 6, 5, 9, 3, 2, 1, 0, 4},
    {9, 8, 7, 6, 5, 4, 3, 2, 1, 0},
};

// Position permutations
const int kVerhoeffP[8][10] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
    {1, 5, 7, 6, 2, 8, 3, 0, 9, 4},
    {5, 8, 0, 3, 7, 9, 6, 1, 4, 2},
    {8, 9, 1, 6, 0, 4, 3, 5, 2, 7},
    {9, 4, 5, 3, 1, 2, 6, 8, 7, 0},
    {4, 2, 8, 6, 5, 7, 3, 9, 0, 1},
    {2, 7, 9, 3, 8, 0, 6, 4, 1, 5},
    {7, 0, 4, 6, 9, 1, 3, 2, 5, 8},
};

const int kVerhoeffInv[10] = {0, 4, 3, 2, 1, 5, 6, 7, 8, 9};

// Desc: run the Verhoeff recurrence over reversed digits
// In: const std::string& digits, int shift (0 validate, 1 generate)
// Out: int (final accumulator)
int verhoeff_accumulate(const std::string& digits, int shift) {
    int c = 0;
    std::size_t i = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it, ++i) {
        const int d = *it - '0';
        c = kVerhoeffD[c][kVerhoeffP[(i + shift) % 8][d]];
    }
    return c;
}

} // namespace

namespace Checksum {

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

// Desc: Luhn mod-10 over a digit string
// In: const std::string& digits
// Out: bool (sum % 10 == 0)
bool luhn_validate(const std::string& digits) {
    if (!all_digits(digits)) return false;

    int sum = 0;
    std::size_t i = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it, ++i) {
        int d = *it - '0';
        if (i % 2 == 1) {
            d *= 2;
            if (d >= 10) d -= 9;
        }
        sum += d;
    }
    return sum % 10 == 0;
}

bool verhoeff_validate(const std::string& digits) {
    if (!all_digits(digits)) return false;
    return verhoeff_accumulate(digits, 0) == 0;
}

std::string verhoeff_generate(const std::string& digits) {
    if (!all_digits(digits)) return {};
    return std::string(1, static_cast<char>('0' + kVerhoeffInv[verhoeff_accumulate(digits, 1)]));
}

// Desc: weighted mod-11 check digit (CPF/CNPJ family)
// In: const std::string& digits, const std::vector<int>& weights
// Out: int (0..9, or -1 on invalid input)
int mod11_check_digit(const std::string& digits, const std::vector<int>& weights) {
    if (!all_digits(digits) || digits.size() != weights.size()) return -1;

    long sum = 0;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        sum += static_cast<long>(digits[i] - '0') * weights[i];
    }
    const long r = sum % 11;
    return r < 2 ? 0 : static_cast<int>(11 - r);
}

// Desc: ISO 7064 mod 97-10 check, reduced chunk by chunk
// In: const std::string& numeric
// Out: bool (value % 97 == 1)
bool iso7064_mod97_10(const std::string& numeric) {
    if (!all_digits(numeric)) return false;

    unsigned rem = 0;
    for (char c : numeric) {
        rem = (rem * 10 + static_cast<unsigned>(c - '0')) % 97;
    }
    return rem == 1;
}

std::string iban_to_numeric(const std::string& iban) {
    if (iban.size() < 4) return {};
    const std::string rearranged = iban.substr(4) + iban.substr(0, 4);

    std::string out;
    out.reserve(rearranged.size() * 2);
    for (unsigned char c : rearranged) {
        if (std::isdigit(c)) {
            out.push_back(static_cast<char>(c));
        } else if (std::isalpha(c)) {
            out += std::to_string(std::toupper(c) - 'A' + 10);
        } else {
            return {};
        }
    }
    return out;
}

} // namespace Checksum
