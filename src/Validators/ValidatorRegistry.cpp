#include "ValidatorRegistry.hpp"
#include "Checksum.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <initializer_list>
#include <regex>
#include <vector>

namespace {

// Desc: keep only decimal digits
// In: const std::string& s
// Out: std::string
std::string digits_only(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isdigit(c)) out.push_back(static_cast<char>(c));
    }
    return out;
}

// Desc: keep only letters and digits, uppercased
// In: const std::string& s
// Out: std::string
std::string alnum_upper(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c)) out.push_back(static_cast<char>(std::toupper(c)));
    }
    return out;
}

bool all_same(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [&](char c) { return c == s[0]; });
}

// True when s is made of digits and the listed separators only.
bool digits_with(const std::string& s, const char* separators) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (std::isdigit(c)) continue;
        if (std::strchr(separators, c) == nullptr) return false;
    }
    return true;
}

bool digit_count_in(const std::string& s, const char* separators, std::size_t lo, std::size_t hi) {
    if (!digits_with(s, separators)) return false;
    const std::size_t n = digits_only(s).size();
    return n >= lo && n <= hi;
}

bool has_prefix(const std::string& s, std::initializer_list<const char*> prefixes) {
    for (const char* p : prefixes) {
        if (s.rfind(p, 0) == 0) return true;
    }
    return false;
}

bool full_match(const std::string& s, const std::regex& re) {
    return std::regex_match(s, re);
}

bool valid_ec_province(const std::string& d) {
    const int province = (d[0] - '0') * 10 + (d[1] - '0');
    return (province >= 1 && province <= 24) || province == 30;
}

} // namespace

namespace Validators {

// ==================== BRASIL ====================

bool cpf(const std::string& v) {
    const std::string d = digits_only(v);
    if (d.size() != 11 || all_same(d)) return false;
    if (!digits_with(v, ".-")) return false;

    static const std::vector<int> w1 = {10, 9, 8, 7, 6, 5, 4, 3, 2};
    static const std::vector<int> w2 = {11, 10, 9, 8, 7, 6, 5, 4, 3, 2};
    if (Checksum::mod11_check_digit(d.substr(0, 9), w1) != d[9] - '0') return false;
    return Checksum::mod11_check_digit(d.substr(0, 10), w2) == d[10] - '0';
}

bool cnpj(const std::string& v) {
    const std::string d = digits_only(v);
    if (d.size() != 14 || all_same(d)) return false;
    if (!digits_with(v, "./-")) return false;

    static const std::vector<int> w1 = {5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
    static const std::vector<int> w2 = {6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
    if (Checksum::mod11_check_digit(d.substr(0, 12), w1) != d[12] - '0') return false;
    return Checksum::mod11_check_digit(d.substr(0, 13), w2) == d[13] - '0';
}

// RG has no national check digit; state formats share this shape.
bool rg(const std::string& v) {
    const std::string a = alnum_upper(v);
    if (a.size() < 7 || a.size() > 9 || all_same(a)) return false;
    for (std::size_t i = 0; i + 1 < a.size(); ++i) {
        if (!std::isdigit((unsigned char)a[i])) return false;
    }
    const char last = a.back();
    return std::isdigit((unsigned char)last) || last == 'X';
}

bool cnh(const std::string& v) {
    if (!Checksum::all_digits(v)) return false;
    return v.size() == 11 && !all_same(v);
}

bool renavam(const std::string& v) {
    if (!Checksum::all_digits(v) || v.size() < 9 || v.size() > 11) return false;
    return v.find_first_not_of('0') != std::string::npos;
}

bool pix(const std::string& v) {
    static const std::regex uuid_re(
        R"(^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$)", std::regex::icase);
    static const std::regex phone_re(R"(^\+55\d{10,11}$)");
    return full_match(v, uuid_re) || email(v) || full_match(v, phone_re);
}

bool placa_mercosul(const std::string& v) {
    static const std::regex re(R"(^[A-Z]{3}[0-9][A-Z][0-9]{2}$)");
    return full_match(v, re);
}

bool placa_antiga(const std::string& v) {
    static const std::regex re(R"(^[A-Z]{3}-?[0-9]{4}$)");
    return full_match(v, re);
}

// ==================== ARGENTINA ====================

bool ar_cuil(const std::string& v) {
    if (!digits_with(v, "-")) return false;
    const std::string d = digits_only(v);
    return d.size() == 11 && has_prefix(d, {"20", "23", "24", "27", "30", "33", "34"});
}

bool ar_dni(const std::string& v) {
    return digit_count_in(v, ".", 7, 8);
}

// ==================== CHILE ====================

// Desc: RUT mod-11 check digit (weights 2..7 cycling from the right)
// In: const std::string& v ("12.345.678-5")
// Out: bool
bool cl_rut(const std::string& v) {
    const std::string a = alnum_upper(v);
    if (a.size() < 8 || a.size() > 9) return false;

    const std::string body = a.substr(0, a.size() - 1);
    const char dv = a.back();
    if (!Checksum::all_digits(body)) return false;

    int sum = 0;
    int weight = 2;
    for (auto it = body.rbegin(); it != body.rend(); ++it) {
        sum += (*it - '0') * weight;
        weight = weight == 7 ? 2 : weight + 1;
    }
    const int r = 11 - (sum % 11);
    const char expected = r == 11 ? '0' : (r == 10 ? 'K' : static_cast<char>('0' + r));
    return dv == expected;
}

// ==================== COLOMBIA ====================

bool co_cedula(const std::string& v) {
    return digit_count_in(v, ".", 6, 10);
}

bool co_nit(const std::string& v) {
    return digit_count_in(v, ".-", 9, 11);
}

// ==================== PERU ====================

bool pe_dni(const std::string& v) {
    return Checksum::all_digits(v) && v.size() == 8;
}

bool pe_ruc(const std::string& v) {
    return Checksum::all_digits(v) && v.size() == 11 && has_prefix(v, {"10", "15", "17", "20"});
}

// ==================== URUGUAY ====================

bool uy_ci(const std::string& v) {
    return digit_count_in(v, ".-", 6, 8);
}

bool uy_rut(const std::string& v) {
    return Checksum::all_digits(v) && v.size() == 12;
}

// ==================== VENEZUELA ====================

bool ve_ci(const std::string& v) {
    static const std::regex re(R"(^[VE]-?[0-9]{6,9}$)", std::regex::icase);
    return full_match(v, re);
}

bool ve_rif(const std::string& v) {
    static const std::regex re(R"(^[VEJPG]-?[0-9]{8,9}(-?[0-9])?$)", std::regex::icase);
    return full_match(v, re);
}

// ==================== ECUADOR ====================

// Desc: cedula check: province, third digit < 6, mod-10 with 2,1 coefficients
// In: const std::string& v
// Out: bool
bool ec_cedula(const std::string& v) {
    if (!Checksum::all_digits(v) || v.size() != 10) return false;
    if (!valid_ec_province(v) || v[2] - '0' >= 6) return false;

    int sum = 0;
    for (int i = 0; i < 9; ++i) {
        int p = (v[i] - '0') * (i % 2 == 0 ? 2 : 1);
        if (p > 9) p -= 9;
        sum += p;
    }
    const int dv = (10 - sum % 10) % 10;
    return dv == v[9] - '0';
}

bool ec_ruc(const std::string& v) {
    if (!Checksum::all_digits(v) || v.size() != 13) return false;
    return valid_ec_province(v) && v.compare(10, 3, "001") == 0;
}

// ==================== BOLIVIA / PARAGUAY ====================

bool bo_ci(const std::string& v) {
    return Checksum::all_digits(v) && v.size() >= 6 && v.size() <= 10;
}

bool bo_nit(const std::string& v) {
    return Checksum::all_digits(v) && v.size() >= 7 && v.size() <= 12;
}

bool py_ci(const std::string& v) {
    return digit_count_in(v, ".", 5, 8);
}

bool py_ruc(const std::string& v) {
    static const std::regex re(R"(^[0-9]{6,8}(-?[0-9])?$)");
    return full_match(v, re);
}

// ==================== INTERNATIONAL ====================

bool credit_card(const std::string& v) {
    if (!digits_with(v, " -")) return false;
    const std::string d = digits_only(v);
    if (d.size() < 13 || d.size() > 19) return false;
    return Checksum::luhn_validate(d);
}

// Desc: IBAN structure plus ISO 7064 mod 97-10
// In: const std::string& v (spaces allowed)
// Out: bool
bool iban(const std::string& v) {
    std::string s;
    s.reserve(v.size());
    for (unsigned char c : v) {
        if (c == ' ') continue;
        s.push_back(static_cast<char>(std::toupper(c)));
    }
    static const std::regex re(R"(^[A-Z]{2}[0-9]{2}[A-Z0-9]{11,30}$)");
    if (!full_match(s, re)) return false;
    return Checksum::iso7064_mod97_10(Checksum::iban_to_numeric(s));
}

bool email(const std::string& v) {
    static const std::regex re(
        R"(^[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9-]{1,63}(\.[A-Za-z0-9-]{1,63}){0,8}\.[A-Za-z]{2,24}$)");
    return full_match(v, re);
}

bool phone(const std::string& v) {
    std::string rest = v;
    if (!rest.empty() && rest[0] == '+') rest.erase(0, 1);
    return digit_count_in(rest, " .-()", 8, 15);
}

bool passport(const std::string& v) {
    static const std::regex re(R"(^([A-Z]{1,2}[0-9]{6,8}|[0-9]{9})$)");
    return full_match(v, re);
}

bool aadhaar(const std::string& v) {
    if (!digits_with(v, " ")) return false;
    const std::string d = digits_only(v);
    if (d.size() != 12 || d[0] == '0' || d[0] == '1') return false;
    return Checksum::verhoeff_validate(d);
}

// ==================== SECRETS ====================

bool aws_access_key(const std::string& v) {
    static const std::regex re(R"(^(AKIA|ASIA)[0-9A-Z]{16}$)");
    return full_match(v, re);
}

bool stripe_key(const std::string& v) {
    static const std::regex re(R"(^(sk|pk|rk)_(test|live)_[0-9a-zA-Z]{24,99}$)");
    return full_match(v, re);
}

bool google_oauth(const std::string& v) {
    static const std::regex re(R"(^ya29\.[0-9A-Za-z_-]{20,2048}$)");
    return full_match(v, re);
}

// Desc: PEM private key block whose END marker names the same key kind
// In: const std::string& v
// Out: bool
bool private_key(const std::string& v) {
    static const std::string begin = "-----BEGIN ";
    static const std::string tail = "PRIVATE KEY-----";
    if (v.rfind(begin, 0) != 0) return false;

    const auto header_end = v.find("-----", begin.size());
    if (header_end == std::string::npos) return false;
    const std::string kind = v.substr(begin.size(), header_end - begin.size());
    if (kind.size() < 11 || kind.compare(kind.size() - 11, 11, "PRIVATE KEY") != 0) return false;

    const std::string footer = "-----END " + kind + "-----";
    if (v.size() < footer.size() + begin.size() + tail.size()) return false;
    return v.compare(v.size() - footer.size(), footer.size(), footer) == 0;
}

} // namespace Validators

// Desc: category -> validator lookup table, indexed by category id
// In: Category c
// Out: ValidatorFn (never null for a registered category)
ValidatorFn validator_for(Category c) {
    static const ValidatorFn table[kCategoryCount] = {
        Validators::cpf,
        Validators::cnpj,
        Validators::rg,
        Validators::cnh,
        Validators::renavam,
        Validators::pix,
        Validators::placa_mercosul,
        Validators::placa_antiga,
        Validators::ar_cuil,
        Validators::ar_dni,
        Validators::cl_rut,
        Validators::co_cedula,
        Validators::co_nit,
        Validators::pe_dni,
        Validators::pe_ruc,
        Validators::uy_ci,
        Validators::uy_rut,
        Validators::ve_ci,
        Validators::ve_rif,
        Validators::ec_cedula,
        Validators::ec_ruc,
        Validators::bo_ci,
        Validators::bo_nit,
        Validators::py_ci,
        Validators::py_ruc,
        Validators::credit_card,
        Validators::iban,
        Validators::email,
        Validators::phone,
        Validators::passport,
        Validators::aadhaar,
        Validators::aws_access_key,
        Validators::stripe_key,
        Validators::google_oauth,
        Validators::private_key,
    };
    const std::size_t i = category_index(c);
    return i < kCategoryCount ? table[i] : nullptr;
}

bool validate(Category c, const std::string& candidate) {
    ValidatorFn fn = validator_for(c);
    return fn != nullptr && fn(candidate);
}
