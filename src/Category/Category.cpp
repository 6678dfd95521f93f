#include "Category.hpp"
#include <algorithm>
#include <cctype>

namespace {

const char* const kNames[kCategoryCount] = {
    "BR.CPF",
    "BR.CNPJ",
    "BR.RG",
    "BR.CNH",
    "BR.RENAVAM",
    "BR.PIX",
    "BR.PLACA_MERCOSUL",
    "BR.PLACA_ANTIGA",
    "AR.CUIL",
    "AR.DNI",
    "CL.RUT",
    "CO.CEDULA",
    "CO.NIT",
    "PE.DNI",
    "PE.RUC",
    "UY.CI",
    "UY.RUT",
    "VE.CI",
    "VE.RIF",
    "EC.CEDULA",
    "EC.RUC",
    "BO.CI",
    "BO.NIT",
    "PY.CI",
    "PY.RUC",
    "FINANCE.CREDIT_CARD",
    "FINANCE.IBAN",
    "INTERNATIONAL.EMAIL",
    "INTERNATIONAL.PHONE",
    "INTERNATIONAL.PASSPORT",
    "ASIA.AADHAAR_IN",
    "TECH.AWS",
    "TECH.STRIPE",
    "TECH.GOOGLE_OAUTH",
    "TECH.PRIVATE_KEY",
};

std::string to_upper(std::string s) {
    for (char& c : s) c = (char)std::toupper((unsigned char)c);
    return s;
}

} // namespace

const char* category_name(Category c) {
    const std::size_t i = category_index(c);
    return i < kCategoryCount ? kNames[i] : "UNKNOWN";
}

std::string category_short_name(Category c) {
    const std::string full = category_name(c);
    const auto dot = full.rfind('.');
    return dot == std::string::npos ? full : full.substr(dot + 1);
}

// Desc: resolve a dotted category name (case-insensitive)
// In: const std::string& name, Category& out
// Out: bool (true if found)
bool parse_category(const std::string& name, Category& out) {
    const std::string wanted = to_upper(name);
    for (std::size_t i = 0; i < kCategoryCount; ++i) {
        if (wanted == kNames[i]) {
            out = static_cast<Category>(i);
            return true;
        }
    }
    return false;
}

const std::vector<Category>& all_categories() {
    static const std::vector<Category> all = [] {
        std::vector<Category> v;
        v.reserve(kCategoryCount);
        for (std::size_t i = 0; i < kCategoryCount; ++i) v.push_back(static_cast<Category>(i));
        return v;
    }();
    return all;
}
