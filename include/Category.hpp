#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Registered document / secret categories, in registration order.
enum class Category : std::uint8_t {
    BR_CPF = 0,
    BR_CNPJ,
    BR_RG,
    BR_CNH,
    BR_RENAVAM,
    BR_PIX,
    BR_PLACA_MERCOSUL,
    BR_PLACA_ANTIGA,
    AR_CUIL,
    AR_DNI,
    CL_RUT,
    CO_CEDULA,
    CO_NIT,
    PE_DNI,
    PE_RUC,
    UY_CI,
    UY_RUT,
    VE_CI,
    VE_RIF,
    EC_CEDULA,
    EC_RUC,
    BO_CI,
    BO_NIT,
    PY_CI,
    PY_RUC,
    FINANCE_CREDIT_CARD,
    FINANCE_IBAN,
    INTERNATIONAL_EMAIL,
    INTERNATIONAL_PHONE,
    INTERNATIONAL_PASSPORT,
    ASIA_AADHAAR_IN,
    TECH_AWS,
    TECH_STRIPE,
    TECH_GOOGLE_OAUTH,
    TECH_PRIVATE_KEY,
    COUNT
};

const std::size_t kCategoryCount = static_cast<std::size_t>(Category::COUNT);

inline std::size_t category_index(Category c) { return static_cast<std::size_t>(c); }

// "BR.CPF"
const char* category_name(Category c);
// "CPF"
std::string category_short_name(Category c);
// Case-insensitive lookup of the dotted name.
bool parse_category(const std::string& name, Category& out);
// Every category, registration order.
const std::vector<Category>& all_categories();

// A pattern hit, before checksum validation.
struct Candidate {
    std::size_t start{0};
    std::size_t end{0};
    std::string text;
    Category category{Category::BR_CPF};
};
