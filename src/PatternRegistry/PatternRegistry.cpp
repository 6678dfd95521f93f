#include "PatternRegistry.hpp"
#include <iostream>
#include <iterator>

namespace {

// Same order as Category. Every repeat is bounded: libstdc++ std::regex
// recurses once per consumed character, so an open quantifier over a long
// log line overflows the stack.
const PatternEntry kPatterns[kCategoryCount] = {
    {Category::BR_CPF, R"(\b\d{3}\.?\d{3}\.?\d{3}-?\d{2}\b)", false},
    {Category::BR_CNPJ, R"(\b\d{2}\.?\d{3}\.?\d{3}/?\d{4}-?\d{2}\b)", false},
    {Category::BR_RG, R"(\b\d{1,2}\.?\d{3}\.?\d{3}(?:-?[\dXx])?\b)", false},
    {Category::BR_CNH, R"(\b\d{11}\b)", false},
    {Category::BR_RENAVAM, R"(\b\d{9,11}\b)", false},
    {Category::BR_PIX,
     R"(\b[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}\b|\+55\d{10,11}\b|\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9-]{1,63}(?:\.[A-Za-z0-9-]{1,63}){0,8}\.[A-Za-z]{2,24}\b)",
     true},
    {Category::BR_PLACA_MERCOSUL, R"(\b[A-Z]{3}\d[A-Z]\d{2}\b)", false},
    {Category::BR_PLACA_ANTIGA, R"(\b[A-Z]{3}-?\d{4}\b)", false},
    {Category::AR_CUIL, R"(\b(?:20|23|24|27|30|33|34)-?\d{8}-?\d\b)", false},
    {Category::AR_DNI, R"(\b\d{1,2}\.?\d{3}\.?\d{3}\b)", false},
    {Category::CL_RUT, R"(\b\d{1,2}\.?\d{3}\.?\d{3}-[\dkK]\b)", false},
    {Category::CO_CEDULA, R"(\b\d{6,10}\b)", false},
    {Category::CO_NIT, R"(\b\d{9,10}(?:-\d)?\b)", false},
    {Category::PE_DNI, R"(\b\d{8}\b)", false},
    {Category::PE_RUC, R"(\b(?:10|15|17|20)\d{9}\b)", false},
    {Category::UY_CI, R"(\b\d\.\d{3}\.\d{3}-\d\b|\b\d{6,8}\b)", false},
    {Category::UY_RUT, R"(\b\d{12}\b)", false},
    {Category::VE_CI, R"(\b[VE]-?\d{6,9}\b)", true},
    {Category::VE_RIF, R"(\b[VEJPG]-?\d{8,9}(?:-?\d)?\b)", true},
    {Category::EC_CEDULA, R"(\b\d{10}\b)", false},
    {Category::EC_RUC, R"(\b\d{10}001\b)", false},
    {Category::BO_CI, R"(\b\d{6,10}\b)", false},
    {Category::BO_NIT, R"(\b\d{7,12}\b)", false},
    {Category::PY_CI, R"(\b\d{1,3}(?:\.\d{3}){1,2}\b|\b\d{5,8}\b)", false},
    {Category::PY_RUC, R"(\b\d{6,8}(?:-\d)?\b)", false},
    {Category::FINANCE_CREDIT_CARD, R"(\b(?:\d[ -]?){13,16}\b)", false},
    {Category::FINANCE_IBAN, R"(\b[A-Z]{2}\d{2}(?: ?[A-Z0-9]{4}){2,7}(?: ?[A-Z0-9]{1,4})?\b)", false},
    {Category::INTERNATIONAL_EMAIL,
     R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9-]{1,63}(?:\.[A-Za-z0-9-]{1,63}){0,8}\.[A-Za-z]{2,24}\b)", false},
    {Category::INTERNATIONAL_PHONE,
     R"(\+\d[\d .()-]{6,18}\d\b|\(\d{2,4}\) ?\d{4,5}-?\d{4}\b|\b\d{8,15}\b)", false},
    {Category::INTERNATIONAL_PASSPORT, R"(\b(?:[A-Z]{1,2}\d{6,8}|\d{9})\b)", false},
    {Category::ASIA_AADHAAR_IN, R"(\b[2-9]\d{3} ?\d{4} ?\d{4}\b)", false},
    {Category::TECH_AWS, R"(\b(?:AKIA|ASIA)[0-9A-Z]{16}\b)", false},
    {Category::TECH_STRIPE, R"(\b(?:sk|pk|rk)_(?:test|live)_[0-9a-zA-Z]{24,99}\b)", false},
    {Category::TECH_GOOGLE_OAUTH, R"(\bya29\.[0-9A-Za-z_-]{20,2048})", false},
    // Header only; findCandidates extends the span to the footer.
    {Category::TECH_PRIVATE_KEY, R"(-----BEGIN [A-Z ]{0,40}PRIVATE KEY-----)", false},
};

} // namespace

const PatternRegistry& PatternRegistry::instance() {
    static const PatternRegistry registry;
    return registry;
}

// Desc: compile every category pattern; a bad pattern disables only its category
// In: (none)
// Out: PatternRegistry
PatternRegistry::PatternRegistry()
    : entries_(std::begin(kPatterns), std::end(kPatterns)),
      compiled_ok_(kCategoryCount, false) {
    patterns_.reserve(entries_.size());
    for (const auto& e : entries_) {
        auto flags = std::regex::ECMAScript | std::regex::optimize;
        if (e.caseless) flags |= std::regex::icase;
        try {
            patterns_.emplace_back(e.expression, flags);
            compiled_ok_[category_index(e.category)] = true;
        } catch (const std::regex_error& err) {
            std::cerr << "[PatternRegistry] invalid regex for " << category_name(e.category)
                      << ": " << err.what() << "\n";
            patterns_.emplace_back();
        }
    }
}

// Desc: locate the END marker closing a PEM header that ends at 'from'
// In: const std::string& text, std::size_t from
// Out: std::size_t (one past the footer, or npos when there is none within kMaxPemBody)
std::size_t PatternRegistry::pemBlockEnd_(const std::string& text, std::size_t from) {
    static const std::string end_marker = "-----END ";
    static const std::string tail = "PRIVATE KEY-----";
    const std::size_t limit = from + kMaxPemBody;

    for (auto pos = text.find(end_marker, from); pos != std::string::npos && pos <= limit;
         pos = text.find(end_marker, pos + 1)) {
        const std::size_t kind_start = pos + end_marker.size();
        const std::size_t t = text.find(tail, kind_start);
        if (t == std::string::npos) return std::string::npos;
        if (t - kind_start > 40) continue;
        bool kind_ok = true;
        for (std::size_t k = kind_start; k < t; ++k) {
            const char ch = text[k];
            if (!(ch == ' ' || (ch >= 'A' && ch <= 'Z'))) { kind_ok = false; break; }
        }
        if (kind_ok) return t + tail.size();
    }
    return std::string::npos;
}

// Desc: find every candidate span for one category
// In: Category c, const std::string& text
// Out: std::vector<Candidate> (left to right)
std::vector<Candidate> PatternRegistry::findCandidates(Category c, const std::string& text) const {
    std::vector<Candidate> out;
    const std::size_t i = category_index(c);
    if (i >= kCategoryCount || !compiled_ok_[i]) return out;

    const bool pem = c == Category::TECH_PRIVATE_KEY;
    std::size_t covered = 0;
    const auto end = std::sregex_iterator();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), patterns_[i]); it != end; ++it) {
        const std::smatch& m = *it;
        Candidate cand;
        cand.start = static_cast<std::size_t>(m.position(0));
        cand.end = cand.start + static_cast<std::size_t>(m.length(0));
        if (pem) {
            // headers inside an accepted block belong to it
            if (cand.start < covered) continue;
            const std::size_t block_end = pemBlockEnd_(text, cand.end);
            if (block_end == std::string::npos) continue;
            cand.end = block_end;
            covered = block_end;
        }
        cand.text = text.substr(cand.start, cand.end - cand.start);
        cand.category = c;
        out.push_back(std::move(cand));
    }
    return out;
}
