#pragma once
#include "Category.hpp"
#include <string>

// Pure, stateless validators; one per category.
using ValidatorFn = bool (*)(const std::string& candidate);

namespace Validators {

// Brazil
bool cpf(const std::string& v);
bool cnpj(const std::string& v);
bool rg(const std::string& v);
bool cnh(const std::string& v);
bool renavam(const std::string& v);
bool pix(const std::string& v);
bool placa_mercosul(const std::string& v);
bool placa_antiga(const std::string& v);

// Rest of Latin America
bool ar_cuil(const std::string& v);
bool ar_dni(const std::string& v);
bool cl_rut(const std::string& v);
bool co_cedula(const std::string& v);
bool co_nit(const std::string& v);
bool pe_dni(const std::string& v);
bool pe_ruc(const std::string& v);
bool uy_ci(const std::string& v);
bool uy_rut(const std::string& v);
bool ve_ci(const std::string& v);
bool ve_rif(const std::string& v);
bool ec_cedula(const std::string& v);
bool ec_ruc(const std::string& v);
bool bo_ci(const std::string& v);
bool bo_nit(const std::string& v);
bool py_ci(const std::string& v);
bool py_ruc(const std::string& v);

// Finance / international / secrets
bool credit_card(const std::string& v);
bool iban(const std::string& v);
bool email(const std::string& v);
bool phone(const std::string& v);
bool passport(const std::string& v);
bool aadhaar(const std::string& v);
bool aws_access_key(const std::string& v);
bool stripe_key(const std::string& v);
bool google_oauth(const std::string& v);
bool private_key(const std::string& v);

} // namespace Validators

ValidatorFn validator_for(Category c);
bool validate(Category c, const std::string& candidate);
