#include "Core/Iec/Decimal.hpp"
#include <cctype>
#include <cstdlib>
#include <stdexcept>

static bool allDigits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

std::optional<Decimal> Decimal::parse(std::string_view text) {
    const auto dot = text.find('.');
    const std::string_view intPart = text.substr(0, dot);
    const std::string_view fracPart = (dot == std::string_view::npos)
        ? std::string_view{} : text.substr(dot + 1);

    if (!allDigits(intPart)) return std::nullopt;
    if (dot != std::string_view::npos && !allDigits(fracPart)) return std::nullopt;

    std::string coeff;
    coeff.reserve(text.size());
    coeff.append(intPart);
    coeff.append(fracPart);

    const auto first = coeff.find_first_not_of('0');
    Decimal d;
    d.m_coefficient = (first == std::string::npos) ? "0" : coeff.substr(first);
    d.m_scale = static_cast<unsigned>(fracPart.size());
    return d;
}

Decimal Decimal::fromString(std::string_view text) {
    auto d = parse(text);
    if (!d) throw std::invalid_argument("decimale non valido: " + std::string(text));
    return *d;
}

std::string Decimal::toString() const {
    if (m_scale == 0) return m_coefficient;

    std::string digits = m_coefficient;
    if (digits.size() <= m_scale) {
        digits.insert(0, m_scale + 1 - digits.size(), '0');
    }
    digits.insert(digits.size() - m_scale, 1, '.');
    return digits;
}

double Decimal::toDouble() const {
    return std::strtod(toString().c_str(), nullptr);
}

// Coefficiente e scala senza zeri finali dopo il punto
static void normalize(std::string& coeff, unsigned& scale) {
    while (scale > 0 && coeff.size() > 1 && coeff.back() == '0') {
        coeff.pop_back();
        --scale;
    }
    if (coeff == "0") scale = 0;
}

bool operator==(const Decimal& a, const Decimal& b) {
    std::string ca = a.m_coefficient, cb = b.m_coefficient;
    unsigned sa = a.m_scale, sb = b.m_scale;
    normalize(ca, sa);
    normalize(cb, sb);
    return sa == sb && ca == cb;
}

std::ostream& operator<<(std::ostream& os, const Decimal& d) {
    return os << d.toString();
}
