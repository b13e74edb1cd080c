#pragma once
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

// Numero decimale esatto, non negativo, che conserva la precisione letta
// dal contatore: "0015.557" -> coefficiente 15557, scala 3 -> "15.557".
// Nessuna aritmetica: serve solo a trasportare il valore senza perdite.
class Decimal {
public:
    Decimal() = default;

    // Accetta "cifre[.cifre]"; nullopt altrimenti
    static std::optional<Decimal> parse(std::string_view text);
    // Come parse(), ma lancia std::invalid_argument
    static Decimal fromString(std::string_view text);

    [[nodiscard]] const std::string& coefficient() const { return m_coefficient; }
    [[nodiscard]] unsigned scale() const { return m_scale; }

    // Rappresentazione canonica con la scala originale ("0.000", "15.557")
    [[nodiscard]] std::string toString() const;
    [[nodiscard]] double toDouble() const;

    // Uguaglianza numerica: 1.50 == 1.5
    friend bool operator==(const Decimal& a, const Decimal& b);
    friend bool operator!=(const Decimal& a, const Decimal& b) { return !(a == b); }

private:
    std::string m_coefficient{ "0" }; // senza zeri iniziali
    unsigned m_scale = 0;             // cifre dopo il punto
};

std::ostream& operator<<(std::ostream& os, const Decimal& d);
