#include "Core/Iec/DataSetParser.hpp"
#include "Core/Iec/Errors.hpp"
#include "Core/Iec/Escape.hpp"

static inline bool isReserved(char c) {
    return c == '(' || c == ')' || c == '/' || c == '!';
}

static inline bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

std::optional<DataSetRecord> TryParseDataSet(std::string_view line) {
    size_t pos = 0;

    // ID
    while (pos < line.size() && !isReserved(line[pos])) ++pos;
    if (pos >= line.size() || line[pos] != '(') return std::nullopt;
    const std::string_view id = line.substr(0, pos);
    ++pos;

    // VALORE: \d+\.\d+ (il gruppo decimale è obbligatorio)
    const size_t valueStart = pos;
    while (pos < line.size() && isDigit(line[pos])) ++pos;
    if (pos == valueStart) return std::nullopt;
    if (pos >= line.size() || line[pos] != '.') return std::nullopt;
    const size_t fracStart = ++pos;
    while (pos < line.size() && isDigit(line[pos])) ++pos;
    if (pos == fracStart) return std::nullopt;
    auto value = Decimal::parse(line.substr(valueStart, pos - valueStart));
    if (!value) return std::nullopt;

    // *UNITA opzionale
    std::optional<std::string> unit;
    if (pos < line.size() && line[pos] == '*') {
        const size_t unitStart = ++pos;
        while (pos < line.size() && !isReserved(line[pos])) ++pos;
        if (pos == unitStart) return std::nullopt;
        unit = std::string(line.substr(unitStart, pos - unitStart));
    }

    if (pos >= line.size() || line[pos] != ')') return std::nullopt;

    return DataSetRecord{ std::string(id), *value, std::move(unit) };
}

DataSetRecord ParseDataSet(std::string_view line) {
    if (auto rec = TryParseDataSet(line)) return std::move(*rec);
    throw InvalidMessageError("Impossibile interpretare il dataset: " + EscapeBytes(line));
}
