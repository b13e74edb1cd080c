#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "Core/Iec/Decimal.hpp"

// Una lettura del contatore: "1.8.0(0015.557*kWh)"
struct DataSetRecord {
    std::string                id;     // può essere vuoto
    Decimal                    value;
    std::optional<std::string> unit;
};

// Parsea una riga nel formato "ID(VALORE[*UNITA])"
// - ID e UNITA non contengono ( ) / !
// - VALORE: cifre, un punto, cifre (un solo gruppo decimale)
// - il resto della riga dopo ")" è ignorato
std::optional<DataSetRecord> TryParseDataSet(std::string_view line);

// Come TryParseDataSet, ma lancia InvalidMessageError
DataSetRecord ParseDataSet(std::string_view line);
