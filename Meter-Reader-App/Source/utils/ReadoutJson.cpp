#include "utils/ReadoutJson.hpp"
#include <algorithm>
#include <fmt/format.h>

using Json = nlohmann::json;

void to_json(Json& j, const IdentificationMessage& m) {
    j = Json{
        {"manufacturer",   m.manufacturerId},
        {"baudId",         std::string(1, m.baudId)},
        {"identification", m.identification},
        {"protocolMode",   std::string(1, ProtocolModeChar(m.protocolMode))},
        {"baudRate",       m.baudRate}
    };
}

void to_json(Json& j, const DataSetRecord& r) {
    j = Json{
        {"id",    r.id},
        {"value", r.value.toString()},
        {"unit",  r.unit ? Json(*r.unit) : Json(nullptr)}
    };
}

void to_json(Json& j, const Readout& r) {
    j = Json{
        {"identification", r.identification},
        {"records",        r.records}
    };
}

std::string FormatReadoutTable(const Readout& r) {
    const auto& id = r.identification;
    std::string out = fmt::format("# {} {} (modo {}, {} baud)\n",
        id.manufacturerId, id.identification, ProtocolModeChar(id.protocolMode), id.baudRate);

    size_t idW = 2, valW = 6;
    for (const auto& rec : r.records) {
        idW = std::max(idW, rec.id.size());
        valW = std::max(valW, rec.value.toString().size());
    }

    for (const auto& rec : r.records) {
        out += fmt::format("{:<{}}  {:>{}}  {}\n", rec.id, idW, rec.value.toString(), valW,
            rec.unit.value_or(""));
    }
    return out;
}
