#include "specread/units.hpp"
#include <map>

namespace specread {

namespace {

const std::map<std::string, UnitLabel>& unitTable() {
    static const std::map<std::string, UnitLabel> table = {
        {"INTENSITY", UnitLabel("Intensity I", " in ", "a.u.")},
        {"A", UnitLabel("Extinction E", "", "")},
        {"E", UnitLabel("Extinction E", "", "")},
        {"%T", UnitLabel("Transmission", " in ", "%")},
    };
    return table;
}

} // namespace

UnitLabel resolveUnit(const std::string& mode_code) {
    const auto& table = unitTable();
    auto it = table.find(mode_code);
    if (it != table.end()) {
        return it->second;
    }
    return UnitLabel("", "", mode_code);
}

} // namespace specread
