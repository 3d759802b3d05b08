#include "ffpfact/descriptors/element_properties.hpp"
#include "ffpfact/utils.hpp"

#include <GraphMol/PeriodicTable.h>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cmath>

namespace ffpfact {
namespace descriptors {

namespace {

    // First ionization energies (eV, NIST) and Pauling electronegativities
    const std::unordered_map<int, ElementalProperties>& builtinEntries() {
        static const std::unordered_map<int, ElementalProperties> table = {
            {1, {13.598, 2.20}},  {3, {5.392, 0.98}},   {4, {9.323, 1.57}},   {5, {8.298, 2.04}},
            {6, {11.260, 2.55}},  {7, {14.534, 3.04}},  {8, {13.618, 3.44}},  {9, {17.423, 3.98}},
            {11, {5.139, 0.93}},  {12, {7.646, 1.31}},  {13, {5.986, 1.61}},  {14, {8.152, 1.90}},
            {15, {10.487, 2.19}}, {16, {10.360, 2.58}}, {17, {12.968, 3.16}}, {19, {4.341, 0.82}},
            {20, {6.113, 1.00}},  {21, {6.561, 1.36}},  {22, {6.828, 1.54}},  {23, {6.746, 1.63}},
            {24, {6.767, 1.66}},  {25, {7.434, 1.55}},  {26, {7.902, 1.83}},  {27, {7.881, 1.88}},
            {28, {7.640, 1.91}},  {29, {7.726, 1.90}},  {30, {9.394, 1.65}},  {31, {5.999, 1.81}},
            {32, {7.899, 2.01}},  {33, {9.789, 2.18}},  {34, {9.752, 2.55}},  {35, {11.814, 2.96}},
            {36, {14.000, 3.00}}, {37, {4.177, 0.82}},  {38, {5.695, 0.95}},  {39, {6.217, 1.22}},
            {40, {6.634, 1.33}},  {41, {6.759, 1.60}},  {42, {7.092, 2.16}},  {43, {7.280, 1.90}},
            {44, {7.361, 2.20}},  {45, {7.459, 2.28}},  {46, {8.337, 2.20}},  {47, {7.576, 1.93}},
            {48, {8.994, 1.69}},  {49, {5.786, 1.78}},  {50, {7.344, 1.96}},  {51, {8.608, 2.05}},
            {52, {9.010, 2.10}},  {53, {10.451, 2.66}}, {54, {12.130, 2.60}}, {55, {3.894, 0.79}},
            {56, {5.212, 0.89}},  {57, {5.577, 1.10}},  {58, {5.539, 1.12}},  {59, {5.473, 1.13}},
            {60, {5.525, 1.14}},  {61, {5.582, 1.13}},  {62, {5.644, 1.17}},  {63, {5.670, 1.20}},
            {64, {6.150, 1.20}},  {65, {5.864, 1.10}},  {66, {5.939, 1.22}},  {67, {6.022, 1.23}},
            {68, {6.108, 1.24}},  {69, {6.184, 1.25}},  {70, {6.254, 1.10}},  {71, {5.426, 1.27}},
            {72, {6.825, 1.30}},  {73, {7.550, 1.50}},  {74, {7.864, 2.36}},  {75, {7.834, 1.90}},
            {76, {8.438, 2.20}},  {77, {8.967, 2.20}},  {78, {8.959, 2.28}},  {79, {9.226, 2.54}},
            {80, {10.438, 2.00}}, {81, {6.108, 1.62}},  {82, {7.417, 2.33}},  {83, {7.286, 2.02}},
            {84, {8.414, 2.00}},  {85, {9.318, 2.20}},  {86, {10.749, 2.20}}, {87, {4.073, 0.70}},
            {88, {5.278, 0.90}},  {89, {5.170, 1.10}},  {90, {6.307, 1.30}},  {91, {5.890, 1.50}},
            {92, {6.194, 1.38}},  {93, {6.266, 1.36}},  {94, {6.026, 1.28}}
        };
        return table;
    }

    // Covalent radii in Angstroms (Cordero et al., Dalton Trans. 2008), H..Cm.
    // Mn, Fe and Co use the low-spin values.
    constexpr std::array<double, 96> COVALENT_RADII = {
        0.31, 0.28,
        1.28, 0.96, 0.84, 0.76, 0.71, 0.66, 0.57, 0.58,
        1.66, 1.41, 1.21, 1.11, 1.07, 1.05, 1.02, 1.06,
        2.03, 1.76, 1.70, 1.60, 1.53, 1.39, 1.39, 1.32, 1.26, 1.24, 1.32, 1.22,
        1.22, 1.20, 1.19, 1.20, 1.20, 1.16,
        2.20, 1.95, 1.90, 1.75, 1.64, 1.54, 1.47, 1.46, 1.42, 1.39, 1.45, 1.44,
        1.42, 1.39, 1.39, 1.38, 1.39, 1.40,
        2.44, 2.15, 2.07, 2.04, 2.03, 2.01, 1.99, 1.98, 1.98, 1.96, 1.94, 1.92,
        1.92, 1.89, 1.90, 1.87, 1.87, 1.75, 1.70, 1.62, 1.51, 1.44, 1.41, 1.36,
        1.36, 1.32, 1.45, 1.46, 1.48, 1.40, 1.50, 1.50,
        2.60, 2.21, 2.15, 2.06, 2.00, 1.96, 1.90, 1.87, 1.80, 1.69
    };

    double requireNumber(const rapidjson::Value& object, const char* key, const std::string& element) {
        auto it = object.FindMember(key);
        if (it == object.MemberEnd() || !it->value.IsNumber()) {
            throw DescriptorException("Element table entry '" + element + "' lacks numeric '" + key + "'",
                                      ErrorCode::PARSE_ERROR);
        }
        double value = it->value.GetDouble();
        if (!std::isfinite(value)) {
            throw DescriptorException("Element table entry '" + element + "' has non-finite '" + key + "'",
                                      ErrorCode::PARSE_ERROR);
        }
        return value;
    }

} // anonymous namespace

ElementalPropertyTable::ElementalPropertyTable(std::unordered_map<int, ElementalProperties> entries)
    : entries(std::move(entries)) {}

const ElementalPropertyTable& ElementalPropertyTable::builtin() {
    static const ElementalPropertyTable table(builtinEntries());
    return table;
}

ElementalPropertyTable ElementalPropertyTable::fromJSON(const std::string& json) {
    rapidjson::Document document;
    document.Parse(json.c_str());
    if (document.HasParseError()) {
        throw DescriptorException(std::string("Invalid element table JSON: ") +
                                  rapidjson::GetParseError_En(document.GetParseError()),
                                  ErrorCode::PARSE_ERROR);
    }
    if (!document.IsObject()) {
        throw DescriptorException("Element table JSON must be an object keyed by atomic number",
                                  ErrorCode::PARSE_ERROR);
    }

    std::unordered_map<int, ElementalProperties> parsed;
    for (auto it = document.MemberBegin(); it != document.MemberEnd(); ++it) {
        std::string key = it->name.GetString();
        int atomicNumber = 0;
        try {
            size_t consumed = 0;
            atomicNumber = std::stoi(key, &consumed);
            if (consumed != key.size()) {
                throw std::invalid_argument(key);
            }
        } catch (const std::exception&) {
            throw DescriptorException("Element table key is not an atomic number: '" + key + "'",
                                      ErrorCode::PARSE_ERROR);
        }
        if (atomicNumber < 1 || atomicNumber > MAX_ATOMIC_NUMBER) {
            throw DescriptorException("Element table key out of range: " + key, ErrorCode::PARSE_ERROR);
        }
        if (!it->value.IsObject()) {
            throw DescriptorException("Element table entry '" + key + "' must be an object",
                                      ErrorCode::PARSE_ERROR);
        }
        parsed[atomicNumber] = ElementalProperties{
            requireNumber(it->value, "ionization_energy", key),
            requireNumber(it->value, "electronegativity", key)
        };
    }

    globalLogger.debug("Loaded element table with " + std::to_string(parsed.size()) + " entries");
    return ElementalPropertyTable(std::move(parsed));
}

ElementalPropertyTable ElementalPropertyTable::fromFile(const std::string& path) {
    return fromJSON(util::readFile(path));
}

bool ElementalPropertyTable::contains(int atomicNumber) const {
    return entries.count(atomicNumber) > 0;
}

const ElementalProperties& ElementalPropertyTable::get(int atomicNumber) const {
    auto it = entries.find(atomicNumber);
    if (it == entries.end()) {
        throw UnknownSpeciesError("No elemental properties for atomic number " +
                                  std::to_string(atomicNumber), atomicNumber);
    }
    return it->second;
}

std::vector<int> ElementalPropertyTable::atomicNumbers() const {
    std::vector<int> numbers;
    numbers.reserve(entries.size());
    for (const auto& entry : entries) {
        numbers.push_back(entry.first);
    }
    std::sort(numbers.begin(), numbers.end());
    return numbers;
}

double covalentRadius(int atomicNumber) {
    if (atomicNumber < 1 || atomicNumber > static_cast<int>(COVALENT_RADII.size())) {
        throw UnknownSpeciesError("No covalent radius for atomic number " +
                                  std::to_string(atomicNumber), atomicNumber);
    }
    return COVALENT_RADII[static_cast<std::size_t>(atomicNumber - 1)];
}

int atomicNumberFromSymbol(const std::string& symbol) {
    int atomicNumber = 0;
    try {
        atomicNumber = RDKit::PeriodicTable::getTable()->getAtomicNumber(symbol);
    } catch (const std::exception& e) {
        throw UnknownSpeciesError("Unknown element symbol '" + symbol + "': " + e.what());
    }
    if (atomicNumber < 1 || atomicNumber > MAX_ATOMIC_NUMBER) {
        throw UnknownSpeciesError("Unknown element symbol '" + symbol + "'", atomicNumber);
    }
    return atomicNumber;
}

std::string elementSymbol(int atomicNumber) {
    if (atomicNumber < 1 || atomicNumber > MAX_ATOMIC_NUMBER) {
        throw UnknownSpeciesError("No element with atomic number " + std::to_string(atomicNumber),
                                  atomicNumber);
    }
    try {
        return RDKit::PeriodicTable::getTable()->getElementSymbol(static_cast<unsigned int>(atomicNumber));
    } catch (const std::exception& e) {
        throw UnknownSpeciesError("No element with atomic number " + std::to_string(atomicNumber) +
                                  ": " + e.what(), atomicNumber);
    }
}

} // namespace descriptors
} // namespace ffpfact
