#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace ffpfact {
namespace descriptors {

struct ElementalProperties {
    double ionizationEnergy;  // first ionization energy, eV
    double electronegativity; // Pauling scale
};

// Read-only lookup from atomic number to ionization energy and electronegativity.
// Loaded once at start-up and shared between threads without locking.
class ElementalPropertyTable {
private:
    std::unordered_map<int, ElementalProperties> entries;

public:
    ElementalPropertyTable() = default;
    explicit ElementalPropertyTable(std::unordered_map<int, ElementalProperties> entries);

    // Compiled-in table covering H..Pu (noble gases without a Pauling value are absent)
    static const ElementalPropertyTable& builtin();

    // JSON object keyed by atomic number strings:
    //   {"8": {"ionization_energy": 13.618, "electronegativity": 3.44}, ...}
    static ElementalPropertyTable fromJSON(const std::string& json);
    static ElementalPropertyTable fromFile(const std::string& path);

    bool contains(int atomicNumber) const;
    // Throws UnknownSpeciesError when the element is missing
    const ElementalProperties& get(int atomicNumber) const;
    double ionizationEnergy(int atomicNumber) const { return get(atomicNumber).ionizationEnergy; }
    double electronegativity(int atomicNumber) const { return get(atomicNumber).electronegativity; }

    std::size_t size() const { return entries.size(); }
    std::vector<int> atomicNumbers() const;
};

constexpr int MAX_ATOMIC_NUMBER = 118;

// Cordero covalent radius in Angstrom, defined for H..Cm
double covalentRadius(int atomicNumber);

int atomicNumberFromSymbol(const std::string& symbol);
std::string elementSymbol(int atomicNumber);

} // namespace descriptors
} // namespace ffpfact
