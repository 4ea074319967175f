#include "specread/spectrum_collection.hpp"
#include <algorithm>

namespace specread {

const Spectrum* SpectrumCollection::find(const std::string& name) const {
    for (const auto& s : spectra_) {
        if (s.displayName() == name) {
            return &s;
        }
    }
    return nullptr;
}

const Spectrum& SpectrumCollection::add(Spectrum spectrum) {
    std::string name = spectrum.displayName();
    if (contains(name)) {
        throw DuplicateNameError(name);
    }
    spectra_.push_back(std::move(spectrum));
    return spectra_.back();
}

bool SpectrumCollection::remove(const std::string& name) {
    auto it = std::find_if(spectra_.begin(), spectra_.end(),
        [&name](const Spectrum& s) { return s.displayName() == name; });
    if (it == spectra_.end()) {
        return false;
    }
    spectra_.erase(it);
    return true;
}

std::vector<std::string> SpectrumCollection::names() const {
    std::vector<std::string> result;
    result.reserve(spectra_.size());
    for (const auto& s : spectra_) {
        result.push_back(s.displayName());
    }
    return result;
}

} // namespace specread
