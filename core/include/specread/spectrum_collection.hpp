#pragma once

#include "spectrum.hpp"
#include "errors.hpp"
#include <string>
#include <vector>

namespace specread {

/**
 * @brief Loaded spectra keyed by display name.
 *
 * Spectra keep the order in which they were added (plot and legend order).
 * At most one spectrum per display name is held.
 */
class SpectrumCollection {
public:
    using const_iterator = std::vector<Spectrum>::const_iterator;

    SpectrumCollection() = default;

    /// Get number of spectra
    [[nodiscard]] std::size_t size() const noexcept { return spectra_.size(); }

    /// Check if collection is empty
    [[nodiscard]] bool empty() const noexcept { return spectra_.empty(); }

    /// Iterate in insertion order
    const_iterator begin() const noexcept { return spectra_.begin(); }
    const_iterator end() const noexcept { return spectra_.end(); }

    /// Access spectrum by position
    [[nodiscard]] const Spectrum& operator[](std::size_t i) const { return spectra_[i]; }

    /// Get all spectra
    [[nodiscard]] const std::vector<Spectrum>& spectra() const noexcept {
        return spectra_;
    }

    /// Check whether a display name is taken
    [[nodiscard]] bool contains(const std::string& name) const {
        return find(name) != nullptr;
    }

    /// Find spectrum by display name (nullptr if absent)
    [[nodiscard]] const Spectrum* find(const std::string& name) const;

    /**
     * @brief Add a spectrum under its display name.
     *
     * @return The stored spectrum
     * @throws DuplicateNameError if the name is already taken; the
     *         collection is left unchanged
     */
    const Spectrum& add(Spectrum spectrum);

    /**
     * @brief Remove the spectrum with the given display name.
     *
     * @return true if a spectrum was removed
     */
    bool remove(const std::string& name);

    /// Remove all spectra
    void clear() noexcept { spectra_.clear(); }

    /// Display names in insertion order
    [[nodiscard]] std::vector<std::string> names() const;

private:
    std::vector<Spectrum> spectra_;
};

} // namespace specread
