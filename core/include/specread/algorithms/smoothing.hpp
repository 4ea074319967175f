#pragma once

#include "../errors.hpp"
#include <vector>

namespace specread {
namespace algorithms {

/**
 * @brief Options for smoothing
 */
struct SmoothingOptions {
    /// Window size (number of points, must be odd)
    int window_size = 31;

    /// Polynomial order for Savitzky-Golay (must be < window_size)
    int sg_order = 3;
};

/**
 * @brief Savitzky-Golay smoothing of evenly indexed series.
 *
 * Interior points are the value at the window centre of a least-squares
 * polynomial fit, computed as a convolution with fixed coefficients. The
 * first and last window_size/2 points are evaluated from a single fit over
 * the first and last full window respectively, so the output has the same
 * length as the input and no padding is invented.
 */
class Smoother {
public:
    Smoother() = default;
    explicit Smoother(const SmoothingOptions& options)
        : options_(options) {}

    /**
     * @brief Smooth intensity values.
     *
     * NaN inputs propagate to every output whose window contains them.
     *
     * @param intensity Input intensities
     * @return Smoothed intensities, same length as the input
     * @throws SeriesTooShortError if the input is shorter than the window
     * @throws std::invalid_argument if the options are invalid
     */
    std::vector<double> smooth(const std::vector<double>& intensity) const;

    /**
     * @brief Get/set options
     */
    const SmoothingOptions& options() const { return options_; }
    void setOptions(const SmoothingOptions& opt) { options_ = opt; }

    /**
     * @brief Generate Savitzky-Golay smoothing coefficients.
     *
     * @param window_size Window size (must be odd)
     * @param order Polynomial order
     * @return Filter coefficients, window_size values, symmetric
     * @throws std::invalid_argument if window_size is even or not positive,
     *         or order is negative or not below window_size
     */
    static std::vector<double> computeSGCoefficients(int window_size, int order);

private:
    SmoothingOptions options_;
};

/**
 * @brief Apply Savitzky-Golay smoothing to a vector.
 */
inline std::vector<double> savitzkyGolaySmooth(const std::vector<double>& data,
                                               int window_size = 31,
                                               int order = 3) {
    SmoothingOptions opts;
    opts.window_size = window_size;
    opts.sg_order = order;
    Smoother smoother(opts);
    return smoother.smooth(data);
}

} // namespace algorithms
} // namespace specread
