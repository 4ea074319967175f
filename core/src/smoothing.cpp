#include "specread/algorithms/smoothing.hpp"
#include <Eigen/Dense>
#include <stdexcept>
#include <string>

namespace specread {
namespace algorithms {

namespace {

void validate(int window_size, int order) {
    if (window_size <= 0 || window_size % 2 == 0) {
        throw std::invalid_argument("Savitzky-Golay window size must be odd and positive, got " +
                                    std::to_string(window_size));
    }
    if (order < 0 || order >= window_size) {
        throw std::invalid_argument("Savitzky-Golay order must be in [0, window size), got " +
                                    std::to_string(order));
    }
}

/// Vandermonde matrix on positions -half..half
Eigen::MatrixXd designMatrix(int window_size, int order) {
    const int half = window_size / 2;
    Eigen::MatrixXd a(window_size, order + 1);
    for (int i = 0; i < window_size; ++i) {
        const double t = static_cast<double>(i - half);
        double p = 1.0;
        for (int j = 0; j <= order; ++j) {
            a(i, j) = p;
            p *= t;
        }
    }
    return a;
}

double evaluatePolynomial(const Eigen::VectorXd& beta, double t) {
    double value = 0.0;
    for (Eigen::Index j = beta.size() - 1; j >= 0; --j) {
        value = value * t + beta(j);
    }
    return value;
}

} // namespace

std::vector<double> Smoother::computeSGCoefficients(int window_size, int order) {
    validate(window_size, order);

    // The smoothed centre value is e0 . (A^T A)^-1 A^T y, so the
    // convolution coefficients are A (A^T A)^-1 e0.
    const Eigen::MatrixXd a = designMatrix(window_size, order);
    Eigen::VectorXd e0 = Eigen::VectorXd::Zero(order + 1);
    e0(0) = 1.0;
    const Eigen::VectorXd h = (a.transpose() * a).ldlt().solve(e0);
    const Eigen::VectorXd c = a * h;

    return std::vector<double>(c.data(), c.data() + c.size());
}

std::vector<double> Smoother::smooth(const std::vector<double>& data) const {
    const int window = options_.window_size;
    const int order = options_.sg_order;
    validate(window, order);

    const std::size_t n = data.size();
    if (n < static_cast<std::size_t>(window)) {
        throw SeriesTooShortError(n, window);
    }

    const std::size_t half = static_cast<std::size_t>(window / 2);
    const std::vector<double> coeffs = computeSGCoefficients(window, order);
    std::vector<double> result(n, 0.0);

    // Interior: convolution
    for (std::size_t i = half; i + half < n; ++i) {
        double sum = 0.0;
        for (std::size_t k = 0; k < coeffs.size(); ++k) {
            sum += coeffs[k] * data[i - half + k];
        }
        result[i] = sum;
    }

    // Edges: evaluate the fit over the first/last full window
    const Eigen::MatrixXd a = designMatrix(window, order);
    const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(a);

    auto fitWindow = [&](std::size_t start) {
        Eigen::VectorXd y(window);
        for (int i = 0; i < window; ++i) {
            y(i) = data[start + static_cast<std::size_t>(i)];
        }
        return Eigen::VectorXd(qr.solve(y));
    };

    const Eigen::VectorXd left = fitWindow(0);
    for (std::size_t i = 0; i < half; ++i) {
        result[i] = evaluatePolynomial(left, static_cast<double>(i) - static_cast<double>(half));
    }

    const std::size_t start = n - static_cast<std::size_t>(window);
    const Eigen::VectorXd right = fitWindow(start);
    for (std::size_t i = n - half; i < n; ++i) {
        result[i] = evaluatePolynomial(
            right, static_cast<double>(i - start) - static_cast<double>(half));
    }

    return result;
}

} // namespace algorithms
} // namespace specread
