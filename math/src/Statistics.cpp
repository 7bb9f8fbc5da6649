/**
 * @file Statistics.cpp
 * @brief Implementation of the Statistics utilities.
 */

#include "bio/math/Statistics.hpp"
#include "bio/math/Fft.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

namespace bio::math {

using core::Error;
using core::ErrorCode;
using core::f64;
using core::usize;

Baseline Statistics::computeBaseline(std::span<const f64> data) noexcept
{
    if (data.empty())
        return {};

    const auto n = static_cast<f64>(data.size());
    const f64 mean = std::accumulate(data.begin(), data.end(), 0.0) / n;

    f64 variance = 0.0;
    for (const f64 v : data) {
        const f64 d = v - mean;
        variance += d * d;
    }
    return {mean, std::sqrt(variance / n)};
}

f64 Statistics::rms(std::span<const f64> data) noexcept
{
    if (data.empty())
        return 0.0;

    f64 sumSq = 0.0;
    for (const f64 v : data)
        sumSq += v * v;
    return std::sqrt(sumSq / static_cast<f64>(data.size()));
}

f64 Statistics::peakAbs(std::span<const f64> data) noexcept
{
    f64 peak = 0.0;
    for (const f64 v : data)
        peak = std::max(peak, std::abs(v));
    return peak;
}

core::Expected<Spectrum> Statistics::periodogram(std::span<const f64> data, f64 sampleRate)
{
    if (data.size() < 2) {
        return std::unexpected(
            Error::make(ErrorCode::kEmptyInput, "periodogram needs at least two samples"));
    }
    if (!(sampleRate > 0.0)) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidParameter, "periodogram sample rate must be positive"));
    }

    const usize nfft = Fft::nextPowerOfTwo(data.size());
    std::vector<Fft::Complex> buffer(nfft);
    for (usize i = 0; i < data.size(); ++i)
        buffer[i] = Fft::Complex(data[i], 0.0);

    BIO_TRY_VOID(Fft::forward(buffer));

    Spectrum spectrum;
    const usize half = nfft / 2;
    spectrum.frequencies.reserve(half);
    spectrum.power.reserve(half);

    const f64 norm = 1.0 / (sampleRate * static_cast<f64>(nfft));
    for (usize k = 1; k <= half; ++k) {
        spectrum.frequencies.push_back(static_cast<f64>(k) * sampleRate / static_cast<f64>(nfft));
        spectrum.power.push_back(std::norm(buffer[k]) * norm);
    }
    return spectrum;
}

core::Expected<f64> Statistics::spectralSlope(const Spectrum &spectrum, f64 minHz, f64 maxHz)
{
    std::vector<f64> logF;
    std::vector<f64> logP;
    for (usize k = 0; k < spectrum.frequencies.size() && k < spectrum.power.size(); ++k) {
        const f64 f = spectrum.frequencies[k];
        const f64 p = spectrum.power[k];
        if (f >= minHz && f <= maxHz && f > 0.0 && p > 0.0) {
            logF.push_back(std::log10(f));
            logP.push_back(std::log10(p));
        }
    }

    if (logF.size() < 2) {
        return std::unexpected(
            Error::make(ErrorCode::kEmptyInput,
                "spectral slope needs two bins in range, got " + std::to_string(logF.size())));
    }

    const auto rows = static_cast<Eigen::Index>(logF.size());
    Eigen::MatrixX2d design(rows, 2);
    design.col(0) = Eigen::Map<const Eigen::VectorXd>(logF.data(), rows);
    design.col(1).setOnes();
    const Eigen::Map<const Eigen::VectorXd> target(logP.data(), rows);

    const Eigen::Vector2d coeffs = design.colPivHouseholderQr().solve(target);
    return coeffs(0);
}

core::Expected<std::vector<f64>> Statistics::resampleLinear(std::span<const f64> points, usize count)
{
    if (points.size() < 2) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidParameter,
                "resampling needs at least two points, got " + std::to_string(points.size())));
    }

    std::vector<f64> out(count);
    if (count == 0)
        return out;
    if (count == 1) {
        out[0] = points.front();
        return out;
    }

    const auto lastPoint = static_cast<f64>(points.size() - 1);
    const Eigen::ArrayXd position =
        Eigen::ArrayXd::LinSpaced(static_cast<Eigen::Index>(count), 0.0, lastPoint);

    for (usize i = 0; i < count; ++i) {
        const f64 x = position(static_cast<Eigen::Index>(i));
        const auto left = std::min(static_cast<usize>(x), points.size() - 2);
        const f64 frac = x - static_cast<f64>(left);
        out[i] = points[left] + frac * (points[left + 1] - points[left]);
    }
    return out;
}

std::vector<usize> Statistics::findPeaks(std::span<const f64> data, f64 minHeight, usize minDistance)
{
    std::vector<usize> candidates;
    for (usize i = 1; i + 1 < data.size(); ++i) {
        if (data[i] >= minHeight && data[i] > data[i - 1] && data[i] >= data[i + 1])
            candidates.push_back(i);
    }

    std::vector<usize> byHeight = candidates;
    std::stable_sort(byHeight.begin(), byHeight.end(),
        [&](usize a, usize b) { return data[a] > data[b]; });

    std::vector<usize> kept;
    for (const usize idx : byHeight) {
        const bool isolated = std::none_of(kept.begin(), kept.end(), [&](usize k) {
            const usize dist = idx > k ? idx - k : k - idx;
            return dist < minDistance;
        });
        if (isolated)
            kept.push_back(idx);
    }

    std::sort(kept.begin(), kept.end());
    return kept;
}

} // namespace bio::math
