/**
 * @file Fft.cpp
 * @brief Implementation of the radix-2 FFT.
 */

#include "bio/math/Fft.hpp"

#include <bit>
#include <cmath>
#include <numbers>
#include <string>

namespace bio::math {

using core::Error;
using core::ErrorCode;

core::usize Fft::nextPowerOfTwo(core::usize n) noexcept
{
    return n <= 1 ? 1 : std::bit_ceil(n);
}

core::ExpectedVoid Fft::checkSize(const std::vector<Complex> &buffer)
{
    if (buffer.empty()) {
        return std::unexpected(
            Error::make(ErrorCode::kEmptyInput, "Fft received empty buffer"));
    }
    if (!std::has_single_bit(buffer.size())) {
        return std::unexpected(
            Error::make(ErrorCode::kSizeMismatch,
                "Fft expects a power-of-two length, got " + std::to_string(buffer.size())));
    }
    return {};
}

void Fft::bitReversalPermutation(std::vector<Complex> &x)
{
    const core::usize N = x.size();
    core::usize j = 0;

    for (core::usize i = 1; i < N; ++i) {
        core::usize bit = N >> 1;
        for (; j & bit; bit >>= 1) {
            j ^= bit;
        }
        j ^= bit;
        if (i < j) {
            std::swap(x[i], x[j]);
        }
    }
}

void Fft::butterflyPass(std::vector<Complex> &x, core::f64 direction)
{
    const core::usize N = x.size();

    for (core::usize len = 2; len <= N; len <<= 1) {
        const core::f64 angle = direction * 2.0 * std::numbers::pi / static_cast<core::f64>(len);
        const Complex wlen(std::cos(angle), std::sin(angle));
        const core::usize halfLen = len / 2;

        for (core::usize i = 0; i < N; i += len) {
            Complex w(1.0, 0.0);
            for (core::usize k = 0; k < halfLen; ++k) {
                const Complex u = x[i + k];
                const Complex v = x[i + k + halfLen] * w;
                x[i + k] = u + v;
                x[i + k + halfLen] = u - v;
                w *= wlen;
            }
        }
    }
}

core::ExpectedVoid Fft::forward(std::vector<Complex> &buffer)
{
    BIO_TRY_VOID(checkSize(buffer));
    bitReversalPermutation(buffer);
    butterflyPass(buffer, -1.0);
    return {};
}

core::ExpectedVoid Fft::inverse(std::vector<Complex> &buffer)
{
    BIO_TRY_VOID(checkSize(buffer));
    bitReversalPermutation(buffer);
    butterflyPass(buffer, 1.0);

    const core::f64 scale = 1.0 / static_cast<core::f64>(buffer.size());
    for (auto &c : buffer)
        c *= scale;
    return {};
}

} // namespace bio::math
