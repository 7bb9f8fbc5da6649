/**
 * @file Fft.hpp
 * @brief Cooley-Tukey radix-2 FFT over double-precision complex buffers.
 *
 * In-place forward and inverse transforms used by the coloured-noise
 * generators and by spectral analysis. Buffer length must be a power
 * of two; callers zero-pad with nextPowerOfTwo().
 *
 * @see Statistics::periodogram
 */

#pragma once

#include "bio/core/Expected.hpp"

#include <complex>
#include <vector>

namespace bio::math {

/**
 * @brief Stateless radix-2 decimation-in-time FFT.
 *
 * @code
 *   std::vector<Fft::Complex> buf(1024);
 *   auto ok = Fft::forward(buf);
 * @endcode
 */
class Fft {
public:
    using Complex = std::complex<core::f64>;

    Fft() = delete;

    /**
     * @brief Forward transform, unnormalized.
     * @return kEmptyInput for an empty buffer, kSizeMismatch if the size is not a power of two
     */
    [[nodiscard]] static core::ExpectedVoid forward(std::vector<Complex> &buffer);

    /**
     * @brief Inverse transform, scaled by 1/N.
     */
    [[nodiscard]] static core::ExpectedVoid inverse(std::vector<Complex> &buffer);

    /**
     * @brief Smallest power of two that is >= @p n (1 for n == 0).
     */
    [[nodiscard]] static core::usize nextPowerOfTwo(core::usize n) noexcept;

private:
    [[nodiscard]] static core::ExpectedVoid checkSize(const std::vector<Complex> &buffer);
    static void bitReversalPermutation(std::vector<Complex> &x);
    static void butterflyPass(std::vector<Complex> &x, core::f64 direction);
};

} // namespace bio::math
