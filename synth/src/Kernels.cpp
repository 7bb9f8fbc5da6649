/**
 * @file Kernels.cpp
 * @brief Analytic pulse shapes.
 */

#include "bio/synth/Kernels.hpp"
#include "bio/core/Constants.hpp"

#include <Eigen/Core>

#include <cmath>
#include <sstream>

namespace bio::synth {

using core::Error;
using core::ErrorCode;
using core::f64;
using core::usize;

namespace {

Signal toSignal(const Eigen::ArrayXd &values)
{
    return Signal(values.data(), values.data() + values.size());
}

/** @brief n times spread evenly over [-halfWidth, halfWidth] seconds; a single sample sits at -halfWidth. */
Eigen::ArrayXd centredTime(usize n, f64 halfWidth)
{
    if (n == 1)
        return Eigen::ArrayXd::Constant(1, -halfWidth);
    return Eigen::ArrayXd::LinSpaced(static_cast<Eigen::Index>(n), -halfWidth, halfWidth);
}

} // namespace

core::Expected<usize> Kernels::sampleCount(const char *kernel, f64 duration, f64 samplingRate)
{
    if (!(samplingRate > 0.0) || !(duration > 0.0) || !std::isfinite(duration)) {
        std::ostringstream os;
        os << kernel << " kernel needs positive duration and sampling rate, got "
           << duration << " s at " << samplingRate << " Hz";
        return std::unexpected(Error::make(ErrorCode::kInvalidParameter, os.str()));
    }

    const auto n = static_cast<usize>(std::llround(duration * samplingRate));
    if (n == 0) {
        std::ostringstream os;
        os << kernel << " kernel of " << duration << " s is shorter than one sample at "
           << samplingRate << " Hz";
        return std::unexpected(Error::make(ErrorCode::kInvalidParameter, os.str()));
    }
    return n;
}

core::Expected<WaveformKernel> Kernels::muap(f64 samplingRate)
{
    const usize n = BIO_TRY(sampleCount("muap", 2.0 * core::kMuapHalfWidthSec, samplingRate));

    const Eigen::ArrayXd t = centredTime(n, core::kMuapHalfWidthSec);

    Eigen::ArrayXd shape = -t * (-core::kMuapShapeConstant * t.square()).exp();
    const f64 peak = shape.abs().maxCoeff();
    if (peak > 0.0)
        shape /= peak;

    return WaveformKernel{toSignal(shape), -core::kMuapHalfWidthSec};
}

core::Expected<WaveformKernel> Kernels::gaussianBump(f64 amplitude, f64 duration, f64 samplingRate)
{
    const usize n = BIO_TRY(sampleCount("gaussian bump", duration, samplingRate));
    const Eigen::ArrayXd t = centredTime(n, duration / 2.0);

    const Eigen::ArrayXd shape = amplitude * (-100.0 * t.square()).exp();
    return WaveformKernel{toSignal(shape), -duration / 2.0};
}

core::Expected<WaveformKernel> Kernels::qrsComplex(f64 q, f64 r, f64 s, f64 duration, f64 samplingRate)
{
    const usize n = BIO_TRY(sampleCount("qrs", duration, samplingRate));
    const Eigen::ArrayXd t = centredTime(n, duration / 2.0);
    const f64 lobe = duration / 4.0;

    const Eigen::ArrayXd shape =
        q * (-50.0 * (t + lobe).square()).exp() +
        r * (-50.0 * t.square()).exp() +
        s * (-50.0 * (t - lobe).square()).exp();
    return WaveformKernel{toSignal(shape), 0.0};
}

core::Expected<WaveformKernel> Kernels::saccadeVelocity(f64 duration, f64 peakVelocity, f64 samplingRate)
{
    const usize n = BIO_TRY(sampleCount("saccade", duration, samplingRate));

    const Eigen::ArrayXd t = Eigen::ArrayXd::LinSpaced(
        static_cast<Eigen::Index>(n), 0.0, static_cast<f64>(n - 1)) / samplingRate;
    const f64 width = 0.2 * duration;

    const Eigen::ArrayXd velocity =
        peakVelocity * (-((t - duration / 3.0) / width).square()).exp();
    return WaveformKernel{toSignal(velocity), 0.0};
}

core::Expected<WaveformKernel> Kernels::saccadePosition(
    f64 amplitude, f64 duration, f64 peakVelocity, f64 samplingRate)
{
    WaveformKernel kernel = BIO_TRY(saccadeVelocity(duration, peakVelocity, samplingRate));

    f64 running = 0.0;
    for (auto &v : kernel.samples) {
        running += v / samplingRate;
        v = running;
    }

    const f64 last = kernel.samples.back();
    const f64 gain = last > 0.0 ? amplitude / last : 0.0;
    for (auto &v : kernel.samples)
        v *= gain;
    return kernel;
}

core::Expected<WaveformKernel> Kernels::blink(f64 amplitude, f64 duration, f64 samplingRate)
{
    const usize n = BIO_TRY(sampleCount("blink", duration, samplingRate));

    const Eigen::ArrayXd t = Eigen::ArrayXd::LinSpaced(
        static_cast<Eigen::Index>(n), 0.0, static_cast<f64>(n - 1)) / samplingRate - duration / 3.0;
    const Eigen::ArrayXd closing = (-(t / (duration / 6.0)).square()).exp();
    const Eigen::ArrayXd opening = (-(t / (duration / 3.0)).square()).exp();

    const Eigen::ArrayXd shape = amplitude * (t < 0.0).select(closing, opening);
    return WaveformKernel{toSignal(shape), 0.0};
}

} // namespace bio::synth
