/**
 * @file Constants.hpp
 * @brief Library-wide defaults and physiological constants.
 *
 * @version 0.1.0
 */
#pragma once

#ifndef BIO_CORE_CONSTANTS_HPP
    #define BIO_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace bio::core {

// ─── Simulator defaults ──────────────────────────────────────────────────────

inline constexpr f64   kDefaultSamplingRate     = 1000.0;
inline constexpr f64   kDefaultDuration         = 10.0;

// ─── EMG ─────────────────────────────────────────────────────────────────────

inline constexpr f64   kMuapHalfWidthSec        = 0.002;
inline constexpr f64   kMuapShapeConstant       = 2000.0;
inline constexpr f64   kMuBaseFiringRate        = 50.0;
inline constexpr f64   kMuFiringRateGain        = 450.0;
inline constexpr f64   kMuapBaseAmplitude       = 0.7;
inline constexpr f64   kMuapAmplitudeGain       = 0.3;
inline constexpr f64   kDefaultFatigueRate      = 2.0;

// ─── ECG ─────────────────────────────────────────────────────────────────────

inline constexpr f64   kDefaultHeartRate        = 75.0;
inline constexpr f64   kMaxHeartRate            = 300.0;
inline constexpr f64   kPrInterval              = 0.16;
inline constexpr f64   kQtOffset                = 0.2;
inline constexpr f64   kStSegmentDuration       = 0.1;
inline constexpr f64   kBradycardiaRate         = 45.0;
inline constexpr f64   kTachycardiaRate         = 120.0;
inline constexpr f64   kPvcQrsGain              = 2.5;
inline constexpr f64   kDefaultEscapeRate       = 40.0;

// ─── EOG ─────────────────────────────────────────────────────────────────────

inline constexpr f64   kSaccadeBaseDuration     = 0.02;
inline constexpr f64   kSaccadeDurationSlope    = 0.002;
inline constexpr f64   kSaccadeBaseVelocity     = 200.0;
inline constexpr f64   kSaccadeVelocitySlope    = 20.0;
inline constexpr f64   kSaccadeGapSec           = 0.05;
inline constexpr f64   kMicrosaccadeDuration    = 0.02;
inline constexpr f64   kTremorFrequency         = 80.0;

// ─── Noise ───────────────────────────────────────────────────────────────────

inline constexpr f64   kDefaultPowerlineFreq    = 50.0;

} // namespace bio::core

#endif // BIO_CORE_CONSTANTS_HPP
