#pragma once

namespace ionkin {

// Physical constants used by the electrodiffusion coupling.
constexpr double kGasConstant  = 8.314;    // J/(mol K)
constexpr double kFaraday      = 96485.0;  // C/mol
constexpr double kTemperature  = 293.15;   // K (20 C)
constexpr int    kValenceK     = 1;        // K+

// Substituted when a protocol leaves a compartment volume unset.
constexpr double kDefaultVolumeInternal_L = 1e-12;  // ~1 pL cell
constexpr double kDefaultVolumeExternal_L = 1e-6;   // ~1 uL bath

// RT/(zF) in mV.
inline double thermal_voltage_mV(double T = kTemperature, int z = kValenceK) {
  return (kGasConstant * T) / (static_cast<double>(z) * kFaraday) * 1000.0;
}

} // namespace ionkin
