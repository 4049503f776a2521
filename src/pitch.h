#pragma once
#include <QString>
#include <cmath>

namespace Pitch {

// Reference tunings in Hz
constexpr int kSourceFrequency = 440;
constexpr int kTargetFrequency = 432;

// Converted/original duration must stay strictly inside 1.0 +/- this value
constexpr double kDurationTolerance = 0.02;

// Retuning factor expressed as target/source so it stays exact until it is rendered.
struct Ratio {
    int target = kTargetFrequency;
    int source = kSourceFrequency;

    bool isValid() const { return target > 0 && source > 0; }

    // Multiplier applied to every frequency (432/440 = 0.981818...)
    double value() const { return isValid() ? double(target) / double(source) : 0.0; }

    // Speed-up that restores the original duration after an asetrate shift (440/432 = 1.018518...)
    double tempoCompensation() const { return isValid() ? double(source) / double(target) : 0.0; }
};

inline Ratio standard() { return Ratio{}; }

// Fixed 6-decimal rendering used in filter graphs and reports
inline QString format(double v) { return QString::number(v, 'f', 6); }

inline double shifted(double hz, const Ratio& r = Ratio{}) { return hz * r.value(); }

inline bool durationWithinTolerance(double ratio)
{
    return std::abs(ratio - 1.0) < kDurationTolerance;
}

} // namespace Pitch
