#include "core/save_classifier.hpp"

namespace palchron {

SaveType SaveClassifier::classify(double elapsedSeconds)
{
    // First observed save, or an interval we could not measure.
    if (!(elapsedSeconds > 0.0)) {
        return SaveType::Unknown;
    }

    if (elapsedSeconds >= kAutosaveWindowMinSeconds
        && elapsedSeconds <= kAutosaveWindowMaxSeconds) {
        return SaveType::Autosave;
    }

    // Rapid consecutive save, usually triggered by hand after something notable.
    if (elapsedSeconds < kRapidSaveMaxSeconds) {
        return SaveType::Manual;
    }

    // Too long a gap for the autosave cadence.
    if (elapsedSeconds > kAutosaveWindowMaxSeconds) {
        return SaveType::Manual;
    }

    return SaveType::Unknown;
}

} // namespace palchron
