#pragma once

#include "common/enums.hpp"

namespace palchron {

// Save cadence windows in seconds. The game autosaves every ten minutes by
// default; the window allows two minutes either side.
constexpr double kAutosaveWindowMinSeconds = 540.0;
constexpr double kAutosaveWindowMaxSeconds = 720.0;
constexpr double kRapidSaveMaxSeconds = 120.0;

class SaveClassifier
{
public:
    // Total over all inputs; elapsed <= 0 (first save) is always Unknown.
    static SaveType classify(double elapsedSeconds);
};

} // namespace palchron
