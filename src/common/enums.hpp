#pragma once

namespace palchron {

enum class Gender {
    Male,
    Female,
    Unknown
};

enum class EventType {
    CreatureCaught,
    CreatureReleased,
    CreatureLeveled,
    PlayerJoined,
    PlayerLeft,
    PlayerLeveled,
    BaseCreated,
    CreatureCountChange,
    Unknown
};

enum class EventCategory {
    Creature,
    Player,
    Base,
    World
};

enum class SaveType {
    Autosave,
    Manual,
    Unknown
};

enum class ActivityLabel {
    Idle,
    Catching,
    Combat,
    Building,
    Managing,
    Exploring,
    // Only produced when a persisted record carries an unrecognised label.
    Unknown
};

} // namespace palchron
