#ifndef COMPONENTS_BASIC_HPP
#define COMPONENTS_BASIC_HPP

#include <bitset>
#include <cstdint>
#include "balldrop/math/vector_math.hpp" // for Position, Vector

namespace Components {

    /// Gates a level may hold; a gate's instanceId indexes this bitset.
    constexpr std::size_t MaxGates = 64;
    using GateMask = std::bitset<MaxGates>;

    enum class BallTypeId : int {
        Standard = 0,
        BonusPoints = 1,
        MultiplierBoost = 2,
        Lucky = 3,
        Harmful = 4
    };

    constexpr int BallTypeCount = 5;

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    struct Mass {
        double value = 1.0;

        explicit Mass(double v = 1.0) : value(v) {}
    };

    struct Radius {
        double value = 0.17;

        explicit Radius(double v = 0.17) : value(v) {}
    };

    struct Material {
        double restitution = 0.3;
        double friction = 0.1; // air drag and wall sliding

        Material(double e = 0.3, double f = 0.1) : restitution(e), friction(f) {}
    };

    // Asleep bodies have zero velocity and skip every pass until woken
    struct Sleep {
        bool asleep = false;
        double threshold = 0.015;
    };

    struct BallType {
        BallTypeId type = BallTypeId::Standard;
        double pointsMultiplier = 1.0;
        double multiplierBoost = 0.0;
    };

    // Append-only for the body's lifetime
    struct GateTracker {
        GateMask hitGates;
    };

    struct Lifetime {
        double spawnTime = 0.0;
        double maxLifetime = 30.0;
    };

    enum class DestroyReason {
        Expired,
        BelowKillPlane,
        Scored,
        LevelUnloaded
    };

    // Staged destruction, applied once after all passes
    struct PendingDestroy {
        DestroyReason reason = DestroyReason::Expired;
    };

} // namespace Components

#endif
