#include "balldrop/core/body.hpp"

#include <utility>
#include <vector>

#include "balldrop/core/constants.hpp"

bool isKnownBallType(Components::BallTypeId type) {
  int const id = static_cast<int>(type);
  return id >= 0 && id < Components::BallTypeCount;
}

BallTypeTraits ballTypeTraits(Components::BallTypeId type) {
  switch (type) {
    case Components::BallTypeId::BonusPoints:     return {2.0, 0.0};
    case Components::BallTypeId::MultiplierBoost: return {1.0, 1.0};
    case Components::BallTypeId::Lucky:           return {5.0, 0.0};
    case Components::BallTypeId::Harmful:         return {-1.0, 0.0};
    case Components::BallTypeId::Standard:
    default:                                      return {1.0, 0.0};
  }
}

Body makeDefaultBody(const Position& position, Components::BallTypeId type, double now) {
  Body body;
  body.position = position;
  body.radius = SimulatorConstants::DefaultBallRadius;
  body.mass = SimulatorConstants::DefaultBallMass;
  body.restitution = SimulatorConstants::DefaultBallRestitution;
  body.friction = SimulatorConstants::DefaultBallFriction;
  body.sleepThreshold = SimulatorConstants::DefaultSleepThreshold;
  body.typeId = type;

  BallTypeTraits const traits = ballTypeTraits(type);
  body.pointsMultiplier = traits.pointsMultiplier;
  body.multiplierBoost = traits.multiplierBoost;

  body.spawnTime = now;
  body.maxLifetime = SimulatorConstants::DefaultMaxLifetime;
  return body;
}

BodyHandle emplaceBody(entt::registry& registry, const Body& body) {
  auto entity = registry.create();
  registry.emplace<Components::Position>(entity, body.position);
  registry.emplace<Components::Velocity>(entity, body.velocity);
  registry.emplace<Components::Radius>(entity, body.radius);
  registry.emplace<Components::Mass>(entity, body.mass);
  registry.emplace<Components::Material>(entity, body.restitution, body.friction);

  auto& sleep = registry.emplace<Components::Sleep>(entity);
  sleep.asleep = body.asleep;
  sleep.threshold = body.sleepThreshold;

  auto& ballType = registry.emplace<Components::BallType>(entity);
  ballType.type = body.typeId;
  ballType.pointsMultiplier = body.pointsMultiplier;
  ballType.multiplierBoost = body.multiplierBoost;

  auto& tracker = registry.emplace<Components::GateTracker>(entity);
  tracker.hitGates = body.hitGatesMask;

  auto& lifetime = registry.emplace<Components::Lifetime>(entity);
  lifetime.spawnTime = body.spawnTime;
  lifetime.maxLifetime = body.maxLifetime;

  return entity;
}

std::optional<Body> readBody(const entt::registry& registry, BodyHandle handle) {
  if (!registry.valid(handle) || !registry.all_of<Components::BallType>(handle)) {
    return std::nullopt;
  }

  Body body;
  body.position = registry.get<Components::Position>(handle);
  body.velocity = registry.get<Components::Velocity>(handle);
  body.radius = registry.get<Components::Radius>(handle).value;
  body.mass = registry.get<Components::Mass>(handle).value;

  const auto& material = registry.get<Components::Material>(handle);
  body.restitution = material.restitution;
  body.friction = material.friction;

  const auto& sleep = registry.get<Components::Sleep>(handle);
  body.asleep = sleep.asleep;
  body.sleepThreshold = sleep.threshold;

  const auto& ballType = registry.get<Components::BallType>(handle);
  body.typeId = ballType.type;
  body.pointsMultiplier = ballType.pointsMultiplier;
  body.multiplierBoost = ballType.multiplierBoost;

  body.hitGatesMask = registry.get<Components::GateTracker>(handle).hitGates;

  const auto& lifetime = registry.get<Components::Lifetime>(handle);
  body.spawnTime = lifetime.spawnTime;
  body.maxLifetime = lifetime.maxLifetime;
  return body;
}

std::size_t countBodies(const entt::registry& registry) {
  return registry.view<Components::BallType>().size();
}

Components::SimulatorState* findSimulatorState(entt::registry& registry) {
  auto view = registry.view<Components::SimulatorState>();
  if (view.empty()) {
    return nullptr;
  }
  return &view.get<Components::SimulatorState>(view.front());
}

const Components::SimulatorState* findSimulatorState(const entt::registry& registry) {
  auto view = registry.view<const Components::SimulatorState>();
  if (view.empty()) {
    return nullptr;
  }
  return &view.get<const Components::SimulatorState>(view.front());
}

std::size_t destroyPendingBodies(entt::registry& registry, entt::dispatcher& dispatcher) {
  auto view = registry.view<Components::PendingDestroy>();
  std::vector<std::pair<entt::entity, Components::DestroyReason>> staged;
  staged.reserve(view.size());
  for (auto entity : view) {
    staged.emplace_back(entity, view.get<Components::PendingDestroy>(entity).reason);
  }

  auto* state = findSimulatorState(registry);
  for (const auto& [entity, reason] : staged) {
    if (state != nullptr) {
      switch (reason) {
        case Components::DestroyReason::Expired:        ++state->stats.destroyedExpired; break;
        case Components::DestroyReason::BelowKillPlane: ++state->stats.destroyedKillPlane; break;
        default: break;
      }
    }
    dispatcher.enqueue<BodyDestroyedEvent>(BodyDestroyedEvent{entity, reason});
    registry.destroy(entity);
  }
  return staged.size();
}
