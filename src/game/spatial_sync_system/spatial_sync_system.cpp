/// @file spatial_sync_system.cpp
/// @brief SpatialSyncSystem implementation.

#include "arena/game/spatial_sync_system.hpp"

namespace arena::game {

SpatialSyncSystem::SpatialSyncSystem(Targeting& targeting) : targeting_(targeting) {}

void SpatialSyncSystem::Execute(float /*deltaTime*/) {
    lastRepairs_ = targeting_.Reconcile();
}

}  // namespace arena::game
