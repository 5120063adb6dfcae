/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/pathfinding/NavGrid.hpp"
#include "core/Logger.hpp"
#include "core/SimulationSettings.hpp"
#include "entities/AgentConfig.hpp"
#include "entities/PlayerRegistry.hpp"
#include "managers/AgentStateStore.hpp"
#include "managers/AuthorityService.hpp"
#include "managers/SimulationNode.hpp"
#include "net/MessageBus.hpp"
#include "world/FlatWorld.hpp"
#include "world/SpatialQueryAdapter.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <format>
#include <memory>
#include <numbers>
#include <random>
#include <string>
#include <vector>

using namespace SwarmForge;

// Demo name goes here.
const std::string DEMO_NAME{"SwarmForge Mass Spawn"};

namespace {

constexpr Uint64 FRAME_MS{16};
constexpr float FRAME_SECONDS{FRAME_MS / 1000.0f};

struct NodeSetup {
  NodeId id;
  Vector3D viewpoint;
};

const std::array<NodeSetup, 3> NODE_SETUP{{
    {1, Vector3D(0.0f, 0.0f, 0.0f)},
    {2, Vector3D(150.0f, 0.0f, 0.0f)},
    {3, Vector3D(0.0f, 0.0f, 150.0f)},
}};

void buildArena(FlatWorld& world) {
  // A few walls and crates so routes and jumps have something to do
  world.addBox(Vector3D(20.0f, 0.0f, -40.0f), Vector3D(24.0f, 8.0f, 40.0f), true, "wall");
  world.addBox(Vector3D(90.0f, 0.0f, 20.0f), Vector3D(130.0f, 8.0f, 24.0f), true, "wall");
  world.addBox(Vector3D(-30.0f, 0.0f, 80.0f), Vector3D(-20.0f, 2.0f, 90.0f), true, "crate");
  world.addBox(Vector3D(40.0f, 0.0f, 100.0f), Vector3D(60.0f, 1.5f, 110.0f), true, "crate");
  world.addBox(Vector3D(-10.0f, 0.0f, -10.0f), Vector3D(10.0f, 6.0f, 10.0f), false, "foliage");
}

std::string makeConfig(std::mt19937& rng) {
  AgentConfig config;
  std::uniform_int_distribution<int> modePick(0, 9);
  const int mode = modePick(rng);
  config.movementMode = mode < 5 ? MovementMode::Ranged : (mode < 8 ? MovementMode::Melee : MovementMode::Flee);
  config.faction = (mode % 2 == 0) ? "raiders" : "settlers";
  config.sightRange = config.movementMode == MovementMode::Flee ? 60.0f : 80.0f;
  config.sightMode = (mode == 3) ? SightMode::Omnidirectional : SightMode::Directional;
  config.canWalk = (mode != 9);
  return config.toJson();
}

} // namespace

// Usage: swarmforge_demo [agentCount] [seconds] [--realtime]
int main(int argc, char* argv[]) {
  DEMO_INFO(std::format("Initializing {}", DEMO_NAME));

  const int agentCount = argc > 1 ? std::max(1, std::atoi(argv[1])) : 150;
  const int durationSeconds = argc > 2 ? std::max(2, std::atoi(argv[2])) : 20;
  const bool realtime = argc > 3 && std::string(argv[3]) == "--realtime";

  if (!SDL_Init(0)) {
    DEMO_CRITICAL(std::format("SDL_Init failed: {}", SDL_GetError()));
    return -1;
  }

  SimulationSettings settings;
  if (!SettingsLoader::loadFromFile("res/simulation.json", settings)) {
    DEMO_WARN("Failed to load res/simulation.json - using defaults");
  }

  FlatWorld world;
  buildArena(world);
  SpatialQueryAdapter queries(world, settings.jump);

  NavGrid grid(200, 200, 2.0f, Vector3D(-200.0f, 0.0f, -200.0f));
  grid.rebuildFromWorld(queries, 0.5f, 3.0f);

  AgentStateStore store;
  PlayerRegistry players;
  MessageBus bus;

  if (!store.init()) {
    DEMO_CRITICAL("Failed to initialize AgentStateStore");
    SDL_Quit();
    return -1;
  }

  AuthorityService authority(settings, store, players, bus);
  if (!authority.init()) {
    DEMO_CRITICAL("Failed to initialize AuthorityService");
    store.clean();
    SDL_Quit();
    return -1;
  }

  std::vector<std::unique_ptr<SimulationNode>> nodes;
  for (const NodeSetup& setup : NODE_SETUP) {
    players.addPlayer(std::format("player{}", setup.id), setup.id, setup.viewpoint);
    auto node = std::make_unique<SimulationNode>(setup.id, settings, store, players, world, bus, &grid);
    if (!node->init()) {
      DEMO_CRITICAL(std::format("Failed to initialize node {}", setup.id));
      authority.clean();
      store.clean();
      SDL_Quit();
      return -1;
    }
    nodes.push_back(std::move(node));
  }

  // Mass spawn around the node viewpoints
  std::mt19937 rng(1234);
  std::uniform_real_distribution<float> angle(0.0f, 2.0f * std::numbers::pi_v<float>);
  std::uniform_real_distribution<float> radius(5.0f, 260.0f);
  for (int i = 0; i < agentCount; ++i) {
    const NodeSetup& anchor = NODE_SETUP[static_cast<size_t>(i) % NODE_SETUP.size()];
    const float a = angle(rng);
    const float r = radius(rng);
    AgentRecord record;
    record.id = std::format("npc_{:04}", i);
    record.configJson = makeConfig(rng);
    record.position = anchor.viewpoint + Vector3D(std::cos(a) * r, 3.0f, std::sin(a) * r);
    if (!store.createAgent(std::move(record))) {
      DEMO_WARN(std::format("Spawn {} rejected", i));
    }
  }
  DEMO_INFO(std::format("Spawned {} agents around {} nodes", store.getAgentCount(), nodes.size()));

  const Uint64 wallStart = SDL_GetTicks();
  const Uint64 totalFrames = static_cast<Uint64>(durationSeconds) * 1000 / FRAME_MS;
  const Uint64 disconnectFrame = totalFrames / 2;
  Uint64 nowMs = 0;

  for (Uint64 frame = 0; frame < totalFrames; ++frame) {
    nowMs += FRAME_MS;
    authority.update(FRAME_SECONDS, nowMs);

    for (auto& node : nodes) {
      if (!node->isInitialized()) {
        continue;
      }
      // Node 3 runs minimized: only its fixed-rate timer drives it
      if (node->getId() == 3) {
        node->onSecondaryTick(nowMs, FRAME_SECONDS);
      } else {
        node->onPrimaryFrame(nowMs, FRAME_SECONDS);
      }
    }
    bus.pump();

    if (frame == disconnectFrame) {
      DEMO_INFO(std::format("Node 2 drops out with {} agents", nodes[1]->getSimulatedCount()));
      bus.disconnect(2);
      players.removePlayersOfNode(2);
      nodes[1]->clean();
      bus.pump();
    }

    if (realtime) {
      SDL_Delay(static_cast<Uint32>(FRAME_MS));
    }
  }

  const Uint64 wallMs = SDL_GetTicks() - wallStart;
  DEMO_INFO(std::format("Simulated {} s in {} ms wall time", durationSeconds, wallMs));
  for (const auto& node : nodes) {
    const SimulationNode::NodeStats& stats = node->getStats();
    DEMO_INFO(std::format("Node {}: {} agents, {} claims ({} rejected, {} aborted), {} releases, {} lost, {} arrivals",
                          node->getId(), node->getSimulatedCount(), stats.claimsAccepted,
                          stats.claimsRejected, stats.claimsAborted, stats.releases, stats.ownershipLost,
                          stats.arrivals));
  }
  const OwnershipManager::OwnershipStats& ownership = authority.getOwnership().getStats();
  DEMO_INFO(std::format("Authority: {} owned, {} fallback-simulated, {} timeouts, {} disconnect orphans",
                        authority.getOwnership().getTotalOwned(),
                        authority.getFallback().getSimulatedCount(), ownership.timeouts,
                        ownership.disconnectOrphans));
  const MessageBus::BusStats& busStats = bus.getStats();
  DEMO_INFO(std::format("Bus: {} posted, {} delivered, {} dropped, {} calls, {} bytes",
                        busStats.posted, busStats.delivered, busStats.dropped, busStats.calls,
                        busStats.bytes));

  for (auto& node : nodes) {
    node->clean();
  }
  bus.pump();
  authority.clean();
  store.clean();
  SDL_Quit();
  DEMO_INFO(std::format("{} shutdown complete", DEMO_NAME));
  return 0;
}
