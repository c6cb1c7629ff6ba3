#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "buildings.h"
#include "economy_error_handler.h"
#include "map.h"
#include "population.h"
#include "resource.h"
#include "simulation_context.h"
#include "supply_demand.h"
#include "village.h"
#include "village_economy.h"

struct HealthCounters {
    std::uint64_t ticks = 0;
    std::uint64_t slowTicks = 0;
    double worstTickMs = 0.0;
    double lastTickMs = 0.0;
    long long errorTotal = 0;
    int villagesReset = 0;
};

// Owns the terrain, the villages and every per-tick component.
// Each tick runs tile recovery, then collect -> economy -> population -> buildings per village, in village order.
class VillageSimulation {
public:
    // Generates terrain and villages from the context seed and config.
    explicit VillageSimulation(SimulationContext& ctx);
    VillageSimulation(SimulationContext& ctx, Map map, std::vector<Village> villages);

    VillageSimulation(const VillageSimulation&) = delete;
    VillageSimulation& operator=(const VillageSimulation&) = delete;

    void step();
    void runTicks(int ticks);

    bool divineIntervention(const sf::Vector2i& cell, Resource::Type type, double amount);

    std::uint64_t computeStateHash() const;
    // Empty when every tile and village invariant holds, otherwise the first breach.
    std::string validateInvariants() const;

    void setDebugEnabled(bool enabled);

    const Map& getMap() const { return m_map; }
    const std::vector<Village>& getVillages() const { return m_villages; }
    std::vector<Village>& getVillagesMutable() { return m_villages; }
    const GameTime& getTime() const { return m_time; }
    HealthCounters getHealth() const;

    EconomyErrorHandler& getErrorHandler() { return m_errorHandler; }
    const EconomyErrorHandler& getErrorHandler() const { return m_errorHandler; }
    const SupplyDemandBalancer& getBalancer() const { return m_balancer; }
    const PopulationManager& getPopulationManager() const { return m_population; }
    const BuildingManager& getBuildingManager() const { return m_buildings; }

private:
    SimulationContext& m_ctx;
    Map m_map;
    std::vector<Village> m_villages;
    GameTime m_time;
    HealthCounters m_health;
    bool m_debug = false;

    EconomyErrorHandler m_errorHandler;
    SupplyDemandBalancer m_balancer;
    ResourceManager m_resources;
    VillageEconomyManager m_economy;
    SeededRandom m_random;
    PopulationManager m_population;
    BuildingManager m_buildings;

    void traceStage(const char* stage) const;
};
