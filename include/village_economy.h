// village_economy.h
#pragma once

#include <array>
#include <vector>

#include "economy_error_handler.h"
#include "resource.h"
#include "simulation_context.h"
#include "supply_demand.h"
#include "village.h"

class Map;

// Saturating multiplier around a pivot population, never below 0.1.
double populationEfficiencyBonus(double population, const SimulationConfig::Production& production);
double buildingEfficiencyBonus(int buildingCount, const SimulationConfig::Production& production);
// Per-capita food demand that weakly decreases as the settlement grows.
double computeFoodConsumption(double population, const SimulationConfig& config);
// Removes min(consumption * deltaTime, food) from storage and mirrors it into stock. Returns the amount drawn.
double consumeFood(Village& village, double deltaTime, const SimulationConfig& config);
// 1.0 above 80% fill of the tiles in reach, 0.1 at or below 30%, linear between.
double resourceEfficiency(const ResourceAmounts& available, const ResourceAmounts& maxPossible);
// Resource types ordered by availability, most available first.
std::array<Resource::Type, Resource::kTypeCount> prioritizeResourceTypes(const ResourceAmounts& available);

class VillageEconomyManager {
public:
    VillageEconomyManager(const SimulationConfig& config, EconomyErrorHandler& errorHandler, const SupplyDemandBalancer& balancer);

    ResourceAmounts getAvailableResources(const Village& village, const Map& map) const;
    ResourceAmounts getMaxPossibleResources(const Village& village, const Map& map) const;

    CalcResult<ResourceAmounts> calculateProduction(const Village& village, const ResourceAmounts& available) const;
    CalcResult<ResourceAmounts> calculateConsumption(const Village& village) const;

    // Harvests from every tile in reach into storage, bounded by stock capacity. Returns the amounts collected.
    ResourceAmounts collectResources(Village& village, Map& map, ResourceManager& resourceManager);

    double applyFoodConsumption(Village& village, double deltaTime) { return consumeFood(village, deltaTime, m_config); }

    void updateVillageEconomy(Village& village, const GameTime& gameTime, const Map& map);

    std::vector<size_t> getResourceShortageVillages(const std::vector<Village>& villages) const;
    std::vector<size_t> getResourceSurplusVillages(const std::vector<Village>& villages) const;

    double storageCapacityFor(int buildingCount) const;

private:
    SimulationConfig m_config;
    EconomyErrorHandler& m_errorHandler;
    const SupplyDemandBalancer& m_balancer;

    template <typename Fn>
    void forEachTileInReach(const Village& village, const Map& map, Fn&& fn) const;
};
