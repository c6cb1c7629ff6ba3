#include "village_economy.h"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "map.h"

double populationEfficiencyBonus(double population, const SimulationConfig::Production& production) {
    const double p = std::isfinite(population) ? std::max(0.0, population) : 0.0;
    const double bonus = 1.0 + (p - production.populationBonusPivot) * production.populationBonusPerPerson;
    return std::max(0.1, std::min(production.populationBonusMax, bonus));
}

double buildingEfficiencyBonus(int buildingCount, const SimulationConfig::Production& production) {
    const double n = static_cast<double>(std::max(0, buildingCount));
    return std::min(production.buildingBonusMax, 1.0 + n * production.buildingBonusPerBuilding);
}

double computeFoodConsumption(double population, const SimulationConfig& config) {
    if (!std::isfinite(population) || population <= 0.0) {
        return 0.0;
    }
    const SimulationConfig::Production& prod = config.production;
    const double efficiency = std::max(prod.consumptionEfficiencyFloor,
                                       1.0 - (population - prod.populationBonusPivot) * prod.consumptionEfficiencySlope);
    return population * config.supplyDemand.foodConsumptionPerPerson * efficiency;
}

double consumeFood(Village& village, double deltaTime, const SimulationConfig& config) {
    const double dt = (std::isfinite(deltaTime) && deltaTime > 0.0) ? deltaTime : 0.0;
    const double demand = computeFoodConsumption(village.population, config) * dt;
    double& food = village.storage[Resource::Type::FOOD];
    const double drawn = std::max(0.0, std::min(demand, food));
    food = std::max(0.0, food - drawn);
    village.syncStockFromStorage();
    return drawn;
}

double resourceEfficiency(const ResourceAmounts& available, const ResourceAmounts& maxPossible) {
    const double totalMax = totalOf(maxPossible);
    if (!(totalMax > 0.0)) {
        return 1.0;
    }
    const double ratio = totalOf(available) / totalMax;
    if (ratio >= 0.8) return 1.0;
    if (ratio <= 0.3) return 0.1;
    return 0.1 + (ratio - 0.3) / (0.8 - 0.3) * 0.9;
}

std::array<Resource::Type, Resource::kTypeCount> prioritizeResourceTypes(const ResourceAmounts& available) {
    std::array<Resource::Type, Resource::kTypeCount> order = Resource::kAllTypes;
    std::stable_sort(order.begin(), order.end(), [&](Resource::Type a, Resource::Type b) {
        return available[a] > available[b];
    });
    return order;
}

VillageEconomyManager::VillageEconomyManager(const SimulationConfig& config,
                                             EconomyErrorHandler& errorHandler,
                                             const SupplyDemandBalancer& balancer)
    : m_config(config),
      m_errorHandler(errorHandler),
      m_balancer(balancer) {}

template <typename Fn>
void VillageEconomyManager::forEachTileInReach(const Village& village, const Map& map, Fn&& fn) const {
    const int radius = std::clamp(village.collectionRadius, m_config.integrity.collectionRadiusMin,
                                  m_config.integrity.collectionRadiusMax);
    for (int dy = -radius; dy <= radius; ++dy) {
        for (int dx = -radius; dx <= radius; ++dx) {
            const sf::Vector2i cell(village.position.x + dx, village.position.y + dy);
            if (map.inBounds(cell)) {
                fn(cell);
            }
        }
    }
}

ResourceAmounts VillageEconomyManager::getAvailableResources(const Village& village, const Map& map) const {
    ResourceAmounts total;
    forEachTileInReach(village, map, [&](const sf::Vector2i& cell) {
        const Tile* tile = map.tileAt(cell);
        for (Resource::Type r : Resource::kAllTypes) {
            total[r] += tile->resources[r];
        }
    });
    return total;
}

ResourceAmounts VillageEconomyManager::getMaxPossibleResources(const Village& village, const Map& map) const {
    ResourceAmounts total;
    forEachTileInReach(village, map, [&](const sf::Vector2i& cell) {
        const Tile* tile = map.tileAt(cell);
        for (Resource::Type r : Resource::kAllTypes) {
            total[r] += tile->maxResources[r];
        }
    });
    return total;
}

double VillageEconomyManager::storageCapacityFor(int buildingCount) const {
    return m_config.supplyDemand.baseStorageCapacity +
           static_cast<double>(std::max(0, buildingCount)) * m_config.supplyDemand.storageCapacityPerBuilding;
}

CalcResult<ResourceAmounts> VillageEconomyManager::calculateProduction(const Village& village,
                                                                       const ResourceAmounts& available) const {
    const SimulationConfig::Production& prod = m_config.production;
    const double radius = static_cast<double>(std::clamp(village.collectionRadius, m_config.integrity.collectionRadiusMin,
                                                         m_config.integrity.collectionRadiusMax));
    const double multiplier = prod.baseProductionRate *
                              populationEfficiencyBonus(village.population, prod) *
                              buildingEfficiencyBonus(village.economy.buildings.count, prod) *
                              radius * radius;
    if (!std::isfinite(multiplier)) {
        return CalcResult<ResourceAmounts>::failure("production multiplier is not finite");
    }

    const ResourceAmounts yields = ResourceAmounts::of(prod.foodYield, prod.woodYield, prod.oreYield);
    ResourceAmounts production;
    for (Resource::Type r : Resource::kAllTypes) {
        const double amount = available[r];
        if (!std::isfinite(amount)) {
            return CalcResult<ResourceAmounts>::failure(std::string("available ") + Resource::name(r) + " is not finite");
        }
        production[r] = (amount > 0.0) ? std::max(0.0, amount * multiplier * yields[r]) : 0.0;
    }
    return CalcResult<ResourceAmounts>::success(production);
}

CalcResult<ResourceAmounts> VillageEconomyManager::calculateConsumption(const Village& village) const {
    if (!std::isfinite(village.population)) {
        return CalcResult<ResourceAmounts>::failure("population is not finite");
    }
    const double queue = static_cast<double>(std::max(0, village.economy.buildings.constructionQueue));
    return CalcResult<ResourceAmounts>::success(ResourceAmounts::of(
        computeFoodConsumption(village.population, m_config),
        queue * m_config.supplyDemand.buildingWoodCost,
        queue * m_config.supplyDemand.buildingOreCost));
}

ResourceAmounts VillageEconomyManager::collectResources(Village& village, Map& map, ResourceManager& resourceManager) {
    // Radius, storage and capacity steer the harvest, so repair them first.
    m_errorHandler.correctInvalidValues(village);

    ResourceAmounts collected;
    const ResourceAmounts available = getAvailableResources(village, map);
    const double efficiency = m_errorHandler.safeCalculation(
        [&]() { return resourceEfficiency(available, getMaxPossibleResources(village, map)); },
        1.0, "resourceEfficiency", village.key());
    const auto priority = prioritizeResourceTypes(available);
    const double capacity = std::max(0.0, village.economy.stock.capacity);

    forEachTileInReach(village, map, [&](const sf::Vector2i& cell) {
        Tile* tile = map.tileAt(cell);
        for (size_t i = 0; i < priority.size(); ++i) {
            const Resource::Type r = priority[i];
            if (tile->resources[r] <= 0.0) {
                continue;
            }
            const double room = capacity - village.storage[r];
            if (room <= 0.0) {
                continue;
            }
            // First choice at 100%, then 75%, then 50%.
            const double priorityMultiplier = 1.0 - static_cast<double>(i) * 0.25;
            const double request = std::min(room, std::max(0.1, efficiency * priorityMultiplier));
            const double harvested = resourceManager.harvestResource(*tile, r, request);
            village.storage[r] += harvested;
            collected[r] += harvested;
        }
    });

    village.syncStockFromStorage();
    return collected;
}

void VillageEconomyManager::updateVillageEconomy(Village& village, const GameTime& gameTime, const Map& map) {
    const std::string id = village.key();
    m_errorHandler.setCurrentTick(gameTime.currentTime);

    const ValidationResult validation = m_errorHandler.validateVillageEconomy(village);
    if (!validation.isValid) {
        m_errorHandler.correctInvalidValues(village);
    }

    const ResourceAmounts zero;
    bool failed = false;
    const auto guarded = [&](auto&& fn, const ResourceAmounts& fallback, const char* context) {
        return m_errorHandler.safeCalculation(
            [&]() -> CalcResult<ResourceAmounts> {
                CalcResult<ResourceAmounts> r = fn();
                if (!r.ok || !isFiniteValue(r.value)) failed = true;
                return r;
            },
            fallback, context, id);
    };

    const ResourceAmounts available = guarded(
        [&]() { return CalcResult<ResourceAmounts>::success(getAvailableResources(village, map)); }, zero, "getAvailableResources");
    village.economy.production = guarded([&]() { return calculateProduction(village, available); }, zero, "calculateProduction");
    village.economy.consumption = guarded([&]() { return calculateConsumption(village); }, zero, "calculateConsumption");

    if (failed) {
        std::cerr << "[Economy] " << id << ": calculation failed, resetting economy" << std::endl;
        m_errorHandler.resetVillageEconomyToDefaults(village);
        village.lastUpdateTime = gameTime.currentTime;
        return;
    }

    village.syncStockFromStorage();
    village.economy.stock.capacity = storageCapacityFor(village.economy.buildings.count);
    village.economy.supplyDemandStatus = m_balancer.evaluateVillageBalance(village);
    village.lastUpdateTime = gameTime.currentTime;

    m_errorHandler.correctInvalidValues(village);
}

std::vector<size_t> VillageEconomyManager::getResourceShortageVillages(const std::vector<Village>& villages) const {
    std::vector<size_t> out;
    for (size_t i = 0; i < villages.size(); ++i) {
        const SupplyDemandStatus& s = villages[i].economy.supplyDemandStatus;
        for (Resource::Type r : Resource::kAllTypes) {
            if (s[r] == SupplyDemandLevel::Shortage || s[r] == SupplyDemandLevel::Critical) {
                out.push_back(i);
                break;
            }
        }
    }
    return out;
}

std::vector<size_t> VillageEconomyManager::getResourceSurplusVillages(const std::vector<Village>& villages) const {
    std::vector<size_t> out;
    for (size_t i = 0; i < villages.size(); ++i) {
        const SupplyDemandStatus& s = villages[i].economy.supplyDemandStatus;
        for (Resource::Type r : Resource::kAllTypes) {
            if (s[r] == SupplyDemandLevel::Surplus) {
                out.push_back(i);
                break;
            }
        }
    }
    return out;
}
