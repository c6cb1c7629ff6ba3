#include "buildings.h"

#include <algorithm>
#include <cmath>
#include <iostream>

int targetBuildingCount(double population, double buildingsPerPopulation) {
    if (!std::isfinite(population) || population <= 0.0) {
        return 0;
    }
    const double ratio = std::isfinite(buildingsPerPopulation) ? std::max(0.0, buildingsPerPopulation) : 0.0;
    const int byRatio = static_cast<int>(std::floor(population * ratio));
    const int byHalf = static_cast<int>(std::floor(population / 2.0));
    return std::max(1, std::min(byRatio, byHalf));
}

BuildingManager::BuildingManager(const SimulationConfig& config, EconomyErrorHandler& errorHandler)
    : m_config(config),
      m_errorHandler(errorHandler) {}

BuildingCost BuildingManager::calculateBuildingCost() const {
    BuildingCost cost;
    cost.wood = m_config.supplyDemand.buildingWoodCost;
    cost.ore = m_config.supplyDemand.buildingOreCost;
    return cost;
}

int BuildingManager::calculateTargetBuildingCount(double population) const {
    return targetBuildingCount(population, m_config.supplyDemand.buildingsPerPopulation);
}

bool BuildingManager::canBuildBuilding(const Village& village) const {
    const BuildingCost cost = calculateBuildingCost();
    const double wood = village.storage[Resource::Type::WOOD];
    const double ore = village.storage[Resource::Type::ORE];

    if (!(wood >= cost.wood) || !(ore >= cost.ore)) {
        return false;
    }

    const double buffer = m_config.construction.resourceBufferMultiplier;
    const bool keepsWood = (wood - cost.wood) >= cost.wood * buffer;
    const bool keepsOre = (ore - cost.ore) >= cost.ore * buffer;

    const SupplyDemandStatus& status = village.economy.supplyDemandStatus;
    const bool woodOk = status[Resource::Type::WOOD] != SupplyDemandLevel::Critical;
    const bool oreOk = status[Resource::Type::ORE] != SupplyDemandLevel::Critical;
    const bool queueOpen = village.economy.buildings.constructionQueue < m_config.construction.maxConcurrentConstruction;

    return keepsWood && keepsOre && woodOk && oreOk && queueOpen;
}

int BuildingManager::calculateMaxBuildableBuildings(const Village& village) const {
    const BuildingCost cost = calculateBuildingCost();
    const double wood = std::max(0.0, village.storage[Resource::Type::WOOD]);
    const double ore = std::max(0.0, village.storage[Resource::Type::ORE]);
    const double byWood = (cost.wood > 0.0) ? std::floor(wood / cost.wood) : static_cast<double>(m_config.construction.maxConcurrentConstruction);
    const double byOre = (cost.ore > 0.0) ? std::floor(ore / cost.ore) : static_cast<double>(m_config.construction.maxConcurrentConstruction);
    const int queueRoom = std::max(0, m_config.construction.maxConcurrentConstruction - village.economy.buildings.constructionQueue);
    const double byResources = std::min(byWood, byOre);
    return static_cast<int>(std::max(0.0, std::min(byResources, static_cast<double>(queueRoom))));
}

int BuildingManager::processConstructionQueue(Village& village, const GameTime& gameTime) {
    Buildings& b = village.economy.buildings;
    if (b.constructionQueue <= 0) {
        b.constructionProgress = 0.0;
        return 0;
    }
    if (!std::isfinite(b.constructionProgress) || b.constructionProgress < 0.0) {
        b.constructionProgress = 0.0;
    }

    const double rate = m_errorHandler.safeCalculation(
        [&]() { return gameTime.deltaTime / m_config.construction.constructionTimePerBuilding; },
        0.0, "construction completion rate", village.key());

    b.constructionProgress += static_cast<double>(b.constructionQueue) * std::max(0.0, rate);
    const int completed = std::min(b.constructionQueue, static_cast<int>(std::floor(b.constructionProgress)));
    if (completed <= 0) {
        return 0;
    }

    b.count += completed;
    b.constructionQueue -= completed;
    b.constructionProgress = (b.constructionQueue > 0) ? std::max(0.0, b.constructionProgress - completed) : 0.0;
    village.economy.stock.capacity = m_config.supplyDemand.baseStorageCapacity +
                                     static_cast<double>(b.count) * m_config.supplyDemand.storageCapacityPerBuilding;

    if (m_debug) {
        std::cout << "[Buildings] " << village.key() << ": " << completed << " completed (total " << b.count << ")" << std::endl;
    }
    return completed;
}

void BuildingManager::constructBuildings(Village& village, int buildCount) {
    const BuildingCost cost = calculateBuildingCost();
    const double woodCost = cost.wood * buildCount;
    const double oreCost = cost.ore * buildCount;

    village.storage[Resource::Type::WOOD] = std::max(0.0, village.storage[Resource::Type::WOOD] - woodCost);
    village.storage[Resource::Type::ORE] = std::max(0.0, village.storage[Resource::Type::ORE] - oreCost);
    village.syncStockFromStorage();
    village.economy.buildings.constructionQueue += buildCount;

    if (m_debug) {
        std::cout << "[Buildings] " << village.key() << ": started " << buildCount << " (wood " << woodCost
                  << ", ore " << oreCost << ")" << std::endl;
    }
}

void BuildingManager::updateBuildings(Village& village, const GameTime& gameTime) {
    const std::string id = village.key();
    m_errorHandler.setCurrentTick(gameTime.currentTime);
    m_errorHandler.correctInvalidValues(village);

    processConstructionQueue(village, gameTime);

    Buildings& b = village.economy.buildings;
    b.targetCount = std::min(m_config.integrity.buildingsMax, calculateTargetBuildingCount(village.population));

    const int needed = std::max(0, b.targetCount - (b.count + b.constructionQueue));
    if (needed > 0) {
        const int buildable = calculateMaxBuildableBuildings(village);
        const int buildCount = std::min(needed, buildable);
        if (buildCount > 0 && canBuildBuilding(village)) {
            constructBuildings(village, buildCount);
        }
    }

    m_errorHandler.correctInvalidValues(village);
}

BuildingStats BuildingManager::getBuildingStats(const Village& village) const {
    BuildingStats stats;
    stats.currentCount = village.economy.buildings.count;
    stats.targetCount = village.economy.buildings.targetCount;
    stats.constructionQueue = village.economy.buildings.constructionQueue;
    stats.canBuild = canBuildBuilding(village);
    stats.buildingCost = calculateBuildingCost();
    stats.maxBuildable = calculateMaxBuildableBuildings(village);
    return stats;
}
