#include "population.h"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "village_economy.h"

const char* populationTrendName(PopulationTrend trend) {
    switch (trend) {
        case PopulationTrend::Growing: return "growing";
        case PopulationTrend::Stable: return "stable";
        case PopulationTrend::Declining: return "declining";
    }
    return "unknown";
}

PopulationTrend populationTrend(const PopulationHistory& history) {
    const size_t n = history.size();
    if (n < 2) {
        return PopulationTrend::Stable;
    }
    const size_t first = (n >= 3) ? n - 3 : 0;
    bool increasing = true;
    bool decreasing = true;
    for (size_t i = first + 1; i < n; ++i) {
        increasing = increasing && history[i] > history[i - 1];
        decreasing = decreasing && history[i] < history[i - 1];
    }
    if (increasing) return PopulationTrend::Growing;
    if (decreasing) return PopulationTrend::Declining;
    return PopulationTrend::Stable;
}

double eventProbability(double rate, double deltaTime) {
    const double p = rate * deltaTime;
    if (!std::isfinite(p)) {
        return (p > 0.0) ? 1.0 : 0.0;
    }
    return std::max(0.0, std::min(1.0, p));
}

PopulationManager::PopulationManager(const SimulationConfig& config, EconomyErrorHandler& errorHandler, RandomSource& random)
    : m_config(config),
      m_errorHandler(errorHandler),
      m_random(random) {}

int PopulationManager::radiusForPopulation(double population) const {
    const int step = std::max(1, m_config.population.populationPerRadiusStep);
    return static_cast<int>(std::floor(std::max(0.0, population) / step)) + 1;
}

bool PopulationManager::canPopulationGrow(const Village& village) const {
    if (!(village.population < m_config.population.maxPopulation)) {
        return false;
    }
    const double current = computeFoodConsumption(village.population, m_config);
    const double next = computeFoodConsumption(village.population + 1.0, m_config);

    // Food left after this tick's draw must cover the larger population for the buffer horizon.
    const double remaining = village.storage[Resource::Type::FOOD] - current;
    const bool hasBuffer = remaining >= next * m_config.population.foodBufferHorizon;
    const bool productionCovers = village.economy.production[Resource::Type::FOOD] >= next;
    const bool notCritical = village.economy.supplyDemandStatus[Resource::Type::FOOD] != SupplyDemandLevel::Critical;
    return hasBuffer && productionCovers && notCritical;
}

bool PopulationManager::isFoodExhausted(const Village& village) const {
    return village.storage[Resource::Type::FOOD] <= 0.0 &&
           village.economy.production[Resource::Type::FOOD] <= 0.0 &&
           village.economy.supplyDemandStatus[Resource::Type::FOOD] == SupplyDemandLevel::Critical;
}

bool PopulationManager::shouldPopulationDecrease(const Village& village) const {
    if (!(village.population > 1.0)) {
        return false;
    }
    if (village.economy.supplyDemandStatus[Resource::Type::FOOD] != SupplyDemandLevel::Critical) {
        return false;
    }
    const double consumption = computeFoodConsumption(village.population, m_config);
    const double production = village.economy.production[Resource::Type::FOOD];
    const bool exhausted = village.storage[Resource::Type::FOOD] <= 0.0 && production <= 0.0;
    const bool insufficient = production < consumption * m_config.population.declineProductionRatio;
    return exhausted || insufficient;
}

bool PopulationManager::decreasePopulation(Village& village, const GameTime& gameTime) {
    const std::string id = village.key();
    bool fire = false;

    if (isFoodExhausted(village)) {
        ++village.starvationTicks;
        if (village.starvationTicks >= m_config.population.exhaustionGuaranteeTicks) {
            fire = true;
        }
    }

    if (!fire) {
        const double consumption = computeFoodConsumption(village.population, m_config);
        const double shortageFactor = m_errorHandler.safeCalculation(
            [&]() { return std::max(1.0, 2.0 - village.storage[Resource::Type::FOOD] / std::max(0.1, consumption)); },
            1.0, "decline shortage factor", id);
        const double chance = eventProbability(m_config.supplyDemand.populationDeclineRate, gameTime.deltaTime) * shortageFactor;
        fire = m_random.next01() < chance;
    }

    if (!fire || !(village.population > 1.0)) {
        return false;
    }

    village.population = std::max(1.0, village.population - 1.0);
    village.starvationTicks = 0;
    village.collectionRadius = std::min(village.collectionRadius, std::max(1, radiusForPopulation(village.population)));
    if (m_debug) {
        std::cout << "[Population] " << id << " declined to " << village.population << std::endl;
    }
    return true;
}

bool PopulationManager::increasePopulation(Village& village, const GameTime& gameTime) {
    const std::string id = village.key();
    const double consumption = computeFoodConsumption(village.population, m_config);
    const double abundance = m_errorHandler.safeCalculation(
        [&]() {
            if (consumption <= 0.0) return 2.0;
            return std::min(2.0, village.storage[Resource::Type::FOOD] / (consumption * 10.0));
        },
        0.0, "growth food abundance", id);
    const double chance = eventProbability(m_config.supplyDemand.populationGrowthRate, gameTime.deltaTime) * abundance;
    if (!(m_random.next01() < chance)) {
        return false;
    }

    village.population = std::min(m_config.population.maxPopulation, village.population + 1.0);
    const int radius = std::min(m_config.population.maxCollectionRadius, radiusForPopulation(village.population));
    village.collectionRadius = std::max(village.collectionRadius, radius);
    if (m_debug) {
        std::cout << "[Population] " << id << " grew to " << village.population << std::endl;
    }
    return true;
}

void PopulationManager::updatePopulation(Village& village, const GameTime& gameTime) {
    const std::string id = village.key();
    m_errorHandler.setCurrentTick(gameTime.currentTime);
    m_errorHandler.correctInvalidValues(village);

    // A living village keeps at least one inhabitant.
    if (village.population < m_config.integrity.populationDefault) {
        m_errorHandler.logError(id, EconomyErrorType::DataIntegrity,
                                "population below floor, raised to " + std::to_string(static_cast<int>(m_config.integrity.populationDefault)),
                                "automatic correction");
        village.population = m_config.integrity.populationDefault;
    }

    consumeFood(village, gameTime.deltaTime, m_config);

    if (shouldPopulationDecrease(village)) {
        decreasePopulation(village, gameTime);
    } else {
        village.starvationTicks = 0;
        if (canPopulationGrow(village)) {
            increasePopulation(village, gameTime);
        }
    }

    village.populationHistory.push(village.population);
    m_errorHandler.correctInvalidValues(village);
}

PopulationStats PopulationManager::getPopulationStats(const Village& village) const {
    PopulationStats stats;
    stats.currentPopulation = village.population;
    stats.foodConsumption = computeFoodConsumption(village.population, m_config);
    stats.canGrow = canPopulationGrow(village);
    stats.shouldDecline = shouldPopulationDecrease(village);
    stats.trend = populationTrend(village.populationHistory);
    return stats;
}
