#include "village.h"

#include <set>
#include <utility>

#include "map.h"

const char* supplyDemandLevelName(SupplyDemandLevel level) {
    switch (level) {
        case SupplyDemandLevel::Critical: return "critical";
        case SupplyDemandLevel::Shortage: return "shortage";
        case SupplyDemandLevel::Balanced: return "balanced";
        case SupplyDemandLevel::Surplus: return "surplus";
    }
    return "unknown";
}

void PopulationHistory::push(double population) {
    if (m_entries.size() >= kCapacity) {
        m_entries.erase(m_entries.begin());
    }
    m_entries.push_back(population);
}

std::string villageKey(const sf::Vector2i& position) {
    return std::to_string(position.x) + "," + std::to_string(position.y);
}

const std::string& Village::key() const {
    return id;
}

Village makeVillage(const sf::Vector2i& position, const SimulationConfig& config) {
    Village village;
    village.position = position;
    village.id = villageKey(position);
    village.population = config.population.initialPopulation;
    village.storage = ResourceAmounts::of(5.0, 5.0, 2.0);
    village.collectionRadius = 1;
    village.economy.stock.capacity = config.supplyDemand.baseStorageCapacity;
    village.syncStockFromStorage();
    return village;
}

std::vector<Village> createVillages(const Map& map, int count, std::mt19937_64& rng, const SimulationConfig& config) {
    std::vector<Village> villages;
    if (count <= 0 || map.getWidth() <= 0 || map.getHeight() <= 0) {
        return villages;
    }

    std::uniform_int_distribution<int> xDist(0, map.getWidth() - 1);
    std::uniform_int_distribution<int> yDist(0, map.getHeight() - 1);
    std::set<std::pair<int, int>> taken;

    const int maxAttempts = 1000 * count;
    for (int attempt = 0; attempt < maxAttempts && static_cast<int>(villages.size()) < count; ++attempt) {
        const sf::Vector2i cell(xDist(rng), yDist(rng));
        const Tile* tile = map.tileAt(cell);
        if (!tile || tile->height <= 0.3 || tile->height >= 0.8) {
            continue;
        }
        if (!taken.insert({cell.x, cell.y}).second) {
            continue;
        }
        villages.push_back(makeVillage(cell, config));
    }
    return villages;
}
