// village.h
#pragma once

#include <SFML/System/Vector2.hpp>

#include <cstddef>
#include <random>
#include <string>
#include <vector>

#include "resource.h"
#include "simulation_context.h"

class Map;

// Ordered worst to best.
enum class SupplyDemandLevel {
    Critical = 0,
    Shortage = 1,
    Balanced = 2,
    Surplus = 3
};

const char* supplyDemandLevelName(SupplyDemandLevel level);

using SupplyDemandStatus = PerResource<SupplyDemandLevel>;

struct Stock {
    ResourceAmounts amounts; // mirrors Village::storage
    double capacity = 100.0;
};

struct Buildings {
    int count = 0;
    int targetCount = 0;
    int constructionQueue = 0;
    double constructionProgress = 0.0; // fractional completions carried between ticks
};

struct VillageEconomy {
    ResourceAmounts production;
    ResourceAmounts consumption;
    Stock stock;
    Buildings buildings;
    SupplyDemandStatus supplyDemandStatus = SupplyDemandStatus::filled(SupplyDemandLevel::Balanced);
};

// Newest entry last; the oldest is dropped once kCapacity is reached.
class PopulationHistory {
public:
    static constexpr size_t kCapacity = 10;

    void push(double population);
    void clear() { m_entries.clear(); }

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }
    double operator[](size_t i) const { return m_entries[i]; }
    double back() const { return m_entries.back(); }
    const std::vector<double>& entries() const { return m_entries; }

private:
    std::vector<double> m_entries;
};

struct Village {
    std::string id;
    sf::Vector2i position;
    double population = 0.0;
    ResourceAmounts storage;
    int collectionRadius = 1;
    PopulationHistory populationHistory;
    double lastUpdateTime = 0.0;
    int starvationTicks = 0; // consecutive ticks of full food exhaustion without a decrease
    VillageEconomy economy;

    // Error log key, "x,y" of the founding cell.
    const std::string& key() const;
    void syncStockFromStorage() { economy.stock.amounts = storage; }
};

std::string villageKey(const sf::Vector2i& position);

Village makeVillage(const sf::Vector2i& position, const SimulationConfig& config);

// Places up to `count` villages on distinct tiles with height in (0.3, 0.8).
std::vector<Village> createVillages(const Map& map, int count, std::mt19937_64& rng, const SimulationConfig& config);
