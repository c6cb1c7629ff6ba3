// resource.cpp
#include "resource.h"

#include <algorithm>
#include <cmath>

#include "map.h"

const char* Resource::name(Type type) {
    switch (type) {
        case Type::FOOD: return "food";
        case Type::WOOD: return "wood";
        case Type::ORE: return "ore";
    }
    return "unknown";
}

bool Resource::fromName(const std::string& name, Type& out) {
    for (Type type : kAllTypes) {
        if (name == Resource::name(type)) {
            out = type;
            return true;
        }
    }
    return false;
}

double totalOf(const ResourceAmounts& amounts) {
    double sum = 0.0;
    for (double v : amounts.values) {
        sum += v;
    }
    return sum;
}

ResourceManager::ResourceManager(const SimulationConfig::Resources& config)
    : m_config(config) {}

void ResourceManager::refreshDepletion(Tile& tile, Resource::Type type) {
    const double maxAmount = tile.maxResources[type];
    tile.depletionState[type] = (maxAmount > 0.0) ? (tile.resources[type] / maxAmount) : 0.0;
}

double ResourceManager::harvestResource(Tile& tile, Resource::Type type, double requestedAmount) {
    if (!std::isfinite(requestedAmount) || requestedAmount <= 0.0) {
        return 0.0;
    }

    const double harvestable = std::min(requestedAmount, tile.resources[type]);
    if (harvestable <= 0.0) {
        return 0.0;
    }

    tile.resources[type] = std::max(0.0, tile.resources[type] - harvestable);
    refreshDepletion(tile, type);
    tile.lastHarvestTime = m_currentTick;
    tile.recoveryTimer[type] = 0.0;
    return harvestable;
}

void ResourceManager::updateRecovery(Tile& tile, double elapsed) {
    if (!std::isfinite(elapsed) || elapsed < 0.0) {
        elapsed = 0.0;
    }

    const size_t terrain = static_cast<size_t>(tile.type);
    for (Resource::Type type : Resource::kAllTypes) {
        const double maxAmount = tile.maxResources[type];
        if (maxAmount <= 0.0) {
            tile.depletionState[type] = 0.0;
            continue;
        }

        if (tile.resources[type] >= maxAmount) {
            tile.resources[type] = maxAmount;
            tile.depletionState[type] = 1.0;
            tile.recoveryTimer[type] = 0.0;
            continue;
        }

        tile.recoveryTimer[type] += elapsed;
        if (tile.recoveryTimer[type] <= m_config.recoveryDelay) {
            continue;
        }

        const double multiplier = m_config.typeMultipliers[terrain][Resource::index(type)];
        const double regrowth = maxAmount * m_config.recoveryRate * multiplier;
        tile.resources[type] = std::clamp(tile.resources[type] + regrowth, 0.0, maxAmount);
        refreshDepletion(tile, type);
    }
}

void ResourceManager::advanceAll(Map& map, double elapsed) {
    for (Tile& tile : map.getTiles()) {
        updateRecovery(tile, elapsed);
    }
}

void ResourceManager::divineIntervention(Tile& tile, Resource::Type type, double newAmount) {
    const double maxAmount = tile.maxResources[type];
    if (!std::isfinite(newAmount)) {
        newAmount = (newAmount > 0.0) ? maxAmount : 0.0;
    }
    tile.resources[type] = std::max(0.0, std::min(maxAmount, newAmount));
    refreshDepletion(tile, type);
    tile.recoveryTimer[type] = 0.0;
    tile.lastHarvestTime = m_currentTick;
}

ResourceVisualState ResourceManager::getVisualState(const Tile& tile) const {
    ResourceVisualState state;

    double sum = 0.0;
    int tracked = 0;
    bool allEmpty = true;
    for (Resource::Type type : Resource::kAllTypes) {
        if (tile.maxResources[type] <= 0.0) {
            continue;
        }
        sum += tile.depletionState[type];
        ++tracked;
        if (tile.resources[type] > 0.0) {
            allEmpty = false;
        }
    }
    if (tracked == 0) {
        return state;
    }

    const double average = sum / static_cast<double>(tracked);
    state.opacity = static_cast<float>(0.3 + average * 0.7);

    // Depleted tiles fade towards red.
    if (average < 0.3) {
        const int redIntensity = static_cast<int>(std::floor((1.0 - average / 0.3) * 100.0));
        const sf::Uint8 gb = static_cast<sf::Uint8>(255 - std::clamp(redIntensity, 0, 100));
        state.tint = sf::Color(255, gb, gb);
    }

    state.isDepleted = allEmpty;
    if (state.isDepleted) {
        // Progress towards the end of the recovery delay of the freshest empty resource.
        double minTimer = -1.0;
        for (Resource::Type type : Resource::kAllTypes) {
            if (tile.maxResources[type] > 0.0 && tile.resources[type] <= 0.0) {
                if (minTimer < 0.0 || tile.recoveryTimer[type] < minTimer) {
                    minTimer = tile.recoveryTimer[type];
                }
            }
        }
        if (m_config.recoveryDelay > 0.0) {
            state.recoveryProgress = std::clamp(std::max(0.0, minTimer) / m_config.recoveryDelay, 0.0, 1.0);
        } else {
            state.recoveryProgress = 1.0;
        }
    } else {
        state.recoveryProgress = average;
    }
    return state;
}
