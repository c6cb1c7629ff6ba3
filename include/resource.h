// resource.h
#pragma once

#include <SFML/Graphics/Color.hpp>

#include <array>
#include <cstddef>
#include <string>

#include "simulation_context.h"

struct Tile;
class Map;

class Resource {
public:
    enum class Type {
        FOOD = 0,
        WOOD = 1,
        ORE = 2
    };

    static constexpr int kTypeCount = 3;
    static constexpr std::array<Type, kTypeCount> kAllTypes = {
        Type::FOOD,
        Type::WOOD,
        Type::ORE
    };

    static const char* name(Type type);
    static bool fromName(const std::string& name, Type& out);
    static size_t index(Type type) { return static_cast<size_t>(type); }
};

// Fixed per-resource storage indexed by Resource::Type.
template <typename T>
struct PerResource {
    std::array<T, Resource::kTypeCount> values{};

    T& operator[](Resource::Type type) { return values[Resource::index(type)]; }
    const T& operator[](Resource::Type type) const { return values[Resource::index(type)]; }

    static PerResource filled(const T& v) {
        PerResource out;
        out.values.fill(v);
        return out;
    }

    static PerResource of(const T& food, const T& wood, const T& ore) {
        PerResource out;
        out.values = {food, wood, ore};
        return out;
    }

    bool operator==(const PerResource& other) const { return values == other.values; }
    bool operator!=(const PerResource& other) const { return values != other.values; }
};

using ResourceAmounts = PerResource<double>;

double totalOf(const ResourceAmounts& amounts);

struct ResourceVisualState {
    float opacity = 1.0f;        // 0.3..1.0
    sf::Color tint = sf::Color::White;
    bool isDepleted = false;
    double recoveryProgress = 0.0; // 0..1
};

// Per-tile stock bookkeeping: harvesting, delayed recovery and direct overrides.
class ResourceManager {
public:
    explicit ResourceManager(const SimulationConfig::Resources& config);

    void setCurrentTick(double tick) { m_currentTick = tick; }
    double getCurrentTick() const { return m_currentTick; }

    // Removes up to `requestedAmount`; returns what was actually taken.
    double harvestResource(Tile& tile, Resource::Type type, double requestedAmount);

    // Advances recovery timers by `elapsed` and regrows resources whose delay has passed.
    void updateRecovery(Tile& tile, double elapsed);
    void advanceAll(Map& map, double elapsed);

    // Administrative override. The value is clamped to [0, max].
    void divineIntervention(Tile& tile, Resource::Type type, double newAmount);

    ResourceVisualState getVisualState(const Tile& tile) const;

    const SimulationConfig::Resources& getConfig() const { return m_config; }

private:
    SimulationConfig::Resources m_config;
    double m_currentTick = 0.0;

    static void refreshDepletion(Tile& tile, Resource::Type type);
};
