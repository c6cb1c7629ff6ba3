// map.h
#pragma once

#include <SFML/System/Vector2.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "resource.h"

enum class TerrainType {
    Water = 0,
    Land = 1,
    Forest = 2,
    Mountain = 3,
    Road = 4
};

constexpr int kTerrainTypeCount = 5;

const char* terrainTypeName(TerrainType type);

struct Tile {
    TerrainType type = TerrainType::Water;
    double height = 0.0;

    ResourceAmounts resources;
    ResourceAmounts maxResources;
    ResourceAmounts depletionState; // current / max, 0 when max is 0
    ResourceAmounts recoveryTimer;  // elapsed since last harvest, per resource
    double lastHarvestTime = 0.0;
};

class Map {
public:
    Map() = default;
    Map(int width, int height);

    // Deterministic terrain for a seed. Height bands follow water < 0.3 <= land < 0.5 <= forest < 0.7 <= mountain.
    static Map generate(int size, std::uint64_t seed);

    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }
    bool inBounds(const sf::Vector2i& cell) const;

    Tile* tileAt(const sf::Vector2i& cell);
    const Tile* tileAt(const sf::Vector2i& cell) const;

    std::vector<Tile>& getTiles() { return m_tiles; }
    const std::vector<Tile>& getTiles() const { return m_tiles; }

    // Replaces a tile and initializes its depletion bookkeeping from `resources` as the maximum.
    void setTile(const sf::Vector2i& cell, TerrainType type, const ResourceAmounts& resources, double height = 0.5);

    std::string validateInvariants() const;

private:
    int m_width = 0;
    int m_height = 0;
    std::vector<Tile> m_tiles;

    size_t cellIndex(const sf::Vector2i& cell) const {
        return static_cast<size_t>(cell.y) * static_cast<size_t>(m_width) + static_cast<size_t>(cell.x);
    }
};
