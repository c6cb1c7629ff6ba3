#include "map.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <sstream>

namespace {

double u01FromU64(std::uint64_t x) {
    return static_cast<double>(x >> 11) * (1.0 / 9007199254740992.0);
}

// Lattice value noise: hashed corners, smoothstep interpolation, two octaves.
double latticeValue(std::uint64_t seed, int ix, int iy, std::uint64_t salt) {
    const std::uint64_t k = seed ^
                            (static_cast<std::uint64_t>(static_cast<std::int64_t>(ix)) * 0x9E3779B97F4A7C15ull) ^
                            (static_cast<std::uint64_t>(static_cast<std::int64_t>(iy)) * 0xD1B54A32D192ED03ull) ^
                            salt;
    return u01FromU64(SimulationContext::mix64(k));
}

double smoothNoise(std::uint64_t seed, double x, double y, std::uint64_t salt) {
    const int x0 = static_cast<int>(std::floor(x));
    const int y0 = static_cast<int>(std::floor(y));
    const double tx = x - x0;
    const double ty = y - y0;
    const double sx = tx * tx * (3.0 - 2.0 * tx);
    const double sy = ty * ty * (3.0 - 2.0 * ty);

    const double v00 = latticeValue(seed, x0, y0, salt);
    const double v10 = latticeValue(seed, x0 + 1, y0, salt);
    const double v01 = latticeValue(seed, x0, y0 + 1, salt);
    const double v11 = latticeValue(seed, x0 + 1, y0 + 1, salt);

    const double a = v00 + (v10 - v00) * sx;
    const double b = v01 + (v11 - v01) * sx;
    return a + (b - a) * sy;
}

} // namespace

const char* terrainTypeName(TerrainType type) {
    switch (type) {
        case TerrainType::Water: return "water";
        case TerrainType::Land: return "land";
        case TerrainType::Forest: return "forest";
        case TerrainType::Mountain: return "mountain";
        case TerrainType::Road: return "road";
    }
    return "unknown";
}

Map::Map(int width, int height)
    : m_width(std::max(0, width)),
      m_height(std::max(0, height)),
      m_tiles(static_cast<size_t>(std::max(0, width)) * static_cast<size_t>(std::max(0, height))) {}

Map Map::generate(int size, std::uint64_t seed) {
    Map map(size, size);
    if (size <= 0) {
        return map;
    }

    // Separate stream for resource amounts so terrain does not shift when amounts change.
    std::mt19937_64 resourceRng(SimulationContext::mix64(seed ^ 0x5245534F55524345ull)); // "RESOURCE"
    std::uniform_int_distribution<int> foodDist(5, 19);
    std::uniform_int_distribution<int> stockDist(0, 9);

    const double frequency = 4.0;
    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            const double nx = static_cast<double>(x) / size * frequency;
            const double ny = static_cast<double>(y) / size * frequency;
            const double h = std::clamp(0.65 * smoothNoise(seed, nx, ny, 0x48454947ull) +          // "HEIG"
                                        0.35 * smoothNoise(seed, nx * 2.0, ny * 2.0, 0x4854324Full), // "HT2O"
                                        0.0, 1.0);

            TerrainType type = TerrainType::Water;
            ResourceAmounts amounts;
            if (h < 0.3) {
                type = TerrainType::Water;
            } else if (h < 0.5) {
                type = TerrainType::Land;
                amounts[Resource::Type::FOOD] = foodDist(resourceRng);
            } else if (h < 0.7) {
                type = TerrainType::Forest;
                amounts[Resource::Type::WOOD] = stockDist(resourceRng);
            } else {
                type = TerrainType::Mountain;
                amounts[Resource::Type::ORE] = stockDist(resourceRng);
            }
            map.setTile(sf::Vector2i(x, y), type, amounts, h);
        }
    }
    return map;
}

bool Map::inBounds(const sf::Vector2i& cell) const {
    return cell.x >= 0 && cell.y >= 0 && cell.x < m_width && cell.y < m_height;
}

Tile* Map::tileAt(const sf::Vector2i& cell) {
    if (!inBounds(cell)) {
        return nullptr;
    }
    return &m_tiles[cellIndex(cell)];
}

const Tile* Map::tileAt(const sf::Vector2i& cell) const {
    if (!inBounds(cell)) {
        return nullptr;
    }
    return &m_tiles[cellIndex(cell)];
}

void Map::setTile(const sf::Vector2i& cell, TerrainType type, const ResourceAmounts& resources, double height) {
    Tile* tile = tileAt(cell);
    if (!tile) {
        return;
    }
    tile->type = type;
    tile->height = height;
    tile->resources = resources;
    tile->maxResources = resources;
    for (Resource::Type r : Resource::kAllTypes) {
        if (!std::isfinite(resources[r]) || resources[r] < 0.0) {
            tile->resources[r] = 0.0;
            tile->maxResources[r] = 0.0;
        }
        tile->depletionState[r] = (tile->maxResources[r] > 0.0) ? 1.0 : 0.0;
    }
    tile->recoveryTimer = ResourceAmounts{};
    tile->lastHarvestTime = 0.0;
}

std::string Map::validateInvariants() const {
    constexpr double kEps = 1e-9;
    for (size_t i = 0; i < m_tiles.size(); ++i) {
        const Tile& tile = m_tiles[i];
        for (Resource::Type r : Resource::kAllTypes) {
            const double current = tile.resources[r];
            const double maxAmount = tile.maxResources[r];
            const double depletion = tile.depletionState[r];
            if (!std::isfinite(current) || !std::isfinite(maxAmount) || !std::isfinite(depletion)) {
                std::ostringstream oss;
                oss << "tile " << (i % static_cast<size_t>(m_width)) << "," << (i / static_cast<size_t>(m_width))
                    << " has non-finite " << Resource::name(r);
                return oss.str();
            }
            if (current < -kEps || current > maxAmount + kEps) {
                std::ostringstream oss;
                oss << "tile " << (i % static_cast<size_t>(m_width)) << "," << (i / static_cast<size_t>(m_width))
                    << " " << Resource::name(r) << " " << current << " outside [0," << maxAmount << "]";
                return oss.str();
            }
            const double expected = (maxAmount > 0.0) ? current / maxAmount : 0.0;
            if (std::abs(depletion - expected) > 1e-6) {
                std::ostringstream oss;
                oss << "tile " << (i % static_cast<size_t>(m_width)) << "," << (i / static_cast<size_t>(m_width))
                    << " " << Resource::name(r) << " depletion " << depletion << " != " << expected;
                return oss.str();
            }
        }
    }
    return {};
}
