#include "simulation_runner.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <utility>

namespace {

std::uint64_t mixHash(std::uint64_t h, std::uint64_t v) {
    h ^= v + 0x9E3779B97F4A7C15ull + (h << 6) + (h >> 2);
    return h;
}

std::uint64_t hashDouble(double v, double scale = 1.0e6) {
    if (!std::isfinite(v)) {
        return 0xFFFFFFFFFFFFFFFFull;
    }
    const double q = std::round(v * scale) / scale;
    return static_cast<std::uint64_t>(static_cast<std::int64_t>(q * scale));
}

std::uint64_t determinismTraceTick() {
    static std::uint64_t tick = []() {
        const char* v = std::getenv("VILLAGESIM_TRACE_TICK");
        if (!v || !*v) return std::numeric_limits<std::uint64_t>::max();
        return static_cast<std::uint64_t>(std::strtoull(v, nullptr, 10));
    }();
    return tick;
}

} // namespace

VillageSimulation::VillageSimulation(SimulationContext& ctx)
    : VillageSimulation(ctx, Map::generate(ctx.config.world.mapSize, ctx.worldSeed), {}) {
    std::mt19937_64 placementRng = ctx.makeRng(0x56494C4Cull); // "VILL"
    m_villages = createVillages(m_map, ctx.config.world.villageCount, placementRng, ctx.config);
    if (static_cast<int>(m_villages.size()) < ctx.config.world.villageCount) {
        std::cerr << "[Sim] placed " << m_villages.size() << " of " << ctx.config.world.villageCount
                  << " villages (not enough habitable tiles)" << std::endl;
    }
}

VillageSimulation::VillageSimulation(SimulationContext& ctx, Map map, std::vector<Village> villages)
    : m_ctx(ctx),
      m_map(std::move(map)),
      m_villages(std::move(villages)),
      m_errorHandler(ctx.config),
      m_balancer(ctx.config),
      m_resources(ctx.config.resources),
      m_economy(ctx.config, m_errorHandler, m_balancer),
      m_random(ctx.makeRng(0x504F5055ull)), // "POPU"
      m_population(ctx.config, m_errorHandler, m_random),
      m_buildings(ctx.config, m_errorHandler) {
    m_time.deltaTime = ctx.config.world.deltaTime;
}

void VillageSimulation::setDebugEnabled(bool enabled) {
    m_debug = enabled;
    m_population.setDebugEnabled(enabled);
    m_buildings.setDebugEnabled(enabled);
}

void VillageSimulation::traceStage(const char* stage) const {
    if (m_time.totalTicks != determinismTraceTick()) {
        return;
    }
    std::cout << "[det-trace] tick=" << m_time.totalTicks << " stage=" << stage << " hash=" << computeStateHash() << std::endl;
}

void VillageSimulation::step() {
    const auto start = std::chrono::steady_clock::now();

    const double dt = m_ctx.config.world.deltaTime;
    m_time.deltaTime = dt;
    m_time.currentTime += dt;
    m_time.totalTicks++;
    m_errorHandler.setCurrentTick(m_time.currentTime);
    traceStage("start");

    m_resources.setCurrentTick(m_time.currentTime);
    m_resources.advanceAll(m_map, dt);
    traceStage("recovery");

    for (Village& village : m_villages) {
        m_economy.collectResources(village, m_map, m_resources);
        m_economy.updateVillageEconomy(village, m_time, m_map);
        m_population.updatePopulation(village, m_time);
        m_buildings.updateBuildings(village, m_time);
        village.economy.supplyDemandStatus = m_balancer.evaluateVillageBalance(village);
        m_errorHandler.correctInvalidValues(village);
    }
    traceStage("villages");

    const double elapsedMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    m_health.ticks++;
    m_health.lastTickMs = elapsedMs;
    m_health.worstTickMs = std::max(m_health.worstTickMs, elapsedMs);
    if (elapsedMs > m_ctx.config.world.tickBudgetMs) {
        m_health.slowTicks++;
        std::cout << "[Perf] tick " << m_time.totalTicks << " took " << elapsedMs << " ms (budget "
                  << m_ctx.config.world.tickBudgetMs << " ms)" << std::endl;
    }
}

void VillageSimulation::runTicks(int ticks) {
    for (int i = 0; i < ticks; ++i) {
        step();
    }
}

bool VillageSimulation::divineIntervention(const sf::Vector2i& cell, Resource::Type type, double amount) {
    Tile* tile = m_map.tileAt(cell);
    if (!tile) {
        return false;
    }
    m_resources.setCurrentTick(m_time.currentTime);
    m_resources.divineIntervention(*tile, type, amount);
    if (m_debug) {
        std::cout << "[Sim] divine intervention at " << cell.x << "," << cell.y << " " << Resource::name(type)
                  << " -> " << tile->resources[type] << std::endl;
    }
    return true;
}

HealthCounters VillageSimulation::getHealth() const {
    HealthCounters health = m_health;
    health.errorTotal = m_errorHandler.getTotalErrorsLogged();
    health.villagesReset = m_errorHandler.getResetCount();
    return health;
}

std::uint64_t VillageSimulation::computeStateHash() const {
    std::uint64_t h = 0xC0DEC0DE12345678ull;
    h = mixHash(h, m_time.totalTicks);
    h = mixHash(h, static_cast<std::uint64_t>(m_villages.size()));
    for (const Village& v : m_villages) {
        h = mixHash(h, static_cast<std::uint64_t>(static_cast<std::int64_t>(v.position.x)));
        h = mixHash(h, static_cast<std::uint64_t>(static_cast<std::int64_t>(v.position.y)));
        h = mixHash(h, hashDouble(v.population, 1.0));
        h = mixHash(h, static_cast<std::uint64_t>(v.collectionRadius));
        for (Resource::Type r : Resource::kAllTypes) {
            h = mixHash(h, hashDouble(v.storage[r], 1.0e3));
            h = mixHash(h, hashDouble(v.economy.production[r], 1.0e3));
            h = mixHash(h, static_cast<std::uint64_t>(v.economy.supplyDemandStatus[r]));
        }
        h = mixHash(h, static_cast<std::uint64_t>(v.economy.buildings.count));
        h = mixHash(h, static_cast<std::uint64_t>(v.economy.buildings.constructionQueue));
    }
    for (const Tile& t : m_map.getTiles()) {
        h = mixHash(h, hashDouble(totalOf(t.resources), 1.0e3));
    }
    return h;
}

std::string VillageSimulation::validateInvariants() const {
    const std::string mapError = m_map.validateInvariants();
    if (!mapError.empty()) {
        return "map: " + mapError;
    }
    for (const Village& v : m_villages) {
        const ValidationResult result = m_errorHandler.validateVillageEconomy(v);
        if (!result.isValid) {
            return "village " + v.key() + ": " + result.errors.front().message;
        }
        if (m_time.totalTicks > 0 && v.population < 1.0) {
            return "village " + v.key() + ": population below 1";
        }
        if (v.populationHistory.size() > PopulationHistory::kCapacity) {
            return "village " + v.key() + ": population history exceeds capacity";
        }
    }
    return {};
}
