#include <doctest/doctest.h>

#include <limits>
#include <utility>
#include <vector>

#include "simulation_runner.h"
#include "test_support.h"

namespace {

SimulationContext makeContext(std::uint64_t seed) {
    SimulationContext ctx(seed, "");
    ctx.config.world.logErrorsToConsole = false;
    ctx.config.world.mapSize = 24;
    ctx.config.world.villageCount = 4;
    ctx.config.world.tickBudgetMs = 60000.0;
    return ctx;
}

std::vector<Village> singleVillage(const SimulationConfig& config, const sf::Vector2i& cell) {
    return {makeVillage(cell, config)};
}

} // namespace

TEST_SUITE("simulation runner") {

TEST_CASE("the same seed replays the same world") {
    SimulationContext ctxA = makeContext(42);
    SimulationContext ctxB = makeContext(42);
    VillageSimulation a(ctxA);
    VillageSimulation b(ctxB);
    CHECK(a.computeStateHash() == b.computeStateHash());

    a.runTicks(30);
    b.runTicks(30);
    CHECK(a.getTime().totalTicks == 30);
    CHECK(a.computeStateHash() == b.computeStateHash());
    REQUIRE(a.getVillages().size() == b.getVillages().size());
    for (size_t i = 0; i < a.getVillages().size(); ++i) {
        CHECK(a.getVillages()[i].population == b.getVillages()[i].population);
        CHECK(a.getVillages()[i].storage == b.getVillages()[i].storage);
    }
}

TEST_CASE("invariants hold over a long run") {
    SimulationContext ctx = makeContext(7);
    VillageSimulation sim(ctx);
    CHECK(sim.validateInvariants().empty());

    for (int tick = 0; tick < 120; ++tick) {
        sim.step();
        REQUIRE(sim.validateInvariants().empty());
    }
    for (const Village& v : sim.getVillages()) {
        CHECK(v.population >= 1.0);
        CHECK(v.population <= ctx.config.population.maxPopulation);
        CHECK(v.populationHistory.size() <= PopulationHistory::kCapacity);
        CHECK(v.economy.stock.amounts == v.storage);
        CHECK(v.economy.buildings.constructionQueue <= ctx.config.construction.maxConcurrentConstruction);
    }
    const HealthCounters health = sim.getHealth();
    CHECK(health.ticks == 120);
    CHECK(health.villagesReset == 0);
}

TEST_CASE("a village with no food nearby shrinks to one inhabitant") {
    SimulationContext ctx = makeContext(3);
    Map water(5, 5);
    std::vector<Village> villages = singleVillage(ctx.config, sf::Vector2i(2, 2));
    villages[0].storage[Resource::Type::FOOD] = 0.0;
    villages[0].syncStockFromStorage();
    VillageSimulation sim(ctx, std::move(water), std::move(villages));

    double previous = sim.getVillages()[0].population;
    for (int tick = 0; tick < 60; ++tick) {
        sim.step();
        const Village& v = sim.getVillages()[0];
        CHECK(v.population >= 1.0);
        CHECK(v.population <= previous);
        CHECK(v.economy.supplyDemandStatus[Resource::Type::FOOD] == SupplyDemandLevel::Critical);
        previous = v.population;
    }
    CHECK(sim.getVillages()[0].population == doctest::Approx(1.0));
    CHECK(sim.validateInvariants().empty());
}

TEST_CASE("a village on fertile land gathers food and builds") {
    SimulationContext ctx = makeContext(11);
    Map land = uniformMap(7, TerrainType::Land, ResourceAmounts::of(15.0, 8.0, 6.0));
    std::vector<Village> villages = singleVillage(ctx.config, sf::Vector2i(3, 3));
    villages[0].storage = ResourceAmounts::of(40.0, 60.0, 30.0);
    villages[0].syncStockFromStorage();
    VillageSimulation sim(ctx, std::move(land), std::move(villages));

    sim.runTicks(20);
    const Village& v = sim.getVillages()[0];
    CHECK(v.population >= 10.0);
    CHECK(v.economy.production[Resource::Type::FOOD] > 0.0);
    CHECK(v.economy.buildings.count + v.economy.buildings.constructionQueue >= 1);
    CHECK(v.lastUpdateTime == doctest::Approx(20.0));
    CHECK(sim.validateInvariants().empty());
}

TEST_CASE("divine intervention sets a tile within its bounds") {
    SimulationContext ctx = makeContext(5);
    Map land = uniformMap(4, TerrainType::Land, ResourceAmounts::of(10.0, 0.0, 0.0));
    VillageSimulation sim(ctx, std::move(land), {});

    CHECK(sim.divineIntervention(sf::Vector2i(1, 2), Resource::Type::FOOD, 3.0));
    CHECK(sim.getMap().tileAt(sf::Vector2i(1, 2))->resources[Resource::Type::FOOD] == doctest::Approx(3.0));

    CHECK(sim.divineIntervention(sf::Vector2i(1, 2), Resource::Type::FOOD, 500.0));
    CHECK(sim.getMap().tileAt(sf::Vector2i(1, 2))->resources[Resource::Type::FOOD] == doctest::Approx(10.0));

    CHECK(sim.divineIntervention(sf::Vector2i(1, 2), Resource::Type::FOOD, -1.0));
    CHECK(sim.getMap().tileAt(sf::Vector2i(1, 2))->resources[Resource::Type::FOOD] == doctest::Approx(0.0));

    CHECK_FALSE(sim.divineIntervention(sf::Vector2i(9, 9), Resource::Type::FOOD, 3.0));
    CHECK(sim.validateInvariants().empty());
}

TEST_CASE("corrupted village state is repaired during a tick") {
    SimulationContext ctx = makeContext(8);
    Map land = uniformMap(5, TerrainType::Land, ResourceAmounts::of(10.0, 0.0, 0.0));
    VillageSimulation sim(ctx, std::move(land), singleVillage(ctx.config, sf::Vector2i(2, 2)));

    Village& v = sim.getVillagesMutable()[0];
    v.storage[Resource::Type::WOOD] = -40.0;
    v.economy.buildings.constructionQueue = 99;
    v.population = std::numeric_limits<double>::infinity();
    CHECK_FALSE(sim.validateInvariants().empty());

    sim.step();
    CHECK(sim.validateInvariants().empty());
    CHECK(sim.getHealth().errorTotal > 0);
    CHECK(sim.getErrorHandler().getVillageErrorLog("2,2").size() > 0);
}

TEST_CASE("an oversized collection radius is capped before harvesting") {
    SimulationContext ctx = makeContext(9);
    Map land = uniformMap(5, TerrainType::Land, ResourceAmounts::of(10.0, 0.0, 0.0));
    VillageSimulation sim(ctx, std::move(land), singleVillage(ctx.config, sf::Vector2i(2, 2)));

    Village& v = sim.getVillagesMutable()[0];
    v.collectionRadius = std::numeric_limits<int>::max();
    v.economy.stock.capacity = std::numeric_limits<double>::quiet_NaN();
    CHECK_FALSE(sim.validateInvariants().empty());

    sim.step();
    CHECK(sim.validateInvariants().empty());
    CHECK(sim.getVillages()[0].collectionRadius <= ctx.config.integrity.collectionRadiusMax);
    CHECK(sim.getErrorHandler().getVillageErrorLog("2,2").size() > 0);
}

} // TEST_SUITE
