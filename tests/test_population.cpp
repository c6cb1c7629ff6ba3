#include <doctest/doctest.h>

#include <cmath>
#include <limits>

#include "population.h"
#include "test_support.h"
#include "village_economy.h"

namespace {

// Draws that never trigger a probabilistic event.
const std::vector<double> kNeverFire = {0.999999};
// Draws that always trigger one.
const std::vector<double> kAlwaysFire = {0.0};

struct PopulationFixture {
    SimulationConfig config = quietConfig();
    EconomyErrorHandler handler{config};
    ScriptedRandom random;
    PopulationManager population;
    Village village = makeVillage(sf::Vector2i(2, 2), config);
    GameTime time;

    explicit PopulationFixture(std::vector<double> draws)
        : random(std::move(draws)),
          population(config, handler, random) {}

    void starve() {
        village.storage[Resource::Type::FOOD] = 0.0;
        village.syncStockFromStorage();
        village.economy.production[Resource::Type::FOOD] = 0.0;
        village.economy.supplyDemandStatus[Resource::Type::FOOD] = SupplyDemandLevel::Critical;
    }

    void feed() {
        village.storage[Resource::Type::FOOD] = 50.0;
        village.syncStockFromStorage();
        village.economy.production[Resource::Type::FOOD] = 5.0;
        village.economy.supplyDemandStatus[Resource::Type::FOOD] = SupplyDemandLevel::Balanced;
    }
};

} // namespace

TEST_SUITE("population") {

TEST_CASE("event probability is the clamped rate over the tick") {
    CHECK(eventProbability(0.05, 1.0) == doctest::Approx(0.05));
    CHECK(eventProbability(0.05, 4.0) == doctest::Approx(0.2));
    CHECK(eventProbability(0.5, 10.0) == doctest::Approx(1.0));
    CHECK(eventProbability(-1.0, 1.0) == 0.0);
    CHECK(eventProbability(std::numeric_limits<double>::infinity(), 1.0) == 1.0);
    CHECK(eventProbability(std::numeric_limits<double>::quiet_NaN(), 1.0) == 0.0);
}

TEST_CASE("trend reads the last three history entries") {
    PopulationHistory history;
    CHECK(populationTrend(history) == PopulationTrend::Stable);
    history.push(5.0);
    CHECK(populationTrend(history) == PopulationTrend::Stable);
    history.push(6.0);
    CHECK(populationTrend(history) == PopulationTrend::Growing);
    history.push(7.0);
    CHECK(populationTrend(history) == PopulationTrend::Growing);
    history.push(7.0);
    CHECK(populationTrend(history) == PopulationTrend::Stable);
    history.push(6.0);
    history.push(5.0);
    CHECK(populationTrend(history) == PopulationTrend::Declining);
    CHECK(std::string(populationTrendName(PopulationTrend::Declining)) == "declining");
}

TEST_CASE("history keeps only the newest entries") {
    PopulationHistory history;
    for (int i = 0; i < 25; ++i) {
        history.push(static_cast<double>(i));
    }
    CHECK(history.size() == PopulationHistory::kCapacity);
    CHECK(history[0] == 15.0);
    CHECK(history.back() == 24.0);
}

TEST_CASE("growth needs a food buffer, covering production and no food crisis") {
    PopulationFixture f(kNeverFire);
    f.feed();
    CHECK(f.population.canPopulationGrow(f.village));

    Village lowStore = f.village;
    lowStore.storage[Resource::Type::FOOD] = 5.0;
    CHECK_FALSE(f.population.canPopulationGrow(lowStore));

    Village lowProduction = f.village;
    lowProduction.economy.production[Resource::Type::FOOD] = 1.0;
    CHECK_FALSE(f.population.canPopulationGrow(lowProduction));

    Village critical = f.village;
    critical.economy.supplyDemandStatus[Resource::Type::FOOD] = SupplyDemandLevel::Critical;
    CHECK_FALSE(f.population.canPopulationGrow(critical));

    // Shortage alone does not block growth.
    Village shortage = f.village;
    shortage.economy.supplyDemandStatus[Resource::Type::FOOD] = SupplyDemandLevel::Shortage;
    CHECK(f.population.canPopulationGrow(shortage));

    Village full = f.village;
    full.population = f.config.population.maxPopulation;
    CHECK_FALSE(f.population.canPopulationGrow(full));
}

TEST_CASE("a fed village grows by one when the draw succeeds") {
    PopulationFixture f(kAlwaysFire);
    f.feed();
    f.population.updatePopulation(f.village, f.time);
    CHECK(f.village.population == doctest::Approx(11.0));
    CHECK(f.village.storage[Resource::Type::FOOD] == doctest::Approx(48.0));
    CHECK(f.village.populationHistory.size() == 1);
    CHECK(f.village.populationHistory.back() == doctest::Approx(11.0));
    CHECK(f.random.calls() == 1);
}

TEST_CASE("a fed village stays put when the draw fails") {
    PopulationFixture f(kNeverFire);
    f.feed();
    f.population.updatePopulation(f.village, f.time);
    CHECK(f.village.population == doctest::Approx(10.0));
}

TEST_CASE("growth never passes the population cap and widens the collection radius") {
    PopulationFixture f(kAlwaysFire);
    f.config.population.maxPopulation = 25.0;
    PopulationManager capped(f.config, f.handler, f.random);
    f.feed();
    f.village.population = 24.0;
    f.village.storage[Resource::Type::FOOD] = 200.0;
    f.village.economy.production[Resource::Type::FOOD] = 20.0;
    f.village.syncStockFromStorage();

    capped.updatePopulation(f.village, f.time);
    CHECK(f.village.population == doctest::Approx(25.0));
    CHECK(f.village.collectionRadius == 2);

    capped.updatePopulation(f.village, f.time);
    CHECK(f.village.population == doctest::Approx(25.0));
}

TEST_CASE("decline requires a food crisis") {
    PopulationFixture f(kNeverFire);
    f.starve();
    CHECK(f.population.shouldPopulationDecrease(f.village));
    CHECK(f.population.isFoodExhausted(f.village));

    Village notCritical = f.village;
    notCritical.economy.supplyDemandStatus[Resource::Type::FOOD] = SupplyDemandLevel::Shortage;
    CHECK_FALSE(f.population.shouldPopulationDecrease(notCritical));

    Village producing = f.village;
    producing.economy.production[Resource::Type::FOOD] = 5.0;
    CHECK_FALSE(f.population.shouldPopulationDecrease(producing));

    Village alone = f.village;
    alone.population = 1.0;
    CHECK_FALSE(f.population.shouldPopulationDecrease(alone));
}

TEST_CASE("a starving village loses people within a bounded number of ticks") {
    PopulationFixture f(kNeverFire);
    f.starve();
    const int guarantee = f.config.population.exhaustionGuaranteeTicks;

    for (int tick = 1; tick < guarantee; ++tick) {
        f.population.updatePopulation(f.village, f.time);
        CHECK(f.village.population == doctest::Approx(10.0));
        CHECK(f.village.starvationTicks == tick);
    }
    f.population.updatePopulation(f.village, f.time);
    CHECK(f.village.population == doctest::Approx(9.0));
    CHECK(f.village.starvationTicks == 0);
    CHECK(f.village.populationHistory.back() == doctest::Approx(9.0));
}

TEST_CASE("starvation never empties a village") {
    PopulationFixture f(kAlwaysFire);
    f.starve();
    for (int tick = 0; tick < 100; ++tick) {
        f.population.updatePopulation(f.village, f.time);
        CHECK(f.village.population >= 1.0);
    }
    CHECK(f.village.population == doctest::Approx(1.0));
    CHECK(f.village.collectionRadius == 1);
}

TEST_CASE("recovering food supply resets the starvation counter") {
    PopulationFixture f(kNeverFire);
    f.starve();
    f.population.updatePopulation(f.village, f.time);
    f.population.updatePopulation(f.village, f.time);
    CHECK(f.village.starvationTicks == 2);

    f.feed();
    f.population.updatePopulation(f.village, f.time);
    CHECK(f.village.starvationTicks == 0);
}

TEST_CASE("an empty or corrupt population is raised to one") {
    PopulationFixture f(kNeverFire);
    f.village.population = 0.0;
    f.population.updatePopulation(f.village, f.time);
    CHECK(f.village.population == doctest::Approx(1.0));

    f.village.population = std::numeric_limits<double>::quiet_NaN();
    f.population.updatePopulation(f.village, f.time);
    CHECK(f.village.population == doctest::Approx(1.0));
    CHECK(f.handler.getErrorStatistics().errorsByType.at(EconomyErrorType::DataIntegrity) >= 2);
}

TEST_CASE("population stats summarize the village") {
    PopulationFixture f(kNeverFire);
    f.feed();
    const PopulationStats stats = f.population.getPopulationStats(f.village);
    CHECK(stats.currentPopulation == doctest::Approx(10.0));
    CHECK(stats.foodConsumption == doctest::Approx(2.0));
    CHECK(stats.canGrow);
    CHECK_FALSE(stats.shouldDecline);
    CHECK(stats.trend == PopulationTrend::Stable);
}

} // TEST_SUITE
