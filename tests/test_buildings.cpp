#include <doctest/doctest.h>

#include "buildings.h"
#include "test_support.h"

namespace {

struct BuildingFixture {
    SimulationConfig config = quietConfig();
    EconomyErrorHandler handler{config};
    BuildingManager buildings{config, handler};
    Village village = makeVillage(sf::Vector2i(0, 0), config);

    void stock(double wood, double ore) {
        village.storage[Resource::Type::WOOD] = wood;
        village.storage[Resource::Type::ORE] = ore;
        village.syncStockFromStorage();
    }
};

GameTime tickOf(double dt) {
    GameTime time;
    time.deltaTime = dt;
    return time;
}

} // namespace

TEST_SUITE("buildings") {

TEST_CASE("target count follows population with a floor of one and a ceiling of half") {
    CHECK(targetBuildingCount(20.0, 0.1) == 2);
    CHECK(targetBuildingCount(5.0, 0.1) == 1);
    CHECK(targetBuildingCount(0.0, 0.1) == 0);
    CHECK(targetBuildingCount(10.0, 0.9) == 5);
    CHECK(targetBuildingCount(1.0, 0.9) == 1);

    BuildingFixture f;
    CHECK(f.buildings.calculateTargetBuildingCount(100.0) == 10);
}

TEST_CASE("target count stays within one and half the population") {
    for (int p = 2; p <= 1000; ++p) {
        for (double ratio : {0.0, 0.05, 0.1, 0.5, 1.0}) {
            CAPTURE(p);
            CAPTURE(ratio);
            const int target = targetBuildingCount(static_cast<double>(p), ratio);
            CHECK(target >= 1);
            CHECK(target <= p / 2);
        }
    }
}

TEST_CASE("building cost comes from configuration") {
    BuildingFixture f;
    const BuildingCost cost = f.buildings.calculateBuildingCost();
    CHECK(cost.wood == doctest::Approx(10.0));
    CHECK(cost.ore == doctest::Approx(5.0));
}

TEST_CASE("building needs the cost plus a reserve and a free queue slot") {
    BuildingFixture f;
    f.stock(100.0, 50.0);
    CHECK(f.buildings.canBuildBuilding(f.village));

    f.stock(25.0, 50.0);
    CHECK_FALSE(f.buildings.canBuildBuilding(f.village));

    f.stock(100.0, 14.0);
    CHECK_FALSE(f.buildings.canBuildBuilding(f.village));

    f.stock(100.0, 50.0);
    f.village.economy.supplyDemandStatus[Resource::Type::ORE] = SupplyDemandLevel::Critical;
    CHECK_FALSE(f.buildings.canBuildBuilding(f.village));
    f.village.economy.supplyDemandStatus[Resource::Type::ORE] = SupplyDemandLevel::Shortage;
    CHECK(f.buildings.canBuildBuilding(f.village));

    f.village.economy.buildings.constructionQueue = f.config.construction.maxConcurrentConstruction;
    CHECK_FALSE(f.buildings.canBuildBuilding(f.village));
}

TEST_CASE("buildable count is limited by resources and queue room") {
    BuildingFixture f;
    f.stock(100.0, 50.0);
    CHECK(f.buildings.calculateMaxBuildableBuildings(f.village) == 3);

    f.stock(25.0, 50.0);
    CHECK(f.buildings.calculateMaxBuildableBuildings(f.village) == 2);

    f.stock(100.0, 50.0);
    f.village.economy.buildings.constructionQueue = 2;
    CHECK(f.buildings.calculateMaxBuildableBuildings(f.village) == 1);

    f.stock(0.0, 0.0);
    CHECK(f.buildings.calculateMaxBuildableBuildings(f.village) == 0);
}

TEST_CASE("a long tick completes the whole queue") {
    BuildingFixture f;
    f.village.economy.buildings.constructionQueue = 2;

    const int completed = f.buildings.processConstructionQueue(f.village, tickOf(10.0));
    CHECK(completed == 2);
    CHECK(f.village.economy.buildings.count == 2);
    CHECK(f.village.economy.buildings.constructionQueue == 0);
    CHECK(f.village.economy.buildings.constructionProgress == 0.0);
    CHECK(f.village.economy.stock.capacity == doctest::Approx(140.0));
}

TEST_CASE("short ticks accumulate progress until a building completes") {
    BuildingFixture f;
    f.village.economy.buildings.constructionQueue = 1;

    CHECK(f.buildings.processConstructionQueue(f.village, tickOf(1.0)) == 0);
    CHECK(f.village.economy.buildings.constructionProgress == doctest::Approx(0.2));

    int ticks = 1;
    while (f.village.economy.buildings.count == 0 && ticks < 10) {
        f.buildings.processConstructionQueue(f.village, tickOf(1.0));
        ++ticks;
    }
    CHECK(f.village.economy.buildings.count == 1);
    CHECK(ticks >= 5);
    CHECK(ticks <= 6);
    CHECK(f.village.economy.buildings.constructionQueue == 0);
}

TEST_CASE("an empty queue completes nothing") {
    BuildingFixture f;
    f.village.economy.buildings.constructionProgress = 0.7;
    CHECK(f.buildings.processConstructionQueue(f.village, tickOf(10.0)) == 0);
    CHECK(f.village.economy.buildings.count == 0);
    CHECK(f.village.economy.buildings.constructionProgress == 0.0);
}

TEST_CASE("update queues buildings towards the target and pays for them") {
    BuildingFixture f;
    f.village.population = 20.0;
    f.stock(100.0, 50.0);

    f.buildings.updateBuildings(f.village, tickOf(1.0));
    const Buildings& b = f.village.economy.buildings;
    CHECK(b.targetCount == 2);
    CHECK(b.constructionQueue == 2);
    CHECK(b.count == 0);
    CHECK(f.village.storage[Resource::Type::WOOD] == doctest::Approx(80.0));
    CHECK(f.village.storage[Resource::Type::ORE] == doctest::Approx(40.0));
    CHECK(f.village.economy.stock.amounts == f.village.storage);

    // Already queued, nothing more to start.
    f.buildings.updateBuildings(f.village, tickOf(1.0));
    CHECK(f.village.economy.buildings.constructionQueue == 2);
    CHECK(f.village.storage[Resource::Type::WOOD] == doctest::Approx(80.0));
}

TEST_CASE("update builds nothing without the reserve") {
    BuildingFixture f;
    f.village.population = 20.0;
    f.stock(15.0, 50.0);

    f.buildings.updateBuildings(f.village, tickOf(1.0));
    CHECK(f.village.economy.buildings.constructionQueue == 0);
    CHECK(f.village.storage[Resource::Type::WOOD] == doctest::Approx(15.0));
}

TEST_CASE("queued buildings finish on later updates") {
    BuildingFixture f;
    f.village.population = 20.0;
    f.stock(100.0, 50.0);

    f.buildings.updateBuildings(f.village, tickOf(1.0));
    REQUIRE(f.village.economy.buildings.constructionQueue == 2);
    f.buildings.updateBuildings(f.village, tickOf(10.0));
    CHECK(f.village.economy.buildings.count == 2);
    CHECK(f.village.economy.buildings.constructionQueue == 0);

    const BuildingStats stats = f.buildings.getBuildingStats(f.village);
    CHECK(stats.currentCount == 2);
    CHECK(stats.targetCount == 2);
    CHECK(stats.constructionQueue == 0);
    CHECK(stats.buildingCost.wood == doctest::Approx(10.0));
}

} // TEST_SUITE
