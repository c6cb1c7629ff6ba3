#include <doctest/doctest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

#include "economy_error_handler.h"
#include "test_support.h"

namespace {

Village sampleVillage() {
    return makeVillage(sf::Vector2i(3, 4), quietConfig());
}

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();

} // namespace

TEST_SUITE("economy error handler") {

TEST_CASE("a fresh village passes validation") {
    EconomyErrorHandler handler(quietConfig());
    const ValidationResult result = handler.validateVillageEconomy(sampleVillage());
    CHECK(result.isValid);
    CHECK(result.errors.empty());
}

TEST_CASE("validation flags range breaches, non-finite values and stock drift") {
    EconomyErrorHandler handler(quietConfig());

    Village negative = sampleVillage();
    negative.storage[Resource::Type::WOOD] = -5.0;
    negative.syncStockFromStorage();
    CHECK_FALSE(handler.validateVillageEconomy(negative).isValid);

    Village nan = sampleVillage();
    nan.population = kNaN;
    const ValidationResult nanResult = handler.validateVillageEconomy(nan);
    CHECK_FALSE(nanResult.isValid);
    CHECK(nanResult.errors.front().type == EconomyErrorType::DataIntegrity);
    CHECK(nanResult.errors.front().villageId == "3,4");

    Village drift = sampleVillage();
    drift.economy.stock.amounts[Resource::Type::FOOD] = 99.0;
    CHECK_FALSE(handler.validateVillageEconomy(drift).isValid);

    Village queue = sampleVillage();
    queue.economy.buildings.constructionQueue = 11;
    CHECK_FALSE(handler.validateVillageEconomy(queue).isValid);
}

TEST_CASE("validation warns without failing on suspicious ratios") {
    EconomyErrorHandler handler(quietConfig());
    Village v = sampleVillage();
    v.economy.production[Resource::Type::FOOD] = 0.1;
    v.economy.consumption[Resource::Type::FOOD] = 5.0;
    v.economy.buildings.count = 50;

    const ValidationResult result = handler.validateVillageEconomy(v);
    CHECK(result.isValid);
    CHECK(result.warnings.size() == 2);
}

TEST_CASE("correction clamps fields, resyncs stock and logs each change") {
    EconomyErrorHandler handler(quietConfig());
    Village v = sampleVillage();
    v.population = kNaN;
    v.storage[Resource::Type::FOOD] = -5.0;
    v.storage[Resource::Type::ORE] = kInf;
    v.economy.buildings.constructionQueue = 50;
    v.collectionRadius = 0;
    v.economy.stock.capacity = kNaN;

    CHECK(handler.correctInvalidValues(v));
    CHECK(v.population == doctest::Approx(1.0));
    CHECK(v.storage[Resource::Type::FOOD] == 0.0);
    CHECK(v.storage[Resource::Type::ORE] == 0.0);
    CHECK(v.economy.buildings.constructionQueue == 10);
    CHECK(v.collectionRadius == 1);
    CHECK(v.economy.stock.capacity == doctest::Approx(100.0));
    CHECK(v.economy.stock.amounts == v.storage);

    CHECK(handler.validateVillageEconomy(v).isValid);
    CHECK(handler.getErrorLog().size() >= 6);

    // Nothing left to fix.
    CHECK_FALSE(handler.correctInvalidValues(v));
}

TEST_CASE("population survives correction for arbitrary inputs") {
    EconomyErrorHandler handler(quietConfig());
    for (double p : {-1e9, -5.0, -0.0, 0.0, 0.5, 1.0, 37.0, 999.9, 1000.0, 1000.1, 1e12, kInf, -kInf, kNaN}) {
        CAPTURE(p);
        Village v = sampleVillage();
        v.population = p;
        handler.correctInvalidValues(v);
        CHECK(std::isfinite(v.population));
        CHECK(v.population >= 0.0);
        CHECK(v.population <= 1000.0);
        CHECK(handler.validateVillageEconomy(v).isValid);
    }
}

TEST_CASE("safeCalculation returns the value or the fallback") {
    EconomyErrorHandler handler(quietConfig());

    CHECK(handler.safeCalculation([]() { return 4.5; }, 0.0, "plain") == doctest::Approx(4.5));
    CHECK(handler.getTotalErrorsLogged() == 0);

    CHECK(handler.safeCalculation([]() { return kNaN; }, -1.0, "nan", "1,1") == doctest::Approx(-1.0));
    CHECK(handler.safeCalculation([]() -> double { throw std::runtime_error("boom"); }, 2.0, "throws", "1,1") ==
          doctest::Approx(2.0));
    CHECK(handler.safeCalculation([]() { return CalcResult<double>::failure("bad input"); }, 3.0, "failure", "1,1") ==
          doctest::Approx(3.0));
    CHECK(handler.safeCalculation([]() { return CalcResult<double>::success(7.0); }, 3.0, "success", "1,1") ==
          doctest::Approx(7.0));

    const ResourceAmounts fallback = ResourceAmounts::of(1.0, 1.0, 1.0);
    const ResourceAmounts result = handler.safeCalculation(
        []() { return ResourceAmounts::of(1.0, kInf, 0.0); }, fallback, "amounts", "1,1");
    CHECK(result == fallback);

    const ErrorStatistics stats = handler.getErrorStatistics();
    CHECK(stats.totalErrors == 4);
    CHECK(stats.errorsByType.at(EconomyErrorType::Calculation) == 4);
    CHECK(stats.errorsByType.at(EconomyErrorType::DataIntegrity) == 0);
    CHECK(stats.errorsByVillage.at("1,1") == 4);

    const std::vector<EconomyError> log = handler.getErrorLog();
    REQUIRE(log.size() == 4);
    CHECK(log[1].message.find("boom") != std::string::npos);
    CHECK(log[1].message.find("throws") != std::string::npos);
}

TEST_CASE("the error log is bounded but totals keep counting") {
    SimulationConfig config = quietConfig();
    config.integrity.maxLogSize = 3;
    EconomyErrorHandler handler(config);

    handler.setCurrentTick(2.0);
    for (int i = 0; i < 5; ++i) {
        handler.logError(i % 2 == 0 ? "a" : "b", EconomyErrorType::DataIntegrity, "entry " + std::to_string(i), "none");
    }
    const std::vector<EconomyError> log = handler.getErrorLog();
    REQUIRE(log.size() == 3);
    CHECK(log.front().message == "entry 2");
    CHECK(log.back().message == "entry 4");
    CHECK(log.back().tick == doctest::Approx(2.0));
    CHECK(handler.getTotalErrorsLogged() == 5);

    CHECK(handler.getErrorLog(1).size() == 1);
    CHECK(handler.getErrorLog(1).front().message == "entry 4");

    const std::vector<EconomyError> forA = handler.getVillageErrorLog("a");
    REQUIRE(forA.size() == 2);
    CHECK(forA.front().message == "entry 2");
    CHECK(handler.getVillageErrorLog("a", 1).front().message == "entry 4");

    handler.clearErrorLog();
    CHECK(handler.getErrorLog().empty());
    CHECK(handler.getErrorStatistics().totalErrors == 0);
    CHECK(handler.getTotalErrorsLogged() == 5);
}

TEST_CASE("resetting an economy restores a valid state") {
    EconomyErrorHandler handler(quietConfig());
    Village v = sampleVillage();
    v.economy.production = ResourceAmounts::of(kNaN, 3.0, 1.0);
    v.economy.consumption = ResourceAmounts::of(2.0, kInf, 0.0);
    v.economy.buildings.count = 4;
    v.economy.buildings.targetCount = 9;
    v.economy.buildings.constructionQueue = 2;
    v.economy.supplyDemandStatus = SupplyDemandStatus::filled(SupplyDemandLevel::Critical);
    v.storage[Resource::Type::WOOD] = kNaN;
    v.economy.stock.capacity = 7.0;

    handler.resetVillageEconomyToDefaults(v);
    CHECK(v.economy.production == ResourceAmounts{});
    CHECK(v.economy.consumption == ResourceAmounts{});
    CHECK(v.economy.buildings.count == 4);
    CHECK(v.economy.buildings.targetCount == 0);
    CHECK(v.economy.buildings.constructionQueue == 0);
    CHECK(v.economy.supplyDemandStatus == SupplyDemandStatus::filled(SupplyDemandLevel::Balanced));
    CHECK(v.storage[Resource::Type::WOOD] == 0.0);
    CHECK(v.storage[Resource::Type::FOOD] == doctest::Approx(5.0));
    CHECK(v.economy.stock.capacity == doctest::Approx(100.0));
    CHECK(handler.getResetCount() == 1);
    CHECK(handler.validateVillageEconomy(v).isValid);
}

TEST_CASE("error type names") {
    CHECK(std::string(economyErrorTypeName(EconomyErrorType::DataIntegrity)) == "data_integrity");
    CHECK(std::string(economyErrorTypeName(EconomyErrorType::Calculation)) == "calculation");
}

} // TEST_SUITE
