#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

struct SimulationConfig {
    struct Resources {
        double depletionRate = 0.10;
        double recoveryRate = 0.02;      // fraction of max regrown per recovery step
        double recoveryDelay = 5.0;      // ticks after a harvest before regrowth starts
        double minRecoveryThreshold = 0.10;
        // [terrain][resource] multipliers, terrain order water/land/forest/mountain/road,
        // resource order food/wood/ore.
        std::array<std::array<double, 3>, 5> typeMultipliers{{
            {{0.0, 0.0, 0.0}},
            {{1.5, 0.5, 0.3}},
            {{0.8, 2.0, 0.2}},
            {{0.3, 0.5, 2.5}},
            {{0.1, 0.1, 0.1}}
        }};
    } resources{};

    struct SupplyDemand {
        double foodConsumptionPerPerson = 0.2;
        double populationGrowthRate = 0.02;
        double populationDeclineRate = 0.05;
        double buildingsPerPopulation = 0.1;
        double buildingWoodCost = 10.0;
        double buildingOreCost = 5.0;
        double surplusThreshold = 1.5;
        double shortageThreshold = 0.8;
        double criticalThreshold = 0.3;
        double baseStorageCapacity = 100.0;
        double storageCapacityPerBuilding = 20.0;
    } supplyDemand{};

    struct Production {
        double baseProductionRate = 1.0;
        double foodYield = 0.10;
        double woodYield = 0.08;
        double oreYield = 0.05;
        double populationBonusPivot = 10.0;
        double populationBonusPerPerson = 0.02;
        double populationBonusMax = 2.0;
        double buildingBonusPerBuilding = 0.10;
        double buildingBonusMax = 1.5;
        double consumptionEfficiencySlope = 0.002;
        double consumptionEfficiencyFloor = 0.8;
    } production{};

    struct Population {
        double maxPopulation = 100.0;
        double foodBufferHorizon = 3.0;
        double declineProductionRatio = 0.3;
        int exhaustionGuaranteeTicks = 5;
        int populationPerRadiusStep = 20;
        int maxCollectionRadius = 4;
        double initialPopulation = 10.0;
    } population{};

    struct Construction {
        double constructionTimePerBuilding = 5.0;
        int maxConcurrentConstruction = 3;
        double resourceBufferMultiplier = 2.0;
    } construction{};

    struct Balance {
        double criticalStockDays = 1.0;
        double shortageStockDays = 5.0;
        double surplusStockDays = 10.0;
        double supplierReserveDays = 3.0;
        double supplierStockShare = 0.1;
        double minDistanceDecay = 0.1;
        double defaultMaxSupplyDistance = 10.0;
    } balance{};

    struct Integrity {
        double populationMax = 1000.0;
        double populationDefault = 1.0;
        double resourceMax = 100000.0;
        double productionMax = 10000.0;
        double consumptionMax = 10000.0;
        int buildingsMax = 500;
        int constructionQueueMax = 10;
        int collectionRadiusMin = 1;
        int collectionRadiusMax = 10;
        double capacityMax = 200000.0;
        int maxLogSize = 1000;
    } integrity{};

    struct World {
        int mapSize = 50;
        int villageCount = 8;
        double deltaTime = 1.0;
        double tickBudgetMs = 16.67;
        bool logErrorsToConsole = true;
    } world{};

    bool applyResourcePreset(const std::string& presetName);
    static std::vector<std::string> resourcePresetNames();
};

struct ConfigValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

ConfigValidationResult validateConfig(const SimulationConfig& config);
// Returns a copy where every field that fails validation is replaced by its default.
SimulationConfig sanitizeConfig(const SimulationConfig& config);

struct GameTime {
    double currentTime = 0.0;
    double deltaTime = 1.0;
    std::uint64_t totalTicks = 0;
};

// Source of uniform [0,1) draws for probabilistic rules.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double next01() = 0;
};

class SeededRandom : public RandomSource {
public:
    explicit SeededRandom(std::uint64_t seed) : m_rng(seed) {}
    explicit SeededRandom(std::mt19937_64 rng) : m_rng(std::move(rng)) {}

    double next01() override;

private:
    std::mt19937_64 m_rng;
};

struct SimulationContext {
    std::uint64_t worldSeed = 0;
    std::mt19937_64 worldRng;
    SimulationConfig config;
    std::string configPath;
    std::string configHash;

    explicit SimulationContext(std::uint64_t seed, const std::string& runtimeConfigPath = "data/sim_config.toml");

    double rand01();
    int randInt(int a, int b); // inclusive

    bool loadConfig(const std::string& path, std::string* errorMessage = nullptr);
    static std::string hashFileFNV1a(const std::string& path);

    std::mt19937_64 makeRng(std::uint64_t salt) const;

    static std::uint64_t mix64(std::uint64_t x);
};
