#include "simulation_context.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string_view>
#include <type_traits>

#include <toml++/toml.hpp>

namespace {

template <typename T>
void readTomlValue(const toml::table& root,
                   std::string_view section,
                   std::string_view key,
                   T& target) {
    const toml::node_view<const toml::node> view = root[section][key];
    if constexpr (std::is_same_v<T, int>) {
        if (const auto v = view.value<std::int64_t>()) {
            target = static_cast<int>(*v);
        }
    } else if constexpr (std::is_same_v<T, double>) {
        if (const auto v = view.value<double>()) {
            target = *v;
        } else if (const auto vi = view.value<std::int64_t>()) {
            target = static_cast<double>(*vi);
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const auto v = view.value<bool>()) {
            target = *v;
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const auto v = view.value<std::string>()) {
            target = *v;
        }
    }
}

const char* const kTerrainKeys[5] = {"water", "land", "forest", "mountain", "road"};
const char* const kResourceKeys[3] = {"food", "wood", "ore"};

struct Range {
    double min;
    double max;
    double recommendedMin;
    double recommendedMax;
};

// Calls fn(name, value, defaultValue, range) for every bounded floating-point knob.
template <typename Fn>
void visitBoundedFields(SimulationConfig& c, Fn&& fn) {
    const SimulationConfig d{};
    fn("resources.depletionRate", c.resources.depletionRate, d.resources.depletionRate, Range{0.0, 1.0, 0.05, 0.3});
    fn("resources.recoveryRate", c.resources.recoveryRate, d.resources.recoveryRate, Range{0.0, 1.0, 0.01, 0.1});
    fn("resources.recoveryDelay", c.resources.recoveryDelay, d.resources.recoveryDelay, Range{0.0, 60.0, 3.0, 15.0});
    fn("resources.minRecoveryThreshold", c.resources.minRecoveryThreshold, d.resources.minRecoveryThreshold,
       Range{0.0, 1.0, 0.05, 0.3});

    fn("supplyDemand.foodConsumptionPerPerson", c.supplyDemand.foodConsumptionPerPerson,
       d.supplyDemand.foodConsumptionPerPerson, Range{0.1, 2.0, 0.15, 0.5});
    fn("supplyDemand.populationGrowthRate", c.supplyDemand.populationGrowthRate,
       d.supplyDemand.populationGrowthRate, Range{0.001, 0.1, 0.01, 0.05});
    fn("supplyDemand.populationDeclineRate", c.supplyDemand.populationDeclineRate,
       d.supplyDemand.populationDeclineRate, Range{0.001, 0.2, 0.02, 0.1});
    fn("supplyDemand.buildingsPerPopulation", c.supplyDemand.buildingsPerPopulation,
       d.supplyDemand.buildingsPerPopulation, Range{0.05, 1.0, 0.08, 0.2});
    fn("supplyDemand.buildingWoodCost", c.supplyDemand.buildingWoodCost, d.supplyDemand.buildingWoodCost,
       Range{1.0, 100.0, 5.0, 20.0});
    fn("supplyDemand.buildingOreCost", c.supplyDemand.buildingOreCost, d.supplyDemand.buildingOreCost,
       Range{1.0, 50.0, 2.0, 15.0});
    fn("supplyDemand.surplusThreshold", c.supplyDemand.surplusThreshold, d.supplyDemand.surplusThreshold,
       Range{1.1, 3.0, 1.2, 2.0});
    fn("supplyDemand.shortageThreshold", c.supplyDemand.shortageThreshold, d.supplyDemand.shortageThreshold,
       Range{0.3, 0.95, 0.6, 0.9});
    fn("supplyDemand.criticalThreshold", c.supplyDemand.criticalThreshold, d.supplyDemand.criticalThreshold,
       Range{0.1, 0.6, 0.2, 0.5});
    fn("supplyDemand.baseStorageCapacity", c.supplyDemand.baseStorageCapacity, d.supplyDemand.baseStorageCapacity,
       Range{50.0, 500.0, 80.0, 200.0});
    fn("supplyDemand.storageCapacityPerBuilding", c.supplyDemand.storageCapacityPerBuilding,
       d.supplyDemand.storageCapacityPerBuilding, Range{5.0, 100.0, 10.0, 50.0});

    fn("population.maxPopulation", c.population.maxPopulation, d.population.maxPopulation,
       Range{1.0, c.integrity.populationMax, 20.0, 500.0});
    fn("population.foodBufferHorizon", c.population.foodBufferHorizon, d.population.foodBufferHorizon,
       Range{0.0, 100.0, 1.0, 10.0});
    fn("population.declineProductionRatio", c.population.declineProductionRatio,
       d.population.declineProductionRatio, Range{0.0, 1.0, 0.1, 0.5});

    fn("construction.constructionTimePerBuilding", c.construction.constructionTimePerBuilding,
       d.construction.constructionTimePerBuilding, Range{0.1, 1000.0, 1.0, 30.0});

    fn("world.deltaTime", c.world.deltaTime, d.world.deltaTime, Range{0.001, 1000.0, 0.1, 10.0});
    fn("world.tickBudgetMs", c.world.tickBudgetMs, d.world.tickBudgetMs, Range{0.1, 60000.0, 1.0, 1000.0});
}

std::string describeRange(const char* name, double value, const Range& r) {
    std::ostringstream oss;
    oss << name << "=" << value << " outside [" << r.min << ", " << r.max << "]";
    return oss.str();
}

bool thresholdsOrdered(const SimulationConfig::SupplyDemand& s) {
    return s.criticalThreshold < s.shortageThreshold && s.shortageThreshold < s.surplusThreshold;
}

struct ResourcePreset {
    const char* name;
    SimulationConfig::Resources resources;
};

std::vector<ResourcePreset> resourcePresets() {
    std::vector<ResourcePreset> presets;

    SimulationConfig::Resources easy;
    easy.depletionRate = 0.05;
    easy.recoveryRate = 0.04;
    easy.recoveryDelay = 3.0;
    easy.minRecoveryThreshold = 0.2;
    easy.typeMultipliers = {{
        {{0.0, 0.0, 0.0}},
        {{2.0, 0.8, 0.5}},
        {{1.2, 2.5, 0.3}},
        {{0.5, 0.8, 3.0}},
        {{0.1, 0.1, 0.1}}
    }};
    presets.push_back({"easy", easy});

    presets.push_back({"normal", SimulationConfig::Resources{}});

    SimulationConfig::Resources hard;
    hard.depletionRate = 0.15;
    hard.recoveryRate = 0.01;
    hard.recoveryDelay = 10.0;
    hard.minRecoveryThreshold = 0.05;
    hard.typeMultipliers = {{
        {{0.0, 0.0, 0.0}},
        {{1.2, 0.3, 0.2}},
        {{0.5, 1.5, 0.1}},
        {{0.2, 0.3, 2.0}},
        {{0.05, 0.05, 0.05}}
    }};
    presets.push_back({"hard", hard});

    SimulationConfig::Resources extreme;
    extreme.depletionRate = 0.25;
    extreme.recoveryRate = 0.005;
    extreme.recoveryDelay = 15.0;
    extreme.minRecoveryThreshold = 0.02;
    extreme.typeMultipliers = {{
        {{0.0, 0.0, 0.0}},
        {{1.0, 0.2, 0.1}},
        {{0.3, 1.2, 0.05}},
        {{0.1, 0.2, 1.5}},
        {{0.02, 0.02, 0.02}}
    }};
    presets.push_back({"extreme", extreme});

    return presets;
}

} // namespace

bool SimulationConfig::applyResourcePreset(const std::string& presetName) {
    for (const ResourcePreset& preset : resourcePresets()) {
        if (presetName == preset.name) {
            resources = preset.resources;
            return true;
        }
    }
    return false;
}

std::vector<std::string> SimulationConfig::resourcePresetNames() {
    std::vector<std::string> names;
    for (const ResourcePreset& preset : resourcePresets()) {
        names.emplace_back(preset.name);
    }
    return names;
}

ConfigValidationResult validateConfig(const SimulationConfig& config) {
    ConfigValidationResult result;
    SimulationConfig scratch = config;

    visitBoundedFields(scratch, [&](const char* name, double& value, double, const Range& r) {
        if (!std::isfinite(value) || value < r.min || value > r.max) {
            result.errors.push_back(describeRange(name, value, r));
        } else if (value < r.recommendedMin || value > r.recommendedMax) {
            std::ostringstream oss;
            oss << name << "=" << value << " outside recommended [" << r.recommendedMin << ", "
                << r.recommendedMax << "]";
            result.warnings.push_back(oss.str());
        }
    });

    if (!thresholdsOrdered(config.supplyDemand)) {
        result.errors.push_back("supplyDemand thresholds must satisfy critical < shortage < surplus");
    }

    for (int t = 0; t < 5; ++t) {
        for (int r = 0; r < 3; ++r) {
            const double m = config.resources.typeMultipliers[static_cast<size_t>(t)][static_cast<size_t>(r)];
            std::ostringstream name;
            name << "resources.typeMultipliers." << kTerrainKeys[t] << "." << kResourceKeys[r];
            if (!std::isfinite(m) || m < 0.0) {
                result.errors.push_back(name.str() + " must be non-negative");
            } else if (m > 10.0) {
                result.warnings.push_back(name.str() + " above 10 may cause very rapid recovery");
            }
        }
    }

    if (config.resources.depletionRate > config.resources.recoveryRate * 10.0) {
        result.warnings.push_back("depletionRate is much higher than recoveryRate, resources may stay depleted");
    }

    if (config.population.exhaustionGuaranteeTicks < 1) {
        result.errors.push_back("population.exhaustionGuaranteeTicks must be >= 1");
    }
    if (config.population.populationPerRadiusStep < 1) {
        result.errors.push_back("population.populationPerRadiusStep must be >= 1");
    }
    if (config.population.maxCollectionRadius < config.integrity.collectionRadiusMin ||
        config.population.maxCollectionRadius > config.integrity.collectionRadiusMax) {
        result.errors.push_back("population.maxCollectionRadius outside the integrity radius range");
    }
    if (config.construction.maxConcurrentConstruction < 1 ||
        config.construction.maxConcurrentConstruction > config.integrity.constructionQueueMax) {
        result.errors.push_back("construction.maxConcurrentConstruction outside [1, integrity.constructionQueueMax]");
    }
    if (config.world.mapSize < 1) {
        result.errors.push_back("world.mapSize must be >= 1");
    }
    if (config.world.villageCount < 0) {
        result.errors.push_back("world.villageCount must be >= 0");
    }

    result.isValid = result.errors.empty();
    return result;
}

SimulationConfig sanitizeConfig(const SimulationConfig& config) {
    SimulationConfig out = config;
    const SimulationConfig d{};

    visitBoundedFields(out, [](const char*, double& value, double defaultValue, const Range& r) {
        if (!std::isfinite(value) || value < r.min || value > r.max) {
            value = defaultValue;
        }
    });

    if (!thresholdsOrdered(out.supplyDemand)) {
        out.supplyDemand.criticalThreshold = d.supplyDemand.criticalThreshold;
        out.supplyDemand.shortageThreshold = d.supplyDemand.shortageThreshold;
        out.supplyDemand.surplusThreshold = d.supplyDemand.surplusThreshold;
    }

    for (size_t t = 0; t < 5; ++t) {
        for (size_t r = 0; r < 3; ++r) {
            double& m = out.resources.typeMultipliers[t][r];
            if (!std::isfinite(m) || m < 0.0) {
                m = d.resources.typeMultipliers[t][r];
            }
        }
    }

    if (out.population.exhaustionGuaranteeTicks < 1) {
        out.population.exhaustionGuaranteeTicks = d.population.exhaustionGuaranteeTicks;
    }
    if (out.population.populationPerRadiusStep < 1) {
        out.population.populationPerRadiusStep = d.population.populationPerRadiusStep;
    }
    if (out.population.maxCollectionRadius < out.integrity.collectionRadiusMin ||
        out.population.maxCollectionRadius > out.integrity.collectionRadiusMax) {
        out.population.maxCollectionRadius = d.population.maxCollectionRadius;
    }
    if (out.construction.maxConcurrentConstruction < 1 ||
        out.construction.maxConcurrentConstruction > out.integrity.constructionQueueMax) {
        out.construction.maxConcurrentConstruction = d.construction.maxConcurrentConstruction;
    }
    if (out.world.mapSize < 1) {
        out.world.mapSize = d.world.mapSize;
    }
    if (out.world.villageCount < 0) {
        out.world.villageCount = d.world.villageCount;
    }
    return out;
}

double SeededRandom::next01() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(m_rng);
}

SimulationContext::SimulationContext(std::uint64_t seed, const std::string& runtimeConfigPath)
    : worldSeed(seed), worldRng(seed), config(), configPath(runtimeConfigPath), configHash("defaults") {
    if (!runtimeConfigPath.empty()) {
        std::string err;
        if (!loadConfig(runtimeConfigPath, &err)) {
            std::cerr << "[Config] " << err << " Using built-in defaults.\n";
        }
    }
}

double SimulationContext::rand01() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(worldRng);
}

int SimulationContext::randInt(int a, int b) {
    if (a > b) {
        std::swap(a, b);
    }
    std::uniform_int_distribution<int> dist(a, b);
    return dist(worldRng);
}

bool SimulationContext::loadConfig(const std::string& path, std::string* errorMessage) {
    config = SimulationConfig{};
    configPath = path;
    configHash = "defaults";

    if (path.empty()) {
        return true;
    }

    try {
        toml::table root = toml::parse_file(path);
        SimulationConfig loaded;

        std::string preset;
        readTomlValue(root, "resources", "preset", preset);
        if (!preset.empty() && !loaded.applyResourcePreset(preset)) {
            std::cerr << "[Config] Unknown resource preset '" << preset << "', keeping normal.\n";
        }
        readTomlValue(root, "resources", "depletionRate", loaded.resources.depletionRate);
        readTomlValue(root, "resources", "recoveryRate", loaded.resources.recoveryRate);
        readTomlValue(root, "resources", "recoveryDelay", loaded.resources.recoveryDelay);
        readTomlValue(root, "resources", "minRecoveryThreshold", loaded.resources.minRecoveryThreshold);
        for (size_t t = 0; t < 5; ++t) {
            for (size_t r = 0; r < 3; ++r) {
                const auto view = root["resources"]["typeMultipliers"][kTerrainKeys[t]][kResourceKeys[r]];
                if (const auto v = view.value<double>()) {
                    loaded.resources.typeMultipliers[t][r] = *v;
                } else if (const auto vi = view.value<std::int64_t>()) {
                    loaded.resources.typeMultipliers[t][r] = static_cast<double>(*vi);
                }
            }
        }

        readTomlValue(root, "supplyDemand", "foodConsumptionPerPerson", loaded.supplyDemand.foodConsumptionPerPerson);
        readTomlValue(root, "supplyDemand", "populationGrowthRate", loaded.supplyDemand.populationGrowthRate);
        readTomlValue(root, "supplyDemand", "populationDeclineRate", loaded.supplyDemand.populationDeclineRate);
        readTomlValue(root, "supplyDemand", "buildingsPerPopulation", loaded.supplyDemand.buildingsPerPopulation);
        readTomlValue(root, "supplyDemand", "buildingWoodCost", loaded.supplyDemand.buildingWoodCost);
        readTomlValue(root, "supplyDemand", "buildingOreCost", loaded.supplyDemand.buildingOreCost);
        readTomlValue(root, "supplyDemand", "surplusThreshold", loaded.supplyDemand.surplusThreshold);
        readTomlValue(root, "supplyDemand", "shortageThreshold", loaded.supplyDemand.shortageThreshold);
        readTomlValue(root, "supplyDemand", "criticalThreshold", loaded.supplyDemand.criticalThreshold);
        readTomlValue(root, "supplyDemand", "baseStorageCapacity", loaded.supplyDemand.baseStorageCapacity);
        readTomlValue(root, "supplyDemand", "storageCapacityPerBuilding", loaded.supplyDemand.storageCapacityPerBuilding);

        readTomlValue(root, "production", "baseProductionRate", loaded.production.baseProductionRate);
        readTomlValue(root, "production", "foodYield", loaded.production.foodYield);
        readTomlValue(root, "production", "woodYield", loaded.production.woodYield);
        readTomlValue(root, "production", "oreYield", loaded.production.oreYield);
        readTomlValue(root, "production", "populationBonusPivot", loaded.production.populationBonusPivot);
        readTomlValue(root, "production", "populationBonusPerPerson", loaded.production.populationBonusPerPerson);
        readTomlValue(root, "production", "populationBonusMax", loaded.production.populationBonusMax);
        readTomlValue(root, "production", "buildingBonusPerBuilding", loaded.production.buildingBonusPerBuilding);
        readTomlValue(root, "production", "buildingBonusMax", loaded.production.buildingBonusMax);
        readTomlValue(root, "production", "consumptionEfficiencySlope", loaded.production.consumptionEfficiencySlope);
        readTomlValue(root, "production", "consumptionEfficiencyFloor", loaded.production.consumptionEfficiencyFloor);

        readTomlValue(root, "population", "maxPopulation", loaded.population.maxPopulation);
        readTomlValue(root, "population", "foodBufferHorizon", loaded.population.foodBufferHorizon);
        readTomlValue(root, "population", "declineProductionRatio", loaded.population.declineProductionRatio);
        readTomlValue(root, "population", "exhaustionGuaranteeTicks", loaded.population.exhaustionGuaranteeTicks);
        readTomlValue(root, "population", "populationPerRadiusStep", loaded.population.populationPerRadiusStep);
        readTomlValue(root, "population", "maxCollectionRadius", loaded.population.maxCollectionRadius);
        readTomlValue(root, "population", "initialPopulation", loaded.population.initialPopulation);

        readTomlValue(root, "construction", "constructionTimePerBuilding",
                      loaded.construction.constructionTimePerBuilding);
        readTomlValue(root, "construction", "maxConcurrentConstruction", loaded.construction.maxConcurrentConstruction);
        readTomlValue(root, "construction", "resourceBufferMultiplier", loaded.construction.resourceBufferMultiplier);

        readTomlValue(root, "balance", "criticalStockDays", loaded.balance.criticalStockDays);
        readTomlValue(root, "balance", "shortageStockDays", loaded.balance.shortageStockDays);
        readTomlValue(root, "balance", "surplusStockDays", loaded.balance.surplusStockDays);
        readTomlValue(root, "balance", "supplierReserveDays", loaded.balance.supplierReserveDays);
        readTomlValue(root, "balance", "supplierStockShare", loaded.balance.supplierStockShare);
        readTomlValue(root, "balance", "minDistanceDecay", loaded.balance.minDistanceDecay);
        readTomlValue(root, "balance", "defaultMaxSupplyDistance", loaded.balance.defaultMaxSupplyDistance);

        readTomlValue(root, "world", "mapSize", loaded.world.mapSize);
        readTomlValue(root, "world", "villageCount", loaded.world.villageCount);
        readTomlValue(root, "world", "deltaTime", loaded.world.deltaTime);
        readTomlValue(root, "world", "tickBudgetMs", loaded.world.tickBudgetMs);
        readTomlValue(root, "world", "logErrorsToConsole", loaded.world.logErrorsToConsole);

        const ConfigValidationResult validation = validateConfig(loaded);
        for (const std::string& w : validation.warnings) {
            std::cout << "[Config] warning: " << w << "\n";
        }
        if (!validation.isValid) {
            for (const std::string& e : validation.errors) {
                std::cerr << "[Config] invalid: " << e << " (using default)\n";
            }
            loaded = sanitizeConfig(loaded);
        }

        config = loaded;
        configHash = hashFileFNV1a(path);
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse config '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load config '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }

    return false;
}

std::string SimulationContext::hashFileFNV1a(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return "missing";
    }
    std::uint64_t h = 1469598103934665603ull;
    constexpr std::uint64_t prime = 1099511628211ull;
    char buffer[4096];
    while (in.good()) {
        in.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
        const std::streamsize n = in.gcount();
        for (std::streamsize i = 0; i < n; ++i) {
            h ^= static_cast<std::uint8_t>(buffer[i]);
            h *= prime;
        }
    }
    std::ostringstream oss;
    oss << std::hex << h;
    return oss.str();
}

std::mt19937_64 SimulationContext::makeRng(std::uint64_t salt) const {
    return std::mt19937_64(mix64(worldSeed ^ salt));
}

std::uint64_t SimulationContext::mix64(std::uint64_t x) {
    // SplitMix64 finalizer.
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}
