#include "economy_error_handler.h"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <sstream>

namespace {

std::string formatValue(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

void checkRange(const std::string& villageId, const std::string& field, double value, double minValue, double maxValue,
                double tick, std::vector<EconomyError>& errors) {
    if (!std::isfinite(value)) {
        errors.push_back({villageId, EconomyErrorType::DataIntegrity, field + " is not finite", "reset to default", tick});
    } else if (value < minValue || value > maxValue) {
        errors.push_back({villageId, EconomyErrorType::DataIntegrity,
                          field + " " + formatValue(value) + " outside [" + formatValue(minValue) + ", " + formatValue(maxValue) + "]",
                          "clamp to range", tick});
    }
}

} // namespace

const char* economyErrorTypeName(EconomyErrorType type) {
    switch (type) {
        case EconomyErrorType::DataIntegrity: return "data_integrity";
        case EconomyErrorType::Calculation: return "calculation";
    }
    return "unknown";
}

EconomyErrorHandler::EconomyErrorHandler(const SimulationConfig& config)
    : m_ranges(config.integrity),
      m_baseCapacity(config.supplyDemand.baseStorageCapacity),
      m_maxLogSize(static_cast<size_t>(std::max(1, config.integrity.maxLogSize))),
      m_consoleEcho(config.world.logErrorsToConsole) {}

ValidationResult EconomyErrorHandler::validateVillageEconomy(const Village& village) const {
    ValidationResult result;
    const std::string id = village.key();
    const VillageEconomy& eco = village.economy;

    checkRange(id, "population", village.population, 0.0, m_ranges.populationMax, m_currentTick, result.errors);
    checkRange(id, "collectionRadius", village.collectionRadius, m_ranges.collectionRadiusMin, m_ranges.collectionRadiusMax,
               m_currentTick, result.errors);
    if (!std::isfinite(village.lastUpdateTime)) {
        result.errors.push_back({id, EconomyErrorType::DataIntegrity, "lastUpdateTime is not finite", "reset to 0", m_currentTick});
    }

    for (Resource::Type r : Resource::kAllTypes) {
        const std::string name = Resource::name(r);
        checkRange(id, "storage." + name, village.storage[r], 0.0, m_ranges.resourceMax, m_currentTick, result.errors);
        checkRange(id, "stock." + name, eco.stock.amounts[r], 0.0, m_ranges.resourceMax, m_currentTick, result.errors);
        checkRange(id, "production." + name, eco.production[r], 0.0, m_ranges.productionMax, m_currentTick, result.errors);
        checkRange(id, "consumption." + name, eco.consumption[r], 0.0, m_ranges.consumptionMax, m_currentTick, result.errors);

        if (std::isfinite(village.storage[r]) && std::isfinite(eco.stock.amounts[r]) &&
            eco.stock.amounts[r] != village.storage[r]) {
            result.errors.push_back({id, EconomyErrorType::DataIntegrity,
                                     "stock." + name + " " + formatValue(eco.stock.amounts[r]) + " != storage " +
                                         formatValue(village.storage[r]),
                                     "resync stock from storage", m_currentTick});
        }
        if (std::isfinite(eco.production[r]) && std::isfinite(eco.consumption[r]) &&
            eco.consumption[r] > eco.production[r] * 10.0 && eco.consumption[r] > 0.0) {
            result.warnings.push_back(name + " consumption " + formatValue(eco.consumption[r]) +
                                      " exceeds ten times production " + formatValue(eco.production[r]));
        }
    }

    checkRange(id, "stock.capacity", eco.stock.capacity, 0.0, m_ranges.capacityMax, m_currentTick, result.errors);
    checkRange(id, "buildings.count", eco.buildings.count, 0, m_ranges.buildingsMax, m_currentTick, result.errors);
    checkRange(id, "buildings.targetCount", eco.buildings.targetCount, 0, m_ranges.buildingsMax, m_currentTick, result.errors);
    checkRange(id, "buildings.constructionQueue", eco.buildings.constructionQueue, 0, m_ranges.constructionQueueMax,
               m_currentTick, result.errors);

    if (std::isfinite(village.population) && eco.buildings.count > village.population) {
        result.warnings.push_back("buildings " + std::to_string(eco.buildings.count) + " exceed population " +
                                  formatValue(village.population));
    }

    result.isValid = result.errors.empty();
    return result;
}

bool EconomyErrorHandler::correctDouble(double& value, double minValue, double maxValue, double defaultValue,
                                        const std::string& villageId, const std::string& field) {
    const double original = value;
    if (!std::isfinite(value)) {
        value = defaultValue;
    } else {
        value = std::max(minValue, std::min(maxValue, value));
    }
    if (std::isfinite(original) && value == original) {
        return false;
    }
    logError(villageId, EconomyErrorType::DataIntegrity,
             field + " corrected: " + formatValue(original) + " -> " + formatValue(value), "automatic correction");
    return true;
}

bool EconomyErrorHandler::correctInt(int& value, int minValue, int maxValue, const std::string& villageId, const std::string& field) {
    const int original = value;
    value = std::max(minValue, std::min(maxValue, value));
    if (value == original) {
        return false;
    }
    logError(villageId, EconomyErrorType::DataIntegrity,
             field + " corrected: " + std::to_string(original) + " -> " + std::to_string(value), "automatic correction");
    return true;
}

bool EconomyErrorHandler::correctInvalidValues(Village& village) {
    const std::string id = village.key();
    VillageEconomy& eco = village.economy;
    bool corrected = false;

    corrected |= correctDouble(village.population, 0.0, m_ranges.populationMax, m_ranges.populationDefault, id, "population");
    corrected |= correctInt(village.collectionRadius, m_ranges.collectionRadiusMin, m_ranges.collectionRadiusMax, id, "collectionRadius");
    if (!std::isfinite(village.lastUpdateTime)) {
        corrected |= correctDouble(village.lastUpdateTime, 0.0, 0.0, 0.0, id, "lastUpdateTime");
    }

    for (Resource::Type r : Resource::kAllTypes) {
        const std::string name = Resource::name(r);
        corrected |= correctDouble(village.storage[r], 0.0, m_ranges.resourceMax, 0.0, id, "storage." + name);
        corrected |= correctDouble(eco.production[r], 0.0, m_ranges.productionMax, 0.0, id, "production." + name);
        corrected |= correctDouble(eco.consumption[r], 0.0, m_ranges.consumptionMax, 0.0, id, "consumption." + name);
    }

    corrected |= correctDouble(eco.stock.capacity, 0.0, m_ranges.capacityMax, m_baseCapacity, id, "stock.capacity");
    corrected |= correctInt(eco.buildings.count, 0, m_ranges.buildingsMax, id, "buildings.count");
    corrected |= correctInt(eco.buildings.targetCount, 0, m_ranges.buildingsMax, id, "buildings.targetCount");
    corrected |= correctInt(eco.buildings.constructionQueue, 0, m_ranges.constructionQueueMax, id, "buildings.constructionQueue");

    // Storage is authoritative; stock always mirrors it.
    for (Resource::Type r : Resource::kAllTypes) {
        if (!(eco.stock.amounts[r] == village.storage[r])) {
            logError(id, EconomyErrorType::DataIntegrity,
                     std::string("stock.") + Resource::name(r) + " resynced: " + formatValue(eco.stock.amounts[r]) + " -> " +
                         formatValue(village.storage[r]),
                     "resync stock from storage");
            corrected = true;
        }
    }
    village.syncStockFromStorage();

    return corrected;
}

void EconomyErrorHandler::resetVillageEconomyToDefaults(Village& village) {
    VillageEconomy& eco = village.economy;
    eco.production = ResourceAmounts{};
    eco.consumption = ResourceAmounts{};
    eco.supplyDemandStatus = SupplyDemandStatus::filled(SupplyDemandLevel::Balanced);
    eco.buildings.count = std::max(0, std::min(m_ranges.buildingsMax, eco.buildings.count));
    eco.buildings.targetCount = 0;
    eco.buildings.constructionQueue = 0;

    for (Resource::Type r : Resource::kAllTypes) {
        double& v = village.storage[r];
        v = std::isfinite(v) ? std::max(0.0, std::min(m_ranges.resourceMax, v)) : 0.0;
    }
    village.syncStockFromStorage();
    eco.stock.capacity = m_baseCapacity;
    ++m_resetCount;

    logError(village.key(), EconomyErrorType::DataIntegrity, "economy reset to defaults", "restore a stable state");
}

void EconomyErrorHandler::logError(const std::string& villageId, EconomyErrorType type, const std::string& message,
                                   const std::string& recoveryAction) {
    m_log.push_back({villageId, type, message, recoveryAction, m_currentTick});
    ++m_totalLogged;
    while (m_log.size() > m_maxLogSize) {
        m_log.pop_front();
    }
    if (m_consoleEcho) {
        std::cerr << "[EconomyError] " << villageId << " [" << economyErrorTypeName(type) << "]: " << message
                  << " (" << recoveryAction << ")" << std::endl;
    }
}

std::vector<EconomyError> EconomyErrorHandler::getErrorLog(size_t maxEntries) const {
    const size_t n = std::min(maxEntries, m_log.size());
    return std::vector<EconomyError>(m_log.end() - static_cast<std::ptrdiff_t>(n), m_log.end());
}

std::vector<EconomyError> EconomyErrorHandler::getVillageErrorLog(const std::string& villageId, size_t maxEntries) const {
    std::vector<EconomyError> matches;
    for (const EconomyError& e : m_log) {
        if (e.villageId == villageId) {
            matches.push_back(e);
        }
    }
    if (matches.size() > maxEntries) {
        matches.erase(matches.begin(), matches.end() - static_cast<std::ptrdiff_t>(maxEntries));
    }
    return matches;
}

ErrorStatistics EconomyErrorHandler::getErrorStatistics() const {
    ErrorStatistics stats;
    stats.errorsByType[EconomyErrorType::DataIntegrity] = 0;
    stats.errorsByType[EconomyErrorType::Calculation] = 0;
    for (const EconomyError& e : m_log) {
        stats.errorsByType[e.type]++;
        stats.errorsByVillage[e.villageId]++;
    }
    stats.totalErrors = static_cast<int>(m_log.size());
    return stats;
}
