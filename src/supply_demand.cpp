#include "supply_demand.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

SupplyDemandBalancer::SupplyDemandBalancer(const SimulationConfig& config)
    : m_thresholds(config.supplyDemand),
      m_balance(config.balance) {}

SupplyDemandLevel SupplyDemandBalancer::classify(double production, double consumption, double stock) const {
    production = std::isfinite(production) ? std::max(0.0, production) : 0.0;
    consumption = std::isfinite(consumption) ? std::max(0.0, consumption) : 0.0;
    stock = std::isfinite(stock) ? std::max(0.0, stock) : 0.0;

    // No demand: ratio is undefined, so fixed absolute stock bands apply.
    if (consumption <= 0.0) {
        if (stock > 50.0) return SupplyDemandLevel::Surplus;
        if (stock > 20.0) return SupplyDemandLevel::Balanced;
        if (stock > 5.0) return SupplyDemandLevel::Shortage;
        return SupplyDemandLevel::Critical;
    }

    const double ratio = production / consumption;
    const double stockDays = stock / consumption;

    if (ratio < m_thresholds.criticalThreshold || stockDays < m_balance.criticalStockDays) {
        return SupplyDemandLevel::Critical;
    }
    if (ratio >= m_thresholds.surplusThreshold && stockDays > m_balance.surplusStockDays) {
        return SupplyDemandLevel::Surplus;
    }
    if (ratio < m_thresholds.shortageThreshold && stockDays < m_balance.shortageStockDays) {
        return SupplyDemandLevel::Shortage;
    }
    return SupplyDemandLevel::Balanced;
}

SupplyDemandStatus SupplyDemandBalancer::evaluateVillageBalance(const Village& village) const {
    const VillageEconomy& eco = village.economy;
    SupplyDemandStatus status;
    for (Resource::Type r : Resource::kAllTypes) {
        status[r] = classify(eco.production[r], eco.consumption[r], eco.stock.amounts[r]);
    }
    return status;
}

VillageBalanceComparison SupplyDemandBalancer::calculateResourceBalance(const std::vector<Village>& villages,
                                                                         Resource::Type type) const {
    const int n = static_cast<int>(villages.size());
    std::vector<VillageResourceBalance> entries(villages.size());

    #pragma omp parallel for
    for (int i = 0; i < n; ++i) {
        const Village& village = villages[static_cast<size_t>(i)];
        const VillageEconomy& eco = village.economy;
        VillageResourceBalance& e = entries[static_cast<size_t>(i)];
        e.villageIndex = static_cast<size_t>(i);
        e.villageId = village.key();
        e.resourceType = type;
        e.production = eco.production[type];
        e.consumption = eco.consumption[type];
        e.stock = eco.stock.amounts[type];
        e.level = classify(e.production, e.consumption, e.stock);
        e.netBalance = e.production - e.consumption;
        if (e.consumption > 0.0) {
            e.stockDays = e.stock / e.consumption;
        } else {
            e.stockDays = (e.stock > 0.0) ? std::numeric_limits<double>::infinity() : 0.0;
        }
    }

    // Bucketing stays serial so village order within a bucket is stable.
    VillageBalanceComparison comparison;
    for (VillageResourceBalance& e : entries) {
        comparison.bucket(e.level).push_back(std::move(e));
    }
    return comparison;
}

PerResource<VillageBalanceComparison> SupplyDemandBalancer::compareVillageBalances(const std::vector<Village>& villages) const {
    PerResource<VillageBalanceComparison> result;
    for (Resource::Type r : Resource::kAllTypes) {
        result[r] = calculateResourceBalance(villages, r);
    }
    return result;
}

SupplyDemandOverview SupplyDemandBalancer::identifySupplyDemandVillages(const std::vector<Village>& villages) const {
    SupplyDemandOverview overview;
    for (size_t i = 0; i < villages.size(); ++i) {
        const SupplyDemandStatus& status = villages[i].economy.supplyDemandStatus;
        bool shortage = false;
        bool surplus = false;
        bool critical = false;
        for (Resource::Type r : Resource::kAllTypes) {
            shortage = shortage || status[r] == SupplyDemandLevel::Shortage || status[r] == SupplyDemandLevel::Critical;
            surplus = surplus || status[r] == SupplyDemandLevel::Surplus;
            critical = critical || status[r] == SupplyDemandLevel::Critical;
        }
        if (shortage) overview.shortageVillages.push_back(i);
        if (surplus) overview.surplusVillages.push_back(i);
        if (critical) overview.criticalVillages.push_back(i);
    }
    overview.resourceBalances = compareVillageBalances(villages);
    return overview;
}

double SupplyDemandBalancer::distanceBetween(const Village& a, const Village& b) {
    const double dx = static_cast<double>(a.position.x - b.position.x);
    const double dy = static_cast<double>(a.position.y - b.position.y);
    return std::sqrt(dx * dx + dy * dy);
}

std::vector<SupplierCandidate> SupplyDemandBalancer::findSuppliers(const Village& shortageVillage,
                                                                   const std::vector<Village>& candidates,
                                                                   Resource::Type type) const {
    return findSuppliers(shortageVillage, candidates, type, m_balance.defaultMaxSupplyDistance);
}

std::vector<SupplierCandidate> SupplyDemandBalancer::findSuppliers(const Village& shortageVillage,
                                                                   const std::vector<Village>& candidates,
                                                                   Resource::Type type,
                                                                   double maxDistance) const {
    std::vector<SupplierCandidate> suppliers;
    if (!std::isfinite(maxDistance) || maxDistance <= 0.0) {
        return suppliers;
    }

    const std::string requesterId = shortageVillage.key();
    for (size_t i = 0; i < candidates.size(); ++i) {
        const Village& supplier = candidates[i];
        if (&supplier == &shortageVillage || supplier.key() == requesterId) {
            continue;
        }
        if (supplier.economy.supplyDemandStatus[type] != SupplyDemandLevel::Surplus) {
            continue;
        }
        const double distance = distanceBetween(shortageVillage, supplier);
        if (distance > maxDistance) {
            continue;
        }

        const VillageEconomy& eco = supplier.economy;
        const double production = eco.production[type];
        const double consumption = eco.consumption[type];
        const double stock = eco.stock.amounts[type];

        // Suppliers keep a reserve of a few days of their own consumption and only share part of the rest.
        const double netProduction = std::max(0.0, production - consumption);
        const double excessStock = std::max(0.0, stock - consumption * m_balance.supplierReserveDays);
        const double availableSupply = netProduction + excessStock * m_balance.supplierStockShare;
        const double distanceDecay = std::max(m_balance.minDistanceDecay, 1.0 - distance / maxDistance);
        const double capacity = availableSupply * distanceDecay;
        if (!(capacity > 0.0)) {
            continue;
        }

        SupplierCandidate c;
        c.villageIndex = i;
        c.villageId = supplier.key();
        c.distance = distance;
        c.availableSupply = availableSupply;
        c.supplyCapacity = capacity;
        suppliers.push_back(std::move(c));
    }

    std::stable_sort(suppliers.begin(), suppliers.end(), [](const SupplierCandidate& a, const SupplierCandidate& b) {
        if (a.supplyCapacity != b.supplyCapacity) {
            return a.supplyCapacity > b.supplyCapacity;
        }
        return a.distance < b.distance;
    });
    return suppliers;
}
