// supply_demand.h
#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "resource.h"
#include "simulation_context.h"
#include "village.h"

struct VillageResourceBalance {
    size_t villageIndex = 0;
    std::string villageId;
    Resource::Type resourceType = Resource::Type::FOOD;
    SupplyDemandLevel level = SupplyDemandLevel::Balanced;
    double production = 0.0;
    double consumption = 0.0;
    double stock = 0.0;
    double netBalance = 0.0; // production - consumption
    double stockDays = 0.0;  // stock / consumption; infinity when only consumption is 0
};

struct VillageBalanceComparison {
    std::array<std::vector<VillageResourceBalance>, 4> byLevel;

    std::vector<VillageResourceBalance>& bucket(SupplyDemandLevel level) { return byLevel[static_cast<size_t>(level)]; }
    const std::vector<VillageResourceBalance>& bucket(SupplyDemandLevel level) const { return byLevel[static_cast<size_t>(level)]; }
};

struct SupplyDemandOverview {
    std::vector<size_t> shortageVillages; // any resource in shortage or critical
    std::vector<size_t> surplusVillages;
    std::vector<size_t> criticalVillages;
    PerResource<VillageBalanceComparison> resourceBalances;
};

struct SupplierCandidate {
    size_t villageIndex = 0;
    std::string villageId;
    double distance = 0.0;
    double availableSupply = 0.0;
    double supplyCapacity = 0.0;
};

// Per-village classification and read-only cross-village queries.
class SupplyDemandBalancer {
public:
    explicit SupplyDemandBalancer(const SimulationConfig& config);

    SupplyDemandLevel classify(double production, double consumption, double stock) const;
    SupplyDemandStatus evaluateVillageBalance(const Village& village) const;

    VillageBalanceComparison calculateResourceBalance(const std::vector<Village>& villages, Resource::Type type) const;
    PerResource<VillageBalanceComparison> compareVillageBalances(const std::vector<Village>& villages) const;
    SupplyDemandOverview identifySupplyDemandVillages(const std::vector<Village>& villages) const;

    // Surplus villages able to supply `type` to `shortageVillage`, best first.
    std::vector<SupplierCandidate> findSuppliers(const Village& shortageVillage,
                                                 const std::vector<Village>& candidates,
                                                 Resource::Type type,
                                                 double maxDistance) const;
    std::vector<SupplierCandidate> findSuppliers(const Village& shortageVillage,
                                                 const std::vector<Village>& candidates,
                                                 Resource::Type type) const;

    static double distanceBetween(const Village& a, const Village& b);

private:
    SimulationConfig::SupplyDemand m_thresholds;
    SimulationConfig::Balance m_balance;
};
