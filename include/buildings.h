// buildings.h
#pragma once

#include "economy_error_handler.h"
#include "simulation_context.h"
#include "village.h"

struct BuildingCost {
    double wood = 0.0;
    double ore = 0.0;
};

struct BuildingStats {
    int currentCount = 0;
    int targetCount = 0;
    int constructionQueue = 0;
    bool canBuild = false;
    BuildingCost buildingCost;
    int maxBuildable = 0;
};

// 0 for an empty village, otherwise at least one and at most half the population.
int targetBuildingCount(double population, double buildingsPerPopulation);

class BuildingManager {
public:
    BuildingManager(const SimulationConfig& config, EconomyErrorHandler& errorHandler);

    BuildingCost calculateBuildingCost() const;
    int calculateTargetBuildingCount(double population) const;
    bool canBuildBuilding(const Village& village) const;
    int calculateMaxBuildableBuildings(const Village& village) const;

    // Moves finished buildings from the queue to the completed count. Returns the number completed.
    int processConstructionQueue(Village& village, const GameTime& gameTime);

    void updateBuildings(Village& village, const GameTime& gameTime);

    BuildingStats getBuildingStats(const Village& village) const;

    void setDebugEnabled(bool enabled) { m_debug = enabled; }

private:
    SimulationConfig m_config;
    EconomyErrorHandler& m_errorHandler;
    bool m_debug = false;

    void constructBuildings(Village& village, int buildCount);
};
