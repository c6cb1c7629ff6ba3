// population.h
#pragma once

#include "economy_error_handler.h"
#include "simulation_context.h"
#include "village.h"

enum class PopulationTrend {
    Growing,
    Stable,
    Declining
};

const char* populationTrendName(PopulationTrend trend);

// Derived from the last three history entries; fewer than two entries is stable.
PopulationTrend populationTrend(const PopulationHistory& history);

// Per-tick probability of an event with the given rate.
double eventProbability(double rate, double deltaTime);

struct PopulationStats {
    double currentPopulation = 0.0;
    double foodConsumption = 0.0;
    bool canGrow = false;
    bool shouldDecline = false;
    PopulationTrend trend = PopulationTrend::Stable;
};

class PopulationManager {
public:
    PopulationManager(const SimulationConfig& config, EconomyErrorHandler& errorHandler, RandomSource& random);

    bool canPopulationGrow(const Village& village) const;
    bool shouldPopulationDecrease(const Village& village) const;
    // Food, production and status all at zero or critical.
    bool isFoodExhausted(const Village& village) const;

    void updatePopulation(Village& village, const GameTime& gameTime);

    PopulationStats getPopulationStats(const Village& village) const;

    void setDebugEnabled(bool enabled) { m_debug = enabled; }

private:
    SimulationConfig m_config;
    EconomyErrorHandler& m_errorHandler;
    RandomSource& m_random;
    bool m_debug = false;

    bool decreasePopulation(Village& village, const GameTime& gameTime);
    bool increasePopulation(Village& village, const GameTime& gameTime);
    int radiusForPopulation(double population) const;
};
