// economy_error_handler.h
#pragma once

#include <cmath>
#include <deque>
#include <exception>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "resource.h"
#include "simulation_context.h"
#include "village.h"

enum class EconomyErrorType {
    DataIntegrity = 0,
    Calculation = 1
};

const char* economyErrorTypeName(EconomyErrorType type);

struct EconomyError {
    std::string villageId;
    EconomyErrorType type = EconomyErrorType::DataIntegrity;
    std::string message;
    std::string recoveryAction;
    double tick = 0.0;
};

struct ValidationResult {
    bool isValid = true;
    std::vector<EconomyError> errors;
    std::vector<std::string> warnings;
};

struct ErrorStatistics {
    int totalErrors = 0;
    std::map<EconomyErrorType, int> errorsByType;
    std::map<std::string, int> errorsByVillage;
};

// Value-or-error result for fallible arithmetic.
template <typename T>
struct CalcResult {
    bool ok = false;
    T value{};
    std::string error;

    static CalcResult success(T v) {
        CalcResult r;
        r.ok = true;
        r.value = std::move(v);
        return r;
    }
    static CalcResult failure(std::string message) {
        CalcResult r;
        r.error = std::move(message);
        return r;
    }
};

template <typename T>
bool isFiniteValue(const T&) { return true; }
inline bool isFiniteValue(double v) { return std::isfinite(v); }
inline bool isFiniteValue(const ResourceAmounts& amounts) {
    for (double v : amounts.values) {
        if (!std::isfinite(v)) return false;
    }
    return true;
}

template <typename T>
struct IsCalcResult : std::false_type {};
template <typename T>
struct IsCalcResult<CalcResult<T>> : std::true_type {};

// Validation, correction and the structured error log for village economies.
class EconomyErrorHandler {
public:
    explicit EconomyErrorHandler(const SimulationConfig& config);

    // Checks every village invariant without mutating the village.
    ValidationResult validateVillageEconomy(const Village& village) const;

    // Clamps out-of-range fields and replaces non-finite ones with defaults.
    // Returns true if anything changed.
    bool correctInvalidValues(Village& village);

    // Runs `fn` and returns its value, or `fallback` if it failed, threw, or produced a non-finite
    // value. `fn` may return either T or CalcResult<T>.
    template <typename T, typename Fn>
    T safeCalculation(Fn&& fn, const T& fallback, const std::string& context, const std::string& villageId = "unknown") {
        try {
            using Ret = std::decay_t<decltype(fn())>;
            if constexpr (IsCalcResult<Ret>::value) {
                return resolve(fn(), fallback, context, villageId);
            } else {
                T value = fn();
                if (!isFiniteValue(value)) {
                    logError(villageId, EconomyErrorType::Calculation,
                             "non-finite result (context: " + context + ")", "used fallback value");
                    return fallback;
                }
                return value;
            }
        } catch (const std::exception& e) {
            logError(villageId, EconomyErrorType::Calculation,
                     std::string("calculation threw: ") + e.what() + " (context: " + context + ")",
                     "used fallback value");
            return fallback;
        }
    }

    template <typename T>
    T resolve(const CalcResult<T>& result, const T& fallback, const std::string& context, const std::string& villageId = "unknown") {
        if (!result.ok) {
            logError(villageId, EconomyErrorType::Calculation,
                     result.error + " (context: " + context + ")", "used fallback value");
            return fallback;
        }
        if (!isFiniteValue(result.value)) {
            logError(villageId, EconomyErrorType::Calculation,
                     "non-finite result (context: " + context + ")", "used fallback value");
            return fallback;
        }
        return result.value;
    }

    // Last-resort recovery for a village whose economy could not be computed.
    void resetVillageEconomyToDefaults(Village& village);

    std::vector<EconomyError> getErrorLog(size_t maxEntries = 50) const;
    std::vector<EconomyError> getVillageErrorLog(const std::string& villageId, size_t maxEntries = 20) const;
    ErrorStatistics getErrorStatistics() const;
    void clearErrorLog() { m_log.clear(); }

    // Cumulative counts, unaffected by log trimming or clearing.
    long long getTotalErrorsLogged() const { return m_totalLogged; }
    int getResetCount() const { return m_resetCount; }

    void setConsoleEcho(bool enabled) { m_consoleEcho = enabled; }
    void setCurrentTick(double tick) { m_currentTick = tick; }

    void logError(const std::string& villageId, EconomyErrorType type, const std::string& message, const std::string& recoveryAction);

private:
    SimulationConfig::Integrity m_ranges;
    double m_baseCapacity;
    std::deque<EconomyError> m_log;
    size_t m_maxLogSize;
    bool m_consoleEcho;
    double m_currentTick = 0.0;
    long long m_totalLogged = 0;
    int m_resetCount = 0;

    bool correctDouble(double& value, double minValue, double maxValue, double defaultValue,
                       const std::string& villageId, const std::string& field);
    bool correctInt(int& value, int minValue, int maxValue, const std::string& villageId, const std::string& field);
};
