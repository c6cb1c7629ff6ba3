#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "economy_error_handler.h"
#include "simulation_context.h"
#include "simulation_runner.h"
#include "supply_demand.h"

namespace {

struct RunOptions {
    std::uint64_t seed = 1;
    std::string configPath = "data/sim_config.toml";
    int ticks = 200;
    int villages = -1; // -1 means "use config value"
    int mapSize = -1;
    int checkpointEvery = 50;
    std::string preset;
    bool debug = false;
};

bool parseUInt64(const std::string& s, std::uint64_t& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoull(s, &pos);
        if (pos != s.size()) return false;
        out = static_cast<std::uint64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        if (v < static_cast<long long>(std::numeric_limits<int>::min()) ||
            v > static_cast<long long>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseBool01(const std::string& s, bool& out) {
    if (s == "1" || s == "true" || s == "TRUE") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "FALSE") {
        out = false;
        return true;
    }
    return false;
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << (argv0 ? argv0 : "villagesim_cli")
              << " [--seed N] [--config path] [--ticks N]\n"
              << "       [--villages N] [--mapSize N] [--checkpointEvery N]\n"
              << "       [--preset easy|normal|hard|extreme] [--debug 0|1]\n";
}

bool parseArgs(int argc, char** argv, RunOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            printUsage((argc > 0) ? argv[0] : nullptr);
            return false;
        } else if (arg == "--seed") {
            std::string v;
            if (!requireValue(v) || !parseUInt64(v, opt.seed)) return false;
        } else if (arg.rfind("--seed=", 0) == 0) {
            if (!parseUInt64(arg.substr(7), opt.seed)) return false;
        } else if (arg == "--config") {
            if (!requireValue(opt.configPath)) return false;
        } else if (arg.rfind("--config=", 0) == 0) {
            opt.configPath = arg.substr(9);
        } else if (arg == "--ticks") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.ticks)) return false;
        } else if (arg.rfind("--ticks=", 0) == 0) {
            if (!parseInt(arg.substr(8), opt.ticks)) return false;
        } else if (arg == "--villages") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.villages)) return false;
        } else if (arg.rfind("--villages=", 0) == 0) {
            if (!parseInt(arg.substr(11), opt.villages)) return false;
        } else if (arg == "--mapSize") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.mapSize)) return false;
        } else if (arg.rfind("--mapSize=", 0) == 0) {
            if (!parseInt(arg.substr(10), opt.mapSize)) return false;
        } else if (arg == "--checkpointEvery") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.checkpointEvery)) return false;
        } else if (arg.rfind("--checkpointEvery=", 0) == 0) {
            if (!parseInt(arg.substr(18), opt.checkpointEvery)) return false;
        } else if (arg == "--preset") {
            if (!requireValue(opt.preset)) return false;
        } else if (arg.rfind("--preset=", 0) == 0) {
            opt.preset = arg.substr(9);
        } else if (arg == "--debug") {
            std::string v;
            if (!requireValue(v) || !parseBool01(v, opt.debug)) return false;
        } else if (arg.rfind("--debug=", 0) == 0) {
            if (!parseBool01(arg.substr(8), opt.debug)) return false;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

void printCheckpoint(const VillageSimulation& sim) {
    const std::vector<Village>& villages = sim.getVillages();
    double population = 0.0;
    int buildings = 0;
    int queued = 0;
    for (const Village& v : villages) {
        population += v.population;
        buildings += v.economy.buildings.count;
        queued += v.economy.buildings.constructionQueue;
    }

    std::cout << "tick=" << sim.getTime().totalTicks
              << " villages=" << villages.size()
              << " population=" << std::fixed << std::setprecision(0) << population
              << " buildings=" << buildings
              << " queued=" << queued;

    const PerResource<VillageBalanceComparison> balance = sim.getBalancer().compareVillageBalances(villages);
    for (Resource::Type r : Resource::kAllTypes) {
        std::cout << " " << Resource::name(r) << "=";
        for (int level = 0; level < 4; ++level) {
            if (level > 0) std::cout << "/";
            std::cout << balance[r].byLevel[static_cast<size_t>(level)].size();
        }
    }
    std::cout << " hash=" << sim.computeStateHash() << "\n";
}

void printSummary(const VillageSimulation& sim) {
    const HealthCounters health = sim.getHealth();
    const ErrorStatistics stats = sim.getErrorHandler().getErrorStatistics();

    std::cout << "health ticks=" << health.ticks
              << " slow_ticks=" << health.slowTicks
              << " worst_tick_ms=" << std::setprecision(3) << health.worstTickMs
              << " errors_total=" << health.errorTotal
              << " villages_reset=" << health.villagesReset << "\n";

    std::cout << "errors logged=" << stats.totalErrors;
    for (const auto& entry : stats.errorsByType) {
        std::cout << " " << economyErrorTypeName(entry.first) << "=" << entry.second;
    }
    std::cout << "\n";
}

} // namespace

int main(int argc, char** argv) {
    RunOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return 2;
    }

#ifdef _OPENMP
    omp_set_num_threads(1); // deterministic headless mode
#endif

    if (opt.ticks < 0) {
        std::cerr << "Invalid ticks=" << opt.ticks << "\n";
        return 2;
    }
    if (opt.checkpointEvery <= 0) {
        opt.checkpointEvery = 50;
    }

    SimulationContext ctx(opt.seed, opt.configPath);
    if (!opt.preset.empty() && !ctx.config.applyResourcePreset(opt.preset)) {
        std::cerr << "Unknown preset: " << opt.preset << " (expected one of:";
        for (const std::string& name : SimulationConfig::resourcePresetNames()) {
            std::cerr << " " << name;
        }
        std::cerr << ")\n";
        return 2;
    }
    if (opt.villages >= 0) {
        ctx.config.world.villageCount = opt.villages;
    }
    if (opt.mapSize >= 0) {
        ctx.config.world.mapSize = opt.mapSize;
    }
    if (opt.debug) {
        ctx.config.world.logErrorsToConsole = true;
    }

    const ConfigValidationResult validation = validateConfig(ctx.config);
    for (const std::string& w : validation.warnings) {
        std::cerr << "[Config] warning: " << w << "\n";
    }
    if (!validation.isValid) {
        for (const std::string& e : validation.errors) {
            std::cerr << "[Config] invalid: " << e << "\n";
        }
        return 2;
    }

    std::cout << "villagesim_cli seed=" << opt.seed
              << " config=" << ctx.configPath
              << " hash=" << ctx.configHash
              << " ticks=" << opt.ticks
              << " mapSize=" << ctx.config.world.mapSize
              << " villages=" << ctx.config.world.villageCount
              << "\n";

    VillageSimulation sim(ctx);
    sim.setDebugEnabled(opt.debug);
    printCheckpoint(sim);

    for (int t = 1; t <= opt.ticks; ++t) {
        sim.step();
        if (t % opt.checkpointEvery == 0 || t == opt.ticks) {
            printCheckpoint(sim);
        }
    }

    printSummary(sim);

    const std::string breach = sim.validateInvariants();
    if (!breach.empty()) {
        std::cerr << "[Sim] invariant breach: " << breach << "\n";
        return 1;
    }
    return 0;
}
