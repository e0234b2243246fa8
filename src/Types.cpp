#include "Types.hpp"
#include "Arrivals.hpp"

// ============== Configuration ==============

Config Config::makeDefault(int numFloors, int numElevators) {
    ArrivalParams arrivals = ArrivalGenerator::defaultParams(numElevators, numFloors);

    Config config;
    config.numFloors = numFloors;
    config.elevators.assign(numElevators, ElevatorSpec{0, numFloors - 1, 10, 0});
    config.floorArrivalRates = arrivals.floorArrivalRates;
    config.floorDestinationRates = arrivals.floorDestinationRates;
    config.queueCapacities.assign(numFloors, 20);
    return config;
}

void validateConfig(const Config& config) {
    if (config.numFloors < 2) {
        throw ConfigError("building needs at least 2 floors, got " +
                          std::to_string(config.numFloors));
    }
    if (config.elevators.empty()) {
        throw ConfigError("building needs at least 1 elevator");
    }

    for (int i = 0; i < config.getNumElevators(); ++i) {
        const ElevatorSpec& spec = config.elevators[i];
        const std::string name = "elevator " + std::to_string(i);
        if (spec.minFloor < 0 || spec.maxFloor > config.numFloors - 1 ||
            spec.minFloor > spec.maxFloor) {
            throw ConfigError(name + " range [" + std::to_string(spec.minFloor) + ", " +
                              std::to_string(spec.maxFloor) + "] is outside the building");
        }
        if (spec.startFloor < spec.minFloor || spec.startFloor > spec.maxFloor) {
            throw ConfigError(name + " starts outside its range");
        }
        if (spec.capacity <= 0) {
            throw ConfigError(name + " capacity must be positive");
        }
    }

    if (static_cast<int>(config.queueCapacities.size()) != config.numFloors) {
        throw ConfigError("expected " + std::to_string(config.numFloors) +
                          " queue capacities, got " +
                          std::to_string(config.queueCapacities.size()));
    }
    for (int cap : config.queueCapacities) {
        if (cap < 0) {
            throw ConfigError("queue capacity must be non-negative");
        }
    }

    if (config.maxWaitSteps < 0) {
        throw ConfigError("max wait steps must be non-negative");
    }
    if (config.episodeLength < 0) {
        throw ConfigError("episode length must be non-negative");
    }

    ArrivalGenerator::validateParams(
        config.numFloors,
        ArrivalParams{config.floorArrivalRates, config.floorDestinationRates});
}

// ============== Reward ==============

double computeReward(const RewardComponents& counts, const RewardWeights& weights) {
    return weights.delivered * counts.delivered +
           weights.movedToward * counts.movedToward +
           weights.movedAway * counts.movedAway +
           weights.rejected * counts.rejected +
           weights.abandoned * counts.abandoned +
           weights.inElevator * counts.inElevator +
           weights.inQueue * counts.inQueue;
}
