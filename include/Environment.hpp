#ifndef ENVIRONMENT_HPP
#define ENVIRONMENT_HPP

#include "Building.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <vector>

struct EnvStep {
    EncodedObservation observation;
    double reward = 0.0;
    bool done = false;
    RewardComponents info;
};

// Discrete product space: numElevators independent choices of kNumActions.
struct ActionSpace {
    int numElevators = 0;
    int actionsPerElevator = kNumActions;
};

// ============== Environment ==============
// reset/step adapter over a Building. One Building per episode; a new
// one is constructed on every reset.

class Environment {
private:
    Config config_;
    std::ostream& logOut_;
    std::mt19937 seedSequence_;  // draws per-episode seeds when none is given
    std::unique_ptr<Building> building_;
    bool done_ = false;

public:
    // Throws ConfigError if the configuration is malformed.
    explicit Environment(const Config& config, std::ostream& logOut = std::clog);

    // Non-copyable
    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    // Starts a new episode. A new config replaces the current one.
    EncodedObservation reset(std::optional<uint32_t> seed = std::nullopt,
                             std::optional<Config> config = std::nullopt);

    // One action code (0-5) per elevator, in construction order.
    EnvStep step(const std::vector<int>& actions);

    EncodedObservation observe() const;

    ActionSpace actionSpace() const;
    int observationSize() const;
    bool isDone() const;

    const Config& getConfig() const;
    const Building& getBuilding() const;

private:
    EncodedObservation encode(const Observation& obs) const;
};

#endif // ENVIRONMENT_HPP
