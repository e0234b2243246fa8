#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// ============== Enums =============

enum class Direction {
    Up,
    Down
};

// Numeric values are the wire codes agents send.
enum class Action {
    Idle = 0,
    MoveUp = 1,
    MoveDown = 2,
    LoadUp = 3,
    LoadDown = 4,
    Unload = 5
};

constexpr int kNumActions = 6;

enum class ObservationMode {
    Structured,
    Flattened
};

// ============== Errors ==============

// Raised for malformed configurations at construction/reset time only.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what)
        : std::invalid_argument("config error: " + what) {}
};

// ============== Configuration ==============

struct ElevatorSpec {
    int minFloor = 0;
    int maxFloor = 0;
    int capacity = 10;
    int startFloor = 0;
};

// Signed weights; reward = sum(weight * count).
struct RewardWeights {
    double delivered = 10.0;
    double movedToward = 1.0;
    double rejected = -5.0;
    double abandoned = -5.0;
    double movedAway = -1.0;
    double inElevator = -0.1;
    double inQueue = -0.1;
};

// A default-constructed Config has no elevators, arrival rates or queue
// capacities and fails validateConfig; start from Config::makeDefault.
struct Config {
    int numFloors = 10;
    std::vector<ElevatorSpec> elevators;
    std::vector<double> floorArrivalRates;
    std::vector<std::vector<double>> floorDestinationRates;
    std::vector<int> queueCapacities;
    int maxWaitSteps = 50;
    RewardWeights rewardWeights;
    ObservationMode observationMode = ObservationMode::Structured;
    int episodeLength = 0;  // 0 = unbounded
    uint32_t seed = 12345;
    bool logEnabled = false;

    int getNumElevators() const { return static_cast<int>(elevators.size()); }

    // Full-range elevators starting at the ground floor, default arrivals.
    static Config makeDefault(int numFloors, int numElevators);
};

// Throws ConfigError on the first violated constraint.
void validateConfig(const Config& config);

// ============== Step Bookkeeping ==============

// Raw counts behind one step's reward.
struct RewardComponents {
    int delivered = 0;
    int movedToward = 0;
    int movedAway = 0;
    int rejected = 0;
    int abandoned = 0;
    int inElevator = 0;
    int inQueue = 0;
};

double computeReward(const RewardComponents& counts, const RewardWeights& weights);

// Cumulative passenger flow since the last reset.
struct Accounting {
    long generated = 0;
    long admitted = 0;
    long rejected = 0;
    long abandoned = 0;
    long delivered = 0;
    long queued = 0;  // current
    long aboard = 0;  // current
};

// ============== Utility Functions ==============

inline std::string directionToString(Direction dir) {
    switch (dir) {
        case Direction::Up: return "Up";
        case Direction::Down: return "Down";
    }
    return "Unknown";
}

inline std::string actionToString(Action action) {
    switch (action) {
        case Action::Idle: return "Idle";
        case Action::MoveUp: return "MoveUp";
        case Action::MoveDown: return "MoveDown";
        case Action::LoadUp: return "LoadUp";
        case Action::LoadDown: return "LoadDown";
        case Action::Unload: return "Unload";
    }
    return "Unknown";
}

// Throws std::invalid_argument for codes outside the action space.
inline Action actionFromCode(int code) {
    if (code < 0 || code >= kNumActions) {
        throw std::invalid_argument("Invalid action code: " + std::to_string(code));
    }
    return static_cast<Action>(code);
}

#endif // TYPES_HPP
