#ifndef BUILDING_HPP
#define BUILDING_HPP

#include "Types.hpp"
#include "Domain.hpp"
#include "Arrivals.hpp"
#include "Logger.hpp"
#include "Observation.hpp"
#include <map>
#include <memory>
#include <random>
#include <vector>

struct StepResult {
    Observation observation;
    double reward = 0.0;
    bool done = false;
    RewardComponents info;
};

// ============== Building ==============
// Owns queues and elevators and runs one timestep at a time:
// arrivals -> admission -> expiry -> actions (collection order) -> aging.

class Building {
private:
    Config config_;
    std::vector<std::unique_ptr<Elevator>> elevators_;
    // (floor, direction) -> queue; ground has no Down, top has no Up
    std::map<std::pair<int, Direction>, PassengerQueue> queues_;
    ArrivalGenerator arrivals_;
    Logger logger_;

    int timestep_ = 0;
    long nextPassengerId_ = 0;
    Accounting accounting_;

public:
    // Throws ConfigError if the configuration is malformed.
    Building(const Config& config, std::mt19937 rng, std::ostream& logOut = std::clog);

    // Non-copyable
    Building(const Building&) = delete;
    Building& operator=(const Building&) = delete;

    // Accessors
    int getNumFloors() const;
    int getNumElevators() const;
    const Config& getConfig() const;
    int getTimestep() const;
    Accounting getAccounting() const;
    Logger& getLogger();

    // Elevator access
    Elevator& getElevator(int id);
    const Elevator& getElevator(int id) const;

    // Queue access
    bool hasQueue(int floor, Direction dir) const;
    const PassengerQueue& getQueue(int floor, Direction dir) const;

    // One step with arrivals drawn from the generator.
    StepResult step(const std::vector<Action>& actions);

    // One step with an explicit arrival list; the generator is not consulted.
    StepResult advance(const std::vector<Passenger>& arrivals,
                       const std::vector<Action>& actions);

    Observation observe() const;

    // Throws std::logic_error if any internal invariant is broken.
    void checkInvariants() const;

    // Validation
    bool isValidFloor(int floor) const;
    bool isValidElevator(int id) const;

private:
    PassengerQueue& queueFor(int floor, Direction dir);
    void checkActionCount(const std::vector<Action>& actions) const;

    void admitArrivals(const std::vector<Passenger>& arrivals, RewardComponents& counts);
    void expireQueues(RewardComponents& counts);
    void executeAction(Elevator& elev, Action action, RewardComponents& counts);
    void incrementPassengerSteps();

    int countQueued() const;
    int countAboard() const;
};

#endif // BUILDING_HPP
