#include "Building.hpp"
#include <stdexcept>

namespace {

const Config& validated(const Config& config) {
    validateConfig(config);
    return config;
}

}  // namespace

// ============== Building Implementation ==============

Building::Building(const Config& config, std::mt19937 rng, std::ostream& logOut)
    : config_(validated(config)),
      arrivals_(ArrivalParams{config.floorArrivalRates, config.floorDestinationRates},
                config.maxWaitSteps, rng),
      logger_(logOut, config.logEnabled) {

    logger_.setTickReference(&timestep_);

    // Create queues; each floor only gets the directions it can request
    for (int floor = 0; floor < config_.numFloors; ++floor) {
        int capacity = config_.queueCapacities[floor];
        if (floor < config_.numFloors - 1) {
            queues_.emplace(std::make_pair(floor, Direction::Up),
                            PassengerQueue(floor, Direction::Up, capacity));
        }
        if (floor > 0) {
            queues_.emplace(std::make_pair(floor, Direction::Down),
                            PassengerQueue(floor, Direction::Down, capacity));
        }
    }

    // Create elevators; collection order is execution order
    elevators_.reserve(config_.elevators.size());
    for (int i = 0; i < config_.getNumElevators(); ++i) {
        elevators_.push_back(std::make_unique<Elevator>(i, config_.elevators[i]));
    }

    logger_.log("Building initialized with " + std::to_string(config_.numFloors) +
                " floors, " + std::to_string(config_.getNumElevators()) + " elevators");
}

int Building::getNumFloors() const { return config_.numFloors; }
int Building::getNumElevators() const { return static_cast<int>(elevators_.size()); }
const Config& Building::getConfig() const { return config_; }
int Building::getTimestep() const { return timestep_; }
Logger& Building::getLogger() { return logger_; }

Accounting Building::getAccounting() const {
    Accounting snapshot = accounting_;
    snapshot.queued = countQueued();
    snapshot.aboard = countAboard();
    return snapshot;
}

Elevator& Building::getElevator(int id) {
    if (!isValidElevator(id)) {
        throw std::out_of_range("Invalid elevator ID: " + std::to_string(id));
    }
    return *elevators_[id];
}

const Elevator& Building::getElevator(int id) const {
    if (!isValidElevator(id)) {
        throw std::out_of_range("Invalid elevator ID: " + std::to_string(id));
    }
    return *elevators_[id];
}

bool Building::hasQueue(int floor, Direction dir) const {
    return queues_.count(std::make_pair(floor, dir)) > 0;
}

const PassengerQueue& Building::getQueue(int floor, Direction dir) const {
    auto it = queues_.find(std::make_pair(floor, dir));
    if (it == queues_.end()) {
        throw std::out_of_range("No " + directionToString(dir) + " queue on floor " +
                                std::to_string(floor));
    }
    return it->second;
}

PassengerQueue& Building::queueFor(int floor, Direction dir) {
    auto it = queues_.find(std::make_pair(floor, dir));
    if (it == queues_.end()) {
        throw std::out_of_range("No " + directionToString(dir) + " queue on floor " +
                                std::to_string(floor));
    }
    return it->second;
}

StepResult Building::step(const std::vector<Action>& actions) {
    // Reject before drawing so a bad call leaves the random stream untouched
    checkActionCount(actions);
    std::vector<Passenger> arrivals = arrivals_.generate(timestep_, nextPassengerId_);
    nextPassengerId_ += static_cast<long>(arrivals.size());
    return advance(arrivals, actions);
}

StepResult Building::advance(const std::vector<Passenger>& arrivals,
                             const std::vector<Action>& actions) {
    checkActionCount(actions);
    for (const auto& p : arrivals) {
        if (!isValidFloor(p.getStartFloor()) || !isValidFloor(p.getDestinationFloor())) {
            throw std::invalid_argument("Passenger " + std::to_string(p.getId()) +
                                        " references a floor outside the building");
        }
    }

    RewardComponents counts;

    admitArrivals(arrivals, counts);
    expireQueues(counts);

    for (std::size_t i = 0; i < elevators_.size(); ++i) {
        executeAction(*elevators_[i], actions[i], counts);
    }

    counts.inElevator = countAboard();
    counts.inQueue = countQueued();

    incrementPassengerSteps();
    ++timestep_;

    checkInvariants();

    StepResult result;
    result.observation = observe();
    result.reward = computeReward(counts, config_.rewardWeights);
    result.done = false;
    result.info = counts;

    logger_.logStepSummary(counts, result.reward);
    return result;
}

void Building::checkActionCount(const std::vector<Action>& actions) const {
    if (static_cast<int>(actions.size()) != getNumElevators()) {
        throw std::invalid_argument("Expected " + std::to_string(getNumElevators()) +
                                    " actions, got " + std::to_string(actions.size()));
    }
}

void Building::admitArrivals(const std::vector<Passenger>& arrivals, RewardComponents& counts) {
    for (const auto& passenger : arrivals) {
        ++accounting_.generated;
        logger_.logArrival(passenger);

        PassengerQueue& queue = queueFor(passenger.getStartFloor(), passenger.getDirection());
        if (queue.tryPush(passenger)) {
            ++accounting_.admitted;
        } else {
            ++counts.rejected;
            ++accounting_.rejected;
            logger_.logRejection(passenger);
        }
    }
}

void Building::expireQueues(RewardComponents& counts) {
    for (auto& [key, queue] : queues_) {
        for (const auto& passenger : queue.removeExpired()) {
            ++counts.abandoned;
            ++accounting_.abandoned;
            logger_.logAbandonment(passenger);
        }
    }
}

void Building::executeAction(Elevator& elev, Action action, RewardComponents& counts) {
    const int startFloor = elev.getCurrentFloor();
    bool effective = false;

    switch (action) {
        case Action::Idle:
            effective = true;
            break;

        case Action::MoveUp:
        case Action::MoveDown:
            effective = (action == Action::MoveUp) ? elev.moveUp() : elev.moveDown();
            // Only an actual floor change classifies onboard passengers
            if (effective) {
                counts.movedToward += elev.countMovedToward(startFloor);
                counts.movedAway += elev.countMovedAway(startFloor);
            }
            break;

        case Action::LoadUp:
        case Action::LoadDown: {
            Direction dir = (action == Action::LoadUp) ? Direction::Up : Direction::Down;
            if (!hasQueue(startFloor, dir)) {
                break;
            }
            for (const auto& p : elev.loadFrom(queueFor(startFloor, dir))) {
                logger_.logBoarding(elev.getId(), p);
                effective = true;
            }
            break;
        }

        case Action::Unload:
            for (const auto& p : elev.unload()) {
                ++counts.delivered;
                ++accounting_.delivered;
                logger_.logDelivery(elev.getId(), p);
                effective = true;
            }
            break;
    }

    logger_.logAction(elev.getId(), action, effective);
    if (effective && action != Action::Idle) {
        logger_.logElevatorState(elev);
    }
}

void Building::incrementPassengerSteps() {
    for (auto& [key, queue] : queues_) {
        queue.incrementWaits();
    }
    for (auto& elev : elevators_) {
        elev->incrementPassengerSteps();
    }
}

Observation Building::observe() const {
    const int floors = getNumFloors();

    Observation obs;
    obs.upButtons.assign(floors, false);
    obs.downButtons.assign(floors, false);

    for (const auto& [key, queue] : queues_) {
        if (queue.empty()) continue;
        if (key.second == Direction::Up) {
            obs.upButtons[key.first] = true;
        } else {
            obs.downButtons[key.first] = true;
        }
    }

    for (const auto& elev : elevators_) {
        std::vector<bool> buttons(floors, false);
        for (int floor : elev->getDestinations()) {
            buttons[floor] = true;
        }
        obs.elevatorButtons.push_back(buttons);
        obs.elevatorFloors.push_back(elev->getCurrentFloor());
    }
    return obs;
}

void Building::checkInvariants() const {
    for (const auto& elev : elevators_) {
        int floor = elev->getCurrentFloor();
        if (floor < elev->getMinFloor() || floor > elev->getMaxFloor()) {
            throw std::logic_error("Elevator " + std::to_string(elev->getId()) +
                                   " is on floor " + std::to_string(floor) +
                                   " outside its range");
        }
        if (elev->getPassengerCount() > elev->getCapacity()) {
            throw std::logic_error("Elevator " + std::to_string(elev->getId()) +
                                   " is over capacity");
        }
        for (const auto& p : elev->getPassengers()) {
            if (p.getWait() > p.getAge()) {
                throw std::logic_error("Passenger " + std::to_string(p.getId()) +
                                       " has wait greater than age");
            }
        }
    }

    for (const auto& [key, queue] : queues_) {
        if (queue.size() > queue.getMaxSize()) {
            throw std::logic_error("Queue on floor " + std::to_string(key.first) +
                                   " exceeds its maximum size");
        }
        for (const auto& p : queue.getPassengers()) {
            if (p.getWait() > p.getAge()) {
                throw std::logic_error("Passenger " + std::to_string(p.getId()) +
                                       " has wait greater than age");
            }
        }
    }

    const Accounting snapshot = getAccounting();
    if (snapshot.admitted + snapshot.rejected != snapshot.generated ||
        snapshot.queued + snapshot.aboard + snapshot.delivered + snapshot.abandoned !=
            snapshot.admitted) {
        throw std::logic_error("Passenger accounting does not reconcile at timestep " +
                               std::to_string(timestep_));
    }
}

bool Building::isValidFloor(int floor) const {
    return floor >= 0 && floor < config_.numFloors;
}

bool Building::isValidElevator(int id) const {
    return id >= 0 && id < getNumElevators();
}

int Building::countQueued() const {
    int total = 0;
    for (const auto& [key, queue] : queues_) {
        total += queue.size();
    }
    return total;
}

int Building::countAboard() const {
    int total = 0;
    for (const auto& elev : elevators_) {
        total += elev->getPassengerCount();
    }
    return total;
}
