#include "Domain.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

// ============== Passenger Implementation ==============

Passenger::Passenger(long id, int startFloor, int destinationFloor, int startStep, int maxWaitSteps)
    : id_(id), startFloor_(startFloor), destinationFloor_(destinationFloor),
      startStep_(startStep), maxWaitSteps_(maxWaitSteps) {
    if (startFloor == destinationFloor) {
        throw std::invalid_argument("Passenger destination equals start floor: " +
                                    std::to_string(startFloor));
    }
}

long Passenger::getId() const { return id_; }
int Passenger::getStartFloor() const { return startFloor_; }
int Passenger::getDestinationFloor() const { return destinationFloor_; }
int Passenger::getStartStep() const { return startStep_; }
int Passenger::getMaxWaitSteps() const { return maxWaitSteps_; }
int Passenger::getAge() const { return age_; }
int Passenger::getWait() const { return wait_; }

Direction Passenger::getDirection() const {
    return destinationFloor_ > startFloor_ ? Direction::Up : Direction::Down;
}

void Passenger::incrementStep(bool inElevator) {
    if (!inElevator) {
        ++wait_;
    }
    ++age_;
}

bool Passenger::reachedMaxWait() const {
    return wait_ >= maxWaitSteps_;
}

bool Passenger::reachedDestination(int floor) const {
    return floor == destinationFloor_;
}

bool Passenger::movedTowardDestination(int from, int to) const {
    return std::abs(to - destinationFloor_) < std::abs(from - destinationFloor_);
}

// ============== PassengerQueue Implementation ==============

PassengerQueue::PassengerQueue(int floor, Direction direction, int maxSize)
    : floor_(floor), direction_(direction), maxSize_(maxSize) {}

int PassengerQueue::getFloor() const { return floor_; }
Direction PassengerQueue::getDirection() const { return direction_; }
int PassengerQueue::getMaxSize() const { return maxSize_; }
int PassengerQueue::size() const { return static_cast<int>(passengers_.size()); }
bool PassengerQueue::empty() const { return passengers_.empty(); }
bool PassengerQueue::isFull() const { return size() >= maxSize_; }

bool PassengerQueue::tryPush(const Passenger& passenger) {
    if (isFull()) {
        return false;
    }
    passengers_.push_back(passenger);
    return true;
}

std::vector<Passenger> PassengerQueue::popFront(int count) {
    std::vector<Passenger> taken;
    while (count > 0 && !passengers_.empty()) {
        taken.push_back(passengers_.front());
        passengers_.pop_front();
        --count;
    }
    return taken;
}

std::vector<Passenger> PassengerQueue::removeExpired() {
    std::vector<Passenger> expired;
    auto keep = std::stable_partition(passengers_.begin(), passengers_.end(),
        [](const Passenger& p) { return !p.reachedMaxWait(); });
    expired.assign(keep, passengers_.end());
    passengers_.erase(keep, passengers_.end());
    return expired;
}

void PassengerQueue::incrementWaits() {
    for (auto& p : passengers_) {
        p.incrementStep(false);
    }
}

const std::deque<Passenger>& PassengerQueue::getPassengers() const {
    return passengers_;
}

// ============== Elevator Implementation ==============

Elevator::Elevator(int id, const ElevatorSpec& spec)
    : id_(id), minFloor_(spec.minFloor), maxFloor_(spec.maxFloor),
      capacity_(spec.capacity), currentFloor_(spec.startFloor) {}

int Elevator::getId() const { return id_; }
int Elevator::getMinFloor() const { return minFloor_; }
int Elevator::getMaxFloor() const { return maxFloor_; }
int Elevator::getCapacity() const { return capacity_; }
int Elevator::getCurrentFloor() const { return currentFloor_; }
int Elevator::getPassengerCount() const { return static_cast<int>(passengers_.size()); }
int Elevator::availableCapacity() const { return capacity_ - getPassengerCount(); }
bool Elevator::isFull() const { return availableCapacity() <= 0; }
const std::vector<Passenger>& Elevator::getPassengers() const { return passengers_; }

std::set<int> Elevator::getDestinations() const {
    return std::set<int>(destinations_.begin(), destinations_.end());
}

bool Elevator::hasDestination(int floor) const {
    return destinations_.count(floor) > 0;
}

bool Elevator::moveUp() {
    if (currentFloor_ >= maxFloor_) {
        return false;
    }
    ++currentFloor_;
    return true;
}

bool Elevator::moveDown() {
    if (currentFloor_ <= minFloor_) {
        return false;
    }
    --currentFloor_;
    return true;
}

std::vector<Passenger> Elevator::loadFrom(PassengerQueue& queue) {
    if (queue.getFloor() != currentFloor_) {
        throw std::logic_error("Elevator " + std::to_string(id_) + " on floor " +
                               std::to_string(currentFloor_) + " loading from floor " +
                               std::to_string(queue.getFloor()));
    }

    std::vector<Passenger> boarded = queue.popFront(availableCapacity());
    for (const auto& p : boarded) {
        passengers_.push_back(p);
        destinations_.insert(p.getDestinationFloor());
    }
    return boarded;
}

std::vector<Passenger> Elevator::unload() {
    std::vector<Passenger> leaving;
    if (!hasDestination(currentFloor_)) {
        return leaving;
    }

    auto stay = std::stable_partition(passengers_.begin(), passengers_.end(),
        [this](const Passenger& p) { return !p.reachedDestination(currentFloor_); });
    leaving.assign(stay, passengers_.end());
    passengers_.erase(stay, passengers_.end());
    destinations_.erase(currentFloor_);
    return leaving;
}

int Elevator::countMovedToward(int fromFloor) const {
    return static_cast<int>(std::count_if(passengers_.begin(), passengers_.end(),
        [this, fromFloor](const Passenger& p) {
            return p.movedTowardDestination(fromFloor, currentFloor_);
        }));
}

int Elevator::countMovedAway(int fromFloor) const {
    return getPassengerCount() - countMovedToward(fromFloor);
}

void Elevator::incrementPassengerSteps() {
    for (auto& p : passengers_) {
        p.incrementStep(true);
    }
}
