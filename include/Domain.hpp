#ifndef DOMAIN_HPP
#define DOMAIN_HPP

#include "Types.hpp"
#include <deque>
#include <set>
#include <vector>

// ============== Passenger ==============

class Passenger {
private:
    long id_;
    int startFloor_;
    int destinationFloor_;
    int startStep_;
    int maxWaitSteps_;
    int age_ = 0;   // steps since arrival
    int wait_ = 0;  // steps spent queued

public:
    Passenger(long id, int startFloor, int destinationFloor, int startStep, int maxWaitSteps);

    long getId() const;
    int getStartFloor() const;
    int getDestinationFloor() const;
    int getStartStep() const;
    int getMaxWaitSteps() const;
    int getAge() const;
    int getWait() const;
    Direction getDirection() const;

    // Age always advances; wait only while queued.
    void incrementStep(bool inElevator);

    bool reachedMaxWait() const;
    bool reachedDestination(int floor) const;

    // True when `to` is strictly closer to the destination than `from`.
    bool movedTowardDestination(int from, int to) const;
};

// ============== PassengerQueue ==============

// Bounded FIFO for one (floor, direction) call button.
class PassengerQueue {
private:
    int floor_;
    Direction direction_;
    int maxSize_;
    std::deque<Passenger> passengers_;

public:
    PassengerQueue(int floor, Direction direction, int maxSize);

    int getFloor() const;
    Direction getDirection() const;
    int getMaxSize() const;
    int size() const;
    bool empty() const;
    bool isFull() const;

    // Returns false (and leaves the queue untouched) when full.
    bool tryPush(const Passenger& passenger);

    // Removes up to `count` passengers from the front.
    std::vector<Passenger> popFront(int count);

    // Removes every passenger whose wait reached its limit.
    std::vector<Passenger> removeExpired();

    void incrementWaits();

    const std::deque<Passenger>& getPassengers() const;
};

// ============== Elevator ==============

class Elevator {
private:
    int id_;
    int minFloor_;
    int maxFloor_;
    int capacity_;
    int currentFloor_;
    std::vector<Passenger> passengers_;  // boarding order
    std::multiset<int> destinations_;    // one entry per onboard passenger

public:
    Elevator(int id, const ElevatorSpec& spec);

    // Getters
    int getId() const;
    int getMinFloor() const;
    int getMaxFloor() const;
    int getCapacity() const;
    int getCurrentFloor() const;
    int getPassengerCount() const;
    int availableCapacity() const;
    bool isFull() const;
    const std::vector<Passenger>& getPassengers() const;

    // Destination buttons
    std::set<int> getDestinations() const;
    bool hasDestination(int floor) const;

    // Movement; returns false when clamped at the range boundary.
    bool moveUp();
    bool moveDown();

    // Boards as many as fit from the front of the queue.
    std::vector<Passenger> loadFrom(PassengerQueue& queue);

    // Removes passengers whose destination is the current floor.
    std::vector<Passenger> unload();

    // Toward/away counts for a move that started on `fromFloor`.
    int countMovedToward(int fromFloor) const;
    int countMovedAway(int fromFloor) const;

    void incrementPassengerSteps();
};

#endif // DOMAIN_HPP
