#ifndef OBSERVATION_HPP
#define OBSERVATION_HPP

#include <variant>
#include <vector>

// ============== Observation ==============
// Button-level view of the building: never exposes passenger counts or
// destinations beyond "some button is lit".

struct Observation {
    // elevators x floors: some onboard passenger requested floor F
    std::vector<std::vector<bool>> elevatorButtons;
    // floors: up/down queue at floor F is non-empty
    std::vector<bool> upButtons;
    std::vector<bool> downButtons;
    // current floor per elevator
    std::vector<int> elevatorFloors;

    int getNumFloors() const { return static_cast<int>(upButtons.size()); }
    int getNumElevators() const { return static_cast<int>(elevatorFloors.size()); }
};

// Length of the flattened vector: 2 * floors * elevators + 2 * floors.
int flattenedSize(int numFloors, int numElevators);

// Elevator buttons (row-major), up buttons, down buttons, one-hot floors.
std::vector<int> flatten(const Observation& obs);

using EncodedObservation = std::variant<Observation, std::vector<int>>;

#endif // OBSERVATION_HPP
