#include "Observation.hpp"

int flattenedSize(int numFloors, int numElevators) {
    return 2 * numFloors * numElevators + 2 * numFloors;
}

std::vector<int> flatten(const Observation& obs) {
    const int floors = obs.getNumFloors();
    const int elevators = obs.getNumElevators();

    std::vector<int> flat;
    flat.reserve(flattenedSize(floors, elevators));

    for (const auto& row : obs.elevatorButtons) {
        for (bool pressed : row) {
            flat.push_back(pressed ? 1 : 0);
        }
    }
    for (bool pressed : obs.upButtons) {
        flat.push_back(pressed ? 1 : 0);
    }
    for (bool pressed : obs.downButtons) {
        flat.push_back(pressed ? 1 : 0);
    }
    for (int floor : obs.elevatorFloors) {
        for (int f = 0; f < floors; ++f) {
            flat.push_back(f == floor ? 1 : 0);
        }
    }
    return flat;
}
