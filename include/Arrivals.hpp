#ifndef ARRIVALS_HPP
#define ARRIVALS_HPP

#include "Domain.hpp"
#include <random>
#include <vector>

struct ArrivalParams {
    std::vector<double> floorArrivalRates;
    std::vector<std::vector<double>> floorDestinationRates;
};

// ============== Arrival Generator ==============
// Poisson arrivals per floor, categorical destinations per arrival floor.
// All randomness comes from the engine handed in at construction.

class ArrivalGenerator {
private:
    int numFloors_;
    std::vector<double> arrivalRates_;
    std::vector<std::discrete_distribution<int>> destinationDists_;
    int maxWaitSteps_;
    std::mt19937 rng_;

public:
    // Throws ConfigError on malformed rates.
    ArrivalGenerator(const ArrivalParams& params, int maxWaitSteps, std::mt19937 rng);

    int getNumFloors() const;

    // Number of arrivals per floor for one step.
    std::vector<int> sampleArrivalCounts();

    int sampleDestination(int floor);

    // Passengers for `timestep`, ids assigned consecutively from `firstId`.
    std::vector<Passenger> generate(int timestep, long firstId);

    // Ground floor busiest and spread evenly upward; upper floors mostly
    // head back to the ground floor.
    static ArrivalParams defaultParams(int numElevators, int numFloors);

    static void validateParams(int numFloors, const ArrivalParams& params);
};

#endif // ARRIVALS_HPP
