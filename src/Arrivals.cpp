#include "Arrivals.hpp"
#include <cmath>
#include <numeric>

namespace {

constexpr double kProbabilityTolerance = 1e-6;
constexpr double kGroundDestinationProb = 0.8;
// Keeps per-step Poisson draws well inside int range
constexpr double kMaxArrivalRate = 1000.0;

}  // namespace

// ============== ArrivalGenerator Implementation ==============

ArrivalGenerator::ArrivalGenerator(const ArrivalParams& params, int maxWaitSteps, std::mt19937 rng)
    : numFloors_(static_cast<int>(params.floorArrivalRates.size())),
      arrivalRates_(params.floorArrivalRates),
      maxWaitSteps_(maxWaitSteps),
      rng_(rng) {
    validateParams(numFloors_, params);
    if (maxWaitSteps < 0) {
        throw ConfigError("max wait steps must be non-negative");
    }

    destinationDists_.reserve(numFloors_);
    for (const auto& row : params.floorDestinationRates) {
        destinationDists_.emplace_back(row.begin(), row.end());
    }
}

int ArrivalGenerator::getNumFloors() const { return numFloors_; }

std::vector<int> ArrivalGenerator::sampleArrivalCounts() {
    std::vector<int> counts(numFloors_, 0);
    for (int floor = 0; floor < numFloors_; ++floor) {
        // poisson_distribution requires a strictly positive mean
        if (arrivalRates_[floor] > 0.0) {
            std::poisson_distribution<int> dist(arrivalRates_[floor]);
            counts[floor] = dist(rng_);
        }
    }
    return counts;
}

int ArrivalGenerator::sampleDestination(int floor) {
    return destinationDists_.at(floor)(rng_);
}

std::vector<Passenger> ArrivalGenerator::generate(int timestep, long firstId) {
    std::vector<int> counts = sampleArrivalCounts();

    std::vector<Passenger> passengers;
    long nextId = firstId;
    for (int floor = 0; floor < numFloors_; ++floor) {
        for (int i = 0; i < counts[floor]; ++i) {
            int destination = sampleDestination(floor);
            passengers.emplace_back(nextId++, floor, destination, timestep, maxWaitSteps_);
        }
    }
    return passengers;
}

ArrivalParams ArrivalGenerator::defaultParams(int numElevators, int numFloors) {
    if (numFloors < 2) {
        throw ConfigError("building needs at least 2 floors, got " + std::to_string(numFloors));
    }
    if (numElevators < 1) {
        throw ConfigError("building needs at least 1 elevator");
    }

    const double groundRate = 0.5 * numElevators;
    const double otherRate = groundRate / numFloors;

    ArrivalParams params;
    params.floorArrivalRates.assign(numFloors, otherRate);
    params.floorArrivalRates[0] = groundRate;

    std::vector<double> groundRow(numFloors, 1.0 / (numFloors - 1));
    groundRow[0] = 0.0;
    params.floorDestinationRates.push_back(groundRow);

    // With two floors the only other destination is the ground floor.
    const double groundProb = numFloors == 2 ? 1.0 : kGroundDestinationProb;
    const double otherProb = numFloors == 2 ? 0.0 : (1.0 - groundProb) / (numFloors - 2);

    for (int floor = 1; floor < numFloors; ++floor) {
        std::vector<double> row(numFloors, otherProb);
        row[0] = groundProb;
        row[floor] = 0.0;
        params.floorDestinationRates.push_back(row);
    }
    return params;
}

void ArrivalGenerator::validateParams(int numFloors, const ArrivalParams& params) {
    if (static_cast<int>(params.floorArrivalRates.size()) != numFloors) {
        throw ConfigError("expected " + std::to_string(numFloors) + " arrival rates, got " +
                          std::to_string(params.floorArrivalRates.size()));
    }
    for (int floor = 0; floor < numFloors; ++floor) {
        double rate = params.floorArrivalRates[floor];
        if (!std::isfinite(rate) || rate < 0.0) {
            throw ConfigError("arrival rate for floor " + std::to_string(floor) +
                              " must be a non-negative number");
        }
        if (rate > kMaxArrivalRate) {
            throw ConfigError("arrival rate for floor " + std::to_string(floor) +
                              " exceeds " + std::to_string(kMaxArrivalRate) + " per step");
        }
    }

    if (static_cast<int>(params.floorDestinationRates.size()) != numFloors) {
        throw ConfigError("expected " + std::to_string(numFloors) +
                          " destination distributions, got " +
                          std::to_string(params.floorDestinationRates.size()));
    }
    for (int floor = 0; floor < numFloors; ++floor) {
        const auto& row = params.floorDestinationRates[floor];
        if (static_cast<int>(row.size()) != numFloors) {
            throw ConfigError("destination distribution for floor " + std::to_string(floor) +
                              " must have " + std::to_string(numFloors) + " entries");
        }
        for (double p : row) {
            if (!std::isfinite(p) || p < 0.0) {
                throw ConfigError("destination distribution for floor " +
                                  std::to_string(floor) + " has a negative entry");
            }
        }
        if (row[floor] != 0.0) {
            throw ConfigError("destination distribution for floor " + std::to_string(floor) +
                              " must be zero at its own floor");
        }
        double sum = std::accumulate(row.begin(), row.end(), 0.0);
        if (std::fabs(sum - 1.0) > kProbabilityTolerance) {
            throw ConfigError("destination distribution for floor " + std::to_string(floor) +
                              " sums to " + std::to_string(sum) + ", expected 1");
        }
    }
}
