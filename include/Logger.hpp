#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "Domain.hpp"
#include <iostream>
#include <string>

// ============== Logger ==============

class Logger {
private:
    std::ostream& out_;
    bool enabled_;
    const int* tickRef_ = nullptr;  // Reference to current timestep

public:
    explicit Logger(std::ostream& out = std::clog, bool enabled = false);

    void setTickReference(const int* tick);

    void log(const std::string& message);
    void logArrival(const Passenger& passenger);
    void logRejection(const Passenger& passenger);
    void logAbandonment(const Passenger& passenger);
    void logBoarding(int elevatorId, const Passenger& passenger);
    void logDelivery(int elevatorId, const Passenger& passenger);
    void logAction(int elevatorId, Action action, bool effective);
    void logElevatorState(const Elevator& elev);
    void logStepSummary(const RewardComponents& counts, double reward);

    void enable();
    void disable();
    bool isEnabled() const;

private:
    std::string getTimestamp() const;
};

#endif // LOGGER_HPP
