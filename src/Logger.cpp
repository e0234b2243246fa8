#include "Logger.hpp"
#include <iomanip>
#include <sstream>

// ============== Logger Implementation ==============

Logger::Logger(std::ostream& out, bool enabled)
    : out_(out), enabled_(enabled) {}

void Logger::setTickReference(const int* tick) {
    tickRef_ = tick;
}

void Logger::log(const std::string& message) {
    if (!enabled_) return;

    out_ << getTimestamp() << " " << message << "\n";
}

void Logger::logArrival(const Passenger& passenger) {
    if (!enabled_) return;

    std::ostringstream oss;
    oss << "[ARRIVAL] passenger=" << passenger.getId()
        << " floor=" << passenger.getStartFloor()
        << " dest=" << passenger.getDestinationFloor()
        << " dir=" << directionToString(passenger.getDirection());
    log(oss.str());
}

void Logger::logRejection(const Passenger& passenger) {
    if (!enabled_) return;

    std::ostringstream oss;
    oss << "[REJECTED] passenger=" << passenger.getId()
        << " floor=" << passenger.getStartFloor()
        << " dir=" << directionToString(passenger.getDirection()) << " (queue full)";
    log(oss.str());
}

void Logger::logAbandonment(const Passenger& passenger) {
    if (!enabled_) return;

    std::ostringstream oss;
    oss << "[ABANDONED] passenger=" << passenger.getId()
        << " floor=" << passenger.getStartFloor()
        << " wait=" << passenger.getWait();
    log(oss.str());
}

void Logger::logBoarding(int elevatorId, const Passenger& passenger) {
    if (!enabled_) return;

    log("[BOARD] elevator=" + std::to_string(elevatorId) +
        " passenger=" + std::to_string(passenger.getId()) +
        " wait=" + std::to_string(passenger.getWait()));
}

void Logger::logDelivery(int elevatorId, const Passenger& passenger) {
    if (!enabled_) return;

    log("[DELIVERED] elevator=" + std::to_string(elevatorId) +
        " passenger=" + std::to_string(passenger.getId()) +
        " floor=" + std::to_string(passenger.getDestinationFloor()) +
        " age=" + std::to_string(passenger.getAge()));
}

void Logger::logAction(int elevatorId, Action action, bool effective) {
    if (!enabled_) return;

    log("[ACTION] elevator=" + std::to_string(elevatorId) +
        " " + actionToString(action) + (effective ? "" : " (no-op)"));
}

void Logger::logElevatorState(const Elevator& elev) {
    if (!enabled_) return;

    std::ostringstream oss;
    oss << "[ELEVATOR " << elev.getId() << "] "
        << "floor=" << elev.getCurrentFloor() << " "
        << "passengers=" << elev.getPassengerCount() << "/" << elev.getCapacity();

    auto dests = elev.getDestinations();
    if (!dests.empty()) {
        oss << " destinations={";
        bool first = true;
        for (int d : dests) {
            if (!first) oss << ",";
            oss << d;
            first = false;
        }
        oss << "}";
    }

    log(oss.str());
}

void Logger::logStepSummary(const RewardComponents& counts, double reward) {
    if (!enabled_) return;

    std::ostringstream oss;
    oss << "[STEP] delivered=" << counts.delivered
        << " toward=" << counts.movedToward
        << " away=" << counts.movedAway
        << " rejected=" << counts.rejected
        << " abandoned=" << counts.abandoned
        << " inElevator=" << counts.inElevator
        << " inQueue=" << counts.inQueue
        << " reward=" << std::fixed << std::setprecision(3) << reward;
    log(oss.str());
}

void Logger::enable() { enabled_ = true; }
void Logger::disable() { enabled_ = false; }
bool Logger::isEnabled() const { return enabled_; }

std::string Logger::getTimestamp() const {
    std::ostringstream oss;
    oss << "[";
    if (tickRef_) {
        oss << "T" << std::setw(4) << std::setfill('0') << *tickRef_;
    } else {
        oss << "----";
    }
    oss << "]";
    return oss.str();
}
