#include "Environment.hpp"
#include <stdexcept>

// ============== Environment Implementation ==============

Environment::Environment(const Config& config, std::ostream& logOut)
    : config_(config), logOut_(logOut), seedSequence_(config.seed) {
    validateConfig(config_);
    reset();
}

EncodedObservation Environment::reset(std::optional<uint32_t> seed,
                                      std::optional<Config> config) {
    if (config) {
        validateConfig(*config);
        config_ = *config;
        seedSequence_.seed(config_.seed);
    }

    const uint32_t episodeSeed = seed ? *seed : static_cast<uint32_t>(seedSequence_());

    building_ = std::make_unique<Building>(config_, std::mt19937(episodeSeed), logOut_);
    done_ = false;

    building_->getLogger().log("Episode reset with seed " + std::to_string(episodeSeed));
    return observe();
}

EnvStep Environment::step(const std::vector<int>& actions) {
    if (done_) {
        throw std::logic_error("step() called on a finished episode; call reset() first");
    }

    std::vector<Action> decoded;
    decoded.reserve(actions.size());
    for (int code : actions) {
        decoded.push_back(actionFromCode(code));
    }

    StepResult result = building_->step(decoded);

    done_ = config_.episodeLength > 0 &&
            building_->getTimestep() >= config_.episodeLength;
    if (done_) {
        building_->getLogger().log("Episode finished after " +
                                   std::to_string(building_->getTimestep()) + " steps");
    }

    EnvStep out;
    out.observation = encode(result.observation);
    out.reward = result.reward;
    out.done = done_;
    out.info = result.info;
    return out;
}

EncodedObservation Environment::observe() const {
    return encode(building_->observe());
}

ActionSpace Environment::actionSpace() const {
    return ActionSpace{config_.getNumElevators(), kNumActions};
}

int Environment::observationSize() const {
    return flattenedSize(config_.numFloors, config_.getNumElevators());
}

bool Environment::isDone() const { return done_; }
const Config& Environment::getConfig() const { return config_; }
const Building& Environment::getBuilding() const { return *building_; }

EncodedObservation Environment::encode(const Observation& obs) const {
    if (config_.observationMode == ObservationMode::Flattened) {
        return flatten(obs);
    }
    return obs;
}
