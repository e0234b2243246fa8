#include <gtest/gtest.h>
#include "Environment.hpp"
#include <random>
#include <set>
#include <vector>

namespace {

std::vector<int> randomActions(std::mt19937& gen, int numElevators) {
    std::uniform_int_distribution<> actionDist(0, kNumActions - 1);
    std::vector<int> actions(numElevators);
    for (auto& a : actions) {
        a = actionDist(gen);
    }
    return actions;
}

// Every passenger in exactly one place, wait <= age, floors in range.
void expectConsistent(const Building& building) {
    std::set<long> seen;

    for (int i = 0; i < building.getNumElevators(); ++i) {
        const Elevator& elev = building.getElevator(i);
        EXPECT_GE(elev.getCurrentFloor(), elev.getMinFloor());
        EXPECT_LE(elev.getCurrentFloor(), elev.getMaxFloor());
        EXPECT_LE(elev.getPassengerCount(), elev.getCapacity());
        for (const auto& p : elev.getPassengers()) {
            EXPECT_TRUE(seen.insert(p.getId()).second) << "passenger " << p.getId();
            EXPECT_LE(p.getWait(), p.getAge());
        }
    }

    for (int floor = 0; floor < building.getNumFloors(); ++floor) {
        for (Direction dir : {Direction::Up, Direction::Down}) {
            if (!building.hasQueue(floor, dir)) continue;
            const PassengerQueue& queue = building.getQueue(floor, dir);
            EXPECT_LE(queue.size(), queue.getMaxSize());

            int lastStart = -1;
            for (const auto& p : queue.getPassengers()) {
                EXPECT_TRUE(seen.insert(p.getId()).second) << "passenger " << p.getId();
                EXPECT_LE(p.getWait(), p.getAge());
                EXPECT_LE(p.getWait(), p.getMaxWaitSteps());
                EXPECT_GE(p.getStartStep(), lastStart);
                lastStart = p.getStartStep();
            }
        }
    }

    Accounting acc = building.getAccounting();
    EXPECT_EQ(acc.queued + acc.aboard, static_cast<long>(seen.size()));
    EXPECT_EQ(acc.queued + acc.aboard + acc.delivered + acc.abandoned + acc.rejected,
              acc.generated);
}

}  // namespace

// ============== Random Policy Endurance ==============

TEST(StressTest, RandomPolicyKeepsInvariants) {
    Config config = Config::makeDefault(12, 3);
    config.floorArrivalRates.assign(12, 0.6);
    config.queueCapacities.assign(12, 6);
    config.maxWaitSteps = 15;
    config.elevators[1] = ElevatorSpec{0, 5, 4, 3};
    config.elevators[2] = ElevatorSpec{6, 11, 2, 11};

    Environment env(config);
    std::mt19937 policy(2024);

    long delivered = 0;
    for (int t = 0; t < 2000; ++t) {
        EnvStep result = env.step(randomActions(policy, 3));
        delivered += result.info.delivered;
        expectConsistent(env.getBuilding());
        if (HasFailure()) {
            FAIL() << "invariant broken at timestep " << t;
        }
    }

    EXPECT_EQ(env.getBuilding().getTimestep(), 2000);
    EXPECT_EQ(env.getBuilding().getAccounting().delivered, delivered);
    EXPECT_GT(env.getBuilding().getAccounting().rejected, 0);
    EXPECT_GT(env.getBuilding().getAccounting().abandoned, 0);
}

TEST(StressTest, CeilingHammering) {
    Config config = Config::makeDefault(6, 2);
    config.elevators[1] = ElevatorSpec{2, 4, 3, 2};
    Environment env(config);

    for (int t = 0; t < 500; ++t) {
        env.step({1, 1});
        expectConsistent(env.getBuilding());
    }
    EXPECT_EQ(env.getBuilding().getElevator(0).getCurrentFloor(), 5);
    EXPECT_EQ(env.getBuilding().getElevator(1).getCurrentFloor(), 4);

    for (int t = 0; t < 500; ++t) {
        env.step({2, 2});
    }
    EXPECT_EQ(env.getBuilding().getElevator(0).getCurrentFloor(), 0);
    EXPECT_EQ(env.getBuilding().getElevator(1).getCurrentFloor(), 2);
}

TEST(StressTest, RewardMatchesComponents) {
    Config config = Config::makeDefault(8, 2);
    config.rewardWeights = RewardWeights{3.0, 0.5, -2.0, -4.0, -0.25, -0.05, -0.2};
    Environment env(config);
    std::mt19937 policy(7);

    for (int t = 0; t < 500; ++t) {
        EnvStep result = env.step(randomActions(policy, 2));
        EXPECT_DOUBLE_EQ(result.reward, computeReward(result.info, config.rewardWeights));
        EXPECT_EQ(result.info.inQueue, env.getBuilding().getAccounting().queued);
        EXPECT_EQ(result.info.inElevator, env.getBuilding().getAccounting().aboard);
    }
}

// ============== Determinism ==============

namespace {

struct Trajectory {
    std::vector<std::vector<int>> observations;
    std::vector<double> rewards;
};

Trajectory runEpisode(const Config& config, uint32_t seed, uint32_t policySeed, int steps) {
    Environment env(config);
    env.reset(seed);
    std::mt19937 policy(policySeed);

    Trajectory trajectory;
    for (int t = 0; t < steps; ++t) {
        EnvStep result = env.step(randomActions(policy, config.getNumElevators()));
        trajectory.observations.push_back(std::get<std::vector<int>>(result.observation));
        trajectory.rewards.push_back(result.reward);
    }
    return trajectory;
}

}  // namespace

TEST(StressTest, SameSeedSameTrajectory) {
    Config config = Config::makeDefault(10, 3);
    config.observationMode = ObservationMode::Flattened;

    Trajectory a = runEpisode(config, 31337, 5, 1000);
    Trajectory b = runEpisode(config, 31337, 5, 1000);

    EXPECT_EQ(a.observations, b.observations);
    EXPECT_EQ(a.rewards, b.rewards);
}

TEST(StressTest, DifferentSeedsDiverge) {
    Config config = Config::makeDefault(10, 3);
    config.observationMode = ObservationMode::Flattened;

    Trajectory a = runEpisode(config, 1, 5, 500);
    Trajectory b = runEpisode(config, 2, 5, 500);

    EXPECT_NE(a.observations, b.observations);
}

TEST(StressTest, UnseededResetsAreReproducible) {
    Config config = Config::makeDefault(6, 2);
    config.seed = 77;
    config.episodeLength = 50;

    auto runEpisodes = [&config]() {
        Environment env(config);
        std::mt19937 policy(3);
        std::vector<double> rewards;
        for (int episode = 0; episode < 4; ++episode) {
            env.reset();
            while (!env.isDone()) {
                rewards.push_back(env.step(randomActions(policy, 2)).reward);
            }
        }
        return rewards;
    };

    std::vector<double> first = runEpisodes();
    std::vector<double> second = runEpisodes();
    EXPECT_EQ(first.size(), 200u);
    EXPECT_EQ(first, second);
}

// ============== Independent Instances ==============

TEST(StressTest, IndependentBuildingsDoNotInterfere) {
    Config config = Config::makeDefault(8, 2);
    config.observationMode = ObservationMode::Flattened;

    Trajectory alone = runEpisode(config, 9, 11, 300);

    // Interleave two environments; the first must match its solo run
    Environment first(config);
    Environment second(config);
    first.reset(9u);
    second.reset(10u);
    std::mt19937 policyA(11);
    std::mt19937 policyB(12);

    for (int t = 0; t < 300; ++t) {
        EnvStep a = first.step(randomActions(policyA, 2));
        second.step(randomActions(policyB, 2));
        EXPECT_EQ(std::get<std::vector<int>>(a.observation), alone.observations[t]);
        EXPECT_EQ(a.reward, alone.rewards[t]);
    }
}

// ============== Main ==============

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
