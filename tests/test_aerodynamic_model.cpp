#include <gtest/gtest.h>
#include "aircraft/aerodynamic_model.hpp"
#include "test_fixtures.hpp"
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace aerobuild;

namespace {

FlightState stateFor(int i) {
    FlightState s;
    s.alpha = -0.1 + 0.01 * (i % 40);
    s.beta = -0.05 + 0.005 * (i % 20);
    s.p = 0.02 * (i % 7);
    s.q = -0.03 * (i % 5);
    s.r = 0.01 * (i % 3);
    s.elevator = -0.01 * (i % 4);
    s.aileron = 0.005 * (i % 6);
    s.rudder = -0.004 * (i % 8);
    s.airspeed = 50.0 + i;
    return s;
}

} // namespace

TEST(AerodynamicModelTest, ModelMatchesFreeFunctions) {
    auto params = std::make_shared<AircraftParams>(aerobuild::testing::loadF4());
    StabilityDerivativeModel model(params);
    EXPECT_STREQ(model.name(), "StabilityDerivativeModel");
    EXPECT_EQ(model.params().name(), "F4Phantom");

    FlightState s = stateFor(17);
    AeroCoefficients direct = computeCoefficients(*params, s);
    AeroCoefficients viaModel = model.coefficients(s);
    EXPECT_EQ(viaModel.cD, direct.cD);
    EXPECT_EQ(viaModel.cm, direct.cm);

    AeroForces loads = model.evaluate(s, 1.1);
    AeroForces expected = evaluate(*params, s, 1.1);
    EXPECT_EQ(loads.force, expected.force);
    EXPECT_EQ(loads.moment, expected.moment);
}

TEST(AerodynamicModelTest, NullParamsAreRejected) {
    EXPECT_THROW(StabilityDerivativeModel(nullptr), std::invalid_argument);
}

TEST(AerodynamicModelTest, UsableThroughInterface) {
    auto params = std::make_shared<AircraftParams>(aerobuild::testing::loadF4());
    std::unique_ptr<AerodynamicModel> model = std::make_unique<StabilityDerivativeModel>(params);
    FlightState s;
    s.airspeed = 100.0;
    EXPECT_EQ(model->coefficients(s).cL, params->coefficients().lift.c0);
}

TEST(AerodynamicModelTest, TwoAircraftShareNoState) {
    auto f4 = std::make_shared<AircraftParams>(aerobuild::testing::loadF4());
    AeroCoefficientSet k;
    k.lift.c0 = 0.5;
    auto other = std::make_shared<AircraftParams>(aerobuild::testing::withCoefficients(k));

    StabilityDerivativeModel a(f4);
    StabilityDerivativeModel b(other);
    FlightState s;
    s.airspeed = 100.0;
    EXPECT_EQ(a.coefficients(s).cL, 0.105);
    EXPECT_EQ(b.coefficients(s).cL, 0.5);
    EXPECT_EQ(a.coefficients(s).cL, 0.105);
}

TEST(AerodynamicModelTest, ConcurrentEvaluationMatchesSequential) {
    std::shared_ptr<const AircraftParams> params =
        std::make_shared<AircraftParams>(aerobuild::testing::loadF4());
    const StabilityDerivativeModel model(params);

    constexpr int kStates = 200;
    constexpr int kThreads = 8;

    std::vector<AeroForces> expected;
    expected.reserve(kStates);
    for (int i = 0; i < kStates; ++i) {
        expected.push_back(model.evaluate(stateFor(i), 1.0));
    }

    std::vector<std::vector<AeroForces>> results(kThreads);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
            // Each thread owns its FlightState and shares only the record.
            StabilityDerivativeModel local(params);
            results[t].reserve(kStates);
            for (int i = 0; i < kStates; ++i) {
                const AerodynamicModel& m = (t % 2 == 0) ? static_cast<const AerodynamicModel&>(model) : local;
                results[t].push_back(m.evaluate(stateFor(i), 1.0));
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    for (int t = 0; t < kThreads; ++t) {
        ASSERT_EQ(results[t].size(), expected.size());
        for (int i = 0; i < kStates; ++i) {
            EXPECT_EQ(results[t][i].force, expected[i].force) << "thread " << t << " state " << i;
            EXPECT_EQ(results[t][i].moment, expected[i].moment) << "thread " << t << " state " << i;
        }
    }
}
