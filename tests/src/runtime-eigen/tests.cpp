#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

#include <dp_access/adaptive.hpp>
#include <dp_access/errors.hpp>
#include <dp_access/node.hpp>

#include <dp_access_runtime_eigen/distributions.hpp>
#include <dp_access_runtime_eigen/mechanisms.hpp>
#include <dp_access_runtime_eigen/norms.hpp>
#include <dp_access_runtime_eigen/queries.hpp>
#include <dp_access_runtime_eigen/sampling.hpp>
#include <dp_access_runtime_eigen/sensitivity_sampler.hpp>
#include <dp_access_runtime_eigen/utilities.hpp>

#include "../../include/tests/main.hpp"

namespace {

double sampleVariance(const Eigen::VectorXd& samples) {
    double mean = samples.mean();
    return (samples.array() - mean).square().sum() / static_cast<double>(samples.size() - 1);
}

RuntimeValue makeOnes(Eigen::Index count) {
    Eigen::VectorXd ones = Eigen::VectorXd::Ones(count);
    return RuntimeValue(ones);
}

}

TEST_CASE("RandomSource", "[Utilities]") {
    auto random = make_test_random();

    for (int i = 0; i < 1000; ++i) {
        double uniform = random->sampleUniform();
        REQUIRE(uniform >= 0);
        REQUIRE(uniform < 1);

        Eigen::Index index = random->sampleIndex(7);
        REQUIRE(index >= 0);
        REQUIRE(index < 7);
    }

    SeededRandomSource first(3), second(3);
    REQUIRE(first.sampleUniform() == second.sampleUniform());

    OpenSslRandomSource secure;
    double uniform = secure.sampleUniform(-2, 2);
    REQUIRE(uniform >= -2);
    REQUIRE(uniform < 2);
    REQUIRE(resolveRandomSource(nullptr) == defaultRandomSource());
}

TEST_CASE("Laplace_Mechanism", "[Mechanisms]") {
    LaplaceMechanism mechanism(1, 1, make_test_random());
    REQUIRE(mechanism.get_name() == "laplace");
    REQUIRE(mechanism.get_scale() == 1);
    REQUIRE(mechanism.get_epsilon_delta() == PrivacyBudget(1, 0));

    Eigen::VectorXd data = Eigen::VectorXd::Constant(20000, 5);
    RuntimeValue noisy = mechanism.apply(RuntimeValue(data));

    REQUIRE(noisy.getDatatype() == typeVectorNumeric);
    REQUIRE(noisy.valueVector.mean() == Approx(5).margin(0.1));
    // variance of laplace noise is 2 (sensitivity / epsilon)^2
    REQUIRE(sampleVariance(noisy.valueVector) == Approx(2).margin(0.2));

    RuntimeValue scalar = mechanism.apply(RuntimeValue(5.));
    REQUIRE(scalar.getDatatype() == typeScalarNumeric);

    REQUIRE_THROWS_AS(LaplaceMechanism(-1, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(LaplaceMechanism(1, 0), std::invalid_argument);
}

TEST_CASE("Gaussian_Mechanism", "[Mechanisms]") {
    GaussianMechanism mechanism(1, PrivacyBudget(0.5, 0.01), make_test_random());
    REQUIRE(mechanism.get_name() == "gaussian");
    REQUIRE(mechanism.get_standard_deviation() == Approx(std::sqrt(2 * std::log(125.)) * 2));

    Eigen::MatrixXd data = Eigen::MatrixXd::Zero(100, 100);
    RuntimeValue noisy = mechanism.apply(RuntimeValue(data));
    REQUIRE(noisy.getDatatype() == typeMatrixNumeric);
    REQUIRE(noisy.valueMatrix.rows() == 100);
    REQUIRE(noisy.mean() == Approx(0).margin(0.3));

    REQUIRE_THROWS_AS(GaussianMechanism(1, PrivacyBudget(1, 1)), std::invalid_argument);
    REQUIRE_THROWS_AS(GaussianMechanism(1, PrivacyBudget(0.5, 0)), std::invalid_argument);
    REQUIRE_NOTHROW(GaussianMechanism(1, PrivacyBudget(0.1, 1)));
}

TEST_CASE("Exponential_Mechanism", "[Mechanisms]") {
    Eigen::VectorXd range = Eigen::VectorXd::LinSpaced(5, 0, 4);
    UtilityFunction closeToTwo = [](const RuntimeValue&, const Eigen::VectorXd& candidates) {
        Eigen::VectorXd scores = -(candidates.array() - 2).abs().matrix();
        return scores;
    };

    SECTION("repeated draws concentrate on the best candidate") {
        ExponentialMechanism mechanism(closeToTwo, range, 1, 20, 1000, make_test_random());
        RuntimeValue draws = mechanism.apply(RuntimeValue(0.));
        REQUIRE(draws.getDatatype() == typeVectorNumeric);
        REQUIRE(draws.size() == 1000);
        REQUIRE((draws.valueVector.array() == 2).count() >= 990);
    }

    SECTION("one draw is a scalar from the range") {
        ExponentialMechanism mechanism(closeToTwo, range, 1, 1, 1, make_test_random());
        RuntimeValue draw = mechanism.apply(RuntimeValue(0.));
        REQUIRE(draw.getDatatype() == typeScalarNumeric);
        REQUIRE(draw.valueScalar >= 0);
        REQUIRE(draw.valueScalar <= 4);
        REQUIRE(draw.valueScalar == std::round(draw.valueScalar));
    }

    SECTION("invalid configurations") {
        REQUIRE_THROWS_AS(ExponentialMechanism(closeToTwo, Eigen::VectorXd(0), 1, 1), std::invalid_argument);
        REQUIRE_THROWS_AS(ExponentialMechanism(closeToTwo, range, 0, 1), std::invalid_argument);
        REQUIRE_THROWS_AS(ExponentialMechanism(closeToTwo, range, 1, 1, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(ExponentialMechanism(nullptr, range, 1, 1), std::invalid_argument);
    }
}

TEST_CASE("Randomized_Response_Coins", "[Mechanisms]") {
    RandomizedResponseCoins mechanism(0.5, 0.5, make_test_random());
    REQUIRE(mechanism.get_epsilon_delta().get_epsilon() == Approx(std::log(3.)));

    RuntimeValue released = mechanism.apply(makeOnes(100));
    REQUIRE(released.isBinary());
    REQUIRE(released.mean() > 0);
    REQUIRE(released.mean() < 1);

    Eigen::VectorXd nonBinary = Eigen::VectorXd::Constant(10, 2);
    REQUIRE_THROWS_AS(mechanism.apply(RuntimeValue(nonBinary)), std::invalid_argument);

    REQUIRE_THROWS_AS(RandomizedResponseCoins(0, 0.5), std::invalid_argument);
    REQUIRE_THROWS_AS(RandomizedResponseCoins(0.5, 1), std::invalid_argument);
}

TEST_CASE("Randomized_Response_Binary", "[Mechanisms]") {
    REQUIRE(randomizedResponseBinaryEpsilon(0.25, 0.75) == Approx(std::log(3.)));

    SECTION("released values follow f0 and f1") {
        RandomizedResponseBinary mechanism(0.25, 0.75, 1.1, make_test_random());
        RuntimeValue ones = mechanism.apply(makeOnes(10000));
        Eigen::VectorXd zeroVector = Eigen::VectorXd::Zero(10000);
        RuntimeValue zeros = mechanism.apply(RuntimeValue(zeroVector));

        REQUIRE(ones.isBinary());
        REQUIRE(ones.mean() == Approx(0.75).margin(0.03));
        REQUIRE(zeros.mean() == Approx(0.25).margin(0.03));
    }

    SECTION("invalid configurations") {
        // epsilon below the incurred privacy loss
        REQUIRE_THROWS_AS(RandomizedResponseBinary(0.25, 0.75, 1), std::invalid_argument);
        // unbounded privacy loss
        REQUIRE_THROWS_AS(RandomizedResponseBinary(0, 0.5, 10), std::invalid_argument);
        REQUIRE_THROWS_AS(RandomizedResponseBinary(0, 1, 10), std::invalid_argument);
        REQUIRE_THROWS_AS(RandomizedResponseBinary(1.5, 0.5, 10), std::invalid_argument);
        REQUIRE_THROWS_AS(RandomizedResponseBinary(0.25, 0.75, 0), std::invalid_argument);
    }

    SECTION("non binary data") {
        RandomizedResponseBinary mechanism(0.25, 0.75, 1.1, make_test_random());
        REQUIRE_THROWS_AS(mechanism.apply(RuntimeValue(0.5)), std::invalid_argument);
    }
}

TEST_CASE("Sample_Without_Replacement", "[Sampling]") {
    auto laplace = std::make_shared<LaplaceMechanism>(1, 1, make_test_random());
    SampleWithoutReplacement sampler(laplace, 50, {100}, make_test_random(7));

    REQUIRE(sampler.get_name() == "sample-without-replacement");
    REQUIRE(sampler.get_epsilon_delta().get_epsilon() == Approx(std::log(1 + 0.5 * (std::exp(1.) - 1))));
    REQUIRE(sampler.get_epsilon_delta().get_delta() == 0);

    Eigen::VectorXd data = Eigen::VectorXd::LinSpaced(100, 0, 99);
    RuntimeValue released = sampler.apply(RuntimeValue(data));
    REQUIRE(released.rows() == 50);

    SECTION("delta scales with the sampled proportion") {
        auto gaussian = std::make_shared<GaussianMechanism>(1, PrivacyBudget(0.5, 0.01), make_test_random());
        SampleWithoutReplacement gaussianSampler(gaussian, 10, {100, 3});
        REQUIRE(gaussianSampler.get_epsilon_delta().get_epsilon() ==
                Approx(std::log(1 + 0.1 * (std::exp(0.5) - 1))));
        REQUIRE(gaussianSampler.get_epsilon_delta().get_delta() == Approx(0.001));
    }

    SECTION("records are drawn once") {
        auto identity = std::make_shared<RandomizedResponseBinary>(0.25, 0.75, 2);
        SampleWithoutReplacement whole(identity, 100, {100}, make_test_random(11));
        RuntimeValue sample = whole.sample(RuntimeValue(data));
        Eigen::VectorXd sorted = sample.valueVector;
        std::sort(sorted.data(), sorted.data() + sorted.size());
        REQUIRE(sorted == data);
    }

    SECTION("invalid configurations") {
        REQUIRE_THROWS_AS(SampleWithoutReplacement(laplace, 101, {100}), std::invalid_argument);
        REQUIRE_THROWS_AS(SampleWithoutReplacement(laplace, 0, {100}), std::invalid_argument);
        REQUIRE_THROWS_AS(SampleWithoutReplacement(std::make_shared<UnprotectedAccess>(), 10, {100}),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(sampler.apply(RuntimeValue(1.)), std::invalid_argument);
    }
}

TEST_CASE("Sample_With_Replacement", "[Sampling]") {
    auto gaussian = std::make_shared<GaussianMechanism>(1, PrivacyBudget(0.5, 0.01), make_test_random());
    SampleWithReplacement sampler(gaussian, 50, {100}, make_test_random(5));

    // probability that a given record is drawn at least once
    double proportion = 1 - std::pow(0.99, 50);
    REQUIRE(sampler.get_name() == "sample-with-replacement");
    REQUIRE(sampler.get_epsilon_delta().get_epsilon() == Approx(std::log(1 + proportion * (std::exp(0.5) - 1))));
    REQUIRE(sampler.get_epsilon_delta().get_delta() == Approx(proportion * 0.01));

    Eigen::VectorXd data = Eigen::VectorXd::Ones(100);
    REQUIRE(sampler.apply(RuntimeValue(data)).rows() == 50);

    SECTION("sizes are flattened over the trailing axes") {
        SampleWithReplacement matrixSampler(gaussian, 10, {100, 3}, make_test_random(5));

        // 30 draws over 300 elements
        double flattenedProportion = 1 - std::pow(1 - 1. / 300, 30);
        REQUIRE(matrixSampler.get_epsilon_delta().get_epsilon() ==
                Approx(std::log(1 + flattenedProportion * (std::exp(0.5) - 1))));
        REQUIRE(matrixSampler.get_epsilon_delta().get_delta() == Approx(flattenedProportion * 0.01));

        Eigen::MatrixXd records = Eigen::MatrixXd::Ones(100, 3);
        RuntimeValue released = matrixSampler.apply(RuntimeValue(records));
        REQUIRE(released.getDatatype() == typeMatrixNumeric);
        REQUIRE(released.rows() == 10);
        REQUIRE(released.valueMatrix.cols() == 3);
    }
}

TEST_CASE("Sampler_Data_Must_Match_Declared_Size", "[Sampling]") {
    auto laplace = std::make_shared<LaplaceMechanism>(1, 1, make_test_random());
    SampleWithoutReplacement sampler(laplace, 50, {100}, make_test_random(3));

    // fewer records than declared would all be released at the amplified cost
    Eigen::VectorXd fewer = Eigen::VectorXd::Zero(50);
    REQUIRE_THROWS_AS(sampler.apply(RuntimeValue(fewer)), std::invalid_argument);

    Eigen::VectorXd more = Eigen::VectorXd::Zero(200);
    REQUIRE_THROWS_AS(sampler.apply(RuntimeValue(more)), std::invalid_argument);

    SampleWithReplacement matrixSampler(laplace, 10, {100, 3}, make_test_random(3));
    Eigen::MatrixXd narrower = Eigen::MatrixXd::Zero(100, 2);
    REQUIRE_THROWS_AS(matrixSampler.apply(RuntimeValue(narrower)), std::invalid_argument);
    Eigen::MatrixXd declared = Eigen::MatrixXd::Zero(100, 3);
    REQUIRE(matrixSampler.apply(RuntimeValue(declared)).rows() == 10);
}

TEST_CASE("Sampler_Size_Limits", "[Sampling]") {
    auto laplace = std::make_shared<LaplaceMechanism>(1, 1, make_test_random());
    Eigen::Index large = Eigen::Index(1) << 40;

    REQUIRE_THROWS_AS(checkSampleSize(1, {large, large}), std::invalid_argument);
    REQUIRE_THROWS_AS(SampleWithoutReplacement(laplace, 1, {large, large}), std::invalid_argument);
    REQUIRE_NOTHROW(checkSampleSize(1, {large, 1000}));
}

TEST_CASE("Sampler_Large_Epsilon", "[Sampling]") {
    auto laplace = std::make_shared<LaplaceMechanism>(1, 1000, make_test_random());
    SampleWithoutReplacement sampler(laplace, 50, {100});

    // e^1000 is not representable, the reduction still is
    REQUIRE(sampler.get_epsilon_delta().get_epsilon() == Approx(1000 + std::log(0.5)));

    SampleWithReplacement withReplacement(laplace, 50, {100});
    double proportion = 1 - std::pow(0.99, 50);
    REQUIRE(withReplacement.get_epsilon_delta().get_epsilon() == Approx(1000 + std::log(proportion)));
}

TEST_CASE("Filter_Over_Mechanisms", "[Adaptive]") {
    SECTION("a node querying a scalar exhausts a small global delta") {
        DataNode node;
        node.set_private_data("answer", RuntimeValue(42.));
        auto gaussian = std::make_shared<GaussianMechanism>(1, PrivacyBudget(0.1, 1), make_test_random());
        node.configure_data_access("answer", std::make_shared<AdaptiveDifferentialPrivacy>(
                PrivacyBudget(1, 1e-3), gaussian));

        bool exceeded = false;
        int queries = 0;
        for (; queries < 1000 && !exceeded; ++queries) {
            try {
                node.query("answer");
            } catch (const ExceededPrivacyBudgetError&) {
                exceeded = true;
            }
        }
        REQUIRE(exceeded);
        REQUIRE(queries < 1000);
    }

    SECTION("a delta of one exhausts a small global delta at once") {
        auto gaussian = std::make_shared<GaussianMechanism>(1, PrivacyBudget(0.1, 1), make_test_random());
        AdaptiveDifferentialPrivacy filter(PrivacyBudget(1, 1e-3), gaussian);
        Eigen::VectorXd zeros = Eigen::VectorXd::Zero(10);
        RuntimeValue data(zeros);

        bool exceeded = false;
        for (int i = 0; i < 1000 && !exceeded; ++i) {
            try {
                filter.apply(data);
            } catch (const ExceededPrivacyBudgetError&) {
                exceeded = true;
            }
        }
        REQUIRE(exceeded);
    }

    SECTION("sampling stretches the budget") {
        auto laplace = std::make_shared<LaplaceMechanism>(1, 0.5, make_test_random());
        auto sampled = std::make_shared<SampleWithoutReplacement>(laplace, 10, std::vector<Eigen::Index>{100},
                                                                  make_test_random(9));
        AdaptiveDifferentialPrivacy direct(PrivacyBudget(1), laplace);
        AdaptiveDifferentialPrivacy amplified(PrivacyBudget(1), sampled);
        Eigen::VectorXd records = Eigen::VectorXd::Zero(100);

        int directCount = 0, amplifiedCount = 0;
        try {
            for (; directCount < 100; ++directCount)
                direct.apply(RuntimeValue(records));
        } catch (const ExceededPrivacyBudgetError&) {}
        try {
            for (; amplifiedCount < 100; ++amplifiedCount)
                amplified.apply(RuntimeValue(records));
        } catch (const ExceededPrivacyBudgetError&) {}

        REQUIRE(directCount == 2);
        REQUIRE(amplifiedCount > 10);
    }

    SECTION("failures after acceptance keep the charge") {
        AdaptiveDifferentialPrivacy filter(PrivacyBudget(3), std::make_shared<RandomizedResponseCoins>());
        Eigen::VectorXd nonBinary = Eigen::VectorXd::Constant(5, 3);
        REQUIRE_THROWS_AS(filter.apply(RuntimeValue(nonBinary)), std::invalid_argument);
        REQUIRE(filter.get_access_count() == 1);
    }

    SECTION("nodes query through the filter") {
        DataNode node;
        node.set_private_data("ones", makeOnes(100));
        node.configure_data_access("ones", std::make_shared<AdaptiveDifferentialPrivacy>(
                PrivacyBudget(1), std::make_shared<LaplaceMechanism>(1, 0.4, make_test_random())));

        REQUIRE(node.query("ones").rows() == 100);
        REQUIRE(node.query("ones", std::make_shared<LaplaceMechanism>(1, 0.3, make_test_random())).rows() == 100);
        // ln 19 does not fit in what is left
        REQUIRE_THROWS_AS(node.query("ones", std::make_shared<RandomizedResponseCoins>(0.9, 0.5)),
                          ExceededPrivacyBudgetError);
    }
}

TEST_CASE("Sensitivity_Norms", "[Sensitivity]") {
    Eigen::VectorXd first(3), second(3);
    first << 1, 2, 3;
    second << 0, 0, 0;

    REQUIRE(L1SensitivityNorm().compute(RuntimeValue(first), RuntimeValue(second)) == 6);
    REQUIRE(L2SensitivityNorm().compute(RuntimeValue(first), RuntimeValue(second)) == Approx(std::sqrt(14.)));
    REQUIRE(L1SensitivityNorm().compute(RuntimeValue(1.5), RuntimeValue(-1.)) == 2.5);

    Eigen::VectorXd shorter(2);
    shorter << 0, 0;
    REQUIRE_THROWS_AS(L1SensitivityNorm().compute(RuntimeValue(first), RuntimeValue(shorter)),
                      std::invalid_argument);
}

TEST_CASE("Probability_Distributions", "[Sensitivity]") {
    NormalDistribution normal(0, 1, make_test_random());
    REQUIRE(normal.sample(10).size() == 10);
    REQUIRE_THROWS_AS(normal.sample(0), std::invalid_argument);

    Eigen::MatrixXd params(2, 2);
    params << -10, 0,
              10, 0;
    Eigen::VectorXd weights(2);
    weights << 1, 1;
    GaussianMixture mixture(params, weights, make_test_random());
    RuntimeValue mixed = mixture.sample(200);
    REQUIRE((mixed.valueVector.array().abs() == 10).all());

    Eigen::VectorXd pool = Eigen::VectorXd::LinSpaced(5, 1, 5);
    ResampledDistribution resampled(RuntimeValue(pool), make_test_random());
    RuntimeValue drawn = resampled.sample(5);
    REQUIRE(drawn.valueVector.sum() == 15);
    REQUIRE_THROWS_AS(resampled.sample(6), std::invalid_argument);
}

TEST_CASE("Sensitivity_Sampler", "[Sensitivity]") {
    Eigen::VectorXd pool = Eigen::VectorXd::LinSpaced(1000, 0, 1);
    ResampledDistribution distribution(RuntimeValue(pool), make_test_random());
    Mean query;
    L1SensitivityNorm norm;

    SECTION("bounded records bound the mean") {
        SensitivitySampler sampler;
        SensitivityEstimate estimate = sampler.sample_sensitivity(query, norm, distribution, 100, 500);

        // one record of a hundred in [0, 1] moves the mean by at most 0.01
        REQUIRE(estimate.sensitivity <= 0.01 + 1e-12);
        REQUIRE(estimate.sensitivity > 0);
        REQUIRE(estimate.mean <= estimate.sensitivity);
    }

    SECTION("independent databases") {
        SensitivitySampler sampler(SensitivitySampler::independentSamples);
        SensitivityEstimate estimate = sampler.sample_sensitivity(query, norm, distribution, 100, 0, 0.2);
        REQUIRE(estimate.sensitivity >= estimate.mean);
        REQUIRE(estimate.sensitivity <= 1);
    }

    SECTION("configuration") {
        SensitivitySamplerConfig fromSamples = SensitivitySampler::configureFromSamples(500);
        REQUIRE(fromSamples.k == 500);
        REQUIRE(fromSamples.gamma > 0);
        REQUIRE(fromSamples.gamma < 1);

        SensitivitySamplerConfig fromGamma = SensitivitySampler::configureFromGamma(0.05);
        REQUIRE(fromGamma.m > 0);
        REQUIRE(fromGamma.k >= 1);
        REQUIRE(fromGamma.k <= fromGamma.m);

        REQUIRE_THROWS_AS(SensitivitySampler::configureFromGamma(1), std::invalid_argument);
        REQUIRE_THROWS_AS(SensitivitySampler::configureFromSamples(0), std::invalid_argument);
    }

    SECTION("exactly one of m or gamma") {
        SensitivitySampler sampler;
        REQUIRE_THROWS_AS(sampler.sample_sensitivity(query, norm, distribution, 100), std::invalid_argument);
        REQUIRE_THROWS_AS(sampler.sample_sensitivity(query, norm, distribution, 100, 10, 0.1),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(sampler.sample_sensitivity(query, norm, distribution, 0, 10), std::invalid_argument);
        REQUIRE_THROWS_AS(sampler.sample_sensitivity(query, norm, distribution, 2000, 10), std::invalid_argument);
    }
}
