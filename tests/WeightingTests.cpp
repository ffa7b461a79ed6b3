#include "LiteTest.hpp"

#include "knn/errors.hpp"
#include "knn/weighting.hpp"

#include <cmath>
#include <deque>
#include <numeric>
#include <vector>

using namespace wknn;

// Neighbor sets point into this storage; std::deque keeps the addresses stable.
static NeighborSet MakeNeighbors(std::deque<Instance>& store, const std::vector<double>& classes,
                                 const std::vector<double>& distances,
                                 const std::vector<double>& weights = {})
{
  NeighborSet out;
  for (std::size_t i = 0; i < classes.size(); ++i) {
    store.emplace_back(std::vector<double>{0.0}, classes[i], weights.empty() ? 1.0 : weights[i]);
    out.push_back(Neighbor{&store.back(), distances[i], i});
  }
  return out;
}

static double Sum(const std::vector<double>& v)
{
  return std::accumulate(v.begin(), v.end(), 0.0);
}

static void TestLogDistributionIsProbability()
{
  const std::vector<std::vector<double>> distanceSets = {
    {0.0, 0.0, 0.0},
    {0.1, 0.5, 0.9},
    {0.0, 0.25, 0.99},
    {0.3, 0.3, 0.7},
  };

  WeightConfig cfg;
  for (const auto& distances : distanceSets) {
    std::deque<Instance> store;
    NeighborSet nb = MakeNeighbors(store, {0, 1, 2}, distances);
    const std::vector<double> dist = buildDistribution(nb, cfg, 3, AttributeType::Nominal, 1, 50);
    EXPECT_EQ(dist.size(), 3u);
    for (double d : dist) EXPECT_TRUE(d >= 0.0);
    EXPECT_NEAR(Sum(dist), 1.0, 1e-12);
  }
}

static void TestZeroDistanceLogWeightIsFinite()
{
  WeightConfig cfg;
  const double w = neighborWeight(0.0, cfg);
  EXPECT_TRUE(std::isfinite(w));
  EXPECT_NEAR(w, -std::log(1e-10), 1e-12);
  EXPECT_TRUE(w > neighborWeight(1e-6, cfg));
  EXPECT_TRUE(w > neighborWeight(0.5, cfg));
}

static void TestGaussianAtMean()
{
  EXPECT_NEAR(gaussian(0.0, 1.0, 0.0), 0.3989422804014327, 1e-12);

  WeightConfig cfg;
  cfg.mode = WeightingMode::Gaussian;
  EXPECT_NEAR(neighborWeight(0.0, cfg), 1.0 / std::sqrt(2.0 * 3.14159265358979323846), 1e-12);
  EXPECT_TRUE(neighborWeight(0.1, cfg) > neighborWeight(0.5, cfg));

  cfg.sd = 0.5;
  EXPECT_NEAR(neighborWeight(0.0, cfg), 2.0 * 0.3989422804014327, 1e-12);
}

static void TestAdjustedDistanceDependsOnAttributeCount()
{
  EXPECT_NEAR(adjustDistance(2.0, 1), 2.0, 1e-12);
  EXPECT_NEAR(adjustDistance(2.0, 4), 1.0, 1e-12);
  EXPECT_TRUE(adjustDistance(0.8, 2) > adjustDistance(0.8, 3));
  EXPECT_TRUE(adjustDistance(0.8, 3) > adjustDistance(0.8, 10));
  EXPECT_EQ(adjustDistance(0.0, 1), 0.0);
  EXPECT_EQ(adjustDistance(0.0, 7), 0.0);
}

static void TestTwoCloseVotesBeatOne()
{
  std::deque<Instance> store;
  NeighborSet nb = MakeNeighbors(store, {0, 0, 1}, {0.1, 0.2, 0.1});

  const std::vector<double> dist = buildDistribution(nb, WeightConfig{}, 2, AttributeType::Nominal, 1, 100);
  EXPECT_TRUE(dist[0] > dist[1]);
  EXPECT_NEAR(Sum(dist), 1.0, 1e-12);

  const double wA = -std::log(0.1 + 1e-10) - std::log(0.2 + 1e-10);
  const double wB = -std::log(0.1 + 1e-10);
  EXPECT_NEAR(dist[0], (0.01 + wA) / (0.02 + wA + wB), 1e-12);
}

static void TestNumericEqualWeightsAverage()
{
  std::deque<Instance> store;
  NeighborSet nb = MakeNeighbors(store, {10.0, 20.0}, {0.3, 0.3});

  const std::vector<double> dist = buildDistribution(nb, WeightConfig{}, 1, AttributeType::Numeric, 2, 10);
  EXPECT_EQ(dist.size(), 1u);
  EXPECT_NEAR(dist[0], 15.0, 1e-9);

  WeightConfig gauss;
  gauss.mode = WeightingMode::Gaussian;
  EXPECT_NEAR(buildDistribution(nb, gauss, 1, AttributeType::Numeric, 2, 10)[0], 15.0, 1e-9);
}

static void TestInstanceWeightScalesVote()
{
  std::deque<Instance> store;
  NeighborSet nb = MakeNeighbors(store, {10.0, 20.0}, {0.3, 0.3}, {3.0, 1.0});
  EXPECT_NEAR(buildDistribution(nb, WeightConfig{}, 1, AttributeType::Numeric, 1, 2)[0], 12.5, 1e-9);
}

static void TestUnknownModeUsesConstantWeight()
{
  WeightConfig cfg;
  cfg.mode = static_cast<WeightingMode>(3);
  EXPECT_NEAR(neighborWeight(0.7, cfg), -std::log(1e-10), 1e-12);
  EXPECT_NEAR(neighborWeight(0.0, cfg), neighborWeight(0.9, cfg), 1e-12);

  std::deque<Instance> store;
  NeighborSet nb = MakeNeighbors(store, {0, 0, 1}, {0.9, 0.8, 0.0});
  const std::vector<double> dist = buildDistribution(nb, cfg, 2, AttributeType::Nominal, 1, 100);
  const double w = -std::log(1e-10);
  EXPECT_NEAR(dist[0], (0.01 + 2 * w) / (0.02 + 3 * w), 1e-12);
  EXPECT_NEAR(dist[1], (0.01 + w) / (0.02 + 3 * w), 1e-12);

  cfg.strict = true;
  EXPECT_THROW(neighborWeight(0.5, cfg), ConfigurationError);
  EXPECT_THROW(buildDistribution(nb, cfg, 2, AttributeType::Nominal, 1, 100), ConfigurationError);
}

static void TestMissingClassIsFatal()
{
  std::deque<Instance> store;
  NeighborSet nb = MakeNeighbors(store, {0, Instance::missingValue()}, {0.1, 0.2});
  EXPECT_THROW(buildDistribution(nb, WeightConfig{}, 2, AttributeType::Nominal, 1, 10), DataIntegrityError);
  EXPECT_THROW(buildDistribution(nb, WeightConfig{}, 1, AttributeType::Numeric, 1, 10), DataIntegrityError);
}

static void TestNonPositiveTotalLeftUnnormalized()
{
  // Adjusted distance e gives a log weight of -1.
  std::deque<Instance> store;
  NeighborSet nb = MakeNeighbors(store, {10.0}, {std::exp(1.0)});
  const std::vector<double> dist = buildDistribution(nb, WeightConfig{}, 1, AttributeType::Numeric, 1, 1);
  EXPECT_NEAR(dist[0], -10.0, 1e-6);

  // Gaussian weight underflows to zero far from the mean.
  WeightConfig gauss;
  gauss.mode = WeightingMode::Gaussian;
  std::deque<Instance> farStore;
  NeighborSet far = MakeNeighbors(farStore, {4.0, 8.0}, {1e3, 2e3});
  const std::vector<double> raw = buildDistribution(far, gauss, 1, AttributeType::Numeric, 1, 2);
  EXPECT_EQ(raw[0], 0.0);
  EXPECT_TRUE(!std::isnan(raw[0]));
}

static void TestEmptyNeighborsKeepPrior()
{
  NeighborSet none;
  const std::vector<double> dist = buildDistribution(none, WeightConfig{}, 4, AttributeType::Nominal, 3, 0);
  for (double d : dist) EXPECT_NEAR(d, 0.25, 1e-12);

  EXPECT_THROW(buildDistribution(none, WeightConfig{}, 4, AttributeType::Nominal, 0, 0), DataIntegrityError);
}

int main()
{
  TestLogDistributionIsProbability();
  TestZeroDistanceLogWeightIsFinite();
  TestGaussianAtMean();
  TestAdjustedDistanceDependsOnAttributeCount();
  TestTwoCloseVotesBeatOne();
  TestNumericEqualWeightsAverage();
  TestInstanceWeightScalesVote();
  TestUnknownModeUsesConstantWeight();
  TestMissingClassIsFatal();
  TestNonPositiveTotalLeftUnnormalized();
  TestEmptyNeighborsKeepPrior();

  return ReportResult("wknn_weighting_tests");
}
