#include "LiteTest.hpp"

#include "knn/distance.hpp"
#include "knn/errors.hpp"
#include "knn/kd_tree.hpp"
#include "knn/linear_search.hpp"
#include "knn/nn_search.hpp"

#include <cmath>
#include <random>
#include <string>
#include <vector>

using namespace wknn;

static Instances MakeHeader(std::size_t numFeatures)
{
  std::vector<Attribute> features;
  for (std::size_t i = 0; i < numFeatures; ++i)
    features.push_back(Attribute{"a" + std::to_string(i), AttributeType::Numeric, {}});
  return Instances{features, Attribute{"class", AttributeType::Numeric, {}}};
}

static Instances MakeLine(const std::vector<double>& xs)
{
  Instances data = MakeHeader(1);
  for (std::size_t i = 0; i < xs.size(); ++i)
    data.add(Instance{{xs[i]}, static_cast<double>(i)});
  return data;
}

static Instances MakeRandom(std::size_t n, std::size_t dims, unsigned seed)
{
  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> u(-5.0, 5.0);
  Instances data = MakeHeader(dims);
  for (std::size_t i = 0; i < n; ++i) {
    std::vector<double> v(dims);
    for (auto& x : v) x = u(rng);
    data.add(Instance{v, static_cast<double>(i)});
  }
  return data;
}

static void TestDistanceNormalizesRanges()
{
  Instances data = MakeHeader(2);
  data.add(Instance{{0.0, 100.0}, 0});
  data.add(Instance{{10.0, 300.0}, 0});

  EuclideanDistance dist;
  dist.setInstances(data);
  EXPECT_NEAR(dist.norm(0, 5.0), 0.5, 1e-12);
  EXPECT_NEAR(dist.norm(1, 150.0), 0.25, 1e-12);
  EXPECT_NEAR(dist.distance(data.instance(0), data.instance(1)), std::sqrt(2.0), 1e-12);

  EuclideanDistance raw(true);
  raw.setInstances(data);
  EXPECT_NEAR(raw.distance(data.instance(0), data.instance(1)), std::sqrt(100.0 + 40000.0), 1e-9);
}

static void TestDistanceMissingValues()
{
  Instances data = MakeHeader(1);
  data.add(Instance{{0.0}, 0});
  data.add(Instance{{10.0}, 0});

  EuclideanDistance dist;
  dist.setInstances(data);

  const Instance missing{{Instance::missingValue()}, 0};
  const Instance low{{2.0}, 0};
  const Instance high{{9.0}, 0};
  EXPECT_NEAR(dist.distance(missing, missing), 1.0, 1e-12);
  EXPECT_NEAR(dist.distance(missing, low), 0.8, 1e-12);
  EXPECT_NEAR(dist.distance(high, missing), 0.9, 1e-12);
}

static void TestConstantAttributeHasNoWeight()
{
  Instances data = MakeHeader(2);
  data.add(Instance{{1.0, 7.0}, 0});
  data.add(Instance{{3.0, 7.0}, 0});

  EuclideanDistance dist;
  dist.setInstances(data);
  const Instance q{{3.0, 50.0}, 0};
  EXPECT_NEAR(dist.distance(q, data.instance(1)), 0.0, 1e-12);
}

static void TestLinearKeepsTies()
{
  // Range 8 keeps every normalized value exact, so the ties are exact too.
  const Instances data = MakeLine({0.0, 2.0, 4.0, 4.0, 8.0});
  LinearNNSearch search;
  search.setInstances(data);

  const Instance q{{3.0}, 0};
  const NeighborSet k1 = search.kNearestNeighbours(q, 1);
  EXPECT_EQ(k1.size(), 3u);
  for (const auto& n : k1) EXPECT_EQ(n.distance, 0.125);

  const NeighborSet k2 = search.kNearestNeighbours(q, 2);
  EXPECT_EQ(k2.size(), 3u);

  const NeighborSet k4 = search.kNearestNeighbours(q, 4);
  EXPECT_EQ(k4.size(), 4u);
  for (std::size_t i = 1; i < k4.size(); ++i) EXPECT_TRUE(k4[i - 1].distance <= k4[i].distance);

  const Instance q2{{0.5}, 0};
  const NeighborSet single = search.kNearestNeighbours(q2, 1);
  EXPECT_EQ(single.size(), 1u);
  EXPECT_EQ(single[0].index, 0u);
  EXPECT_TRUE(search.kNearestNeighbours(q2, 0).empty());
}

static void TestExcludeAndSkipIdentical()
{
  const Instances data = MakeLine({0.0, 1.0, 5.0, 10.0});
  LinearNNSearch search;
  search.setInstances(data);

  const NeighborSet held = search.kNearestNeighbours(data.instance(1), 1, 1);
  EXPECT_EQ(held.size(), 1u);
  EXPECT_EQ(held[0].index, 0u);

  LinearNNSearch skipping;
  skipping.setSkipIdentical(true);
  skipping.setInstances(data);
  const NeighborSet skipped = skipping.kNearestNeighbours(data.instance(2), 1);
  EXPECT_EQ(skipped.size(), 1u);
  EXPECT_EQ(skipped[0].index, 1u);

  KDTree tree;
  tree.setLeafSize(1);
  tree.setInstances(data);
  const NeighborSet treeHeld = tree.kNearestNeighbours(data.instance(1), 1, 1);
  EXPECT_EQ(treeHeld.size(), 1u);
  EXPECT_EQ(treeHeld[0].index, 0u);
}

static void TestKDTreeMatchesLinear()
{
  for (int leaf : {1, 3, 10}) {
    for (std::size_t dims : {1u, 2u, 5u}) {
      const Instances data = MakeRandom(300, dims, 17u + static_cast<unsigned>(dims));
      const Instances queries = MakeRandom(40, dims, 99u);

      LinearNNSearch linear;
      linear.setInstances(data);
      KDTree tree;
      tree.setLeafSize(leaf);
      tree.setInstances(data);

      for (const auto& q : queries) {
        for (int k : {1, 4, 9}) {
          const NeighborSet a = linear.kNearestNeighbours(q, k);
          const NeighborSet b = tree.kNearestNeighbours(q, k);
          EXPECT_EQ(a.size(), b.size());
          if (a.size() != b.size()) continue;
          for (std::size_t i = 0; i < a.size(); ++i) EXPECT_NEAR(a[i].distance, b[i].distance, 1e-12);
        }
      }
    }
  }
}

static void TestKDTreeMissingValues()
{
  Instances data = MakeLine({0.0, 1.0, 2.0});
  KDTree tree;
  tree.setInstances(data);

  const Instance q{{Instance::missingValue()}, 0};
  EXPECT_EQ(tree.kNearestNeighbours(q, 1).size(), 1u);

  data.add(Instance{{Instance::missingValue()}, 3});
  KDTree other;
  EXPECT_THROW(other.setInstances(data), DataIntegrityError);
}

static void TestUpdateWidensRanges()
{
  Instances data = MakeLine({0.0, 1.0});
  LinearNNSearch search;
  search.setInstances(data);
  EXPECT_NEAR(search.distanceFunction().norm(0, 0.5), 0.5, 1e-12);

  data.add(Instance{{3.0}, 2});
  search.update(data.instance(2));
  EXPECT_NEAR(search.distanceFunction().norm(0, 1.5), 0.5, 1e-12);
  EXPECT_EQ(search.kNearestNeighbours(Instance{{2.9}, 0}, 1)[0].index, 2u);

  KDTree tree;
  tree.setInstances(data);
  data.add(Instance{{-3.0}, 3});
  tree.update(data.instance(3));
  EXPECT_EQ(tree.kNearestNeighbours(Instance{{-2.0}, 0}, 1)[0].index, 3u);
}

static void TestPruneToK()
{
  const Instance dummy{{0.0}, 0};
  const NeighborSet nb = {
    {&dummy, 0.1, 0}, {&dummy, 0.2, 1}, {&dummy, 0.2, 2}, {&dummy, 0.3, 3}, {&dummy, 0.4, 4}};

  EXPECT_EQ(pruneToK(nb, 1).size(), 1u);
  EXPECT_EQ(pruneToK(nb, 2).size(), 3u);
  EXPECT_EQ(pruneToK(nb, 3).size(), 3u);
  EXPECT_EQ(pruneToK(nb, 4).size(), 4u);
  EXPECT_EQ(pruneToK(nb, 9).size(), 5u);
  EXPECT_EQ(pruneToK(nb, 0).size(), 1u);
  EXPECT_TRUE(pruneToK(NeighborSet{}, 2).empty());
}

static void TestFactoryAndSpecification()
{
  auto linear = makeNeighborSearch("LinearNNSearch");
  EXPECT_EQ(linear->name(), std::string("LinearNNSearch"));
  EXPECT_EQ(linear->specification(), std::string("LinearNNSearch"));

  auto tree = makeNeighborSearch("KDTree -L 7 -D");
  EXPECT_EQ(tree->specification(), std::string("KDTree -L 7 -D"));
  EXPECT_TRUE(tree->distanceFunction().getDontNormalize());

  auto copy = tree->clone();
  EXPECT_EQ(copy->specification(), tree->specification());

  EXPECT_THROW(makeNeighborSearch(""), ConfigurationError);
  EXPECT_THROW(makeNeighborSearch("CoverTree"), ConfigurationError);

  LinearNNSearch unset;
  EXPECT_THROW(unset.kNearestNeighbours(Instance{{0.0}, 0}, 1), DataIntegrityError);
}

int main()
{
  TestDistanceNormalizesRanges();
  TestDistanceMissingValues();
  TestConstantAttributeHasNoWeight();
  TestLinearKeepsTies();
  TestExcludeAndSkipIdentical();
  TestKDTreeMatchesLinear();
  TestKDTreeMissingValues();
  TestUpdateWidensRanges();
  TestPruneToK();
  TestFactoryAndSpecification();

  return ReportResult("wknn_search_tests");
}
