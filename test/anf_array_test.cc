#include "gtest/gtest.h"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <random>
#include <vector>

#include "anf.h"
#include "truth_table.h"

namespace {

using Table4 = std::array<bool, 4>;

struct ArrayCase {
  Table4 truth;
  Table4 anf;
};

// All two-variable functions.
const ArrayCase kCases2[] = {
    {{false, false, false, false}, {false, false, false, false}},
    {{true, false, false, false}, {true, true, true, true}},
    {{false, true, false, false}, {false, true, false, true}},
    {{true, true, false, false}, {true, false, true, false}},
    {{false, false, true, false}, {false, false, true, true}},
    {{true, false, true, false}, {true, true, false, false}},
    {{false, true, true, false}, {false, true, true, false}},
    {{true, true, true, false}, {true, false, false, true}},
    {{false, false, false, true}, {false, false, false, true}},
    {{true, false, false, true}, {true, true, true, false}},
    {{false, true, false, true}, {false, true, false, false}},
    {{true, true, false, true}, {true, false, true, true}},
    {{false, false, true, true}, {false, false, true, false}},
    {{true, false, true, true}, {true, true, false, true}},
    {{false, true, true, true}, {false, true, true, true}},
    {{true, true, true, true}, {true, false, false, false}},
};

TEST(AnfArrayTest, AllTwoVariableFunctions) {
  for (const auto& c : kCases2) {
    Table4 t = c.truth;
    ASSERT_EQ(anf_transform_array_checked(t.data(), t.size()), AnfStatus::Ok);
    EXPECT_EQ(t, c.anf);

    Table4 g = c.truth;
    ASSERT_EQ(anf_transform_array_checked(g), AnfStatus::Ok);
    EXPECT_EQ(g, c.anf);
  }
}

TEST(AnfArrayTest, AllFalseIsFixedPoint) {
  std::vector<bool> t(64, false);
  ASSERT_EQ(anf_transform_array_checked(t), AnfStatus::Ok);
  EXPECT_EQ(t, std::vector<bool>(64, false));
}

TEST(AnfArrayTest, ThreeVariableRules) {
  std::array<bool, 8> r240 = {false, false, false, false, true, true, true, true};
  anf_transform_array(r240.data(), r240.size());
  EXPECT_EQ(r240, (std::array<bool, 8>{false, false, false, false, true, false, false, false}));

  std::array<bool, 8> r30 = {false, true, true, true, true, false, false, false};
  anf_transform_array(r30.data(), r30.size());
  EXPECT_EQ(r30, (std::array<bool, 8>{false, true, true, true, true, false, false, false}));
}

TEST(AnfArrayTest, LengthSevenIsRejectedUntouched) {
  std::array<bool, 7> t = {false, false, false, false, true, true, true};
  const auto before = t;
  EXPECT_EQ(anf_transform_array_checked(t.data(), t.size()), AnfStatus::InvalidLength);
  EXPECT_EQ(t, before);

  std::vector<bool> v(t.begin(), t.end());
  EXPECT_EQ(anf_transform_array_checked(v), AnfStatus::InvalidLength);
  EXPECT_EQ(v, std::vector<bool>(before.begin(), before.end()));
}

TEST(AnfArrayTest, EmptyTableIsInvalidLength) {
  std::vector<bool> v;
  EXPECT_EQ(anf_transform_array_checked(v), AnfStatus::InvalidLength);
  EXPECT_EQ(anf_transform_array_checked(nullptr, 0), AnfStatus::InvalidLength);
}

TEST(AnfArrayTest, SingleEntryIsUnchanged) {
  bool t[1] = {true};
  EXPECT_EQ(anf_transform_array_checked(t, 1), AnfStatus::Ok);
  EXPECT_TRUE(t[0]);
}

TEST(AnfArrayTest, ByteSequenceOfZeroAndOne) {
  std::vector<uint8_t> t = {0, 1, 0, 0};
  ASSERT_EQ(anf_transform_array_checked(t), AnfStatus::Ok);
  EXPECT_EQ(t, (std::vector<uint8_t>{0, 1, 0, 1}));
}

TEST(AnfArrayTest, MatchesPackedTransform) {
  for (int n = 0; n <= 4; ++n) {
    for (uint32_t v = 0; v < (1ull << (1 << n)); ++v) {
      std::vector<bool> t = truth_table_from_packed(v, n);
      anf_transform_array(t);
      EXPECT_EQ(packed_from_truth_table<uint32_t>(t), anf_transform_packed(v, n)) << "n " << n << " v " << v;
    }
  }
}

TEST(AnfArrayTest, InvolutionRandomTables) {
  std::mt19937_64 rng(7);
  for (int n = 0; n <= 12; ++n) {
    const std::size_t N = std::size_t(1) << n;
    std::unique_ptr<bool[]> t(new bool[N]);
    std::vector<bool> orig(N);
    for (std::size_t i = 0; i < N; ++i) orig[i] = t[i] = (rng() & 1) != 0;

    anf_transform_array(t.get(), N);
    EXPECT_EQ(t[0], bool(orig[0])) << "constant term, n " << n;
    anf_transform_array(t.get(), N);
    for (std::size_t i = 0; i < N; ++i) ASSERT_EQ(t[i], bool(orig[i])) << "n " << n << " i " << i;
  }
}

class AnfArrayParallelTest : public ::testing::Test {
 protected:
  void SetUp() override { ::setenv("ANF_PAR_MIN_VARS", "0", 1); }
  void TearDown() override { ::unsetenv("ANF_PAR_MIN_VARS"); }
};

TEST_F(AnfArrayParallelTest, PairwiseScanMatchesBlockScan) {
  std::mt19937_64 rng(11);
  for (int n = 1; n <= 14; ++n) {
    const std::size_t N = std::size_t(1) << n;
    std::unique_ptr<bool[]> t(new bool[N]);
    std::vector<bool> ref(N);
    for (std::size_t i = 0; i < N; ++i) ref[i] = t[i] = (rng() & 1) != 0;

    anf_transform_array(t.get(), N);   // pairwise path, ANF_PAR_MIN_VARS=0
    anf_transform_array(ref);          // generic sequences always use the block scan
    for (std::size_t i = 0; i < N; ++i) ASSERT_EQ(t[i], bool(ref[i])) << "n " << n << " i " << i;
  }
}

}  // namespace
