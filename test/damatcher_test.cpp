#include "TestMarkets.hpp"
#include "damatcher.h"
#include "errors.h"
#include "matchchk.h"
#include <gtest/gtest.h>
#include <random>
#include <string>

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(DARejectedByOnlyChoice, BasicAssertions) {
  // proposer 1 only ranks respondent 1, who does not rank it at all
  Side props{{1}, {{1}}, 1};
  Side resps{{1}, {{}}, 1};
  DAmatcher da;
  Matching m = da.run(props, resps);
  EXPECT_EQ(m.nPairs(), 0);
  EXPECT_TRUE(m.objectOf(0).isNil());
  EXPECT_TRUE(m.agentsOf(0).empty());
  EXPECT_EQ(da.proposals(), 1);
  EXPECT_EQ(da.rejections(), 1);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(DADisplacement, BasicAssertions) {
  // both propose to respondent 1 first; it keeps proposer 2
  Side props{{1, 1}, {{1, 2}, {1, 2}}, 2};
  Side resps{{1, 1}, {{2, 1}, {1, 2}}, 2};
  DAmatcher da;
  Matching m = da.run(props, resps);
  EXPECT_TRUE(m.has(0, 1));
  EXPECT_TRUE(m.has(1, 0));
  EXPECT_EQ(m.nPairs(), 2);
  EXPECT_EQ(da.rounds(), 2);
  EXPECT_EQ(da.proposals(), 3);
  EXPECT_EQ(da.rejections(), 0);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(DAProposerOptimal, BasicAssertions) {
  // classic 3x3 instance: the men get their first choices, the women
  // their last acceptable ones
  Side men{{1, 1, 1}, {{1, 2, 3}, {2, 3, 1}, {3, 1, 2}}, 3};
  Side women{{1, 1, 1}, {{2, 3, 1}, {3, 1, 2}, {1, 2, 3}}, 3};
  DAmatcher da;
  Matching m = da.run(men, women);
  EXPECT_TRUE(m.has(0, 0));
  EXPECT_TRUE(m.has(1, 1));
  EXPECT_TRUE(m.has(2, 2));

  // and with the women proposing they get theirs
  Matching w = da.run(women, men);
  EXPECT_TRUE(w.has(0, 1));
  EXPECT_TRUE(w.has(1, 2));
  EXPECT_TRUE(w.has(2, 0));
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(DAPreferUnmatched, BasicAssertions) {
  // proposer 1 would rather stay single than take respondent 2
  Side props{{1, 1}, {{1, 0, 2}, {1}}, 2};
  Side resps{{1, 1}, {{2, 1}, {1, 2}}, 2};
  DAmatcher da;
  Matching m = da.run(props, resps);
  EXPECT_TRUE(m.has(1, 0));
  EXPECT_TRUE(m.objectOf(0).isNil());
  EXPECT_TRUE(m.agentsOf(1).empty());
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(DARespondentCapacity, BasicAssertions) {
  // respondent 1 has two seats and drops its worst held proposer
  Side props{{1, 1, 1}, {{1, 2}, {1, 2}, {1, 2}}, 2};
  Side resps{{2, 1}, {{3, 1, 2}, {1, 2, 3}}, 3};
  DAmatcher da;
  Matching m = da.run(props, resps);
  EXPECT_EQ(m.agentsOf(0).size(), 2);
  EXPECT_TRUE(m.has(0, 0));
  EXPECT_TRUE(m.has(2, 0));
  EXPECT_TRUE(m.has(1, 1));

  Side closed{{0, 1}, {{1, 2}, {1, 2, 3}}, 3};
  Matching c = da.run(props, closed);
  EXPECT_TRUE(c.agentsOf(0).empty());
  EXPECT_EQ(c.nPairs(), 1);
  EXPECT_TRUE(c.has(0, 1));
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(DAConfiguration, BasicAssertions) {
  DAmatcher da;
  Side props{{2}, {{1}}, 1};
  Side resps{{1}, {{1}}, 1};
  EXPECT_THROW(da.run(props, resps), ConfigurationError);
  Side wide{{1}, {{1}}, 2};
  EXPECT_THROW(da.run(wide, resps), DimensionMismatchError);

  // capacity 0 proposers never propose
  Side idle{{0}, {{1}}, 1};
  Matching m = da.run(idle, resps);
  EXPECT_EQ(m.nPairs(), 0);
  EXPECT_EQ(da.proposals(), 0);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(DARandomStable, BasicAssertions) {
  std::mt19937 rng{20140101};
  DAmatcher da;
  for (int trial = 0; trial < 200; ++trial) {
    int nProps = 1 + trial % 9;
    int nResps = 1 + (trial * 7) % 8;
    Side props = randomSide(rng, nProps, nResps, 0, 1);
    Side resps = randomSide(rng, nResps, nProps, 0, 3);
    Problem prob{props, resps};
    Matching m = da.match(prob);

    MatchChk chk{&prob};
    chk.setMatch(m);
    EXPECT_TRUE(chk.check(0)) << chk.getError();
    // each proposer proposes to every entry of its list at most once
    EXPECT_LE(da.proposals(), totalPrefLength(props));
    EXPECT_LE(da.rounds(), totalPrefLength(props) + nProps);
  }
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(OutOfMemoryReport, BasicAssertions) {
  Side props{{1, 1}, {{1, 2}, {1, 2}}, 2};
  Side resps{{1, 1}, {{2, 1}, {1, 2}}, 2};
  DAmatcher da;
  da.run(props, resps);

  testing::internal::CaptureStdout();
  EXPECT_EQ(reportOutOfMemory(&da), 100);
  std::string out = testing::internal::GetCapturedStdout();
  EXPECT_NE(out.find("#ERROR: could not allocate memory"), std::string::npos);
  EXPECT_NE(out.find("#DA Stats:"), std::string::npos);

  // nothing selected yet: error line only
  testing::internal::CaptureStdout();
  EXPECT_EQ(reportOutOfMemory(nullptr), outOfMemoryExit);
  out = testing::internal::GetCapturedStdout();
  EXPECT_NE(out.find("could not allocate memory"), std::string::npos);
  EXPECT_EQ(out.find("Stats:"), std::string::npos);
}
