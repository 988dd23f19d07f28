#include "damatcher.h"
#include "matchchk.h"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace {
auto marriageMarket() -> Problem {
  Side men{{1, 1}, {{1, 2}, {1, 2}}, 2};
  Side women{{1, 1}, {{2, 1}, {1, 2}}, 2};
  return Problem{men, women};
}
} // namespace

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(MatchChkBlockingPair, BasicAssertions) {
  Problem prob = marriageMarket();
  // man 2 and woman 1 both prefer each other to their partners
  Matching bad{2, 2};
  bad.add(0, 0);
  bad.add(1, 1);
  MatchChk chk{&prob};
  chk.setMatch(bad);
  EXPECT_FALSE(chk.check(0));
  EXPECT_NE(chk.getError().find("block the match"), std::string::npos);

  DAmatcher da;
  MatchChk good{&prob};
  good.setMatch(da.match(prob));
  EXPECT_TRUE(good.check(0)) << good.getError();
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(MatchChkCapacityAndAcceptability, BasicAssertions) {
  Side agents{{1, 1}, {{1}, {1}}, 1};
  Side objects{{1}, {{1}}, 2};
  Problem prob{agents, objects};
  Matching crowded{2, 1};
  crowded.add(0, 0);
  crowded.add(1, 0);
  MatchChk chk{&prob};
  chk.setMatch(crowded);
  EXPECT_FALSE(chk.checkCapacities());
  // object 1 does not rank agent 2
  EXPECT_FALSE(chk.checkAcceptable());
  EXPECT_FALSE(chk.ok());
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(MatchChkReadMatch, BasicAssertions) {
  Problem prob = marriageMarket();
  {
    MatchChk chk{&prob};
    std::istringstream in{"# match\nm 1\na 1 2\na 2 1\n"};
    ASSERT_TRUE(chk.readMatch(in)) << chk.getError();
    EXPECT_FALSE(chk.noMatch());
    EXPECT_TRUE(chk.MATCH().has(0, 1));
    EXPECT_TRUE(chk.MATCH().has(1, 0));
    EXPECT_TRUE(chk.check(0)) << chk.getError();

    std::ostringstream oss;
    chk.printMatchStats(oss);
    EXPECT_NE(oss.str().find("#Unmatched Agents: 0"), std::string::npos);
    EXPECT_NE(oss.str().find("#Num Agents getting their top rank = 1"),
              std::string::npos);
  }
  {
    MatchChk chk{&prob};
    std::istringstream in{"m 0\n"};
    ASSERT_TRUE(chk.readMatch(in));
    EXPECT_TRUE(chk.noMatch());
    EXPECT_TRUE(chk.check(0));
  }
  {
    MatchChk chk{&prob};
    std::istringstream in{"m 1\na 3 1\n"};
    EXPECT_FALSE(chk.readMatch(in));
  }
  {
    // round trip through the writer
    DAmatcher da;
    Matching m = da.match(prob);
    std::ostringstream out;
    prob.printMatch(m, out);
    MatchChk chk{&prob};
    std::istringstream in{out.str()};
    ASSERT_TRUE(chk.readMatch(in));
    EXPECT_EQ(chk.MATCH(), m);
  }
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(MatchChkIndividualRationality, BasicAssertions) {
  Side agents{{1, 1}, {{1, 2}, {2, 1}}, 2};
  Side houses{{1, 1}, {{}, {}}, 2};
  Problem prob{agents, houses};
  Ownership owners{2, 2};
  owners.own(1, 1);
  owners.own(2, 2);
  prob.setOwnership(owners);

  // both moved to their second choice
  Matching swapped{2, 2};
  swapped.add(0, 1);
  swapped.add(1, 0);
  MatchChk chk{&prob};
  chk.setMatch(swapped);
  EXPECT_FALSE(chk.checkIndividuallyRational());

  Matching kept{2, 2};
  kept.add(0, 0);
  kept.add(1, 1);
  MatchChk fine{&prob};
  fine.setMatch(kept);
  EXPECT_TRUE(fine.check(2)) << fine.getError();
}
