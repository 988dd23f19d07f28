#include "errors.h"
#include "problem.h"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(SideConversion, BasicAssertions) {
  Side agents{{1, 2}, {{2, 0, 1}, {}}, 2};
  EXPECT_EQ(agents.size(), 2);
  EXPECT_EQ(agents.otherSize(), 2);
  EXPECT_EQ(agents.cap(1), 2);
  ASSERT_EQ(agents.prefLen(0), 3);
  EXPECT_EQ(agents.prefLen(1), 0);
  EXPECT_EQ(agents.ROL(0)[0], MID{1});
  EXPECT_TRUE(agents.ROL(0)[1].isNil());
  EXPECT_EQ(agents.ROL(0)[2], MID{0});
  EXPECT_TRUE(agents.accepts(0, 1));
  // listed after "prefer unmatched"
  EXPECT_FALSE(agents.accepts(0, 0));
  EXPECT_FALSE(agents.allCapsOne());
  EXPECT_EQ(MID{3}.ext(), 4);
  EXPECT_TRUE(MID::fromExt(0).isNil());
  EXPECT_NE(MID{0}, nilMID);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(SideValidation, BasicAssertions) {
  EXPECT_THROW(Side({1}, {{1}, {1}}, 1), DimensionMismatchError);
  EXPECT_THROW(Side({-1}, {{1}}, 1), ConfigurationError);
  EXPECT_THROW(Side({1}, {{2}}, 1), DimensionMismatchError);
  EXPECT_THROW(Side({1}, {{-1}}, 1), DimensionMismatchError);
  EXPECT_THROW(Side({1}, {{1, 1}}, 1), ConfigurationError);
  EXPECT_NO_THROW(Side({0}, {{1, 0}}, 1));
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(PriorityValidation, BasicAssertions) {
  EXPECT_NO_THROW(Priority({3, 1, 2}).validate(3));
  EXPECT_THROW(Priority({1, 2}).validate(3), DimensionMismatchError);
  EXPECT_THROW(Priority({1, 1, 2}).validate(3), ConfigurationError);
  EXPECT_THROW(Priority({1, 4, 2}).validate(3), ConfigurationError);
  EXPECT_THROW(Priority({1, 0, 2}).validate(3), ConfigurationError);
  Priority id = Priority::identity(3);
  ASSERT_EQ(id.size(), 3);
  EXPECT_EQ(id.order()[2], MID{2});
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(OwnershipValidation, BasicAssertions) {
  Ownership w{2, 2};
  w.own(1, 2);
  EXPECT_NO_THROW(w.validate(2, 2));
  EXPECT_EQ(w.ownerOf(1), MID{0});
  EXPECT_TRUE(w.ownerOf(0).isNil());
  EXPECT_THROW(w.validate(3, 2), DimensionMismatchError);
  EXPECT_THROW(w.validate(2, 3), DimensionMismatchError);
  EXPECT_THROW(w.own(3, 1), DimensionMismatchError);

  Ownership shared{2, 2};
  shared.own(1, 1);
  shared.own(2, 1);
  EXPECT_THROW(shared.validate(2, 2), OwnershipIntegrityError);

  Ownership greedy{2, 2};
  greedy.own(1, 1);
  greedy.own(1, 2);
  EXPECT_THROW(greedy.validate(2, 2), OwnershipIntegrityError);

  // every error is a MatchError
  EXPECT_THROW(shared.validate(2, 2), MatchError);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(MatchingRelation, BasicAssertions) {
  Matching m{3, 2};
  EXPECT_EQ(m.nPairs(), 0);
  m.add(0, 1);
  m.add(2, 1);
  m.add(2, 1);
  EXPECT_EQ(m.nPairs(), 2);
  EXPECT_TRUE(m.has(0, 1));
  EXPECT_FALSE(m.has(1, 1));
  EXPECT_EQ(m.agentsOf(1).size(), 2);
  EXPECT_EQ(m.objectOf(2), MID{1});
  EXPECT_TRUE(m.objectOf(1).isNil());

  Matching t = m.transposed();
  EXPECT_EQ(t.numAgents(), 2);
  EXPECT_EQ(t.numObjects(), 3);
  EXPECT_TRUE(t.has(1, 2));
  EXPECT_EQ(t.transposed(), m);

  std::ostringstream oss;
  oss << m;
  EXPECT_EQ(oss.str(), "000\n101\n");
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(ReadProblem, BasicAssertions) {
  std::istringstream in{"# housing market\n"
                        "a 1 1 2 1\n"
                        "a 2 1 1 0 2\n"
                        "o 2 1\n"
                        "o 1 1 2 1\n"
                        "p 2 1\n"
                        "w 1 1\n"};
  Problem prob;
  ASSERT_TRUE(prob.readProblem(in)) << prob.getError();
  EXPECT_EQ(prob.agents().size(), 2);
  EXPECT_EQ(prob.objects().size(), 2);
  EXPECT_EQ(prob.agents().ROL(1).size(), 3);
  EXPECT_TRUE(prob.objects().ROL(1).empty());
  ASSERT_TRUE(prob.hasPriority());
  EXPECT_EQ(prob.priority().order()[0], MID{1});
  ASSERT_TRUE(prob.hasOwnership());
  EXPECT_EQ(prob.ownership().ownerOf(0), MID{0});

  Matching m{2, 2};
  m.add(0, 1);
  std::ostringstream oss;
  prob.printMatch(m, oss);
  EXPECT_EQ(oss.str(), "m 1\na 1 2\na 2 0\n");
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(ReadProblemErrors, BasicAssertions) {
  {
    std::istringstream in{"a 1 1 1\na 1 1 1\no 1 1 1\n"};
    Problem prob;
    EXPECT_FALSE(prob.readProblem(in));
    EXPECT_NE(prob.getError().find("Duplicate agent ID"), std::string::npos);
  }
  {
    std::istringstream in{"a 2 1 1\no 1 1 2\n"};
    Problem prob;
    EXPECT_FALSE(prob.readProblem(in));
    EXPECT_NE(prob.getError().find("agent 1 not specified"), std::string::npos);
  }
  {
    std::istringstream in{"a 1 1 3\no 1 1 1\n"};
    Problem prob;
    EXPECT_FALSE(prob.readProblem(in));
  }
  {
    std::istringstream in{"a 1 1 1\na 2 1 1\no 1 1 1 2\nw 1 1\nw 2 1\n"};
    Problem prob;
    EXPECT_FALSE(prob.readProblem(in));
    EXPECT_NE(prob.getError().find("more than one owner"), std::string::npos);
  }
  {
    std::istringstream in{"a 1 1 1\na 2 1 1\no 1 1 1 2\np 1\n"};
    Problem prob;
    EXPECT_FALSE(prob.readProblem(in));
  }
  {
    // huge IDs are rejected before any member table is sized to them
    std::istringstream in{"a 2000000000 1 1\no 1 1 1\no 1500000000 1 1\n"};
    Problem prob;
    EXPECT_FALSE(prob.readProblem(in));
    EXPECT_NE(prob.getError().find("agent ID 2000000000 exceeds the 3 lines"),
              std::string::npos);
    EXPECT_NE(prob.getError().find("object ID 1500000000 exceeds"),
              std::string::npos);
  }
  {
    // the last ID may equal the line count
    std::istringstream in{"a 2 1 1\na 1 1 1\no 1 2 1 2\n"};
    Problem prob;
    EXPECT_TRUE(prob.readProblem(in)) << prob.getError();
  }
  {
    std::istringstream in{"x what\n"};
    Problem prob;
    EXPECT_FALSE(prob.readProblem(in));
    EXPECT_NE(prob.getError().find("is invalid"), std::string::npos);
  }
  {
    Problem prob;
    EXPECT_FALSE(prob.readProblem(std::string{"/nonexistent/problem.txt"}));
  }
}
