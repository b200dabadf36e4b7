/**
 * @file Classifier_uTest.cpp
 * @brief Unit tests for warden::policy::Classifier verdicts and grace tracking.
 *
 * Notes:
 *  - Process table is in-memory; job snapshots are built by hand.
 *  - Round numbers only advance on commit().
 */

#include "src/policy/inc/Classifier.hpp"
#include "src/gpu/utst/FakeDeviceQuery.hpp"
#include "src/process/utst/FakeProcessTree.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using warden::gpu::DeviceInventory;
using warden::gpu::test::FakeDeviceQuery;
using warden::policy::ClassificationRound;
using warden::policy::Classifier;
using warden::policy::ClassifierConfig;
using warden::policy::Decision;
using warden::policy::REASON_ANCESTRY_UNRESOLVED;
using warden::policy::REASON_DEVICE_NOT_ALLOCATED;
using warden::policy::REASON_NO_LAUNCH_ROOT;
using warden::policy::REASON_OWNER_MISMATCH;
using warden::policy::REASON_OWNER_UNKNOWN;
using warden::policy::Verdict;
using warden::process::test::FakeProcessTree;
using warden::scheduler::JobRecord;
using warden::scheduler::JobSnapshot;
using warden::scheduler::QueryStatus;

class ClassifierTest : public ::testing::Test {
protected:
  FakeProcessTree tree_{};
  JobSnapshot jobs_{};

  void SetUp() override {
    // J1: slurmstepd 500 -> bash 8000 -> python 9001
    tree_.add(400, 1, "/usr/sbin/slurmd -D");
    tree_.addStepd(500, 400, "slurmstepd: [1.batch]");
    tree_.add(8000, 500, "/bin/bash job.sh");
    tree_.add(9001, 8000, "python train.py");
    // Inside J1's tree but running as another user.
    tree_.add(9002, 8000, "python borrowed.py");
    tree_.setOwner(9002, 1001, "bob");
    // Rogue processes outside any job.
    tree_.add(7001, 1, "python rogue_a.py");
    tree_.add(7002, 1, "python rogue_b.py");

    jobs_.status = QueryStatus::OK;
    JobRecord j1{};
    j1.jobId = "1";
    j1.ownerUser = "alice";
    j1.launchRoots = {500};
    j1.gpuIndices = {0, 1};
    jobs_.jobs.push_back(j1);
  }

  static DeviceInventory inventory(std::vector<warden::gpu::GpuProcessEntry> entries) {
    return FakeDeviceQuery::ok(std::move(entries));
  }

  static const Decision* find(const ClassificationRound& round, std::int32_t pid, int dev) {
    for (const Decision& D : round.decisions) {
      if (D.pid == pid && D.deviceId == dev) {
        return &D;
      }
    }
    return nullptr;
  }
};

/* ----------------------------- Verdicts ----------------------------- */

/** @test Deep descendant of a job's launch root is AUTHORIZED for that job. */
TEST_F(ClassifierTest, DeepAncestryAuthorized) {
  Classifier c(tree_, ClassifierConfig{});
  const ClassificationRound R = c.evaluate(inventory({FakeDeviceQuery::entry(9001, 0)}), jobs_);
  ASSERT_EQ(R.decisions.size(), 1U);
  const Decision& D = R.decisions[0];
  EXPECT_EQ(D.verdict, Verdict::AUTHORIZED);
  ASSERT_TRUE(D.jobId.has_value());
  EXPECT_EQ(*D.jobId, "1");
  EXPECT_FALSE(D.confirmed);
  EXPECT_EQ(D.command, "python train.py");
  EXPECT_EQ(D.owner, "alice");
  EXPECT_TRUE(R.nextGrace.empty());
}

/** @test A job descendant running as another user is UNAUTHORIZED but keeps the job id. */
TEST_F(ClassifierTest, OwnerMismatchUnauthorized) {
  Classifier c(tree_, ClassifierConfig{});
  const ClassificationRound R = c.evaluate(
      inventory({FakeDeviceQuery::entry(9001, 0), FakeDeviceQuery::entry(9002, 1)}), jobs_);
  EXPECT_EQ(find(R, 9001, 0)->verdict, Verdict::AUTHORIZED);

  const Decision* BAD = find(R, 9002, 1);
  ASSERT_NE(BAD, nullptr);
  EXPECT_EQ(BAD->verdict, Verdict::UNAUTHORIZED);
  EXPECT_EQ(BAD->reason, REASON_OWNER_MISMATCH);
  ASSERT_TRUE(BAD->jobId.has_value());
  EXPECT_EQ(*BAD->jobId, "1");
  EXPECT_EQ(BAD->owner, "bob");
  EXPECT_EQ(R.nextGrace.count(9002), 1U);
}

/** @test An owner that cannot be read never authorizes. */
TEST_F(ClassifierTest, OwnerUnknownUnauthorized) {
  tree_.hideOwner(9001);
  Classifier c(tree_, ClassifierConfig{});
  const ClassificationRound R = c.evaluate(inventory({FakeDeviceQuery::entry(9001, 0)}), jobs_);
  const Decision& D = R.decisions.at(0);
  EXPECT_EQ(D.verdict, Verdict::UNAUTHORIZED);
  EXPECT_EQ(D.reason, REASON_OWNER_UNKNOWN);
  EXPECT_TRUE(D.owner.empty());
}

/** @test Orphan reaching PID 1 is UNAUTHORIZED with no job. */
TEST_F(ClassifierTest, OrphanUnauthorized) {
  Classifier c(tree_, ClassifierConfig{});
  const ClassificationRound R = c.evaluate(inventory({FakeDeviceQuery::entry(7001, 2)}), jobs_);
  const Decision& D = R.decisions.at(0);
  EXPECT_EQ(D.verdict, Verdict::UNAUTHORIZED);
  EXPECT_FALSE(D.jobId.has_value());
  EXPECT_EQ(D.reason, REASON_NO_LAUNCH_ROOT);
}

/** @test Vanished process is UNAUTHORIZED as unresolved, never authorized. */
TEST_F(ClassifierTest, UnresolvedUnauthorized) {
  Classifier c(tree_, ClassifierConfig{});
  const ClassificationRound R = c.evaluate(inventory({FakeDeviceQuery::entry(31337, 0)}), jobs_);
  EXPECT_EQ(R.decisions.at(0).verdict, Verdict::UNAUTHORIZED);
  EXPECT_EQ(R.decisions.at(0).reason, REASON_ANCESTRY_UNRESOLVED);
}

/** @test With no running jobs every process is UNAUTHORIZED. */
TEST_F(ClassifierTest, NoJobs) {
  Classifier c(tree_, ClassifierConfig{});
  JobSnapshot empty{};
  empty.status = QueryStatus::OK;
  const ClassificationRound R = c.evaluate(inventory({FakeDeviceQuery::entry(9001, 0)}), empty);
  EXPECT_EQ(R.decisions.at(0).verdict, Verdict::UNAUTHORIZED);
}

/** @test Completeness: one decision per entry, in inventory order. */
TEST_F(ClassifierTest, Completeness) {
  Classifier c(tree_, ClassifierConfig{});
  const ClassificationRound R = c.evaluate(
      inventory({FakeDeviceQuery::entry(9001, 0), FakeDeviceQuery::entry(9001, 1),
                 FakeDeviceQuery::entry(7001, 2), FakeDeviceQuery::entry(31337, 3)}),
      jobs_);
  ASSERT_EQ(R.decisions.size(), 4U);
  EXPECT_EQ(R.decisions[0].pid, 9001);
  EXPECT_EQ(R.decisions[1].deviceId, 1);
  EXPECT_EQ(R.decisions[2].pid, 7001);
  EXPECT_EQ(R.decisions[3].pid, 31337);
  EXPECT_EQ(R.nextGrace.size(), 2U);
}

/** @test Empty inventory yields no decisions and clears grace. */
TEST_F(ClassifierTest, EmptyInventory) {
  Classifier c(tree_, ClassifierConfig{});
  c.commit(c.evaluate(inventory({FakeDeviceQuery::entry(7001, 0)}), jobs_));
  ASSERT_EQ(c.graceState().size(), 1U);
  c.commit(c.evaluate(inventory({}), jobs_));
  EXPECT_TRUE(c.graceState().empty());
}

/* ----------------------------- Allocation ----------------------------- */

/** @test Allocation check is off by default. */
TEST_F(ClassifierTest, AllocationIgnoredByDefault) {
  Classifier c(tree_, ClassifierConfig{});
  const ClassificationRound R = c.evaluate(inventory({FakeDeviceQuery::entry(9001, 3)}), jobs_);
  EXPECT_EQ(R.decisions.at(0).verdict, Verdict::AUTHORIZED);
}

/** @test With the check on, a foreign device is UNAUTHORIZED but keeps the job id. */
TEST_F(ClassifierTest, AllocationEnforced) {
  ClassifierConfig cfg{};
  cfg.enforceAllocation = true;
  Classifier c(tree_, cfg);
  const ClassificationRound R = c.evaluate(
      inventory({FakeDeviceQuery::entry(9001, 1), FakeDeviceQuery::entry(9001, 3)}), jobs_);
  EXPECT_EQ(find(R, 9001, 1)->verdict, Verdict::AUTHORIZED);
  const Decision* BAD = find(R, 9001, 3);
  ASSERT_NE(BAD, nullptr);
  EXPECT_EQ(BAD->verdict, Verdict::UNAUTHORIZED);
  EXPECT_EQ(BAD->reason, REASON_DEVICE_NOT_ALLOCATED);
  ASSERT_TRUE(BAD->jobId.has_value());
  EXPECT_EQ(*BAD->jobId, "1");
  EXPECT_EQ(R.nextGrace.count(9001), 1U);
}

/* ----------------------------- Grace ----------------------------- */

/** @test U1 then U2: confirmed only on the second consecutive round. */
TEST_F(ClassifierTest, GracePeriod) {
  Classifier c(tree_, ClassifierConfig{});
  const DeviceInventory INV = inventory({FakeDeviceQuery::entry(7001, 0)});

  ClassificationRound r1 = c.evaluate(INV, jobs_);
  EXPECT_FALSE(r1.decisions.at(0).confirmed);
  EXPECT_EQ(r1.nextGrace.at(7001).consecutiveRounds, 1);
  c.commit(std::move(r1));

  const ClassificationRound R2 = c.evaluate(INV, jobs_);
  EXPECT_TRUE(R2.decisions.at(0).confirmed);
  EXPECT_TRUE(R2.decisions.at(0).actionable());
  EXPECT_EQ(R2.nextGrace.at(7001).consecutiveRounds, 2);
  EXPECT_EQ(R2.nextGrace.at(7001).firstSeenUnauthorizedMs, INV.entries[0].observedAtMs);
}

/** @test Grace of one confirms immediately. */
TEST_F(ClassifierTest, GraceOne) {
  ClassifierConfig cfg{};
  cfg.graceCycles = 1;
  Classifier c(tree_, cfg);
  EXPECT_TRUE(
      c.evaluate(inventory({FakeDeviceQuery::entry(7001, 0)}), jobs_).decisions.at(0).confirmed);
}

/** @test Non-positive grace is clamped to one. */
TEST_F(ClassifierTest, GraceClamped) {
  ClassifierConfig cfg{};
  cfg.graceCycles = 0;
  Classifier c(tree_, cfg);
  EXPECT_EQ(c.config().graceCycles, 1);
}

/** @test Without commit the grace state never advances (aborted cycles). */
TEST_F(ClassifierTest, EvaluateIsPure) {
  Classifier c(tree_, ClassifierConfig{});
  const DeviceInventory INV = inventory({FakeDeviceQuery::entry(7001, 0)});
  for (int i = 0; i < 5; ++i) {
    const ClassificationRound R = c.evaluate(INV, jobs_);
    EXPECT_FALSE(R.decisions.at(0).confirmed);
    EXPECT_EQ(R.round, 1U);
  }
  EXPECT_TRUE(c.graceState().empty());
  EXPECT_EQ(c.roundsCommitted(), 0U);
}

/** @test Disappearing for one round resets the count (pruning/replay). */
TEST_F(ClassifierTest, PruneAndReplay) {
  Classifier c(tree_, ClassifierConfig{});
  const DeviceInventory WITH = inventory({FakeDeviceQuery::entry(7001, 0)});
  const DeviceInventory WITHOUT = inventory({FakeDeviceQuery::entry(9001, 0)});

  c.commit(c.evaluate(WITH, jobs_));
  c.commit(c.evaluate(WITHOUT, jobs_));
  EXPECT_EQ(c.graceState().count(7001), 0U);

  const ClassificationRound R = c.evaluate(WITH, jobs_);
  EXPECT_FALSE(R.decisions.at(0).confirmed);
  EXPECT_EQ(R.nextGrace.at(7001).consecutiveRounds, 1);
}

/** @test An AUTHORIZED round clears accumulated grace. */
TEST_F(ClassifierTest, AuthorizedClears) {
  Classifier c(tree_, ClassifierConfig{});
  JobSnapshot none{};
  none.status = QueryStatus::OK;
  const DeviceInventory INV = inventory({FakeDeviceQuery::entry(9001, 0)});

  c.commit(c.evaluate(INV, none));
  ASSERT_EQ(c.graceState().count(9001), 1U);
  c.commit(c.evaluate(INV, jobs_));
  EXPECT_EQ(c.graceState().count(9001), 0U);

  const ClassificationRound R = c.evaluate(INV, none);
  EXPECT_FALSE(R.decisions.at(0).confirmed);
}

/** @test A PID on several devices is confirmed on all of them at once. */
TEST_F(ClassifierTest, MultiDevicePidConfirmedTogether) {
  Classifier c(tree_, ClassifierConfig{});
  const DeviceInventory INV =
      inventory({FakeDeviceQuery::entry(7002, 0), FakeDeviceQuery::entry(7002, 3)});
  c.commit(c.evaluate(INV, jobs_));
  EXPECT_EQ(c.graceState().at(7002).consecutiveRounds, 1);
  EXPECT_EQ(c.graceState().at(7002).deviceId, 0);

  const ClassificationRound R = c.evaluate(INV, jobs_);
  EXPECT_TRUE(R.decisions.at(0).confirmed);
  EXPECT_TRUE(R.decisions.at(1).confirmed);
}

/** @test Independent PIDs track grace independently. */
TEST_F(ClassifierTest, IndependentPids) {
  Classifier c(tree_, ClassifierConfig{});
  c.commit(c.evaluate(inventory({FakeDeviceQuery::entry(7001, 0)}), jobs_));
  const ClassificationRound R = c.evaluate(
      inventory({FakeDeviceQuery::entry(7001, 0), FakeDeviceQuery::entry(7002, 1)}), jobs_);
  EXPECT_TRUE(find(R, 7001, 0)->confirmed);
  EXPECT_FALSE(find(R, 7002, 1)->confirmed);
}

/* ----------------------------- Strings ----------------------------- */

/** @test Decision rendering. */
TEST(DecisionTest, ToString) {
  Decision d{};
  d.pid = 9001;
  d.deviceId = 0;
  d.verdict = Verdict::AUTHORIZED;
  d.jobId = "1";
  d.reason = "launched by job 1 (root 500)";
  const std::string S = d.toString();
  EXPECT_NE(S.find("AUTHORIZED"), std::string::npos);
  EXPECT_NE(S.find("job 1"), std::string::npos);
}
