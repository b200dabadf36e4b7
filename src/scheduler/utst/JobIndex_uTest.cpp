/**
 * @file JobIndex_uTest.cpp
 * @brief Unit tests for warden::scheduler job snapshot parsing and the Slurm backend.
 *
 * Notes:
 *  - Parser tests use captured squeue/scontrol output and slurmstepd titles.
 *  - Backend tests substitute shell scripts for squeue and scontrol under /tmp
 *    and an in-memory process table for the slurmstepd scan.
 */

#include "src/scheduler/inc/JobIndex.hpp"
#include "src/process/utst/FakeProcessTree.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using warden::process::test::FakeProcessTree;
using warden::scheduler::JobRecord;
using warden::scheduler::isStepdExecutable;
using warden::scheduler::JobSnapshot;
using warden::scheduler::localNodeName;
using warden::scheduler::parseGresIndices;
using warden::scheduler::parseIndexList;
using warden::scheduler::parseSqueueJobs;
using warden::scheduler::parseStepdJobId;
using warden::scheduler::QueryStatus;
using warden::scheduler::SlurmConfig;
using warden::scheduler::SlurmSchedulerQuery;

namespace {

constexpr const char* SCONTROL_TWO_NODES =
    "JobId=1234 JobName=train\n"
    "   UserId=alice(1000) GroupId=alice(1000) MCS_label=N/A\n"
    "   JobState=RUNNING Reason=None Dependency=(null)\n"
    "   NumNodes=2 NumCPUs=16 NumTasks=2 CPUs/Task=8 ReqB:S:C:T=0:0:*:*\n"
    "   TRES=cpu=16,mem=128G,node=2,billing=16,gres/gpu=4\n"
    "     Nodes=gpu01 CPU_IDs=0-7 Mem=64000 GRES=gpu:a100:2(IDX:0-1)\n"
    "     Nodes=gpu02 CPU_IDs=0-7 Mem=64000 GRES=gpu:a100:2(IDX:2,3)\n"
    "   WorkDir=/home/alice/run\n";

/// Write an executable shell script standing in for a Slurm command.
std::string writeScript(const std::string& body) {
  char tmpl[] = "/tmp/warden_slurm_XXXXXX";
  const int FD = ::mkstemp(tmpl);
  if (FD < 0) {
    return {};
  }
  ::close(FD);
  std::ofstream out(tmpl);
  out << "#!/bin/sh\n" << body;
  out.close();
  ::chmod(tmpl, 0700);
  return tmpl;
}

} // namespace

/* ----------------------------- squeue ----------------------------- */

/** @test Rows yield job id and owner. */
TEST(ParseSqueueTest, Rows) {
  std::vector<JobRecord> jobs;
  std::string error;
  ASSERT_TRUE(parseSqueueJobs("1234|alice\n1240|bob\n", jobs, error));
  ASSERT_EQ(jobs.size(), 2U);
  EXPECT_EQ(jobs[0].jobId, "1234");
  EXPECT_EQ(jobs[0].ownerUser, "alice");
  EXPECT_EQ(jobs[1].jobId, "1240");
  EXPECT_TRUE(jobs[1].launchRoots.empty());
}

/** @test Empty output is a valid "no jobs" answer. */
TEST(ParseSqueueTest, Empty) {
  std::vector<JobRecord> jobs;
  std::string error;
  EXPECT_TRUE(parseSqueueJobs("", jobs, error));
  EXPECT_TRUE(parseSqueueJobs("\n\n", jobs, error));
  EXPECT_TRUE(jobs.empty());
}

/** @test Duplicate ids collapse into one record. */
TEST(ParseSqueueTest, Duplicates) {
  std::vector<JobRecord> jobs;
  std::string error;
  ASSERT_TRUE(parseSqueueJobs("1234|alice\n1234|alice\n", jobs, error));
  EXPECT_EQ(jobs.size(), 1U);
}

/** @test Malformed rows fail the whole parse. */
TEST(ParseSqueueTest, Malformed) {
  std::vector<JobRecord> jobs;
  std::string error;
  EXPECT_FALSE(parseSqueueJobs("1234|alice\nslurm_load_jobs error\n", jobs, error));
  EXPECT_TRUE(jobs.empty());
  EXPECT_NE(error.find("row 2"), std::string::npos);
  EXPECT_FALSE(parseSqueueJobs("1234_5|alice\n", jobs, error));
  EXPECT_FALSE(parseSqueueJobs("1234|\n", jobs, error));
}

/* ----------------------------- GRES indices ----------------------------- */

/** @test Single values and ranges expand in order. */
TEST(ParseIndexListTest, Ranges) {
  std::vector<int> idx;
  ASSERT_TRUE(parseIndexList("0-1,3", idx));
  EXPECT_EQ(idx, (std::vector<int>{0, 1, 3}));
}

/** @test Reversed ranges, empty elements and text are rejected. */
TEST(ParseIndexListTest, Malformed) {
  std::vector<int> idx;
  EXPECT_FALSE(parseIndexList("3-1", idx));
  EXPECT_FALSE(parseIndexList("0,", idx));
  EXPECT_FALSE(parseIndexList("N/A", idx));
}

/** @test Per-node line naming this node wins. */
TEST(ParseGresIndicesTest, NodeLine) {
  std::vector<int> idx;
  ASSERT_TRUE(parseGresIndices(SCONTROL_TWO_NODES, "gpu02", idx));
  EXPECT_EQ(idx, (std::vector<int>{2, 3}));
}

/** @test Unknown node falls back to the union of all lines. */
TEST(ParseGresIndicesTest, UnknownNodeUnion) {
  std::vector<int> idx;
  ASSERT_TRUE(parseGresIndices(SCONTROL_TWO_NODES, "gpu99", idx));
  EXPECT_EQ(idx, (std::vector<int>{0, 1, 2, 3}));
}

/** @test Several GRES types on one line are merged and deduplicated. */
TEST(ParseGresIndicesTest, MultipleTypes) {
  std::vector<int> idx;
  ASSERT_TRUE(parseGresIndices("     Nodes=gpu01 GRES=gpu:a100:1(IDX:2),gpu:t4:2(IDX:0-1,2)\n",
                               "gpu01", idx));
  EXPECT_EQ(idx, (std::vector<int>{0, 1, 2}));
}

/** @test Job without GPUs has no indices. */
TEST(ParseGresIndicesTest, NoGres) {
  std::vector<int> idx{7};
  ASSERT_TRUE(parseGresIndices("JobId=1 JobName=cpu\n     Nodes=gpu01 CPU_IDs=0 Mem=1\n", "gpu01",
                               idx));
  EXPECT_TRUE(idx.empty());
}

/** @test Garbage inside IDX is malformed. */
TEST(ParseGresIndicesTest, Malformed) {
  std::vector<int> idx;
  EXPECT_FALSE(parseGresIndices("     Nodes=gpu01 GRES=gpu:1(IDX:x)\n", "gpu01", idx));
  EXPECT_FALSE(parseGresIndices("     Nodes=gpu01 GRES=gpu:1(IDX:0\n", "gpu01", idx));
}

/* ----------------------------- slurmstepd ----------------------------- */

/** @test Step daemon titles yield the job id. */
TEST(ParseStepdJobIdTest, Steps) {
  std::string id;
  ASSERT_TRUE(parseStepdJobId("slurmstepd: [1234.batch]", id));
  EXPECT_EQ(id, "1234");
  ASSERT_TRUE(parseStepdJobId("slurmstepd: [1235.extern]", id));
  EXPECT_EQ(id, "1235");
  ASSERT_TRUE(parseStepdJobId("slurmstepd: [1236.0]", id));
  EXPECT_EQ(id, "1236");
  ASSERT_TRUE(parseStepdJobId("slurmstepd: [1237.interactive]", id));
  EXPECT_EQ(id, "1237");
}

/** @test Non-stepd commands and near misses are rejected. */
TEST(ParseStepdJobIdTest, Rejects) {
  std::string id;
  EXPECT_FALSE(parseStepdJobId("/usr/sbin/slurmd -D", id));
  EXPECT_FALSE(parseStepdJobId("python slurmstepd: [1234.batch]", id));
  EXPECT_FALSE(parseStepdJobId("slurmstepd: [1234]", id));
  EXPECT_FALSE(parseStepdJobId("slurmstepd: [abc.batch]", id));
  EXPECT_FALSE(parseStepdJobId("slurmstepd: [1234.bogus]", id));
  EXPECT_FALSE(parseStepdJobId("slurmstepd: [1234.batch", id));
  EXPECT_FALSE(parseStepdJobId("", id));
}

/* ----------------------------- JobSnapshot ----------------------------- */

/** @test Lookups by id and by root; roots union. */
TEST(JobSnapshotTest, Lookups) {
  JobSnapshot snap{};
  snap.status = QueryStatus::OK;
  JobRecord a{};
  a.jobId = "1";
  a.launchRoots = {500, 501};
  JobRecord b{};
  b.jobId = "2";
  b.launchRoots = {600};
  snap.jobs = {a, b};

  ASSERT_NE(snap.find("2"), nullptr);
  EXPECT_EQ(snap.find("2")->jobId, "2");
  EXPECT_EQ(snap.find("3"), nullptr);
  ASSERT_NE(snap.findByRoot(501), nullptr);
  EXPECT_EQ(snap.findByRoot(501)->jobId, "1");
  EXPECT_EQ(snap.findByRoot(1), nullptr);
  EXPECT_EQ(snap.allLaunchRoots().size(), 3U);
}

/** @test Allocation check; empty allocation is unrestricted. */
TEST(JobRecordTest, AllowsDevice) {
  JobRecord job{};
  EXPECT_TRUE(job.allowsDevice(5));
  job.gpuIndices = {0, 1};
  EXPECT_TRUE(job.allowsDevice(1));
  EXPECT_FALSE(job.allowsDevice(2));
}

/* ----------------------------- isStepdExecutable ----------------------------- */

/** @test Only the slurmstepd basename matches. */
TEST(IsStepdExecutableTest, Basename) {
  EXPECT_TRUE(isStepdExecutable("/usr/sbin/slurmstepd"));
  EXPECT_TRUE(isStepdExecutable("/opt/slurm/23.02/sbin/slurmstepd (deleted)"));
  EXPECT_TRUE(isStepdExecutable("slurmstepd"));
  EXPECT_FALSE(isStepdExecutable("/usr/bin/python3"));
  EXPECT_FALSE(isStepdExecutable("/tmp/slurmstepd.evil"));
  EXPECT_FALSE(isStepdExecutable("/usr/sbin/slurmstepd/"));
  EXPECT_FALSE(isStepdExecutable(""));
}

/* ----------------------------- SlurmSchedulerQuery ----------------------------- */

class SlurmQueryTest : public ::testing::Test {
protected:
  FakeProcessTree tree_{};
  std::vector<std::string> scripts_;

  void SetUp() override {
    tree_.add(400, 1, "/usr/sbin/slurmd -D");
    tree_.addStepd(500, 400, "slurmstepd: [1234.batch]");
    tree_.addStepd(501, 400, "slurmstepd: [1234.extern]");
    tree_.addStepd(600, 400, "slurmstepd: [1240.0]");
    tree_.addStepd(700, 400, "slurmstepd: [9999.batch]"); // completing, not in squeue
    tree_.add(8000, 500, "/bin/bash job.sh");
  }

  void TearDown() override {
    for (const std::string& PATH : scripts_) {
      std::remove(PATH.c_str());
    }
  }

  std::string script(const std::string& body) {
    scripts_.push_back(writeScript(body));
    return scripts_.back();
  }

  SlurmConfig config() const {
    SlurmConfig cfg{};
    cfg.timeout = std::chrono::milliseconds(5000);
    cfg.node = "gpu01";
    return cfg;
  }
};

/** @test Jobs, indices and step daemon roots are assembled. */
TEST_F(SlurmQueryTest, Snapshot) {
  SlurmConfig cfg = config();
  cfg.squeuePath = script("echo '1234|alice'\necho '1240|bob'\n");
  cfg.scontrolPath = script("if [ \"$4\" = 1234 ]; then\n"
                            "  echo '     Nodes=gpu01 CPU_IDs=0-7 GRES=gpu:2(IDX:0-1)'\n"
                            "else\n"
                            "  echo '     Nodes=gpu01 CPU_IDs=8-15 GRES=gpu:1(IDX:3)'\n"
                            "fi\n");
  SlurmSchedulerQuery q(cfg, tree_);
  const JobSnapshot SNAP = q.query();

  ASSERT_TRUE(SNAP.ok()) << SNAP.detail;
  ASSERT_EQ(SNAP.jobs.size(), 2U);
  const JobRecord* J1 = SNAP.find("1234");
  ASSERT_NE(J1, nullptr);
  EXPECT_EQ(J1->ownerUser, "alice");
  EXPECT_EQ(J1->launchRoots, (warden::process::PidSet{500, 501}));
  EXPECT_EQ(J1->gpuIndices, (std::vector<int>{0, 1}));

  const JobRecord* J2 = SNAP.find("1240");
  ASSERT_NE(J2, nullptr);
  EXPECT_EQ(J2->launchRoots, (warden::process::PidSet{600}));
  EXPECT_EQ(J2->gpuIndices, (std::vector<int>{3}));

  EXPECT_EQ(SNAP.findByRoot(700), nullptr);
  EXPECT_EQ(SNAP.findByRoot(8000), nullptr);
}

/** @test A user process retitled as a job step daemon is not a launch root. */
TEST_F(SlurmQueryTest, RetitledUserProcessIsNotRoot) {
  tree_.addStepd(100, 400, "slurmstepd: [42.batch]");
  tree_.add(900, 1, "slurmstepd: [42.0] python mine.py");
  tree_.setOwner(900, 1001, "bob");
  tree_.setExecutable(900, "/usr/bin/python3.11");

  SlurmConfig cfg = config();
  cfg.fetchGpuIndices = false;
  cfg.squeuePath = script("echo '42|bob'\n");
  SlurmSchedulerQuery q(cfg, tree_);
  const JobSnapshot SNAP = q.query();

  ASSERT_TRUE(SNAP.ok()) << SNAP.detail;
  const JobRecord* JOB = SNAP.find("42");
  ASSERT_NE(JOB, nullptr);
  EXPECT_EQ(JOB->launchRoots, (warden::process::PidSet{100}));
  EXPECT_EQ(SNAP.findByRoot(900), nullptr);
}

/** @test Root ownership alone is not enough when the exe link names another binary. */
TEST_F(SlurmQueryTest, RootProcessWithOtherBinaryIsNotRoot) {
  tree_.add(900, 1, "slurmstepd: [1234.7]");
  tree_.setOwner(900, 0, "root");
  tree_.setExecutable(900, "/usr/bin/python3.11");
  // Unreadable exe link: ownership decides.
  tree_.add(901, 400, "slurmstepd: [1234.8]");
  tree_.setOwner(901, 0, "root");
  // Binary replaced by a package upgrade while the step runs.
  tree_.addStepd(902, 400, "slurmstepd: [1234.9]");
  tree_.setExecutable(902, "/usr/sbin/slurmstepd (deleted)");

  SlurmConfig cfg = config();
  cfg.fetchGpuIndices = false;
  cfg.squeuePath = script("echo '1234|alice'\n");
  SlurmSchedulerQuery q(cfg, tree_);
  const JobSnapshot SNAP = q.query();

  ASSERT_TRUE(SNAP.ok()) << SNAP.detail;
  const JobRecord* JOB = SNAP.find("1234");
  ASSERT_NE(JOB, nullptr);
  EXPECT_EQ(JOB->launchRoots, (warden::process::PidSet{500, 501, 901, 902}));
}

/** @test squeue is invoked with the node filter and running-state filter. */
TEST_F(SlurmQueryTest, SqueueArguments) {
  SlurmConfig cfg = config();
  cfg.fetchGpuIndices = false;
  cfg.squeuePath = script("[ \"$*\" = '-h -t RUNNING -w gpu01 -o %A|%u' ] || exit 3\n");
  SlurmSchedulerQuery q(cfg, tree_);
  const JobSnapshot SNAP = q.query();
  EXPECT_TRUE(SNAP.ok()) << SNAP.detail;
  EXPECT_TRUE(SNAP.jobs.empty());
}

/** @test Empty squeue output is OK with zero jobs. */
TEST_F(SlurmQueryTest, NoJobs) {
  SlurmConfig cfg = config();
  cfg.squeuePath = script("exit 0\n");
  SlurmSchedulerQuery q(cfg, tree_);
  const JobSnapshot SNAP = q.query();
  EXPECT_EQ(SNAP.status, QueryStatus::OK);
  EXPECT_TRUE(SNAP.jobs.empty());
}

/** @test Non-zero squeue exit is UNAVAILABLE, never an empty OK. */
TEST_F(SlurmQueryTest, SqueueFails) {
  SlurmConfig cfg = config();
  cfg.squeuePath = script("echo 'slurm_load_jobs error: Unable to contact slurm controller' >&2\n"
                          "exit 1\n");
  SlurmSchedulerQuery q(cfg, tree_);
  const JobSnapshot SNAP = q.query();
  EXPECT_EQ(SNAP.status, QueryStatus::UNAVAILABLE);
  EXPECT_NE(SNAP.detail.find("Unable to contact"), std::string::npos);
}

/** @test Missing binary is UNAVAILABLE. */
TEST_F(SlurmQueryTest, MissingBinary) {
  SlurmConfig cfg = config();
  cfg.squeuePath = "/nonexistent/squeue";
  SlurmSchedulerQuery q(cfg, tree_);
  EXPECT_EQ(q.query().status, QueryStatus::UNAVAILABLE);
}

/** @test Hanging squeue is TIMEOUT. */
TEST_F(SlurmQueryTest, SqueueTimeout) {
  SlurmConfig cfg = config();
  cfg.timeout = std::chrono::milliseconds(200);
  cfg.squeuePath = script("exec sleep 30\n");
  SlurmSchedulerQuery q(cfg, tree_);
  EXPECT_EQ(q.query().status, QueryStatus::TIMEOUT);
}

/** @test Malformed squeue rows are MALFORMED. */
TEST_F(SlurmQueryTest, SqueueMalformed) {
  SlurmConfig cfg = config();
  cfg.squeuePath = script("echo 'JOBID USER'\n");
  SlurmSchedulerQuery q(cfg, tree_);
  EXPECT_EQ(q.query().status, QueryStatus::MALFORMED);
}

/** @test A failing scontrol fails the whole snapshot. */
TEST_F(SlurmQueryTest, ScontrolFails) {
  SlurmConfig cfg = config();
  cfg.squeuePath = script("echo '1234|alice'\n");
  cfg.scontrolPath = script("echo 'Invalid job id specified' >&2\nexit 1\n");
  SlurmSchedulerQuery q(cfg, tree_);
  const JobSnapshot SNAP = q.query();
  EXPECT_EQ(SNAP.status, QueryStatus::UNAVAILABLE);
  EXPECT_TRUE(SNAP.jobs.empty());
}

/** @test Unreadable process table is UNAVAILABLE rather than rootless jobs. */
TEST(SlurmQueryProcTest, EmptyProcessTable) {
  const std::string SQUEUE = writeScript("echo '1234|alice'\n");
  warden::process::ProcfsProcessTree tree("/nonexistent/proc");
  SlurmConfig cfg{};
  cfg.node = "gpu01";
  cfg.fetchGpuIndices = false;
  cfg.squeuePath = SQUEUE;
  SlurmSchedulerQuery q(cfg, tree);
  const JobSnapshot SNAP = q.query();
  std::remove(SQUEUE.c_str());
  EXPECT_EQ(SNAP.status, QueryStatus::UNAVAILABLE);
  EXPECT_TRUE(SNAP.jobs.empty());
}

/** @test Default node name comes from the host name without domain. */
TEST(LocalNodeNameTest, NoDomain) {
  const std::string NAME = localNodeName();
  EXPECT_FALSE(NAME.empty());
  EXPECT_EQ(NAME.find('.'), std::string::npos);
}
