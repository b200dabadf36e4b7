/**
 * @file ProcessTree_uTest.cpp
 * @brief Unit tests for warden::process procfs parsing and ProcfsProcessTree.
 *
 * Notes:
 *  - Parser tests use captured /proc text.
 *  - Tree tests build a synthetic proc root under /tmp.
 *  - LiveProc tests read the real /proc for the test process itself.
 */

#include "src/process/inc/ProcessTree.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using warden::process::formatCmdline;
using warden::process::LookupStatus;
using warden::process::NamespaceMapping;
using warden::process::OwnerLookup;
using warden::process::parseStatParent;
using warden::process::parseStatusNsPids;
using warden::process::parseStatusUids;
using warden::process::ParentLookup;
using warden::process::ProcfsProcessTree;
using warden::process::toString;

/* ----------------------------- parseStatParent ----------------------------- */

/** @test Simple stat line yields field 4. */
TEST(ParseStatParentTest, Simple) {
  std::int32_t ppid = -1;
  ASSERT_TRUE(parseStatParent("9001 (python) S 8000 9001 8000 0 -1 4194304", ppid));
  EXPECT_EQ(ppid, 8000);
}

/** @test comm containing spaces and parentheses does not confuse parsing. */
TEST(ParseStatParentTest, TrickyComm) {
  std::int32_t ppid = -1;
  ASSERT_TRUE(parseStatParent("42 (a) b (c) d) R 17 42 42 0", ppid));
  EXPECT_EQ(ppid, 17);
}

/** @test Top of the tree reports parent 0. */
TEST(ParseStatParentTest, ParentZero) {
  std::int32_t ppid = -1;
  ASSERT_TRUE(parseStatParent("1 (systemd) S 0 1 1 0", ppid));
  EXPECT_EQ(ppid, 0);
}

/** @test Truncated or garbage content is rejected. */
TEST(ParseStatParentTest, Malformed) {
  std::int32_t ppid = -1;
  EXPECT_FALSE(parseStatParent("", ppid));
  EXPECT_FALSE(parseStatParent("9001 (python", ppid));
  EXPECT_FALSE(parseStatParent("9001 (python) S", ppid));
  EXPECT_FALSE(parseStatParent("9001 (python) S abc 1", ppid));
}

/* ----------------------------- parseStatusNsPids ----------------------------- */

/** @test Host-only process has a single NSpid value. */
TEST(ParseStatusNsPidsTest, HostOnly) {
  std::vector<std::int32_t> ns;
  ASSERT_TRUE(parseStatusNsPids("Name:\tbash\nPid:\t8000\nNSpid:\t8000\nPPid:\t500\n", ns));
  ASSERT_EQ(ns.size(), 1U);
  EXPECT_EQ(ns[0], 8000);
}

/** @test Nested namespace lists outermost first. */
TEST(ParseStatusNsPidsTest, Nested) {
  std::vector<std::int32_t> ns;
  ASSERT_TRUE(parseStatusNsPids("Name:\tpython\nNSpid:\t620\t7\n", ns));
  ASSERT_EQ(ns.size(), 2U);
  EXPECT_EQ(ns.front(), 620);
  EXPECT_EQ(ns.back(), 7);
}

/** @test Missing line (old kernels) reports false. */
TEST(ParseStatusNsPidsTest, Missing) {
  std::vector<std::int32_t> ns;
  EXPECT_FALSE(parseStatusNsPids("Name:\tbash\nPid:\t8000\n", ns));
  EXPECT_TRUE(ns.empty());
}

/** @test Non-numeric value rejects the line. */
TEST(ParseStatusNsPidsTest, Malformed) {
  std::vector<std::int32_t> ns;
  EXPECT_FALSE(parseStatusNsPids("NSpid:\t620\tx\n", ns));
  EXPECT_TRUE(ns.empty());
}

/* ----------------------------- parseStatusUids ----------------------------- */

/** @test Real, effective, saved and filesystem UIDs are read in order. */
TEST(ParseStatusUidsTest, AllFour) {
  std::array<std::uint32_t, 4> uids{};
  ASSERT_TRUE(parseStatusUids("Name:\tpython\nUid:\t1000\t0\t1000\t0\nGid:\t100\t100\t100\t100\n",
                              uids));
  EXPECT_EQ(uids[0], 1000U);
  EXPECT_EQ(uids[1], 0U);
  EXPECT_EQ(uids[2], 1000U);
  EXPECT_EQ(uids[3], 0U);
}

/** @test Missing, short or non-numeric Uid lines are rejected. */
TEST(ParseStatusUidsTest, Malformed) {
  std::array<std::uint32_t, 4> uids{};
  EXPECT_FALSE(parseStatusUids("Name:\tbash\nPid:\t8000\n", uids));
  EXPECT_FALSE(parseStatusUids("Uid:\t0\t0\n", uids));
  EXPECT_FALSE(parseStatusUids("Uid:\t0\troot\t0\t0\n", uids));
  EXPECT_FALSE(parseStatusUids("Uid:\t-1\t0\t0\t0\n", uids));
}

/* ----------------------------- formatCmdline ----------------------------- */

/** @test NUL separators become spaces and the trailing NUL disappears. */
TEST(FormatCmdlineTest, Joins) {
  const std::string RAW("python\0train.py\0--epochs=3\0", 27);
  EXPECT_EQ(formatCmdline(RAW), "python train.py --epochs=3");
}

/** @test slurmstepd rewrites argv into a single string. */
TEST(FormatCmdlineTest, StepdTitle) {
  const std::string RAW("slurmstepd: [1234.batch]\0\0\0", 27);
  EXPECT_EQ(formatCmdline(RAW), "slurmstepd: [1234.batch]");
}

/* ----------------------------- ProcfsProcessTree ----------------------------- */

class ProcfsTreeTest : public ::testing::Test {
protected:
  std::string root_;

  void SetUp() override {
    char tmpl[] = "/tmp/warden_proc_XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    root_ = tmpl;
  }

  void TearDown() override {
    const std::string CMD = "rm -rf '" + root_ + "'";
    EXPECT_EQ(std::system(CMD.c_str()), 0);
  }

  void writeFile(const std::string& rel, const std::string& content) const {
    std::ofstream out(root_ + "/" + rel, std::ios::binary);
    out << content;
  }

  void addProc(std::int32_t pid, std::int32_t ppid, const std::string& comm,
               const std::string& nsPids, const std::string& cmdline,
               const std::string& uids = "1000\t1000\t1000\t1000") const {
    const std::string DIR = root_ + "/" + std::to_string(pid);
    ::mkdir(DIR.c_str(), 0755);
    const std::string PID = std::to_string(pid);
    writeFile(PID + "/stat", PID + " (" + comm + ") S " + std::to_string(ppid) + " 1 1 0 -1\n");
    writeFile(PID + "/status", "Name:\t" + comm + "\nUid:\t" + uids + "\nNSpid:\t" + nsPids + "\n");
    writeFile(PID + "/cmdline", cmdline);
    writeFile(PID + "/comm", comm + "\n");
  }
};

/** @test Parent links are read from stat. */
TEST_F(ProcfsTreeTest, GetParent) {
  addProc(500, 1, "slurmstepd", "500", std::string("slurmstepd: [1234.batch]\0", 25));
  addProc(8000, 500, "bash", "8000", std::string("bash\0job.sh\0", 12));
  ProcfsProcessTree tree(root_);

  const ParentLookup P = tree.getParent(8000);
  EXPECT_EQ(P.status, LookupStatus::OK);
  EXPECT_EQ(P.parentPid, 500);
}

/** @test Missing PID directory reports NO_SUCH_PROCESS. */
TEST_F(ProcfsTreeTest, MissingProcess) {
  ProcfsProcessTree tree(root_);
  EXPECT_EQ(tree.getParent(4242).status, LookupStatus::NO_SUCH_PROCESS);
  EXPECT_EQ(tree.getNamespaceMapping(4242).status, LookupStatus::NO_SUCH_PROCESS);
  EXPECT_TRUE(tree.getCommand(4242).empty());
}

/** @test Non-positive PIDs are rejected without touching the filesystem. */
TEST_F(ProcfsTreeTest, InvalidPid) {
  ProcfsProcessTree tree(root_);
  EXPECT_EQ(tree.getParent(0).status, LookupStatus::NO_SUCH_PROCESS);
  EXPECT_EQ(tree.getParent(-5).status, LookupStatus::NO_SUCH_PROCESS);
}

/** @test Single NSpid value means not namespaced. */
TEST_F(ProcfsTreeTest, HostNamespace) {
  addProc(8000, 500, "bash", "8000", "bash");
  ProcfsProcessTree tree(root_);
  const NamespaceMapping NS = tree.getNamespaceMapping(8000);
  EXPECT_EQ(NS.status, LookupStatus::NOT_APPLICABLE);
  EXPECT_EQ(NS.hostPid, 8000);
  EXPECT_EQ(NS.localPid, 8000);
  EXPECT_EQ(NS.depth, 0);
  EXPECT_FALSE(NS.isNamespaceInit());
}

/** @test Containerized process maps host and local PIDs. */
TEST_F(ProcfsTreeTest, NestedNamespace) {
  addProc(610, 600, "sh", "610\t1", "/bin/sh");
  addProc(620, 610, "python", "620\t7", "python");
  ProcfsProcessTree tree(root_);

  const NamespaceMapping INIT = tree.getNamespaceMapping(610);
  EXPECT_EQ(INIT.status, LookupStatus::OK);
  EXPECT_TRUE(INIT.isNamespaceInit());

  const NamespaceMapping WORKER = tree.getNamespaceMapping(620);
  EXPECT_EQ(WORKER.hostPid, 620);
  EXPECT_EQ(WORKER.localPid, 7);
  EXPECT_EQ(WORKER.depth, 1);
}

/** @test Command lines are joined; empty cmdline falls back to comm. */
TEST_F(ProcfsTreeTest, GetCommand) {
  addProc(500, 1, "slurmstepd", "500", std::string("slurmstepd: [1234.batch]\0", 25));
  addProc(2, 0, "kthreadd", "2", "");
  ProcfsProcessTree tree(root_);
  EXPECT_EQ(tree.getCommand(500), "slurmstepd: [1234.batch]");
  EXPECT_EQ(tree.getCommand(2), "[kthreadd]");
}

/** @test Owner comes from the Uid line; only an all-zero line is root. */
TEST_F(ProcfsTreeTest, GetOwner) {
  addProc(500, 1, "slurmstepd", "500", "x", "0\t0\t0\t0");
  addProc(700, 1, "python", "700", "x", "0\t1000\t0\t0");
  addProc(800, 1, "python", "800", "x", "3999999\t3999999\t3999999\t3999999");
  ProcfsProcessTree tree(root_);

  const OwnerLookup ROOT = tree.getOwner(500);
  ASSERT_TRUE(ROOT.ok());
  EXPECT_EQ(ROOT.uid, 0U);
  EXPECT_TRUE(ROOT.allRoot);
  EXPECT_EQ(ROOT.user, "root");

  const OwnerLookup MIXED = tree.getOwner(700);
  ASSERT_TRUE(MIXED.ok());
  EXPECT_EQ(MIXED.uid, 0U);
  EXPECT_FALSE(MIXED.allRoot);

  // No passwd entry: the numeric UID stands in for the name.
  const OwnerLookup UNNAMED = tree.getOwner(800);
  ASSERT_TRUE(UNNAMED.ok());
  EXPECT_EQ(UNNAMED.user, "3999999");

  EXPECT_EQ(tree.getOwner(4242).status, LookupStatus::NO_SUCH_PROCESS);
}

/** @test The exe link target is returned; a missing link yields empty. */
TEST_F(ProcfsTreeTest, GetExecutable) {
  addProc(500, 1, "slurmstepd", "500", "x", "0\t0\t0\t0");
  addProc(700, 1, "python", "700", "x");
  ASSERT_EQ(::symlink("/usr/sbin/slurmstepd", (root_ + "/500/exe").c_str()), 0);
  ProcfsProcessTree tree(root_);

  EXPECT_EQ(tree.getExecutable(500), "/usr/sbin/slurmstepd");
  EXPECT_TRUE(tree.getExecutable(700).empty());
  EXPECT_TRUE(tree.getExecutable(4242).empty());
}

/** @test Only numeric entries are listed. */
TEST_F(ProcfsTreeTest, ListPids) {
  addProc(500, 1, "slurmstepd", "500", "x");
  addProc(8000, 500, "bash", "8000", "x");
  ::mkdir((root_ + "/self").c_str(), 0755);
  writeFile("meminfo", "MemTotal: 1 kB\n");

  ProcfsProcessTree tree(root_ + "/");
  std::vector<std::int32_t> pids = tree.listPids();
  std::sort(pids.begin(), pids.end());
  ASSERT_EQ(pids.size(), 2U);
  EXPECT_EQ(pids[0], 500);
  EXPECT_EQ(pids[1], 8000);
  EXPECT_EQ(tree.procRoot(), root_);
}

/* ----------------------------- Live /proc ----------------------------- */

/** @test The test process can resolve its own parent from the real /proc. */
TEST(LiveProcTest, OwnParent) {
  ProcfsProcessTree tree;
  const ParentLookup P = tree.getParent(static_cast<std::int32_t>(::getpid()));
  EXPECT_EQ(P.status, LookupStatus::OK);
  EXPECT_EQ(P.parentPid, static_cast<std::int32_t>(::getppid()));
  EXPECT_FALSE(tree.getCommand(static_cast<std::int32_t>(::getpid())).empty());
}

/** @test The test process owner matches its real UID and its exe link is readable. */
TEST(LiveProcTest, OwnOwnerAndExecutable) {
  ProcfsProcessTree tree;
  const std::int32_t SELF = static_cast<std::int32_t>(::getpid());
  const OwnerLookup OWNER = tree.getOwner(SELF);
  ASSERT_TRUE(OWNER.ok());
  EXPECT_EQ(OWNER.uid, static_cast<std::uint32_t>(::getuid()));
  EXPECT_FALSE(OWNER.user.empty());
  EXPECT_FALSE(tree.getExecutable(SELF).empty());
}

/** @test Status strings are stable. */
TEST(LookupStatusTest, ToString) {
  EXPECT_STREQ(toString(LookupStatus::OK), "ok");
  EXPECT_STREQ(toString(LookupStatus::NO_SUCH_PROCESS), "no-such-process");
}
