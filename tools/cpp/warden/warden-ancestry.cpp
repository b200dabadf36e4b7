/**
 * @file warden-ancestry.cpp
 * @brief Show how gpu-warden would resolve a PID's ancestry.
 *
 * Walks the process tree from --pid upward, against the launch roots given
 * with --roots (none by default), and prints every hop with its namespace
 * mapping and command line. Useful when reviewing an audit record.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/process/inc/AncestryResolver.hpp"
#include "src/process/inc/ProcessTree.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace proc = warden::process;
namespace args = warden::helpers::args;
namespace strings = warden::helpers::strings;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_PID = 2,
  ARG_ROOTS = 3,
  ARG_PROC_ROOT = 4,
  ARG_MAX_DEPTH = 5,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Resolve the ancestry of a process the way gpu-warden does.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_PID] = {"--pid", 1, true, "Host PID to resolve"};
  map[ARG_ROOTS] = {"--roots", 1, false, "Comma-separated launch root PIDs"};
  map[ARG_PROC_ROOT] = {"--proc-root", 1, false, "procfs mount (default: /proc)"};
  map[ARG_MAX_DEPTH] = {"--max-depth", 1, false, "Walk depth cap (default: 512)"};
  return map;
}

/// Parse "500,501" into a PID set.
bool parseRoots(std::string_view text, proc::PidSet& out, std::string& error) {
  for (const std::string_view FIELD : strings::splitFields(text, ',')) {
    std::int32_t pid = 0;
    if (!strings::parsePid(FIELD, pid)) {
      error = fmt::format("invalid PID '{}' in --roots", FIELD);
      return false;
    }
    out.insert(pid);
  }
  return true;
}

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const proc::AncestryResult& result, proc::ProcessTree& tree) {
  fmt::print("{:>8} {:>8} {:>8} {:>3}  {}\n", "HostPID", "LocalPID", "Parent", "NS", "Command");
  for (const proc::AncestryStep& STEP : result.path) {
    fmt::print("{:>8} {:>8} {:>8} {:>3}  {}\n", STEP.hostPid, STEP.pid, STEP.parentPid,
               STEP.namespaceDepth, tree.getCommand(STEP.hostPid));
  }
  fmt::print("\nPath:    {}\n", result.pathString());
  fmt::print("Outcome: {}\n", proc::toString(result.outcome));
  if (result.matched()) {
    fmt::print("Root:    {}\n", result.matchedRoot);
  }
  if (result.boundariesCrossed() > 0) {
    fmt::print("Namespace boundaries crossed: {}\n", result.boundariesCrossed());
  }
  if (!result.detail.empty()) {
    fmt::print("Detail:  {}\n", result.detail);
  }
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const proc::AncestryResult& result, proc::ProcessTree& tree) {
  std::string out = "{\n  \"outcome\": ";
  out += warden::helpers::format::jsonString(proc::toString(result.outcome));
  out += fmt::format(",\n  \"matchedRoot\": {},\n  \"boundariesCrossed\": {},\n  \"detail\": ",
                     result.matchedRoot, result.boundariesCrossed());
  warden::helpers::format::appendJsonString(out, result.detail);
  out += ",\n  \"path\": [";
  for (std::size_t i = 0; i < result.path.size(); ++i) {
    const proc::AncestryStep& STEP = result.path[i];
    out += fmt::format("{}\n    {{\"hostPid\": {}, \"pid\": {}, \"parentPid\": {}, "
                       "\"namespaceDepth\": {}, \"command\": ",
                       i == 0 ? "" : ",", STEP.hostPid, STEP.pid, STEP.parentPid,
                       STEP.namespaceDepth);
    warden::helpers::format::appendJsonString(out, tree.getCommand(STEP.hostPid));
    out += '}';
  }
  out += "\n  ]\n}\n";
  fmt::print("{}", out);
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> tokens;
  tokens.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    tokens.emplace_back(argv[i]);
  }

  // --help must work without the required --pid.
  for (const std::string_view TOK : tokens) {
    if (TOK == "--help") {
      args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 0;
    }
  }

  std::string error;
  if (!args::parseArgs(tokens, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  std::int32_t pid = 0;
  if (!strings::parsePid(pargs[ARG_PID][0], pid)) {
    fmt::print(stderr, "Error: --pid must be a positive integer\n");
    return 1;
  }

  proc::PidSet roots;
  if (const auto ROOTS = args::firstValue(pargs, ARG_ROOTS)) {
    if (!parseRoots(*ROOTS, roots, error)) {
      fmt::print(stderr, "Error: {}\n", error);
      return 1;
    }
  }

  std::size_t maxDepth = proc::DEFAULT_MAX_ANCESTRY_DEPTH;
  if (const auto DEPTH = args::firstValue(pargs, ARG_MAX_DEPTH)) {
    std::int64_t value = 0;
    if (!strings::parseInt64(*DEPTH, value) || value < 1) {
      fmt::print(stderr, "Error: --max-depth must be >= 1\n");
      return 1;
    }
    maxDepth = static_cast<std::size_t>(value);
  }

  const std::string PROC_ROOT(args::firstValue(pargs, ARG_PROC_ROOT).value_or("/proc"));
  proc::ProcfsProcessTree tree(PROC_ROOT);
  const proc::AncestryResolver RESOLVER(tree, maxDepth);
  const proc::AncestryResult RESULT = RESOLVER.resolve(pid, roots);

  if (args::hasFlag(pargs, ARG_JSON)) {
    printJson(RESULT, tree);
  } else {
    printHuman(RESULT, tree);
  }
  return RESULT.outcome == proc::AncestryOutcome::UNRESOLVED ? 2 : 0;
}
