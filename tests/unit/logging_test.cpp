#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

using gate::observability::FormatFields;
using gate::observability::IntField;
using gate::observability::StringField;

void TestPlainValuesAreBare() {
  assert(FormatFields({}).empty());
  assert(FormatFields({IntField("miner_id", 7), StringField("reason", "stale_timestamp")}) == "miner_id=7 reason=stale_timestamp");
  assert(FormatFields({IntField("delta", -3)}) == "delta=-3");
}

void TestAwkwardValuesAreQuoted() {
  assert(FormatFields({StringField("error", "connection refused")}) == R"(error="connection refused")");
  assert(FormatFields({StringField("task_id", "")}) == R"(task_id="")");
  assert(FormatFields({StringField("task_id", "a=b")}) == R"(task_id="a=b")");
  assert(FormatFields({StringField("task_id", "say \"hi\"")}) == R"(task_id="say \"hi\"")");
  assert(FormatFields({StringField("task_id", "line1\nline2")}) == R"(task_id="line1\nline2")");
  assert(FormatFields({StringField("task_id", std::string("a\x01", 2))}) == R"(task_id="a\x01")");

  // backslashes alone do not force quoting
  assert(FormatFields({StringField("path", "C:\\gate")}) == "path=C:\\gate");
}

void TestLoggingBeforeAndAfterInitialize() {
  // default logger until InitializeLogging runs
  gate::observability::LogInfo("before init", {IntField("n", 1)});

  setenv("GATE_LOG_LEVEL", "debug", 1);
  gate::observability::InitializeLogging();
  GATE_LOG_DEBUG("debug line", {StringField("k", "v w")});
  GATE_LOG_WARN("warn line");
  unsetenv("GATE_LOG_LEVEL");
  gate::observability::ShutdownLogging();
}

} // namespace

int main() {
  TestPlainValuesAreBare();
  TestAwkwardValuesAreQuoted();
  TestLoggingBeforeAndAfterInitialize();

  std::cout << "submission_gate_unit_logging: pass\n";
  return 0;
}
