#include "safedose/errors.hpp"
#include "safedose/results_table.hpp"
#include "safedose/trace_environment.hpp"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

using namespace safedose;

static StepRecord make_record(const std::string& time, double cgm, double meal,
                              double basal, double bolus) {
  StepRecord r;
  r.time = time;
  r.cgm_mg_dl = cgm;
  r.meal_g = meal;
  r.basal_u_per_min = basal;
  r.bolus_u = bolus;
  return r;
}

template <typename Fn>
static bool throws_output_error(Fn fn) {
  try {
    fn();
  } catch (const OutputError&) {
    return true;
  }
  return false;
}

// Test 1: Header and column order
static void test_header_and_layout() {
  std::vector<StepRecord> records;
  records.push_back(make_record("0", 120.0, 30.0, 0.05, 1.0));

  std::string csv = format_results_csv(records);

  assert(csv.find("Time,CGM,Meal,Insulin_Basal,Insulin_Bolus\n") == 0);
  assert(csv.find("\n0,120,30,") != std::string::npos);

  auto parsed = parse_results_csv(csv);
  assert(parsed.size() == 1);
  assert(parsed[0].basal_u_per_min == 0.05);
  assert(parsed[0].bolus_u == 1.0);
}

// Test 2: Written file re-parses to the same five fields, in order
static void test_file_round_trip() {
  const std::string path = "safedose_results_roundtrip.csv";

  std::vector<StepRecord> records;
  records.push_back(make_record("2024-01-01 00:00:00", 142.318, 0.0, 0.05, 0.0));
  records.push_back(make_record("2024-01-01 00:01:00", 68.9, 45.0, 0.0, 1.0));
  records.push_back(make_record("2024-01-01 00:02:00", 70.0, 0.0, 0.05, 0.0));
  records.push_back(make_record("2024-01-01 00:03:00", 1.0 / 3.0, 12.5, 0.05, 1.0));
  records.push_back(make_record("2024-01-01 00:04:00", 100.0 / 3.0, 0.0, 0.05, 0.0));
  records.push_back(make_record("2024-01-01 00:05:00", 187.12345678901201, 12345678.123,
                                0.1 + 0.2, 1e-17));

  write_results_csv(path, records);
  auto parsed = read_results_csv(path);

  assert(parsed.size() == records.size());
  for (size_t i = 0; i < records.size(); ++i) {
    assert(parsed[i].time == records[i].time);
    // Doubles are written with enough digits to come back bit-for-bit
    assert(parsed[i].cgm_mg_dl == records[i].cgm_mg_dl);
    assert(parsed[i].meal_g == records[i].meal_g);
    assert(parsed[i].basal_u_per_min == records[i].basal_u_per_min);
    assert(parsed[i].bolus_u == records[i].bolus_u);
  }

  std::remove(path.c_str());
}

// Test 3: Labels with separators are quoted and survive parsing
static void test_quoted_labels() {
  std::vector<StepRecord> records;
  records.push_back(make_record("day 1, \"breakfast\"", 150.0, 40.0, 0.05, 1.0));

  std::string csv = format_results_csv(records);
  assert(csv.find("\"day 1, \"\"breakfast\"\"\",150") != std::string::npos);

  auto parsed = parse_results_csv(csv);
  assert(parsed.size() == 1);
  assert(parsed[0].time == "day 1, \"breakfast\"");
  assert(parsed[0].cgm_mg_dl == 150.0);
}

// Test 4: Empty sequence still writes the header
static void test_header_only() {
  std::string csv = format_results_csv(std::vector<StepRecord>{});
  assert(csv == "Time,CGM,Meal,Insulin_Basal,Insulin_Bolus\n");
  assert(parse_results_csv(csv).empty());
}

// Test 5: CRLF line endings are accepted
static void test_crlf_input() {
  const std::string csv =
      "Time,CGM,Meal,Insulin_Basal,Insulin_Bolus\r\n"
      "0,65,0,0,0\r\n"
      "1,72.5,20,0.05,1\r\n";

  auto parsed = parse_results_csv(csv);
  assert(parsed.size() == 2);
  assert(parsed[1].time == "1");
  assert(parsed[1].cgm_mg_dl == 72.5);
  assert(parsed[1].bolus_u == 1.0);
}

// Test 6: Malformed tables → OutputError
static void test_malformed_input() {
  assert(throws_output_error([] { parse_results_csv(""); }));
  assert(throws_output_error([] { parse_results_csv("Time,CGM\n0,1\n"); }));
  assert(throws_output_error([] {
    parse_results_csv("Time,CGM,Meal,Insulin_Basal,Insulin_Bolus\n0,120,0,0.05\n");
  }));
  assert(throws_output_error([] {
    parse_results_csv("Time,CGM,Meal,Insulin_Basal,Insulin_Bolus\n0,abc,0,0.05,0\n");
  }));
  assert(throws_output_error([] {
    parse_results_csv("Time,CGM,Meal,Insulin_Basal,Insulin_Bolus\n0,120x,0,0.05,0\n");
  }));
  assert(throws_output_error([] {
    parse_results_csv("Time,CGM,Meal,Insulin_Basal,Insulin_Bolus\n\"0,120,0,0.05,0\n");
  }));
}

// Test 7: Unwritable path / missing file → OutputError
static void test_io_failures() {
  std::vector<StepRecord> records;
  records.push_back(make_record("0", 100.0, 0.0, 0.05, 0.0));

  assert(throws_output_error([&] {
    write_results_csv("no_such_directory/for/results.csv", records);
  }));
  assert(throws_output_error([] { read_results_csv("safedose_missing_results.csv"); }));

  // A label with a line break cannot be represented
  records[0].time = "line\nbreak";
  assert(throws_output_error([&] { format_results_csv(records); }));
}

// Test 8: A failed write leaves neither a partial table nor a staging file
static void test_failed_write_leaves_nothing() {
  const std::string path = "safedose_results_blocked";
  const std::string staging = path + ".tmp";
  std::remove(staging.c_str());
  rmdir(path.c_str());

  // A directory at the target path makes the final rename fail
  int rc = mkdir(path.c_str(), 0755);
  assert(rc == 0);

  std::vector<StepRecord> records;
  records.push_back(make_record("0", 100.0, 0.0, 0.05, 0.0));

  assert(throws_output_error([&] { write_results_csv(path, records); }));

  std::ifstream leftover(staging);
  assert(!leftover);

  struct stat st {};
  rc = stat(path.c_str(), &st);
  assert(rc == 0 && S_ISDIR(st.st_mode));
  rmdir(path.c_str());

  // A successful write does not leave the staging file around either
  const std::string ok_path = "safedose_results_staged.csv";
  write_results_csv(ok_path, records);
  std::ifstream staged(ok_path + ".tmp");
  assert(!staged);
  assert(read_results_csv(ok_path).size() == 1);
  std::remove(ok_path.c_str());
}

// Test 9: Trace environment lifecycle
static void test_trace_environment() {
  std::vector<TraceSample> trace(3);
  trace[0].cgm_mg_dl = 100.0;
  trace[1].cgm_mg_dl = 110.0;
  trace[1].meal_g = 15.0;
  trace[2].cgm_mg_dl = 120.0;

  TraceEnvironment env(trace);

  bool threw = false;
  try {
    Action a;
    env.step(a);
  } catch (const EnvironmentError&) {
    threw = true;
  }
  assert(threw); // step before reset

  auto r0 = env.reset();
  assert(r0.observation.cgm_mg_dl == 100.0);
  assert(!r0.done);
  assert(r0.info.time.empty());

  Action a;
  a.basal_u_per_min = 0.05;
  auto r1 = env.step(a);
  assert(r1.observation.cgm_mg_dl == 110.0);
  assert(r1.info.meal_g == 15.0);
  assert(!r1.done);

  auto r2 = env.step(a);
  assert(r2.observation.cgm_mg_dl == 120.0);
  assert(r2.done);
  assert(env.applied_actions().size() == 2);

  threw = false;
  try {
    env.step(a);
  } catch (const EnvironmentError&) {
    threw = true;
  }
  assert(threw); // step after termination

  // Reset starts over
  auto again = env.reset();
  assert(again.observation.cgm_mg_dl == 100.0);
  assert(env.applied_actions().empty());

  threw = false;
  try {
    TraceEnvironment empty(std::vector<TraceSample>{});
    empty.reset();
  } catch (const EnvironmentError&) {
    threw = true;
  }
  assert(threw);
}

// Test 10: UTC clock labels
static void test_clock_labels() {
  assert(format_utc(0) == "1970-01-01 00:00:00");
  assert(format_utc(1704067200) == "2024-01-01 00:00:00");

  TraceConfig cfg;
  cfg.repeat = true;
  cfg.start_time = 1704067200 + 23 * 3600 + 59 * 60; // 23:59
  cfg.sample_minutes = 1;
  std::vector<TraceSample> trace(1);
  trace[0].cgm_mg_dl = 100.0;
  TraceEnvironment env(trace, cfg);

  auto r0 = env.reset();
  assert(r0.info.time == "2024-01-01 23:59:00");
  assert(!r0.done);
  auto r1 = env.step(Action{});
  assert(r1.info.time == "2024-01-02 00:00:00");
  assert(!r1.done);
}

int main() {
  std::cout << "Running results table tests...\n";

  test_header_and_layout();
  std::cout << "[PASS] Header and layout\n";

  test_file_round_trip();
  std::cout << "[PASS] File round trip\n";

  test_quoted_labels();
  std::cout << "[PASS] Quoted labels\n";

  test_header_only();
  std::cout << "[PASS] Header-only table\n";

  test_crlf_input();
  std::cout << "[PASS] CRLF input\n";

  test_malformed_input();
  std::cout << "[PASS] Malformed input\n";

  test_io_failures();
  std::cout << "[PASS] I/O failures\n";

  test_failed_write_leaves_nothing();
  std::cout << "[PASS] Failed write cleanup\n";

  test_trace_environment();
  std::cout << "[PASS] Trace environment\n";

  test_clock_labels();
  std::cout << "[PASS] Clock labels\n";

  std::cout << "\n[PASS] All results table tests passed!\n";

  return 0;
}
