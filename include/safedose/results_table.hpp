#pragma once

// Flat tabular output of a simulation run.
//
// CSV layout (one header row, one row per step, no index column):
//   Time,CGM,Meal,Insulin_Basal,Insulin_Bolus

#include <string>
#include <vector>

namespace safedose {

// One completed control step: the pre-action observation and disturbance,
// and the action taken in response.
struct StepRecord final {
  std::string time;            // environment time label, or the step index
  double cgm_mg_dl = 0.0;
  double meal_g = 0.0;
  double basal_u_per_min = 0.0;
  double bolus_u = 0.0;
};

extern const char* const kResultsHeader;

// Serialize records to CSV text.
std::string format_results_csv(const std::vector<StepRecord>& records);

// Parse CSV text produced by format_results_csv().
// Throws OutputError on a missing/unexpected header or a malformed row.
std::vector<StepRecord> parse_results_csv(const std::string& text);

// Write records to `path`, replacing any existing file.
// Throws OutputError if the file cannot be written.
void write_results_csv(const std::string& path, const std::vector<StepRecord>& records);

// Read a results file back. Throws OutputError if it cannot be opened or parsed.
std::vector<StepRecord> read_results_csv(const std::string& path);

} // namespace safedose
