#include "safedose/results_table.hpp"

#include "safedose/errors.hpp"

#include <cstdio>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace safedose {

const char* const kResultsHeader = "Time,CGM,Meal,Insulin_Basal,Insulin_Bolus";

namespace {

constexpr std::size_t kColumns = 5;

// Quote a field only when it would otherwise break the row.
std::string csv_field(const std::string& s) {
  if (s.find_first_of(",\"") == std::string::npos) {
    return s;
  }
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

bool split_row(const std::string& line, std::vector<std::string>& fields) {
  fields.clear();
  std::string cur;
  bool quoted = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          cur += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        cur += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(cur);
      cur.clear();
    } else {
      cur += c;
    }
  }

  if (quoted) {
    return false; // unterminated quote
  }
  fields.push_back(cur);
  return true;
}

double parse_number(const std::string& field, std::size_t row, const char* column) {
  std::size_t used = 0;
  double v = 0.0;
  try {
    v = std::stod(field, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (used == 0 || used != field.size()) {
    std::ostringstream msg;
    msg << "results row " << row << ": invalid " << column << " value '" << field << "'";
    throw OutputError(msg.str());
  }
  return v;
}

} // namespace

std::string format_results_csv(const std::vector<StepRecord>& records) {
  std::ostringstream csv;
  csv << std::setprecision(std::numeric_limits<double>::max_digits10);
  csv << kResultsHeader << "\n";

  for (const auto& r : records) {
    if (r.time.find_first_of("\r\n") != std::string::npos) {
      throw OutputError("time label contains a line break: cannot write as CSV");
    }
    csv << csv_field(r.time) << ","
        << r.cgm_mg_dl << ","
        << r.meal_g << ","
        << r.basal_u_per_min << ","
        << r.bolus_u << "\n";
  }
  return csv.str();
}

std::vector<StepRecord> parse_results_csv(const std::string& text) {
  std::istringstream iss(text);
  std::string line;

  if (!std::getline(iss, line)) {
    throw OutputError("results table is empty");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (line != kResultsHeader) {
    throw OutputError("unexpected results header: '" + line + "'");
  }

  std::vector<StepRecord> records;
  std::vector<std::string> fields;
  std::size_t row = 0;

  while (std::getline(iss, line)) {
    ++row;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    if (!split_row(line, fields) || fields.size() != kColumns) {
      std::ostringstream msg;
      msg << "results row " << row << ": expected " << kColumns << " fields";
      throw OutputError(msg.str());
    }

    StepRecord r;
    r.time = fields[0];
    r.cgm_mg_dl = parse_number(fields[1], row, "CGM");
    r.meal_g = parse_number(fields[2], row, "Meal");
    r.basal_u_per_min = parse_number(fields[3], row, "Insulin_Basal");
    r.bolus_u = parse_number(fields[4], row, "Insulin_Bolus");
    records.push_back(r);
  }

  return records;
}

void write_results_csv(const std::string& path, const std::vector<StepRecord>& records) {
  // Format first so a bad record never leaves a truncated file behind.
  const std::string text = format_results_csv(records);

  // Stage next to the target and rename into place, so a failed write never
  // leaves a partial table at `path`.
  const std::string staging = path + ".tmp";
  {
    std::ofstream out(staging, std::ios::out | std::ios::trunc);
    if (!out) {
      throw OutputError("cannot open results file for writing: " + staging);
    }
    out << text;
    out.close();
    if (!out) {
      std::remove(staging.c_str());
      throw OutputError("failed writing results file: " + staging);
    }
  }

  if (std::rename(staging.c_str(), path.c_str()) != 0) {
    std::remove(staging.c_str());
    throw OutputError("cannot move results file into place: " + path);
  }
}

std::vector<StepRecord> read_results_csv(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw OutputError("cannot open results file: " + path);
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return parse_results_csv(buf.str());
}

} // namespace safedose
