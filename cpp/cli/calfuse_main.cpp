/*
  calfuse: calibration fusion command-line runner

  Commands
  --------
  calfuse check    --config <path> [--log-level LEVEL]
      Load the calibration, run the interaction governor, print a readiness
      report (plus parameter drift between superseded layer versions).

  calfuse evaluate --config <path> --in <path|-> --out <path|->
                   [--decisions <path|->] [--key-file <path>] [--log-level LEVEL]
      Decide every request in the input (a JSON array, or {"requests": [...]})
      and write the manifest as JSON lines.

  calfuse verify   --manifest <path|-> [--key-file <path>] [--log-level LEVEL]
      Verify hash links, entry hashes and (with a key) signatures.

  Exit codes
  ----------
    check:    0 ready, 1 load/tool error
    evaluate: 0 all fused, 2 at least one veto (no rejections),
              3 at least one request rejected, 1 load/tool error
    verify:   0 valid, 2 invalid, 1 tool error
*/

#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/calibration/parameter_drift.hpp"
#include "engine/config/calibration_context.hpp"
#include "engine/core/canonical_json.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/json_reader.hpp"
#include "engine/core/logging.hpp"
#include "engine/governance/interaction_governor.hpp"
#include "engine/manifest/calibration_manifest.hpp"
#include "engine/manifest/manifest_audit.hpp"
#include "engine/pipeline/decision_pipeline.hpp"

namespace calfuse {
namespace {

enum class ExitCode : int {
  kOk = 0,
  kError = 1,
  kVetoOrInvalid = 2,
  kRejected = 3,
};

static constexpr int kExitErrorInt = static_cast<int>(ExitCode::kError);

enum class Command { kNone, kCheck, kEvaluate, kVerify };

struct Args {
  Command cmd = Command::kNone;
  std::string config_path;
  std::string in_path;
  std::string out_path;
  std::string decisions_path;
  std::string manifest_path;
  std::string key_file;
  std::optional<LogLevel> log_level;
};

static void print_usage(std::ostream& os) {
  os <<
    "calfuse check    --config <path> [--log-level LEVEL]\n"
    "calfuse evaluate --config <path> --in <path|-> --out <path|->\n"
    "                 [--decisions <path|->] [--key-file <path>] [--log-level LEVEL]\n"
    "calfuse verify   --manifest <path|-> [--key-file <path>] [--log-level LEVEL]\n"
    "\n"
    "LEVEL: debug | info | warn | error\n";
}

static bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

static bool parse_args(int argc, char** argv, Args* a, std::string* err, bool* help_requested) {
  if (argc < 2) { *err = "missing command"; return false; }

  const char* cmd = argv[1];
  if (std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
    *help_requested = true;
    return true;
  }
  if (std::strcmp(cmd, "check") == 0) a->cmd = Command::kCheck;
  else if (std::strcmp(cmd, "evaluate") == 0) a->cmd = Command::kEvaluate;
  else if (std::strcmp(cmd, "verify") == 0) a->cmd = Command::kVerify;
  else { *err = std::string("unknown command: ") + cmd; return false; }

  struct PathFlag { const char* flag; std::string* dst; };
  const PathFlag flags[] = {
      {"--config", &a->config_path},   {"--in", &a->in_path},
      {"--out", &a->out_path},         {"--decisions", &a->decisions_path},
      {"--manifest", &a->manifest_path}, {"--key-file", &a->key_file},
  };

  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];

    if (std::strcmp(k, "--help") == 0 || std::strcmp(k, "-h") == 0) {
      *help_requested = true;
      return true;
    }

    if (std::strcmp(k, "--log-level") == 0) {
      const char* v = nullptr;
      if (!get_next(i, argc, argv, &v)) { *err = "--log-level requires a value"; return false; }
      a->log_level = parse_log_level(v);
      if (!a->log_level) { *err = std::string("unknown log level: ") + v; return false; }
      continue;
    }

    bool matched = false;
    for (const auto& f : flags) {
      if (std::strcmp(k, f.flag) != 0) continue;
      const char* v = nullptr;
      if (!get_next(i, argc, argv, &v)) { *err = std::string(f.flag) + " requires a value"; return false; }
      *f.dst = v;
      matched = true;
      break;
    }
    if (!matched) { *err = std::string("unknown argument: ") + k; return false; }
  }

  switch (a->cmd) {
    case Command::kCheck:
      if (a->config_path.empty()) { *err = "missing --config"; return false; }
      break;
    case Command::kEvaluate:
      if (a->config_path.empty()) { *err = "missing --config"; return false; }
      if (a->in_path.empty()) { *err = "missing --in"; return false; }
      if (a->out_path.empty()) { *err = "missing --out"; return false; }
      break;
    case Command::kVerify:
      if (a->manifest_path.empty()) { *err = "missing --manifest"; return false; }
      break;
    case Command::kNone:
      *err = "missing command";
      return false;
  }
  return true;
}

static std::string read_input(const std::string& path) {
  if (path != "-") return read_text_file(path);
  std::ostringstream ss;
  ss << std::cin.rdbuf();
  return ss.str();
}

static void write_output(const std::string& path, const std::string& data) {
  if (path == "-") {
    std::cout << data;
    std::cout.flush();
    if (!std::cout.good()) throw IoError("failed to write stdout", CALFUSE_SITE);
    return;
  }
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f.good()) throw IoError("cannot open for writing: " + path, CALFUSE_SITE);
  f.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!f.good()) throw IoError("failed to write file: " + path, CALFUSE_SITE);
}

// Key file content with trailing whitespace/newlines removed.
static std::string read_key_file(const std::string& path) {
  std::string key = read_text_file(path);
  while (!key.empty() && (key.back() == '\n' || key.back() == '\r' || key.back() == ' ' || key.back() == '\t')) {
    key.pop_back();
  }
  if (key.empty()) throw SignatureError("key file is empty: " + path, CALFUSE_SITE);
  return key;
}

// ----------------------------- check -----------------------------------------

static void print_drift(const CalibrationContext& ctx, std::ostream& os) {
  for (const auto& layer : ctx.layers()) {
    if (!layer.supersedes()) continue;
    for (const auto& prev : ctx.layers()) {
      if (prev.content_hash() != *layer.supersedes()) continue;
      const DriftReport rep = compute_parameter_drift(prev, layer);
      os << "  drift " << rep.layer_id << " " << rep.baseline_version << " -> "
         << rep.current_version << ": " << to_string(rep.overall);
      for (const auto& d : rep.drifts) {
        os << " " << d.name << "(" << d.old_value << "->" << d.new_value << "," << to_string(d.severity) << ")";
      }
      if (rep.contradiction) os << " [contradiction]";
      if (rep.coverage_penalty) os << " [coverage]";
      if (rep.dispersion_penalty) os << " [dispersion]";
      if (rep.requires_recalibration()) os << " RECALIBRATE";
      os << "\n";
      for (const auto& note : rep.recommendations) os << "    - " << note << "\n";
    }
  }
}

static void print_graph_violations(const std::string& text, std::ostream& os) {
  JsonValue doc;
  if (!parse_json(text, &doc)) return;
  try {
    const CalibrationConfig cfg = parse_calibration_config(doc);
    for (const auto& v : governance::collect_violations(cfg.graph)) {
      os << "  " << governance::to_string(v.kind) << ": " << v.message << "\n";
    }
  } catch (const CalibrationLoadError& e) {
    // The structural error is already reported by the caller.
    log(LogLevel::DEBUG, std::string("violation listing skipped: ") + e.what());
  }
}

static int run_check(const Args& a) {
  const std::string text = read_text_file(a.config_path);
  try {
    const CalibrationContextPtr ctx = load_calibration_context_text(text);
    std::cout << "READY cohort=" << ctx->cohort() << " version=" << ctx->version() << "\n"
              << "  state_hash " << ctx->state_hash() << "\n";
    for (FusionRole r : ctx->weights().configured_roles()) {
      const auto& ws = ctx->weight_set(r);
      std::cout << "  role " << to_string(r) << " weight_set=" << ws.id()
                << " linear=" << ws.linear_sum() << " interaction=" << ws.interaction_sum() << "\n";
    }
    std::cout << "  graph nodes=" << ctx->graph().node_count() << " edges=" << ctx->graph().edge_count()
              << " order=";
    for (size_t i = 0; i < ctx->topological_order().size(); ++i) {
      std::cout << (i ? "," : "") << ctx->topological_order()[i];
    }
    std::cout << "\n";
    print_drift(*ctx, std::cout);
    return static_cast<int>(ExitCode::kOk);
  } catch (const CalibrationLoadError& e) {
    std::cout << "NOT READY " << to_string(e.code()) << ": " << e.message() << "\n";
    if (e.code() == ErrorCode::kCyclicDependency || e.code() == ErrorCode::kLevelInversion) {
      print_graph_violations(text, std::cout);
    }
    return kExitErrorInt;
  }
}

// ----------------------------- evaluate --------------------------------------

static const JsonValue::Array& request_list(const JsonValue& doc) {
  if (doc.is_array()) return doc.as_array();
  if (const JsonValue* r = doc.find("requests")) {
    if (r->is_array()) return r->as_array();
  }
  CALFUSE_THROW(ErrorCode::kParse, "requests input must be an array or {\"requests\": [...]}");
}

static int run_evaluate(const Args& a) {
  const CalibrationContextPtr ctx = load_calibration_context(a.config_path);

  ManifestOptions mopt;
  if (!a.key_file.empty()) mopt.signing_key = read_key_file(a.key_file);
  CalibrationManifest manifest(std::move(mopt));
  DecisionPipeline pipeline(ctx, manifest);

  JsonValue doc;
  JsonParseError perr;
  const std::string input = read_input(a.in_path);
  if (!parse_json(input, &doc, &perr)) {
    std::cerr << "Parse error: " << perr.message << " @ " << perr.line << ":" << perr.col << "\n";
    return kExitErrorInt;
  }

  size_t fused = 0, vetoed = 0, rejected = 0;
  JsonValue decisions = JsonValue::make_array();
  const auto& requests = request_list(doc);
  for (size_t i = 0; i < requests.size(); ++i) {
    try {
      const DecisionRequest req = DecisionRequest::from_json(requests[i]);
      const Decision d = pipeline.decide(req);
      if (d.status == DecisionStatus::kVetoed) ++vetoed;
      else ++fused;
      decisions.push_back(d.to_json());
    } catch (const InputError& e) {
      ++rejected;
      std::cerr << "request " << i << " rejected: " << to_string(e.code()) << " field=" << e.field()
                << " expected=" << e.expected() << ": " << e.message() << "\n";
      JsonValue r = JsonValue::make_object();
      r.set("error", JsonValue::make_string(to_string(e.code())));
      r.set("expected", JsonValue::make_string(e.expected()));
      r.set("field", JsonValue::make_string(e.field()));
      r.set("index", JsonValue::make_number(static_cast<double>(i)));
      r.set("status", JsonValue::make_string("REJECTED"));
      decisions.push_back(std::move(r));
    }
  }

  std::ostringstream jsonl;
  write_jsonl(jsonl, manifest.snapshot());
  write_output(a.out_path, jsonl.str());

  if (!a.decisions_path.empty()) {
    JsonWriteOptions jopt;
    jopt.pretty = true;
    write_output(a.decisions_path, to_json(decisions, jopt) + "\n");
  }

  log(LogLevel::INFO, "evaluate: fused=" + std::to_string(fused) + " vetoed=" + std::to_string(vetoed) +
                          " rejected=" + std::to_string(rejected) + " head=" + manifest.head_hash());

  if (rejected > 0) return static_cast<int>(ExitCode::kRejected);
  if (vetoed > 0) return static_cast<int>(ExitCode::kVetoOrInvalid);
  return static_cast<int>(ExitCode::kOk);
}

// ----------------------------- verify ----------------------------------------

static int run_verify(const Args& a) {
  std::istringstream in(read_input(a.manifest_path));
  const std::vector<ManifestEntry> entries = read_jsonl(in);

  std::optional<std::string> key;
  if (!a.key_file.empty()) key = read_key_file(a.key_file);

  const ChainVerification v = key ? verify_chain(entries, std::string_view(*key))
                                  : verify_chain(entries);
  if (v.ok) {
    std::cout << "VALID entries=" << entries.size()
              << (key ? " signatures=checked" : " signatures=unchecked") << "\n";
    return static_cast<int>(ExitCode::kOk);
  }
  std::cout << "INVALID " << v.reason << "\n";
  return static_cast<int>(ExitCode::kVetoOrInvalid);
}

}  // namespace
}  // namespace calfuse

int main(int argc, char** argv) {
  using namespace calfuse;

  Args a{};
  std::string arg_err;
  bool help = false;
  if (!parse_args(argc, argv, &a, &arg_err, &help)) {
    std::cerr << "Argument error: " << arg_err << "\n\n";
    print_usage(std::cerr);
    return kExitErrorInt;
  }
  if (help) {
    print_usage(std::cout);
    return static_cast<int>(ExitCode::kOk);
  }
  if (a.log_level) set_log_level(*a.log_level);

  try {
    switch (a.cmd) {
      case Command::kCheck:    return run_check(a);
      case Command::kEvaluate: return run_evaluate(a);
      case Command::kVerify:   return run_verify(a);
      case Command::kNone:     break;
    }
  } catch (const Error& e) {
    std::cerr << "Error: " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
  }
  return kExitErrorInt;
}
