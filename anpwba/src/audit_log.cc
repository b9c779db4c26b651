#include "audit_log.h"

#include "anpwba_util.h"
#include "signature_codec.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace anpwba {

/*
Line layout (field order is fixed; verification depends on it):

  {"ts":"...","event":"...","outcome":"...","prev_hash":"<64 hex>",
   "line_hash":"<64 hex>","f":{"k":"v",...}}

The hash preimage is prev_hash followed by the same line with the
","line_hash":"..." member removed. Values are escaped, so that member
can only occur once, right after prev_hash.
*/

static const std::string kGenesis(64, '0');
static const std::string kLineHashKey = ",\"line_hash\":\"";

AuditLog::AuditLog(std::string jsonl_path, std::string state_path)
  : jsonl_path_(std::move(jsonl_path)), state_path_(std::move(state_path)) {}

bool AuditLog::set_min_level_str(const std::string& s_in) {
  const std::string s = lower_ascii(trim_ws(s_in));
  MinLevel lvl;
  if (s == "debug") lvl = MinLevel::DEBUG;
  else if (s == "info") lvl = MinLevel::INFO;
  else if (s == "admin") lvl = MinLevel::ADMIN;
  else if (s == "security") lvl = MinLevel::SECURITY;
  else return false;
  min_level_.store(static_cast<int>(lvl));
  return true;
}

std::string AuditLog::min_level_str() const {
  switch (static_cast<MinLevel>(min_level_.load())) {
    case MinLevel::DEBUG: return "DEBUG";
    case MinLevel::INFO: return "INFO";
    case MinLevel::ADMIN: return "ADMIN";
    case MinLevel::SECURITY: return "SECURITY";
  }
  return "INFO";
}

std::string AuditLog::load_prev_hash_() {
  std::ifstream f(state_path_);
  if (!f.good()) return kGenesis;
  std::string line;
  std::getline(f, line);
  if (line.size() != 64) return kGenesis;
  return line;
}

bool AuditLog::store_prev_hash_(const std::string& h) {
  std::ofstream f(state_path_, std::ios::trunc);
  f << h << "\n";
  f.flush();
  return f.good();
}

std::string AuditLog::json_escape_(const std::string& s) {
  std::ostringstream o;
  for (char c : s) {
    switch (c) {
      case '\"': o << "\\\""; break;
      case '\\': o << "\\\\"; break;
      case '\b': o << "\\b"; break;
      case '\f': o << "\\f"; break;
      case '\n': o << "\\n"; break;
      case '\r': o << "\\r"; break;
      case '\t': o << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << (int)(unsigned char)c << std::dec;
        } else {
          o << c;
        }
    }
  }
  return o.str();
}

std::string AuditLog::build_json_(const AuditEvent& e,
                                  const std::string& prev_hash,
                                  std::string* out_line_hash) {
  std::ostringstream head;
  head << "{"
       << "\"ts\":\"" << json_escape_(e.ts_utc) << "\""
       << ",\"event\":\"" << json_escape_(e.event) << "\""
       << ",\"outcome\":\"" << json_escape_(e.outcome) << "\""
       << ",\"prev_hash\":\"" << prev_hash << "\"";

  std::ostringstream tail;
  if (!e.f.empty()) {
    tail << ",\"f\":{";
    bool first = true;
    for (const auto& kv : e.f) {
      if (!first) tail << ",";
      first = false;
      tail << "\"" << json_escape_(kv.first) << "\":"
           << "\"" << json_escape_(kv.second) << "\"";
    }
    tail << "}";
  }
  tail << "}";

  *out_line_hash = sha256_hex(prev_hash + head.str() + tail.str());
  return head.str() + kLineHashKey + *out_line_hash + "\"" + tail.str();
}

bool AuditLog::append(const AuditEvent& e_in, MinLevel level) {
  if (static_cast<int>(level) < min_level_.load()) return true;

  std::lock_guard<std::mutex> lk(mu_);

  AuditEvent e = e_in;
  if (e.ts_utc.empty()) e.ts_utc = now_iso_utc();

  const std::string prev = load_prev_hash_();

  std::string line_hash;
  const std::string line = build_json_(e, prev, &line_hash);

  std::ofstream out(jsonl_path_, std::ios::app);
  out << line << "\n";
  out.flush();
  if (!out.good()) {
    std::cerr << "[audit] WARNING: append failed: " << jsonl_path_ << std::endl;
    return false;
  }

  if (!store_prev_hash_(line_hash)) {
    std::cerr << "[audit] WARNING: state update failed: " << state_path_ << std::endl;
    return false;
  }
  return true;
}

long AuditLog::verify_chain(std::string* err) const {
  std::ifstream f(jsonl_path_);
  if (!f.good()) return 0;

  std::string prev = kGenesis;
  std::string line;
  long n = 0;
  while (std::getline(f, line)) {
    if (line.empty()) continue;
    n++;

    const std::string prev_key = "\"prev_hash\":\"";
    const auto pp = line.find(prev_key);
    const auto lp = line.find(kLineHashKey);
    if (pp == std::string::npos || lp == std::string::npos ||
        pp + prev_key.size() + 64 > line.size() || lp + kLineHashKey.size() + 65 > line.size()) {
      if (err) *err = "line " + std::to_string(n) + ": missing chain fields";
      return -1;
    }

    const std::string got_prev = line.substr(pp + prev_key.size(), 64);
    const std::string got_hash = line.substr(lp + kLineHashKey.size(), 64);
    if (got_prev != prev) {
      if (err) *err = "line " + std::to_string(n) + ": prev_hash does not link";
      return -1;
    }

    std::string without = line;
    without.erase(lp, kLineHashKey.size() + 65);
    if (sha256_hex(prev + without) != got_hash) {
      if (err) *err = "line " + std::to_string(n) + ": line_hash mismatch";
      return -1;
    }
    prev = got_hash;
  }
  return n;
}

void audit_emit(AuditLog* log,
                AuditLog::MinLevel level,
                const std::string& event,
                const std::string& outcome,
                std::map<std::string, std::string> fields) {
  if (!log) return;
  AuditEvent ev;
  ev.event = event;
  ev.outcome = outcome;
  ev.f = std::move(fields);
  if (!log->append(ev, level)) {
    std::cerr << "[audit] dropped event " << event << std::endl;
  }
}

} // namespace anpwba
