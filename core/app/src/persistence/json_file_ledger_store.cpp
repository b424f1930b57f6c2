#include "riskgate/persistence/json_file_ledger_store.hpp"
#include "riskgate/codec/json_codec.hpp"
#include "riskgate/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace riskgate {

namespace {

constexpr const char* kStateFile = "portfolio_state.json";
constexpr const char* kTransactionsFile = "transactions.jsonl";
constexpr const char* kSnapshotsFile = "snapshots.jsonl";
constexpr const char* kDailyStatsFile = "daily_stats.json";
constexpr const char* kDecisionsFile = "decisions.jsonl";

// Percent-escapes every byte outside [A-Za-z0-9-] so distinct session ids
// always land in distinct directories ("bt.1" -> "bt%2E1", "bt_1" -> "bt%5F1").
std::string directoryNameFor(const std::string& session_id) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string name;
  name.reserve(session_id.size());
  for (char c : session_id) {
    const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                      (c >= '0' && c <= '9') || c == '-';
    if (keep) {
      name.push_back(c);
    } else {
      const auto byte = static_cast<unsigned char>(c);
      name.push_back('%');
      name.push_back(kHex[byte >> 4]);
      name.push_back(kHex[byte & 0x0F]);
    }
  }
  // "_" never comes out of the escaping above, so it cannot collide.
  return name.empty() ? std::string("_") : name;
}

// Writes to <file>.tmp then renames over <file>, so readers never observe a
// half-written document.
void writeAtomically(const fs::path& file, const nlohmann::json& doc) {
  fs::path tmp = file;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw PersistenceError("cannot open " + tmp.string() + " for writing");
    }
    out << doc.dump(2) << '\n';
    out.flush();
    if (!out) {
      throw PersistenceError("write failed for " + tmp.string());
    }
  }
  std::error_code ec;
  fs::rename(tmp, file, ec);
  if (ec) {
    throw PersistenceError("rename " + tmp.string() + " failed: " +
                           ec.message());
  }
}

void appendLine(const fs::path& file, const nlohmann::json& doc) {
  std::ofstream out(file, std::ios::app);
  if (!out) {
    throw PersistenceError("cannot open " + file.string() + " for append");
  }
  out << doc.dump() << '\n';
  out.flush();
  if (!out) {
    throw PersistenceError("append failed for " + file.string());
  }
}

std::optional<nlohmann::json> readDocument(const fs::path& file) {
  std::error_code ec;
  if (!fs::exists(file, ec)) {
    return std::nullopt;
  }
  std::ifstream in(file);
  if (!in) {
    throw PersistenceError("cannot open " + file.string());
  }
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw PersistenceError("corrupt " + file.string() + ": " + e.what());
  }
}

// Parses every line of a .jsonl file. A malformed line is fatal unless it is
// the last one, which is a torn append and is skipped with a warning.
template <typename Parse>
void readLines(const fs::path& file, Parse&& parse) {
  std::error_code ec;
  if (!fs::exists(file, ec)) {
    return;
  }
  std::ifstream in(file);
  if (!in) {
    throw PersistenceError("cannot open " + file.string());
  }

  std::string line;
  std::size_t line_no = 0;
  std::string pending_error;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    if (!pending_error.empty()) {
      // The bad line was not the last one.
      throw PersistenceError(pending_error);
    }
    try {
      parse(nlohmann::json::parse(line));
    } catch (const nlohmann::json::exception& e) {
      pending_error = "corrupt " + file.string() + " line " +
                      std::to_string(line_no) + ": " + e.what();
    } catch (const ValidationError& e) {
      pending_error = "corrupt " + file.string() + " line " +
                      std::to_string(line_no) + ": " + e.what();
    }
  }
  if (!pending_error.empty()) {
    std::cerr << "[JsonFileLedgerStore] WARNING: skipping torn final line: "
              << pending_error << std::endl;
  }
}

// Keeps the newest `limit` entries (all when 0), newest first.
template <typename T>
std::vector<T> newestFirst(std::vector<T> items, std::size_t limit) {
  std::reverse(items.begin(), items.end());
  if (limit != 0 && items.size() > limit) {
    items.resize(limit);
  }
  return items;
}

void warnForeignRecord(const fs::path& file, const std::string& expected,
                       const std::string& found) {
  std::cerr << "[JsonFileLedgerStore] WARNING: " << file.string()
            << " holds a record of session '" << found << "', expected '"
            << expected << "'; skipped" << std::endl;
}

}  // namespace

JsonFileLedgerStore::JsonFileLedgerStore(fs::path root)
    : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    throw PersistenceError("cannot create data directory " + root_.string() +
                           ": " + ec.message());
  }
}

fs::path JsonFileLedgerStore::sessionDirectory(
    const std::string& session_id) const {
  return root_ / directoryNameFor(session_id);
}

fs::path JsonFileLedgerStore::ensureSessionDirectory(
    const std::string& session_id) {
  fs::path dir = sessionDirectory(session_id);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw PersistenceError("cannot create " + dir.string() + ": " +
                           ec.message());
  }
  return dir;
}

void JsonFileLedgerStore::savePortfolioState(
    const domain::LedgerSnapshot& state) {
  std::lock_guard lock(mutex_);
  writeAtomically(ensureSessionDirectory(state.session_id) / kStateFile,
                  codec::snapshotToJson(state));
}

std::optional<domain::LedgerSnapshot> JsonFileLedgerStore::loadPortfolioState(
    const std::string& session_id) {
  std::lock_guard lock(mutex_);
  const fs::path file = sessionDirectory(session_id) / kStateFile;
  auto doc = readDocument(file);
  if (!doc) {
    return std::nullopt;
  }
  domain::LedgerSnapshot state;
  try {
    state = codec::snapshotFromJson(*doc);
  } catch (const nlohmann::json::exception& e) {
    throw PersistenceError("corrupt " + file.string() + ": " + e.what());
  }
  if (state.session_id != session_id) {
    throw PersistenceError(file.string() + " belongs to session '" +
                           state.session_id + "', expected '" + session_id +
                           "'");
  }
  return state;
}

void JsonFileLedgerStore::appendTransaction(
    const domain::TransactionRecord& record) {
  std::lock_guard lock(mutex_);
  appendLine(ensureSessionDirectory(record.session_id) / kTransactionsFile,
             codec::transactionToJson(record));
}

std::vector<domain::TransactionRecord>
JsonFileLedgerStore::loadTransactionsAfter(const std::string& session_id,
                                           std::uint64_t after_id) {
  std::lock_guard lock(mutex_);
  std::vector<domain::TransactionRecord> out;
  const fs::path file = sessionDirectory(session_id) / kTransactionsFile;
  readLines(file, [&](const nlohmann::json& line) {
    domain::TransactionRecord record = codec::transactionFromJson(line);
    if (record.session_id != session_id) {
      warnForeignRecord(file, session_id, record.session_id);
      return;
    }
    if (record.id > after_id) {
      out.push_back(std::move(record));
    }
  });
  return out;
}

void JsonFileLedgerStore::appendSnapshot(
    const domain::LedgerSnapshot& snapshot) {
  std::lock_guard lock(mutex_);
  appendLine(ensureSessionDirectory(snapshot.session_id) / kSnapshotsFile,
             codec::snapshotToJson(snapshot));
}

std::vector<domain::LedgerSnapshot> JsonFileLedgerStore::loadSnapshots(
    const std::string& session_id, std::size_t limit) {
  std::lock_guard lock(mutex_);
  std::vector<domain::LedgerSnapshot> out;
  const fs::path file = sessionDirectory(session_id) / kSnapshotsFile;
  readLines(file, [&](const nlohmann::json& line) {
    domain::LedgerSnapshot snapshot = codec::snapshotFromJson(line);
    if (snapshot.session_id != session_id) {
      warnForeignRecord(file, session_id, snapshot.session_id);
      return;
    }
    out.push_back(std::move(snapshot));
  });
  return newestFirst(std::move(out), limit);
}

void JsonFileLedgerStore::saveDailyStats(const std::string& session_id,
                                         const domain::DailyStats& stats) {
  std::lock_guard lock(mutex_);
  nlohmann::json doc = codec::dailyStatsToJson(stats);
  doc["session_id"] = session_id;
  writeAtomically(ensureSessionDirectory(session_id) / kDailyStatsFile, doc);
}

std::optional<domain::DailyStats> JsonFileLedgerStore::loadDailyStats(
    const std::string& session_id) {
  std::lock_guard lock(mutex_);
  const fs::path file = sessionDirectory(session_id) / kDailyStatsFile;
  auto doc = readDocument(file);
  if (!doc) {
    return std::nullopt;
  }
  try {
    const std::string owner = doc->value("session_id", session_id);
    if (owner != session_id) {
      throw PersistenceError(file.string() + " belongs to session '" + owner +
                             "', expected '" + session_id + "'");
    }
    return codec::dailyStatsFromJson(*doc);
  } catch (const nlohmann::json::exception& e) {
    throw PersistenceError("corrupt " + file.string() + ": " + e.what());
  }
}

void JsonFileLedgerStore::appendDecision(const domain::DecisionRecord& record) {
  std::lock_guard lock(mutex_);
  appendLine(ensureSessionDirectory(record.session_id) / kDecisionsFile,
             codec::decisionRecordToJson(record));
}

std::vector<domain::DecisionRecord> JsonFileLedgerStore::loadDecisions(
    const std::string& session_id, std::size_t limit, bool rejected_only) {
  std::lock_guard lock(mutex_);
  std::vector<domain::DecisionRecord> out;
  const fs::path file = sessionDirectory(session_id) / kDecisionsFile;
  readLines(file, [&](const nlohmann::json& line) {
    domain::DecisionRecord record = codec::decisionRecordFromJson(line);
    if (record.session_id != session_id) {
      warnForeignRecord(file, session_id, record.session_id);
      return;
    }
    if (rejected_only && record.decision.passed) {
      return;
    }
    out.push_back(std::move(record));
  });
  return newestFirst(std::move(out), limit);
}

void JsonFileLedgerStore::clearSession(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  const fs::path dir = sessionDirectory(session_id);
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) {
    throw PersistenceError("cannot remove " + dir.string() + ": " +
                           ec.message());
  }
}

}  // namespace riskgate
