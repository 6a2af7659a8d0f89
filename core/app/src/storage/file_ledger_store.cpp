#include "pnlsync/storage/file_ledger_store.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace pnlsync {

namespace {

using nlohmann::json;

constexpr int kFormatVersion = 1;

template <typename T>
json optionalToJson(const std::optional<T>& value) {
  return value.has_value() ? json(*value) : json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJson(const json& j, const char* name) {
  auto it = j.find(name);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

json keyToJson(const domain::PositionKey& key) {
  return json{{"symbol", key.symbol},
              {"exchange", key.exchange},
              {"currency", key.currency}};
}

domain::PositionKey keyFromJson(const json& j) {
  return domain::PositionKey{j.at("symbol").get<std::string>(),
                             j.at("exchange").get<std::string>(),
                             j.at("currency").get<std::string>()};
}

json tradeToJson(const domain::TradeRecord& t) {
  return json{{"id", t.id},
              {"account_id", t.account_id},
              {"key", keyToJson(t.key)},
              {"side", domain::sideToString(t.side)},
              {"quantity", t.quantity},
              {"price", t.price},
              {"commission", t.commission},
              {"realized_pnl", t.realized_pnl},
              {"trade_time_ms", t.trade_time_ms},
              {"exec_id", t.exec_id},
              {"perm_id", optionalToJson(t.perm_id)}};
}

domain::TradeRecord tradeFromJson(const json& j) {
  domain::TradeRecord t;
  t.id = j.at("id").get<std::int64_t>();
  t.account_id = j.at("account_id").get<std::int64_t>();
  t.key = keyFromJson(j.at("key"));
  auto side = domain::parseSide(j.at("side").get<std::string>());
  if (!side) {
    throw StoreError("trade " + std::to_string(t.id) + " has an invalid side");
  }
  t.side = *side;
  t.quantity = j.at("quantity").get<double>();
  t.price = j.at("price").get<double>();
  t.commission = j.at("commission").get<double>();
  t.realized_pnl = j.at("realized_pnl").get<double>();
  t.trade_time_ms = j.at("trade_time_ms").get<std::int64_t>();
  t.exec_id = j.at("exec_id").get<std::string>();
  t.perm_id = optionalFromJson<std::int64_t>(j, "perm_id");
  return t;
}

json positionToJson(std::int64_t account_id, const domain::OpenPosition& p) {
  return json{{"account_id", account_id},
              {"id", p.id},
              {"key", keyToJson(p.key)},
              {"quantity", p.quantity},
              {"avg_cost", p.avg_cost},
              {"total_cost", p.total_cost},
              {"realized_pnl", p.realized_pnl},
              {"unrealized_pnl", p.unrealized_pnl},
              {"daily_pnl", optionalToJson(p.daily_pnl)},
              {"open_time_ms", p.open_time_ms},
              {"con_id", optionalToJson(p.con_id)}};
}

domain::OpenPosition positionFromJson(const json& j) {
  domain::OpenPosition p;
  p.id = j.at("id").get<domain::PositionId>();
  p.key = keyFromJson(j.at("key"));
  p.quantity = j.at("quantity").get<double>();
  p.avg_cost = j.at("avg_cost").get<double>();
  p.total_cost = j.at("total_cost").get<double>();
  p.realized_pnl = j.at("realized_pnl").get<double>();
  p.unrealized_pnl = j.at("unrealized_pnl").get<double>();
  p.daily_pnl = optionalFromJson<double>(j, "daily_pnl");
  p.open_time_ms = j.at("open_time_ms").get<std::int64_t>();
  p.con_id = optionalFromJson<std::int64_t>(j, "con_id");
  p.recomputeTotal();
  return p;
}

json historyToJson(std::int64_t account_id, const domain::HistoryEntry& h) {
  return json{{"account_id", account_id},
              {"id", h.id},
              {"key", keyToJson(h.key)},
              {"open_time_ms", h.open_time_ms},
              {"close_time_ms", h.close_time_ms},
              {"realized_pnl", h.realized_pnl}};
}

domain::HistoryEntry historyFromJson(const json& j) {
  domain::HistoryEntry h;
  h.id = j.at("id").get<domain::PositionId>();
  h.key = keyFromJson(j.at("key"));
  h.open_time_ms = j.at("open_time_ms").get<std::int64_t>();
  h.close_time_ms = j.at("close_time_ms").get<std::int64_t>();
  h.realized_pnl = j.at("realized_pnl").get<double>();
  return h;
}

json summaryToJson(const domain::AccountSummary& s) {
  json fields = json::object();
  for (auto field : domain::kAllAccountFields) {
    fields[domain::accountFieldName(field)] = optionalToJson(s[field]);
  }
  return json{{"fields", std::move(fields)}, {"as_of_ms", s.as_of_ms}};
}

domain::AccountSummary summaryFromJson(const json& j) {
  domain::AccountSummary s;
  const json& fields = j.at("fields");
  for (auto field : domain::kAllAccountFields) {
    s[field] = optionalFromJson<double>(fields, domain::accountFieldName(field));
  }
  s.as_of_ms = j.at("as_of_ms").get<std::int64_t>();
  return s;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
FileLedgerStore::FileLedgerStore(std::string path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw StoreError("FileLedgerStore requires a path");
  }
  load();
}

// -----------------------------------------------------------------------------
// load(): document → State
// -----------------------------------------------------------------------------
void FileLedgerStore::load() {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    std::cout << "[FileLedgerStore] No ledger at " << path_
              << ", starting empty\n";
    return;
  }

  std::ifstream in(path_);
  if (!in) {
    throw StoreError("cannot open ledger file " + path_);
  }

  State state;
  try {
    json doc = json::parse(in);
    const int version = doc.value("version", 0);
    if (version != kFormatVersion) {
      throw StoreError("unsupported ledger format version " +
                       std::to_string(version));
    }

    for (const auto& a : doc.at("accounts")) {
      AccountRow row{a.at("id").get<std::int64_t>(),
                     a.at("venue_account").get<std::string>(),
                     a.at("base_currency").get<std::string>()};
      state.accounts[row.id] = std::move(row);
    }
    for (const auto& t : doc.at("trades")) {
      state.trades.push_back(tradeFromJson(t));
    }
    for (const auto& p : doc.at("positions")) {
      PositionRow row{p.at("account_id").get<std::int64_t>(),
                      positionFromJson(p)};
      state.positions[row.position.id] = std::move(row);
    }
    for (const auto& h : doc.at("history")) {
      HistoryRow row{h.at("account_id").get<std::int64_t>(), historyFromJson(h)};
      state.history[row.entry.id] = std::move(row);
    }
    for (const auto& s : doc.at("summaries")) {
      state.summaries[s.at("account_id").get<std::int64_t>()] =
          summaryFromJson(s);
    }
    for (const auto& d : doc.at("daily")) {
      domain::DailyPnLPoint point{d.at("trade_date").get<std::string>(),
                                  d.at("daily_pnl").get<double>(),
                                  d.at("cumulative_pnl").get<double>()};
      state.daily[d.at("account_id").get<std::int64_t>()][point.trade_date] =
          point;
    }
    state.next_account_id = doc.at("next_account_id").get<std::int64_t>();
    state.next_trade_id = doc.at("next_trade_id").get<std::int64_t>();
    state.next_position_id =
        doc.at("next_position_id").get<domain::PositionId>();
  } catch (const nlohmann::json::exception& e) {
    throw StoreError("malformed ledger file " + path_ + ": " + e.what());
  }

  std::cout << "[FileLedgerStore] Loaded " << state.trades.size()
            << " trades, " << state.positions.size() << " open positions, "
            << state.history.size() << " history entries from " << path_
            << "\n";
  replaceState(std::move(state));
}

// -----------------------------------------------------------------------------
// onCommit(): State → "<path>.tmp" → rename
// -----------------------------------------------------------------------------
void FileLedgerStore::onCommit(const State& state) {
  json doc;
  doc["version"] = kFormatVersion;

  json accounts = json::array();
  for (const auto& [id, row] : state.accounts) {
    accounts.push_back(json{{"id", row.id},
                            {"venue_account", row.venue_account},
                            {"base_currency", row.base_currency}});
  }
  doc["accounts"] = std::move(accounts);

  json trades = json::array();
  for (const auto& t : state.trades) {
    trades.push_back(tradeToJson(t));
  }
  doc["trades"] = std::move(trades);

  json positions = json::array();
  for (const auto& [id, row] : state.positions) {
    positions.push_back(positionToJson(row.account_id, row.position));
  }
  doc["positions"] = std::move(positions);

  json history = json::array();
  for (const auto& [id, row] : state.history) {
    history.push_back(historyToJson(row.account_id, row.entry));
  }
  doc["history"] = std::move(history);

  json summaries = json::array();
  for (const auto& [account_id, summary] : state.summaries) {
    json s = summaryToJson(summary);
    s["account_id"] = account_id;
    summaries.push_back(std::move(s));
  }
  doc["summaries"] = std::move(summaries);

  json daily = json::array();
  for (const auto& [account_id, points] : state.daily) {
    for (const auto& [date, point] : points) {
      daily.push_back(json{{"account_id", account_id},
                           {"trade_date", point.trade_date},
                           {"daily_pnl", point.daily_pnl},
                           {"cumulative_pnl", point.cumulative_pnl}});
    }
  }
  doc["daily"] = std::move(daily);

  doc["next_account_id"] = state.next_account_id;
  doc["next_trade_id"] = state.next_trade_id;
  doc["next_position_id"] = state.next_position_id;

  const std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      throw StoreError("cannot write ledger file " + tmp_path);
    }
    out << doc.dump(2);
    out.flush();
    if (!out) {
      throw StoreError("short write to ledger file " + tmp_path);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    throw StoreError("cannot replace ledger file " + path_ + ": " +
                     ec.message());
  }
}

}  // namespace pnlsync
