#include "pnlsync/engine/sync_engine.hpp"
#include "pnlsync/domain/account_summary.hpp"
#include "pnlsync/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

namespace pnlsync {

using nlohmann::json;

namespace {

json optionalJson(const std::optional<double>& value) {
  return value.has_value() ? json(*value) : json(nullptr);
}

json positionJson(const domain::OpenPosition& p) {
  json j;
  j["id"] = p.id;
  j["symbol"] = p.key.symbol;
  j["exchange"] = p.key.exchange;
  j["currency"] = p.key.currency;
  j["quantity"] = p.quantity;
  j["avg_cost"] = p.avg_cost;
  j["total_cost"] = p.total_cost;
  j["realized_pnl"] = p.realized_pnl;
  j["unrealized_pnl"] = p.unrealized_pnl;
  j["daily_pnl"] = optionalJson(p.daily_pnl);
  j["total_pnl"] = p.total_pnl;
  j["open_time"] = format_iso8601_utc(p.open_time_ms);
  j["con_id"] = p.con_id.has_value() ? json(*p.con_id) : json(nullptr);
  return j;
}

json historyJson(const domain::HistoryEntry& h) {
  json j;
  j["id"] = h.id;
  j["symbol"] = h.key.symbol;
  j["exchange"] = h.key.exchange;
  j["currency"] = h.key.currency;
  j["open_time"] = format_iso8601_utc(h.open_time_ms);
  j["close_time"] = format_iso8601_utc(h.close_time_ms);
  j["realized_pnl"] = h.realized_pnl;
  return j;
}

json tradeJson(const domain::TradeRecord& t) {
  json j;
  j["id"] = t.id;
  j["symbol"] = t.key.symbol;
  j["exchange"] = t.key.exchange;
  j["currency"] = t.key.currency;
  j["side"] = domain::sideToString(t.side);
  j["quantity"] = t.quantity;
  j["price"] = t.price;
  j["commission"] = t.commission;
  j["realized_pnl"] = t.realized_pnl;
  j["trade_time"] = format_iso8601_utc(t.trade_time_ms);
  j["exec_id"] = t.exec_id;
  j["perm_id"] = t.perm_id.has_value() ? json(*t.perm_id) : json(nullptr);
  return j;
}

template <typename T>
std::optional<T> optionalField(const json& request, const char* name) {
  if (!request.is_object()) {
    return std::nullopt;
  }
  auto it = request.find(name);
  if (it == request.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

json orderResultJson(const domain::OrderResult& result) {
  json j;
  j["status"] = result.outcome == domain::OrderOutcome::Failure ? "error" : "ok";
  j["outcome"] = domain::orderOutcomeToString(result.outcome);
  j["request_id"] = result.request_id;
  if (!result.error.empty()) {
    j["response"] = result.error;
  }
  if (result.fill.has_value()) {
    j["order_id"] = result.fill->order_id;
    j["order_status"] = result.fill->status;
    j["filled"] = result.fill->filled;
    j["remaining"] = result.fill->remaining;
    j["avg_fill_price"] = result.fill->avg_fill_price;
  }
  return j;
}

json errorJson(const std::string& message) {
  return json{{"status", "error"}, {"response", message}};
}

// "qty" and "price" are accepted as aliases of "quantity" and "limit_price".
domain::OrderRequest parseOrderRequest(const json& j) {
  domain::OrderRequest req;
  req.symbol = j.at("symbol").get<std::string>();

  const auto side = domain::parseSide(j.at("side").get<std::string>());
  if (!side.has_value()) {
    throw std::invalid_argument("side must be buy or sell");
  }
  req.side = *side;

  req.quantity = j.contains("quantity") ? j.at("quantity").get<double>()
                                        : j.at("qty").get<double>();

  const auto type = domain::parseOrderType(j.value("order_type", std::string("MKT")));
  if (!type.has_value()) {
    throw std::invalid_argument("order_type must be MKT or LMT");
  }
  req.type = *type;

  for (const char* name : {"limit_price", "price"}) {
    auto it = j.find(name);
    if (it != j.end() && !it->is_null()) {
      req.limit_price = it->get<double>();
      break;
    }
  }
  req.exchange = j.value("exchange", std::string());
  req.currency = j.value("currency", std::string());
  req.time_in_force = j.value("tif", std::string("DAY"));
  req.account = j.value("account", std::string());
  return req;
}

}  // namespace

const char* syncStateToString(SyncState state) {
  switch (state) {
    case SyncState::Disconnected: return "disconnected";
    case SyncState::Connecting:   return "connecting";
    case SyncState::Connected:    return "connected";
    case SyncState::Stopped:      return "stopped";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
SyncEngine::SyncEngine(SyncConfig config, IVenueClient& venue,
                       ILedgerStore& store, EventBus& bus,
                       const ITimeProvider& clock)
    : config_(std::move(config)),
      venue_(venue),
      store_(store),
      bus_(bus),
      clock_(clock),
      cache_(clock) {
  reconciler_ = std::make_unique<EventReconciler>(
      cache_, store_, venue_, bus_, clock_, config_.base_currency);

  OrderRouterConfig router_config;
  router_config.queue_max = config_.order_queue_max;
  router_config.readonly = config_.readonly;
  router_config.base_currency = config_.base_currency;
  router_config.status_wait =
      std::chrono::milliseconds(config_.order_status_wait_ms);
  router_ = std::make_unique<OrderRouter>(bus_, clock_, router_config);

  // Resolved orders go out as telemetry. Only the sync worker resolves, and
  // ipc_server_ changes only while the worker is not running.
  router_->setResultListener([this](const domain::OrderResult& result) {
    if (ipc_server_) {
      ipc_server_->pushTelemetry(result);
    }
  });

  subscriptions_.push_back(bus_.subscribe([this](const VenueEvent&) {
    std::lock_guard lock(status_mutex_);
    status_.last_event_ms = clock_.now_ms();
  }));
  subscriptions_.push_back(bus_.subscribe<ConnectivityErrorEvent>(
      [this](const ConnectivityErrorEvent& e) { onConnectivityError(e); }));
}

SyncEngine::~SyncEngine() {
  stop();
  for (auto id : subscriptions_) {
    bus_.unsubscribe(id);
  }
}

// -----------------------------------------------------------------------------
// start() / stop()
// -----------------------------------------------------------------------------
void SyncEngine::start() {
  if (running_) {
    return;
  }
  stop_requested_ = false;

  if (!config_.ipc.command_endpoint.empty() && !config_.ipc.pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc.command_endpoint, config_.ipc.pub_endpoint);
    ipc_server_->start();
  }

  running_ = true;
  setState(SyncState::Disconnected);
  worker_ = std::thread([this] { run(); });

  std::cout << "[SyncEngine] started. base_currency=" << config_.base_currency
            << (config_.readonly ? " readonly" : "")
            << (ipc_server_ ? " ipc=on" : " ipc=off") << "\n";
}

void SyncEngine::stop() {
  if (!running_) {
    return;
  }
  {
    std::lock_guard lock(wake_mutex_);
    stop_requested_ = true;
  }
  wake_.notify_all();

  if (worker_.joinable()) {
    worker_.join();
  }
  ipc_server_.reset();
  running_ = false;

  std::cout << "[SyncEngine] stopped. Worker joined.\n";
}

// -----------------------------------------------------------------------------
// run(): connect / tick / teardown / backoff
// -----------------------------------------------------------------------------
void SyncEngine::run() {
  const std::chrono::milliseconds min_delay(config_.reconnect_min_sec * 1000LL);
  const std::chrono::milliseconds max_delay(config_.reconnect_max_sec * 1000LL);
  std::chrono::milliseconds delay = min_delay;

  while (!stop_requested_) {
    setState(SyncState::Connecting);
    try {
      connectSession();
      delay = min_delay;
      runSession();
    } catch (const std::exception& e) {
      std::cerr << "[SyncEngine] Session error: " << e.what() << "\n";
      recordError(e.what());
    }
    teardown("disconnected");

    if (stop_requested_) {
      break;
    }
    setState(SyncState::Disconnected);
    {
      std::lock_guard lock(status_mutex_);
      status_.reconnect_delay_ms = delay.count();
    }
    std::cerr << "[SyncEngine] Reconnecting in " << delay.count() << " ms\n";
    if (!sleepBackoff(delay)) {
      break;
    }
    delay = nextBackoff(delay, max_delay);
  }
  setState(SyncState::Stopped);
}

std::chrono::milliseconds SyncEngine::nextBackoff(
    std::chrono::milliseconds current, std::chrono::milliseconds max) {
  return std::min(current * 2, max);
}

// Returns false if stop() interrupted the sleep.
bool SyncEngine::sleepBackoff(std::chrono::milliseconds delay) {
  std::unique_lock lock(wake_mutex_);
  return !wake_.wait_for(lock, delay, [this] { return stop_requested_.load(); });
}

// -----------------------------------------------------------------------------
// connectSession(): the replay sequence
// -----------------------------------------------------------------------------
void SyncEngine::connectSession() {
  {
    std::lock_guard lock(status_mutex_);
    ++status_.connect_attempts;
  }
  venue_.connect();

  const auto accounts = venue_.managedAccounts();
  std::string venue_account = config_.account;
  if (venue_account.empty()) {
    if (accounts.empty()) {
      throw VenueError("venue reports no managed accounts");
    }
    venue_account = accounts.front();
  } else if (std::find(accounts.begin(), accounts.end(), venue_account) ==
             accounts.end()) {
    std::cerr << "[SyncEngine] Configured account " << venue_account
              << " is not among the managed accounts\n";
  }

  const std::int64_t account_id =
      store_.upsertAccount(venue_account, config_.base_currency);
  cache_.setAccount(account_id, config_.base_currency);
  if (!cache_.isReady()) {
    cache_.hydrate(store_.loadSnapshot(account_id));
    std::cout << "[SyncEngine] Cache hydrated for account " << venue_account
              << " (id " << account_id << ")\n";
  }
  reconciler_->bindAccount(venue_account, account_id);

  const auto positions = venue_.requestPositions();
  for (const auto& p : positions) {
    reconciler_->onPositionSnapshot(p);
  }
  reconciler_->reconcilePositions(positions);

  const auto fills = venue_.requestExecutions();
  for (const auto& fill : fills) {
    reconciler_->onExecution(fill.execution, false);
    if (fill.commission.has_value()) {
      reconciler_->onCommissionReport(*fill.commission);
    }
  }

  venue_.subscribeAccountPnL(venue_account);
  std::vector<std::string> tags;
  for (auto field : domain::kAllAccountFields) {
    tags.emplace_back(domain::accountFieldVenueTag(field));
  }
  venue_.requestAccountSummary(tags);

  router_->setConnected(true);
  {
    std::lock_guard lock(status_mutex_);
    status_.state = SyncState::Connected;
    status_.connected = true;
    status_.venue_reachable = true;
    status_.degraded = false;
    status_.venue_account = venue_account;
    status_.account_id = account_id;
    status_.last_connect_ms = clock_.now_ms();
    status_.reconnect_delay_ms = 0;
  }
  std::cout << "[SyncEngine] Connected. account=" << venue_account
            << " positions=" << positions.size()
            << " executions=" << fills.size() << "\n";
}

// -----------------------------------------------------------------------------
// runSession(): tick until stop or an exception
// -----------------------------------------------------------------------------
void SyncEngine::runSession() {
  std::int64_t last_keepalive_ms = clock_.now_ms();
  std::int64_t last_flush_ms = last_keepalive_ms;
  std::int64_t last_queue_log_ms = last_keepalive_ms;

  while (!stop_requested_) {
    tick(last_keepalive_ms, last_flush_ms, last_queue_log_ms);
  }
  reconciler_->flush();
}

void SyncEngine::tick(std::int64_t& last_keepalive_ms,
                      std::int64_t& last_flush_ms,
                      std::int64_t& last_queue_log_ms) {
  venue_.pump(std::chrono::milliseconds(config_.tick_ms));

  const std::int64_t now = clock_.now_ms();
  if (now - last_keepalive_ms >= config_.keepalive_sec * 1000LL) {
    venue_.requestCurrentTime();
    last_keepalive_ms = now;
  }
  if (now - last_flush_ms >= config_.cache_flush_sec * 1000LL) {
    reconciler_->flush();
    last_flush_ms = now;
  }
  if (now - last_queue_log_ms >= kQueueLogIntervalMs) {
    std::cout << "[SyncEngine] Order queue depth " << router_->queueDepth()
              << "/" << router_->queueCapacity() << "\n";
    last_queue_log_ms = now;
  }

  processBookings();
  router_->processPending(venue_);
  publishPnlIfChanged();
}

void SyncEngine::processBookings() {
  while (auto job = bookings_.try_pop()) {
    try {
      job->result->set_value(reconciler_->booker().book(job->request));
    } catch (const std::invalid_argument& e) {
      std::cerr << "[SyncEngine] Manual booking rejected: " << e.what() << "\n";
      job->result->set_exception(std::current_exception());
    } catch (const std::exception&) {
      // The session is going down; the caller still gets the error.
      job->result->set_exception(std::current_exception());
      throw;
    }
  }
}

void SyncEngine::publishPnlIfChanged() {
  const std::int64_t updated = cache_.lastUpdateMs();
  if (updated == last_published_update_ms_) {
    return;
  }
  last_published_update_ms_ = updated;
  if (ipc_server_) {
    ipc_server_->pushTelemetry(cache_.snapshotAccountPnL());
  }
}

// -----------------------------------------------------------------------------
// teardown(): fail waiters, forget subscriptions, drop the session
// -----------------------------------------------------------------------------
void SyncEngine::teardown(const std::string& reason) {
  router_->setConnected(false);
  router_->failAll(reason);
  for (auto& job : bookings_.drain()) {
    job.result->set_exception(
        std::make_exception_ptr(std::runtime_error(reason)));
  }
  reconciler_->clearSubscriptions();
  venue_.disconnect();

  std::lock_guard lock(status_mutex_);
  if (status_.connected) {
    status_.last_disconnect_ms = clock_.now_ms();
  }
  status_.connected = false;
}

// -----------------------------------------------------------------------------
// onConnectivityError(): venue notices, sync worker
// -----------------------------------------------------------------------------
void SyncEngine::onConnectivityError(const ConnectivityErrorEvent& event) {
  std::cerr << "[SyncEngine] Venue notice code=" << event.code
            << " req=" << event.request_id << " " << event.message << "\n";

  std::lock_guard lock(status_mutex_);
  switch (event.code) {
    case 1100:
      status_.venue_reachable = false;
      break;
    case 1101:
    case 1102:
      status_.venue_reachable = true;
      status_.degraded = false;
      break;
    case 2110:
      status_.degraded = true;
      break;
    default:
      break;
  }
}

void SyncEngine::setState(SyncState state) {
  std::lock_guard lock(status_mutex_);
  status_.state = state;
}

void SyncEngine::recordError(const std::string& message) {
  std::lock_guard lock(status_mutex_);
  status_.last_error = message;
}

SyncStatus SyncEngine::status() const {
  SyncStatus copy;
  {
    std::lock_guard lock(status_mutex_);
    copy = status_;
  }
  copy.order_queue_depth = router_->queueDepth();
  copy.cache_ready = cache_.isReady();
  return copy;
}

// -----------------------------------------------------------------------------
// enqueueOrder() / bookTrade(): caller threads
// -----------------------------------------------------------------------------
domain::OrderResult SyncEngine::enqueueOrder(
    const domain::OrderRequest& request,
    const std::optional<std::string>& idempotency_key,
    std::optional<std::chrono::milliseconds> timeout) {
  return router_->submit(
      request, idempotency_key,
      timeout.value_or(std::chrono::milliseconds(config_.order_timeout_sec * 1000LL)));
}

BookingResult SyncEngine::bookTrade(BookingRequest request,
                                    std::chrono::milliseconds timeout) {
  if (!router_->isConnected()) {
    throw std::runtime_error("disconnected");
  }
  if (request.exec_id.empty()) {
    request.exec_id = manual_exec_ids_.next() + "-" + std::to_string(clock_.now_ms());
  }
  if (request.trade_time_ms == 0) {
    request.trade_time_ms = clock_.now_ms();
  }

  auto promise = std::make_shared<std::promise<BookingResult>>();
  std::future<BookingResult> future = promise->get_future();
  bookings_.push(BookingJob{std::move(request), promise});

  if (future.wait_for(timeout) != std::future_status::ready) {
    throw std::runtime_error("booking still queued");
  }
  return future.get();
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC command requests
// -----------------------------------------------------------------------------
std::string SyncEngine::executeCommand(const std::string& cmd) {
  json request;
  std::string name;
  try {
    request = json::parse(cmd);
    if (request.is_object()) {
      name = request.at("cmd").get<std::string>();
    } else if (request.is_string()) {
      name = request.get<std::string>();
    }
  } catch (const json::exception&) {
    name = cmd;
    request = json::object();
  }
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });

  json response;
  try {
    if (name == "PING") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (name == "STATUS") {
      response = statusJson();
      response["status"] = "ok";
    } else if (name == "POSITIONS") {
      json positions = json::array();
      for (const auto& p : cache_.snapshotPositions()) {
        positions.push_back(positionJson(p));
      }
      response["status"] = "ok";
      response["positions"] = std::move(positions);
    } else if (name == "HISTORY") {
      const std::size_t limit =
          request.is_object() ? request.value("limit", std::size_t{0}) : 0;
      json history = json::array();
      for (const auto& h : cache_.snapshotHistory()) {
        if (limit != 0 && history.size() >= limit) {
          break;
        }
        history.push_back(historyJson(h));
      }
      response["status"] = "ok";
      response["history"] = std::move(history);
    } else if (name == "PNL") {
      response = json::parse(IpcServer::formatAccountPnL(cache_.snapshotAccountPnL()));
      response.erase("type");
      response["status"] = "ok";
    } else if (name == "SUMMARY") {
      const auto snapshot = cache_.snapshotAccountSummary();
      json fields;
      for (auto field : domain::kAllAccountFields) {
        fields[domain::accountFieldName(field)] = optionalJson(snapshot.summary[field]);
      }
      response["status"] = "ok";
      response["base_currency"] = snapshot.base_currency;
      response["summary"] = std::move(fields);
      response["as_of"] = snapshot.summary.as_of_ms != 0
                              ? json(format_iso8601_utc(snapshot.summary.as_of_ms))
                              : json(nullptr);
    } else if (name == "DAILY") {
      json daily = json::array();
      for (const auto& d : cache_.snapshotDailyPnL()) {
        daily.push_back(json{{"trade_date", d.trade_date},
                             {"daily_pnl", d.daily_pnl},
                             {"cumulative_pnl", d.cumulative_pnl}});
      }
      response["status"] = "ok";
      response["daily"] = std::move(daily);
    } else if (name == "TRADES") {
      response = handleTradesCommand(request);
    } else if (name == "POSITION_TRADES") {
      response = handlePositionTradesCommand(request);
    } else if (name == "ORDER") {
      response = handleOrderCommand(request);
    } else if (name == "BOOK") {
      response = handleBookCommand(request);
    } else {
      response = errorJson("Unknown command: " + cmd);
    }
  } catch (const json::exception& e) {
    response = errorJson(std::string("bad request: ") + e.what());
  } catch (const std::invalid_argument& e) {
    response = errorJson(e.what());
  }
  return response.dump();
}

// -----------------------------------------------------------------------------
// Trade log queries
// -----------------------------------------------------------------------------
json SyncEngine::handleTradesCommand(const json& request) {
  const auto account_id = status().account_id;
  if (!account_id.has_value()) {
    return errorJson("no account bound");
  }
  const auto rows = store_.listTrades(
      *account_id, optionalField<std::string>(request, "symbol"),
      optionalField<std::string>(request, "currency"),
      optionalField<std::int64_t>(request, "from_ms"),
      optionalField<std::int64_t>(request, "to_ms"));
  const std::size_t limit = optionalField<std::size_t>(request, "limit").value_or(0);

  json trades = json::array();
  for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
    if (limit != 0 && trades.size() >= limit) {
      break;
    }
    trades.push_back(tradeJson(*it));
  }
  json response;
  response["status"] = "ok";
  response["trades"] = std::move(trades);
  return response;
}

json SyncEngine::handlePositionTradesCommand(const json& request) {
  const auto account_id = status().account_id;
  if (!account_id.has_value()) {
    return errorJson("no account bound");
  }
  const auto id = request.at("id").get<domain::PositionId>();

  // Open positions first, then history; an open position's window has no
  // upper bound.
  std::optional<domain::PositionKey> key;
  std::optional<std::int64_t> from_ms;
  std::optional<std::int64_t> to_ms;
  for (const auto& p : cache_.snapshotPositions()) {
    if (p.id == id) {
      key = p.key;
      if (p.open_time_ms != 0) {
        from_ms = p.open_time_ms;
      }
      break;
    }
  }
  if (!key.has_value()) {
    for (const auto& h : cache_.snapshotHistory()) {
      if (h.id == id) {
        key = h.key;
        if (h.open_time_ms != 0) {
          from_ms = h.open_time_ms;
        }
        to_ms = h.close_time_ms;
        break;
      }
    }
  }

  json trades = json::array();
  if (key.has_value()) {
    for (const auto& t :
         store_.listTrades(*account_id, key->symbol, key->currency, from_ms, to_ms)) {
      trades.push_back(tradeJson(t));
    }
  }
  json response;
  response["status"] = "ok";
  response["id"] = id;
  response["trades"] = std::move(trades);
  return response;
}

json SyncEngine::handleOrderCommand(const json& request) {
  const domain::OrderRequest order = parseOrderRequest(request.at("order"));

  std::optional<std::string> key;
  if (auto it = request.find("idempotency_key"); it != request.end() && it->is_string()) {
    key = it->get<std::string>();
  }
  std::optional<std::chrono::milliseconds> timeout;
  if (auto it = request.find("timeout_sec"); it != request.end() && it->is_number()) {
    timeout = std::chrono::milliseconds(
        static_cast<std::int64_t>(it->get<double>() * 1000.0));
  }
  return orderResultJson(enqueueOrder(order, key, timeout));
}

json SyncEngine::handleBookCommand(const json& request) {
  const json& trade = request.at("trade");

  BookingRequest booking;
  booking.key.symbol = trade.at("symbol").get<std::string>();
  booking.key.exchange = trade.value("exchange", std::string("SMART"));
  booking.key.currency = trade.value("currency", config_.base_currency);
  const auto side = domain::parseSide(trade.at("side").get<std::string>());
  if (!side.has_value()) {
    throw std::invalid_argument("side must be buy or sell");
  }
  booking.side = *side;
  booking.quantity = trade.at("quantity").get<double>();
  booking.price = trade.at("price").get<double>();
  booking.commission = trade.value("commission", 0.0);
  booking.trade_time_ms = trade.value("trade_time_ms", std::int64_t{0});
  booking.exec_id = trade.value("exec_id", std::string());

  BookingResult result;
  try {
    result = bookTrade(booking, std::chrono::milliseconds(config_.order_timeout_sec * 1000LL));
  } catch (const std::runtime_error& e) {
    return errorJson(e.what());
  }

  json response;
  response["status"] = result.booked ? "ok" : "error";
  if (!result.booked) {
    response["response"] = "duplicate exec id";
    return response;
  }
  response["effect"] = ledgerEffectToString(result.effect);
  response["realized_pnl"] = result.realized_pnl;
  response["trades"] = result.trades.size();
  response["position"] =
      result.position.has_value() ? positionJson(*result.position) : json(nullptr);
  response["archived"] =
      result.archived.has_value() ? historyJson(*result.archived) : json(nullptr);
  return response;
}

json SyncEngine::statusJson() const {
  const SyncStatus s = status();
  json j;
  j["state"] = syncStateToString(s.state);
  j["connected"] = s.connected;
  j["venue_reachable"] = s.venue_reachable;
  j["degraded"] = s.degraded;
  j["account"] = s.venue_account;
  j["account_id"] = s.account_id.has_value() ? json(*s.account_id) : json(nullptr);
  j["last_connect"] =
      s.last_connect_ms != 0 ? json(format_iso8601_utc(s.last_connect_ms)) : json(nullptr);
  j["last_disconnect"] = s.last_disconnect_ms != 0
                             ? json(format_iso8601_utc(s.last_disconnect_ms))
                             : json(nullptr);
  j["last_event"] =
      s.last_event_ms != 0 ? json(format_iso8601_utc(s.last_event_ms)) : json(nullptr);
  j["last_error"] = s.last_error.empty() ? json(nullptr) : json(s.last_error);
  j["order_queue_depth"] = s.order_queue_depth;
  j["cache_ready"] = s.cache_ready;
  j["readonly"] = config_.readonly;
  return j;
}

}  // namespace pnlsync
