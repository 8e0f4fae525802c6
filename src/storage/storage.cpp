#include "storage/storage.hpp"

#include "utils/clock.hpp"

#include <stdexcept>

namespace {

constexpr const char* kUserCols =
  "user_id, name, email, balance, is_admin, created_ts";
constexpr const char* kMarketCols =
  "market_id, title, description, category, creator_id, end_date_ms, volume, "
  "is_resolved, resolved_outcome_id, created_ts";
constexpr const char* kOutcomeCols =
  "outcome_id, market_id, title, description, probability, is_resolved";
constexpr const char* kOrderCols =
  "order_id, user_id, market_id, outcome_id, side, order_type, amount, price, "
  "filled, status, created_ts, updated_ts";
constexpr const char* kHoldingCols =
  "h.holding_id, h.user_id, h.outcome_id, h.quantity, h.avg_price, h.position_side, h.updated_ts";
constexpr const char* kTradeCols =
  "trade_id, user_id, market_id, outcome_id, amount, price, side, created_ts";
constexpr const char* kTxnCols =
  "transaction_id, user_id, amount, type, metadata, created_ts";

std::string select_from(const char* cols, const char* rest) {
  return std::string("SELECT ") + cols + " " + rest;
}

User read_user(SQLite::Statement& q) {
  User u;
  u.user_id    = q.getColumn(0).getString();
  u.name       = q.getColumn(1).getString();
  u.email      = q.getColumn(2).getString();
  u.balance    = q.getColumn(3).getInt64();
  u.is_admin   = q.getColumn(4).getInt() != 0;
  u.created_ts = q.getColumn(5).getInt64();
  return u;
}

Market read_market(SQLite::Statement& q) {
  Market m;
  m.market_id   = q.getColumn(0).getString();
  m.title       = q.getColumn(1).getString();
  m.description = q.getColumn(2).getString();
  m.category    = q.getColumn(3).getString();
  m.creator_id  = q.getColumn(4).getString();
  m.end_date_ms = q.getColumn(5).getInt64();
  m.volume      = q.getColumn(6).getInt64();
  m.is_resolved = q.getColumn(7).getInt() != 0;
  if (!q.getColumn(8).isNull()) m.resolved_outcome_id = q.getColumn(8).getString();
  m.created_ts  = q.getColumn(9).getInt64();
  return m;
}

Outcome read_outcome(SQLite::Statement& q) {
  Outcome o;
  o.outcome_id  = q.getColumn(0).getString();
  o.market_id   = q.getColumn(1).getString();
  o.title       = q.getColumn(2).getString();
  o.description = q.getColumn(3).getString();
  o.probability = q.getColumn(4).getInt64();
  o.is_resolved = q.getColumn(5).getInt() != 0;
  return o;
}

Order read_order(SQLite::Statement& q) {
  Order o;
  o.order_id   = q.getColumn(0).getString();
  o.user_id    = q.getColumn(1).getString();
  o.market_id  = q.getColumn(2).getString();
  o.outcome_id = q.getColumn(3).getString();
  o.side       = static_cast<Side>(q.getColumn(4).getInt());
  o.kind       = static_cast<OrderKind>(q.getColumn(5).getInt());
  o.amount     = q.getColumn(6).getInt64();
  o.price_q4   = q.getColumn(7).getInt64();
  o.filled     = q.getColumn(8).getInt64();
  o.status     = static_cast<OrderStatus>(q.getColumn(9).getInt());
  o.created_ts = q.getColumn(10).getInt64();
  o.updated_ts = q.getColumn(11).getInt64();
  return o;
}

Holding read_holding(SQLite::Statement& q) {
  Holding h;
  h.holding_id    = q.getColumn(0).getString();
  h.user_id       = q.getColumn(1).getString();
  h.outcome_id    = q.getColumn(2).getString();
  h.quantity      = q.getColumn(3).getInt64();
  h.avg_price     = q.getColumn(4).getInt64();
  h.position_side = static_cast<PositionSide>(q.getColumn(5).getInt());
  h.updated_ts    = q.getColumn(6).getInt64();
  return h;
}

TradeRow read_trade(SQLite::Statement& q) {
  TradeRow t;
  t.trade_id   = q.getColumn(0).getInt64();
  t.user_id    = q.getColumn(1).getString();
  t.market_id  = q.getColumn(2).getString();
  t.outcome_id = q.getColumn(3).getString();
  t.amount     = q.getColumn(4).getInt64();
  t.price      = q.getColumn(5).getInt64();
  t.side       = static_cast<Side>(q.getColumn(6).getInt());
  t.created_ts = q.getColumn(7).getInt64();
  return t;
}

TransactionRow read_txn(SQLite::Statement& q) {
  TransactionRow t;
  t.transaction_id = q.getColumn(0).getInt64();
  t.user_id        = q.getColumn(1).getString();
  t.amount         = q.getColumn(2).getInt64();
  t.type           = q.getColumn(3).getString();
  if (!q.getColumn(4).isNull()) t.metadata = q.getColumn(4).getString();
  t.created_ts     = q.getColumn(5).getInt64();
  return t;
}

// Single-row UPDATE/DELETE that must hit exactly one row.
void exec_one(SQLite::Statement& stmt, const std::string& what) {
  if (stmt.exec() != 1) throw std::runtime_error(what + ": no such row");
}

} // namespace

// -------------------- ctor / init --------------------

Storage::Storage(const std::string& db_path)
  : db_(db_path.c_str(),
        SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE | SQLite::OPEN_FULLMUTEX)
{
  // Simple contention handling for brief write-lock situations
  db_.setBusyTimeout(5000); // ms
}

void Storage::init() {
  db_.exec("PRAGMA journal_mode=WAL;");
  db_.exec("PRAGMA synchronous=NORMAL;");
  db_.exec("PRAGMA foreign_keys=ON;");

  create_schema_();

  next_user_.store(load_next_seq_("users", "user_id", "USR-"));
  next_market_.store(load_next_seq_("markets", "market_id", "MKT-"));
  next_outcome_.store(load_next_seq_("outcomes", "outcome_id", "OUT-"));
  next_order_.store(load_next_seq_("orders", "order_id", "OID-"));
  next_holding_.store(load_next_seq_("holdings", "holding_id", "HLD-"));
}

void Storage::create_schema_() {
  // All decimal columns are Q4 integers (1.0000 == 10000).
  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS users (
  user_id     TEXT PRIMARY KEY,
  name        TEXT NOT NULL,
  email       TEXT NOT NULL UNIQUE,
  balance     INTEGER NOT NULL CHECK (balance >= 0),
  is_admin    INTEGER NOT NULL DEFAULT 0,
  created_ts  INTEGER NOT NULL
);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS markets (
  market_id            TEXT PRIMARY KEY,
  title                TEXT NOT NULL,
  description          TEXT NOT NULL,
  category             TEXT NOT NULL,
  creator_id           TEXT NOT NULL,
  end_date_ms          INTEGER NOT NULL,
  volume               INTEGER NOT NULL DEFAULT 0,
  is_resolved          INTEGER NOT NULL DEFAULT 0,
  resolved_outcome_id  TEXT,                     -- set once, at resolution
  created_ts           INTEGER NOT NULL,
  FOREIGN KEY(creator_id) REFERENCES users(user_id)
);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS outcomes (
  outcome_id   TEXT PRIMARY KEY,
  market_id    TEXT NOT NULL,
  title        TEXT NOT NULL,
  description  TEXT NOT NULL DEFAULT '',
  probability  INTEGER NOT NULL CHECK (probability BETWEEN 0 AND 10000),
  is_resolved  INTEGER NOT NULL DEFAULT 0,
  FOREIGN KEY(market_id) REFERENCES markets(market_id)
);
)SQL");

  db_.exec(R"SQL(
CREATE INDEX IF NOT EXISTS idx_outcomes_market
  ON outcomes(market_id);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS orders (
  order_id    TEXT PRIMARY KEY,
  user_id     TEXT NOT NULL,
  market_id   TEXT NOT NULL,
  outcome_id  TEXT NOT NULL,
  side        INTEGER NOT NULL CHECK (side IN (1,2)),        -- 1=BUY, 2=SELL
  order_type  INTEGER NOT NULL CHECK (order_type IN (1,2)),  -- 1=LIMIT, 2=MARKET
  amount      INTEGER NOT NULL CHECK (amount > 0),
  price       INTEGER NOT NULL,
  filled      INTEGER NOT NULL DEFAULT 0 CHECK (filled >= 0 AND filled <= amount),
  status      INTEGER NOT NULL CHECK (status IN (1,2,3)),    -- 1 OPEN, 2 FILLED, 3 CANCELLED
  created_ts  INTEGER NOT NULL,
  updated_ts  INTEGER NOT NULL,
  FOREIGN KEY(user_id) REFERENCES users(user_id),
  FOREIGN KEY(market_id) REFERENCES markets(market_id),
  FOREIGN KEY(outcome_id) REFERENCES outcomes(outcome_id)
);
)SQL");

  db_.exec(R"SQL(
CREATE INDEX IF NOT EXISTS idx_orders_book
  ON orders(market_id, outcome_id, side, status);
)SQL");

  db_.exec(R"SQL(
CREATE INDEX IF NOT EXISTS idx_orders_user
  ON orders(user_id, outcome_id);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS trades (
  trade_id    INTEGER PRIMARY KEY AUTOINCREMENT,
  user_id     TEXT NOT NULL,
  market_id   TEXT NOT NULL,
  outcome_id  TEXT NOT NULL,
  amount      INTEGER NOT NULL,          -- shares
  price       INTEGER NOT NULL,
  side        INTEGER NOT NULL,
  created_ts  INTEGER NOT NULL,
  FOREIGN KEY(user_id) REFERENCES users(user_id),
  FOREIGN KEY(market_id) REFERENCES markets(market_id),
  FOREIGN KEY(outcome_id) REFERENCES outcomes(outcome_id)
);
)SQL");

  db_.exec(R"SQL(
CREATE INDEX IF NOT EXISTS idx_trades_market
  ON trades(market_id);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS holdings (
  holding_id     TEXT PRIMARY KEY,
  user_id        TEXT NOT NULL,
  outcome_id     TEXT NOT NULL,
  quantity       INTEGER NOT NULL CHECK (quantity >= 0),
  avg_price      INTEGER NOT NULL,
  position_side  INTEGER NOT NULL DEFAULT 1,   -- 1=YES, 2=NO
  updated_ts     INTEGER NOT NULL,
  UNIQUE(user_id, outcome_id),
  FOREIGN KEY(user_id) REFERENCES users(user_id),
  FOREIGN KEY(outcome_id) REFERENCES outcomes(outcome_id)
);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS transactions (
  transaction_id  INTEGER PRIMARY KEY AUTOINCREMENT,
  user_id         TEXT NOT NULL,
  amount          INTEGER NOT NULL,       -- signed
  type            TEXT NOT NULL,
  metadata        TEXT,
  created_ts      INTEGER NOT NULL,
  FOREIGN KEY(user_id) REFERENCES users(user_id)
);
)SQL");

  db_.exec(R"SQL(
CREATE INDEX IF NOT EXISTS idx_transactions_user
  ON transactions(user_id);
)SQL");
}

uint64_t Storage::load_next_seq_(const char* table, const char* id_column, const char* prefix) const {
  const std::string prefix_s(prefix);
  SQLite::Statement q(db_,
    std::string("SELECT MAX(CAST(SUBSTR(") + id_column + ", ?) AS INTEGER)) FROM " + table +
    " WHERE " + id_column + " LIKE ?");
  q.bind(1, static_cast<int>(prefix_s.size() + 1));
  q.bind(2, prefix_s + "%");

  if (q.executeStep()) { // aggregates still return one row
    const auto col = q.getColumn(0);
    if (!col.isNull())
      return static_cast<uint64_t>(col.getInt64()) + 1;
  }
  return 1;
}

// -------------------- users --------------------

void Storage::insert_user(const User& u) {
  SQLite::Statement stmt(db_,
    "INSERT INTO users(user_id, name, email, balance, is_admin, created_ts) VALUES (?,?,?,?,?,?)");
  stmt.bind(1, u.user_id);
  stmt.bind(2, u.name);
  stmt.bind(3, u.email);
  stmt.bind(4, u.balance);
  stmt.bind(5, u.is_admin ? 1 : 0);
  stmt.bind(6, u.created_ts);
  stmt.exec();
}

std::optional<User> Storage::find_user(const std::string& user_id) const {
  SQLite::Statement q(db_, select_from(kUserCols, "FROM users WHERE user_id=?"));
  q.bind(1, user_id);
  if (!q.executeStep()) return std::nullopt;
  return read_user(q);
}

std::optional<User> Storage::find_user_by_email(const std::string& email) const {
  SQLite::Statement q(db_, select_from(kUserCols, "FROM users WHERE email=?"));
  q.bind(1, email);
  if (!q.executeStep()) return std::nullopt;
  return read_user(q);
}

void Storage::set_admin(const std::string& user_id, bool is_admin) {
  SQLite::Statement stmt(db_, "UPDATE users SET is_admin=? WHERE user_id=?");
  stmt.bind(1, is_admin ? 1 : 0);
  stmt.bind(2, user_id);
  exec_one(stmt, "set_admin " + user_id);
}

void Storage::adjust_balance(const std::string& user_id, AmountQ4 delta) {
  SQLite::Statement stmt(db_, "UPDATE users SET balance = balance + ? WHERE user_id=?");
  stmt.bind(1, delta);
  stmt.bind(2, user_id);
  exec_one(stmt, "adjust_balance " + user_id);
}

// -------------------- transactions --------------------

int64_t Storage::insert_transaction(const TransactionRow& t) {
  SQLite::Statement stmt(db_,
    "INSERT INTO transactions(user_id, amount, type, metadata, created_ts) VALUES (?,?,?,?,?)");
  stmt.bind(1, t.user_id);
  stmt.bind(2, t.amount);
  stmt.bind(3, t.type);
  if (t.metadata.empty())
    stmt.bind(4); // NULL
  else
    stmt.bind(4, t.metadata);
  stmt.bind(5, t.created_ts);
  stmt.exec();
  return db_.getLastInsertRowid();
}

std::vector<TransactionRow> Storage::list_transactions(const std::string& user_id,
                                                       int limit, int64_t offset) const {
  SQLite::Statement q(db_, select_from(kTxnCols,
    "FROM transactions WHERE user_id=? ORDER BY created_ts DESC, transaction_id DESC LIMIT ? OFFSET ?"));
  q.bind(1, user_id);
  q.bind(2, limit);
  q.bind(3, offset);

  std::vector<TransactionRow> out;
  while (q.executeStep()) out.push_back(read_txn(q));
  return out;
}

int64_t Storage::count_transactions(const std::string& user_id) const {
  SQLite::Statement q(db_, "SELECT COUNT(*) FROM transactions WHERE user_id=?");
  q.bind(1, user_id);
  q.executeStep();
  return q.getColumn(0).getInt64();
}

// -------------------- markets / outcomes --------------------

void Storage::insert_market(const Market& m) {
  SQLite::Statement stmt(db_,
    "INSERT INTO markets(market_id, title, description, category, creator_id, end_date_ms, "
    "volume, is_resolved, resolved_outcome_id, created_ts) VALUES (?,?,?,?,?,?,?,?,?,?)");
  stmt.bind(1,  m.market_id);
  stmt.bind(2,  m.title);
  stmt.bind(3,  m.description);
  stmt.bind(4,  m.category);
  stmt.bind(5,  m.creator_id);
  stmt.bind(6,  m.end_date_ms);
  stmt.bind(7,  m.volume);
  stmt.bind(8,  m.is_resolved ? 1 : 0);
  if (m.resolved_outcome_id.has_value())
    stmt.bind(9, *m.resolved_outcome_id);
  else
    stmt.bind(9); // NULL
  stmt.bind(10, m.created_ts);
  stmt.exec();
}

std::optional<Market> Storage::find_market(const std::string& market_id) const {
  SQLite::Statement q(db_, select_from(kMarketCols, "FROM markets WHERE market_id=?"));
  q.bind(1, market_id);
  if (!q.executeStep()) return std::nullopt;
  return read_market(q);
}

void Storage::add_market_volume(const std::string& market_id, AmountQ4 delta) {
  SQLite::Statement stmt(db_, "UPDATE markets SET volume = volume + ? WHERE market_id=?");
  stmt.bind(1, delta);
  stmt.bind(2, market_id);
  exec_one(stmt, "add_market_volume " + market_id);
}

void Storage::mark_market_resolved(const std::string& market_id, const std::string& outcome_id) {
  // is_resolved=0 in the predicate keeps the transition one-way
  SQLite::Statement stmt(db_,
    "UPDATE markets SET is_resolved=1, resolved_outcome_id=? WHERE market_id=? AND is_resolved=0");
  stmt.bind(1, outcome_id);
  stmt.bind(2, market_id);
  exec_one(stmt, "mark_market_resolved " + market_id);
}

void Storage::insert_outcome(const Outcome& o) {
  SQLite::Statement stmt(db_,
    "INSERT INTO outcomes(outcome_id, market_id, title, description, probability, is_resolved) "
    "VALUES (?,?,?,?,?,?)");
  stmt.bind(1, o.outcome_id);
  stmt.bind(2, o.market_id);
  stmt.bind(3, o.title);
  stmt.bind(4, o.description);
  stmt.bind(5, o.probability);
  stmt.bind(6, o.is_resolved ? 1 : 0);
  stmt.exec();
}

std::optional<Outcome> Storage::find_outcome(const std::string& outcome_id) const {
  SQLite::Statement q(db_, select_from(kOutcomeCols, "FROM outcomes WHERE outcome_id=?"));
  q.bind(1, outcome_id);
  if (!q.executeStep()) return std::nullopt;
  return read_outcome(q);
}

std::vector<Outcome> Storage::outcomes_for_market(const std::string& market_id) const {
  SQLite::Statement q(db_, select_from(kOutcomeCols,
    "FROM outcomes WHERE market_id=? ORDER BY rowid ASC"));
  q.bind(1, market_id);

  std::vector<Outcome> out;
  while (q.executeStep()) out.push_back(read_outcome(q));
  return out;
}

bool Storage::compare_and_set_probability(const std::string& outcome_id,
                                          PriceQ4 expected, PriceQ4 desired) {
  SQLite::Statement stmt(db_,
    "UPDATE outcomes SET probability=? WHERE outcome_id=? AND probability=?");
  stmt.bind(1, desired);
  stmt.bind(2, outcome_id);
  stmt.bind(3, expected);
  return stmt.exec() == 1;
}

void Storage::mark_outcome_resolved(const std::string& outcome_id) {
  SQLite::Statement stmt(db_, "UPDATE outcomes SET is_resolved=1 WHERE outcome_id=?");
  stmt.bind(1, outcome_id);
  exec_one(stmt, "mark_outcome_resolved " + outcome_id);
}

// -------------------- orders --------------------

void Storage::insert_order(const Order& o) {
  SQLite::Statement stmt(db_,
    "INSERT INTO orders(order_id, user_id, market_id, outcome_id, side, order_type, amount, price, "
    "filled, status, created_ts, updated_ts) VALUES (?,?,?,?,?,?,?,?,?,?,?,?)");
  stmt.bind(1,  o.order_id);
  stmt.bind(2,  o.user_id);
  stmt.bind(3,  o.market_id);
  stmt.bind(4,  o.outcome_id);
  stmt.bind(5,  static_cast<int>(o.side));
  stmt.bind(6,  static_cast<int>(o.kind));
  stmt.bind(7,  o.amount);
  stmt.bind(8,  o.price_q4);
  stmt.bind(9,  o.filled);
  stmt.bind(10, static_cast<int>(o.status));
  stmt.bind(11, o.created_ts);
  stmt.bind(12, o.updated_ts);
  stmt.exec();
}

std::optional<Order> Storage::find_order(const std::string& order_id) const {
  SQLite::Statement q(db_, select_from(kOrderCols, "FROM orders WHERE order_id=?"));
  q.bind(1, order_id);
  if (!q.executeStep()) return std::nullopt;
  return read_order(q);
}

void Storage::update_order_fill(const std::string& order_id, AmountQ4 filled,
                                OrderStatus status, int64_t now_ms) {
  // filled only moves forward and only while the order is OPEN
  SQLite::Statement stmt(db_,
    "UPDATE orders SET filled=?, status=?, updated_ts=? "
    "WHERE order_id=? AND status=1 AND filled<=?");
  stmt.bind(1, filled);
  stmt.bind(2, static_cast<int>(status));
  stmt.bind(3, now_ms);
  stmt.bind(4, order_id);
  stmt.bind(5, filled);
  exec_one(stmt, "update_order_fill " + order_id);
}

void Storage::update_order_status(const std::string& order_id, OrderStatus status, int64_t now_ms) {
  SQLite::Statement stmt(db_,
    "UPDATE orders SET status=?, updated_ts=? WHERE order_id=? AND status=1");
  stmt.bind(1, static_cast<int>(status));
  stmt.bind(2, now_ms);
  stmt.bind(3, order_id);
  exec_one(stmt, "update_order_status " + order_id);
}

std::vector<Order> Storage::resting_orders(const std::string& market_id,
                                           const std::string& outcome_id,
                                           Side side) const {
  // asks: cheapest first, bids: highest first; ties by arrival
  const char* order_by = (side == pm::SELL)
    ? "ORDER BY price ASC, created_ts ASC, rowid ASC"
    : "ORDER BY price DESC, created_ts ASC, rowid ASC";
  SQLite::Statement q(db_, select_from(kOrderCols,
    "FROM orders WHERE market_id=? AND outcome_id=? AND side=? AND order_type=1 "
    "AND status=1 AND filled < amount ") + order_by);
  q.bind(1, market_id);
  q.bind(2, outcome_id);
  q.bind(3, static_cast<int>(side));

  std::vector<Order> out;
  while (q.executeStep()) out.push_back(read_order(q));
  return out;
}

std::vector<Order> Storage::open_orders_in_market(const std::string& market_id) const {
  SQLite::Statement q(db_, select_from(kOrderCols,
    "FROM orders WHERE market_id=? AND status=1 ORDER BY created_ts ASC, rowid ASC"));
  q.bind(1, market_id);

  std::vector<Order> out;
  while (q.executeStep()) out.push_back(read_order(q));
  return out;
}

AmountQ4 Storage::reserved_sell_quantity(const std::string& user_id,
                                         const std::string& outcome_id) const {
  SQLite::Statement q(db_,
    "SELECT COALESCE(SUM(amount - filled), 0) FROM orders "
    "WHERE user_id=? AND outcome_id=? AND side=2 AND order_type=1 AND status=1");
  q.bind(1, user_id);
  q.bind(2, outcome_id);
  q.executeStep();
  return q.getColumn(0).getInt64();
}

// -------------------- trades --------------------

int64_t Storage::insert_trade(const TradeRow& t) {
  SQLite::Statement stmt(db_,
    "INSERT INTO trades(user_id, market_id, outcome_id, amount, price, side, created_ts) "
    "VALUES (?,?,?,?,?,?,?)");
  stmt.bind(1, t.user_id);
  stmt.bind(2, t.market_id);
  stmt.bind(3, t.outcome_id);
  stmt.bind(4, t.amount);
  stmt.bind(5, t.price);
  stmt.bind(6, static_cast<int>(t.side));
  stmt.bind(7, t.created_ts);
  stmt.exec();
  return db_.getLastInsertRowid();
}

std::vector<TradeRow> Storage::recent_trades(const std::string& market_id, int limit) const {
  SQLite::Statement q(db_, select_from(kTradeCols,
    "FROM trades WHERE market_id=? ORDER BY created_ts DESC, trade_id DESC LIMIT ?"));
  q.bind(1, market_id);
  q.bind(2, limit);

  std::vector<TradeRow> out;
  while (q.executeStep()) out.push_back(read_trade(q));
  return out;
}

// -------------------- holdings --------------------

std::optional<Holding> Storage::find_holding(const std::string& user_id,
                                             const std::string& outcome_id) const {
  SQLite::Statement q(db_, select_from(kHoldingCols,
    "FROM holdings h WHERE h.user_id=? AND h.outcome_id=?"));
  q.bind(1, user_id);
  q.bind(2, outcome_id);
  if (!q.executeStep()) return std::nullopt;
  return read_holding(q);
}

void Storage::insert_holding(const Holding& h) {
  SQLite::Statement stmt(db_,
    "INSERT INTO holdings(holding_id, user_id, outcome_id, quantity, avg_price, position_side, updated_ts) "
    "VALUES (?,?,?,?,?,?,?)");
  stmt.bind(1, h.holding_id);
  stmt.bind(2, h.user_id);
  stmt.bind(3, h.outcome_id);
  stmt.bind(4, h.quantity);
  stmt.bind(5, h.avg_price);
  stmt.bind(6, static_cast<int>(h.position_side));
  stmt.bind(7, h.updated_ts);
  stmt.exec();
}

void Storage::update_holding(const std::string& holding_id, AmountQ4 quantity,
                             PriceQ4 avg_price, int64_t now_ms) {
  SQLite::Statement stmt(db_,
    "UPDATE holdings SET quantity=?, avg_price=?, updated_ts=? WHERE holding_id=?");
  stmt.bind(1, quantity);
  stmt.bind(2, avg_price);
  stmt.bind(3, now_ms);
  stmt.bind(4, holding_id);
  exec_one(stmt, "update_holding " + holding_id);
}

void Storage::delete_holding(const std::string& holding_id) {
  SQLite::Statement stmt(db_, "DELETE FROM holdings WHERE holding_id=?");
  stmt.bind(1, holding_id);
  exec_one(stmt, "delete_holding " + holding_id);
}

std::vector<Holding> Storage::holdings_in_market(const std::string& market_id) const {
  SQLite::Statement q(db_, select_from(kHoldingCols,
    "FROM holdings h JOIN outcomes o ON o.outcome_id = h.outcome_id "
    "WHERE o.market_id=? AND h.quantity > 0 ORDER BY h.rowid ASC"));
  q.bind(1, market_id);

  std::vector<Holding> out;
  while (q.executeStep()) out.push_back(read_holding(q));
  return out;
}

std::vector<Holding> Storage::holdings_for_user(const std::string& user_id) const {
  SQLite::Statement q(db_, select_from(kHoldingCols,
    "FROM holdings h WHERE h.user_id=? AND h.quantity > 0 ORDER BY h.updated_ts DESC, h.rowid DESC"));
  q.bind(1, user_id);

  std::vector<Holding> out;
  while (q.executeStep()) out.push_back(read_holding(q));
  return out;
}
