#include "nudge/storage/persistence.hpp"

#include "nudge/model/state_strings.hpp"
#include "nudge/util/log.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <format>

namespace nudge {

namespace {

constexpr auto kTaskColumns =
    "id, user_id, title, description, due_at, priority, status, created_at, "
    "updated_at, completed_at";

constexpr auto kUserColumns =
    "id, email, notifications_enabled, priorities, reminder_lead_hours, "
    "overdue_alerts, daily_digest, created_at, updated_at";

constexpr auto kNotificationColumns =
    "id, user_id, task_id, kind, message, created_at, is_sent, is_read";

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) -> void {
  sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

auto priorities_to_json(const PrioritySet& set) -> std::string {
  auto arr = nlohmann::json::array();
  for (auto p : {Priority::Low, Priority::Medium, Priority::High}) {
    if (set.contains(p))
      arr.push_back(priority_name(p));
  }
  return arr.dump();
}

auto priorities_from_json(const std::string& text) -> PrioritySet {
  PrioritySet set;
  auto arr = nlohmann::json::parse(text, nullptr, false);
  if (!arr.is_array()) {
    log::warn("Ignoring malformed priority list: {}", text);
    return set;
  }
  for (const auto& item : arr) {
    if (!item.is_string())
      continue;
    if (auto p = parse_priority(item.get<std::string>()))
      set.insert(*p);
  }
  return set;
}

auto row_to_task(sqlite3_stmt* stmt) -> Task {
  Task t;
  t.id = TaskId{col_text(stmt, 0)};
  t.owner = UserId{col_text(stmt, 1)};
  t.title = col_text(stmt, 2);
  t.description = col_text(stmt, 3);
  t.due_at = from_millis(sqlite3_column_int64(stmt, 4));
  t.priority = parse_priority(col_text(stmt, 5)).value_or(Priority::Medium);
  t.status = parse_task_status(col_text(stmt, 6)).value_or(TaskStatus::Pending);
  t.created_at = from_millis(sqlite3_column_int64(stmt, 7));
  t.updated_at = from_millis(sqlite3_column_int64(stmt, 8));
  if (sqlite3_column_type(stmt, 9) != SQLITE_NULL) {
    t.completed_at = from_millis(sqlite3_column_int64(stmt, 9));
  }
  return t;
}

auto row_to_user(sqlite3_stmt* stmt) -> User {
  User u;
  u.id = UserId{col_text(stmt, 0)};
  u.email = col_text(stmt, 1);
  u.settings.enabled = sqlite3_column_int(stmt, 2) != 0;
  u.settings.priorities = priorities_from_json(col_text(stmt, 3));
  u.settings.reminder_lead_hours = sqlite3_column_int(stmt, 4);
  u.settings.overdue_alerts = sqlite3_column_int(stmt, 5) != 0;
  u.settings.daily_digest = sqlite3_column_int(stmt, 6) != 0;
  u.created_at = from_millis(sqlite3_column_int64(stmt, 7));
  u.updated_at = from_millis(sqlite3_column_int64(stmt, 8));
  return u;
}

auto row_to_notification(sqlite3_stmt* stmt) -> Notification {
  Notification n;
  n.id = NotificationId{col_text(stmt, 0)};
  n.owner = UserId{col_text(stmt, 1)};
  if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
    n.task = TaskId{col_text(stmt, 2)};
  }
  n.kind = parse_notification_kind(col_text(stmt, 3))
               .value_or(NotificationKind::Reminder);
  n.message = col_text(stmt, 4);
  n.created_at = from_millis(sqlite3_column_int64(stmt, 5));
  n.sent = sqlite3_column_int(stmt, 6) != 0;
  n.read = sqlite3_column_int(stmt, 7) != 0;
  return n;
}

}  // namespace

auto Persistence::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

Persistence::Statement::~Statement() {
  reset();
}

auto Persistence::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

Persistence::Persistence(std::string_view db_path) : db_path_(db_path) {
}

Persistence::~Persistence() {
  close();
}

auto Persistence::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  if (!db_)
    return fail(Error::DatabaseError);
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

auto Persistence::open() -> Result<void> {
  std::lock_guard lock(mu_);
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}", sqlite3_errmsg(raw_db));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);

  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    db_.reset();
    return r;
  }

  log::info("Database opened: {}", db_path_);
  return ok();
}

auto Persistence::close() -> void {
  std::lock_guard lock(mu_);
  db_.reset();
}

auto Persistence::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS users (
      id TEXT PRIMARY KEY,
      email TEXT NOT NULL DEFAULT '',
      notifications_enabled INTEGER NOT NULL DEFAULT 1,
      priorities TEXT NOT NULL DEFAULT '["medium","high"]',
      reminder_lead_hours INTEGER NOT NULL DEFAULT 2,
      overdue_alerts INTEGER NOT NULL DEFAULT 1,
      daily_digest INTEGER NOT NULL DEFAULT 1,
      created_at INTEGER NOT NULL,
      updated_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS tasks (
      id TEXT PRIMARY KEY,
      user_id TEXT NOT NULL,
      title TEXT NOT NULL,
      description TEXT DEFAULT '',
      due_at INTEGER NOT NULL,
      priority TEXT NOT NULL DEFAULT 'medium',
      status TEXT NOT NULL DEFAULT 'pending',
      created_at INTEGER NOT NULL,
      updated_at INTEGER NOT NULL,
      completed_at INTEGER
    );

    CREATE INDEX IF NOT EXISTS idx_tasks_user_due
      ON tasks(user_id, due_at);
    CREATE INDEX IF NOT EXISTS idx_tasks_status_user
      ON tasks(status, user_id);

    CREATE TABLE IF NOT EXISTS notifications (
      id TEXT PRIMARY KEY,
      user_id TEXT NOT NULL,
      task_id TEXT,
      kind TEXT NOT NULL,
      message TEXT NOT NULL,
      created_at INTEGER NOT NULL,
      is_sent INTEGER NOT NULL DEFAULT 0,
      is_read INTEGER NOT NULL DEFAULT 0
    );

    CREATE INDEX IF NOT EXISTS idx_notifications_user_created
      ON notifications(user_id, created_at);
  )";

  return execute(sql);
}

auto Persistence::execute(std::string_view sql) -> Result<void> {
  if (!db_)
    return fail(Error::DatabaseError);
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto Persistence::get_user(const UserId& id) -> Result<User> {
  std::lock_guard lock(mu_);
  auto sql = std::format("SELECT {} FROM users WHERE id = ?;", kUserColumns);
  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, id.value());
  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    return fail(Error::NotFound);
  return row_to_user(stmt.get());
}

auto Persistence::save_user(const User& user) -> Result<void> {
  std::lock_guard lock(mu_);
  constexpr auto sql = R"(
    INSERT INTO users (id, email, notifications_enabled, priorities,
                       reminder_lead_hours, overdue_alerts, daily_digest,
                       created_at, updated_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      email = excluded.email,
      notifications_enabled = excluded.notifications_enabled,
      priorities = excluded.priorities,
      reminder_lead_hours = excluded.reminder_lead_hours,
      overdue_alerts = excluded.overdue_alerts,
      daily_digest = excluded.daily_digest,
      updated_at = excluded.updated_at;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  const auto& s = user.settings;
  bind_text(stmt.get(), 1, user.id.value());
  bind_text(stmt.get(), 2, user.email);
  sqlite3_bind_int(stmt.get(), 3, s.enabled ? 1 : 0);
  auto priorities = priorities_to_json(s.priorities);
  bind_text(stmt.get(), 4, priorities);
  sqlite3_bind_int(stmt.get(), 5, s.reminder_lead_hours);
  sqlite3_bind_int(stmt.get(), 6, s.overdue_alerts ? 1 : 0);
  sqlite3_bind_int(stmt.get(), 7, s.daily_digest ? 1 : 0);
  sqlite3_bind_int64(stmt.get(), 8, to_millis(user.created_at));
  sqlite3_bind_int64(stmt.get(), 9, to_millis(user.updated_at));

  return sqlite3_step(stmt.get()) == SQLITE_DONE
             ? ok()
             : fail(Error::DatabaseQueryFailed);
}

auto Persistence::list_users(bool notifications_enabled_only)
    -> Result<std::vector<User>> {
  std::lock_guard lock(mu_);
  auto sql = std::format("SELECT {} FROM users{} ORDER BY id;", kUserColumns,
                         notifications_enabled_only
                             ? " WHERE notifications_enabled = 1"
                             : "");
  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  std::vector<User> users;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    users.push_back(row_to_user(stmt.get()));
  }
  if (rc != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  return users;
}

auto Persistence::get_task(const TaskId& id) -> Result<Task> {
  std::lock_guard lock(mu_);
  auto sql = std::format("SELECT {} FROM tasks WHERE id = ?;", kTaskColumns);
  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, id.value());
  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    return fail(Error::NotFound);
  return row_to_task(stmt.get());
}

auto Persistence::save_task(const Task& task) -> Result<void> {
  std::lock_guard lock(mu_);
  constexpr auto sql = R"(
    INSERT INTO tasks (id, user_id, title, description, due_at, priority,
                       status, created_at, updated_at, completed_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      title = excluded.title,
      description = excluded.description,
      due_at = excluded.due_at,
      priority = excluded.priority,
      status = excluded.status,
      updated_at = excluded.updated_at,
      completed_at = excluded.completed_at;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, task.id.value());
  bind_text(stmt.get(), 2, task.owner.value());
  bind_text(stmt.get(), 3, task.title);
  bind_text(stmt.get(), 4, task.description);
  sqlite3_bind_int64(stmt.get(), 5, to_millis(task.due_at));
  bind_text(stmt.get(), 6, priority_name(task.priority));
  bind_text(stmt.get(), 7, task_status_name(task.status));
  sqlite3_bind_int64(stmt.get(), 8, to_millis(task.created_at));
  sqlite3_bind_int64(stmt.get(), 9, to_millis(task.updated_at));
  if (task.completed_at) {
    sqlite3_bind_int64(stmt.get(), 10, to_millis(*task.completed_at));
  } else {
    sqlite3_bind_null(stmt.get(), 10);
  }

  return sqlite3_step(stmt.get()) == SQLITE_DONE
             ? ok()
             : fail(Error::DatabaseQueryFailed);
}

auto Persistence::delete_task(const TaskId& id) -> Result<void> {
  std::lock_guard lock(mu_);
  auto result = prepare("DELETE FROM tasks WHERE id = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, id.value());
  if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  if (sqlite3_changes(db_.get()) == 0)
    return fail(Error::NotFound);
  return ok();
}

auto Persistence::list_tasks(const TaskQuery& query)
    -> Result<std::vector<Task>> {
  std::lock_guard lock(mu_);
  std::string sql = std::format("SELECT {} FROM tasks WHERE 1 = 1", kTaskColumns);
  if (query.owner) {
    sql += " AND user_id = ?";
  }
  if (!query.statuses.empty()) {
    sql += " AND status IN (";
    for (std::size_t i = 0; i < query.statuses.size(); ++i) {
      sql += i == 0 ? "?" : ", ?";
    }
    sql += ")";
  }
  if (query.due_before) {
    sql += " AND due_at < ?";
  }
  sql += " ORDER BY due_at ASC, id ASC;";

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  int idx = 1;
  if (query.owner) {
    bind_text(stmt.get(), idx++, query.owner->value());
  }
  for (auto status : query.statuses) {
    bind_text(stmt.get(), idx++, task_status_name(status));
  }
  if (query.due_before) {
    sqlite3_bind_int64(stmt.get(), idx++, to_millis(*query.due_before));
  }

  std::vector<Task> tasks;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    tasks.push_back(row_to_task(stmt.get()));
  }
  if (rc != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  return tasks;
}

auto Persistence::update_task_status(const TaskId& id, TaskStatus to,
                                     std::optional<TaskStatus> expected)
    -> Result<bool> {
  std::lock_guard lock(mu_);
  std::string sql = R"(
    UPDATE tasks SET status = ?, updated_at = ?,
      completed_at = CASE WHEN ? = 'completed' THEN ? ELSE completed_at END
    WHERE id = ?)";
  if (expected) {
    sql += " AND status = ?";
  }
  sql += ";";

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  auto now = to_millis(Clock::now());
  bind_text(stmt.get(), 1, task_status_name(to));
  sqlite3_bind_int64(stmt.get(), 2, now);
  bind_text(stmt.get(), 3, task_status_name(to));
  sqlite3_bind_int64(stmt.get(), 4, now);
  bind_text(stmt.get(), 5, id.value());
  if (expected) {
    bind_text(stmt.get(), 6, task_status_name(*expected));
  }

  if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  return sqlite3_changes(db_.get()) > 0;
}

auto Persistence::create_notification(const Notification& n) -> Result<void> {
  std::lock_guard lock(mu_);
  constexpr auto sql = R"(
    INSERT INTO notifications (id, user_id, task_id, kind, message,
                               created_at, is_sent, is_read)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, n.id.value());
  bind_text(stmt.get(), 2, n.owner.value());
  if (n.task) {
    bind_text(stmt.get(), 3, n.task->value());
  } else {
    sqlite3_bind_null(stmt.get(), 3);
  }
  bind_text(stmt.get(), 4, notification_kind_name(n.kind));
  bind_text(stmt.get(), 5, n.message);
  sqlite3_bind_int64(stmt.get(), 6, to_millis(n.created_at));
  sqlite3_bind_int(stmt.get(), 7, n.sent ? 1 : 0);
  sqlite3_bind_int(stmt.get(), 8, n.read ? 1 : 0);

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_CONSTRAINT)
    return fail(Error::AlreadyExists);
  return rc == SQLITE_DONE ? ok() : fail(Error::DatabaseQueryFailed);
}

auto Persistence::list_notifications(const UserId& owner, std::size_t limit)
    -> Result<std::vector<Notification>> {
  std::lock_guard lock(mu_);
  auto sql = std::format(
      "SELECT {} FROM notifications WHERE user_id = ? "
      "ORDER BY created_at DESC, rowid DESC LIMIT ?;",
      kNotificationColumns);
  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, owner.value());
  sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(limit));

  std::vector<Notification> out;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    out.push_back(row_to_notification(stmt.get()));
  }
  if (rc != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  return out;
}

auto Persistence::mark_notification_read(const UserId& owner,
                                         const NotificationId& id)
    -> Result<void> {
  std::lock_guard lock(mu_);
  auto result = prepare(
      "UPDATE notifications SET is_read = 1 WHERE id = ? AND user_id = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, id.value());
  bind_text(stmt.get(), 2, owner.value());
  if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  if (sqlite3_changes(db_.get()) == 0)
    return fail(Error::NotFound);
  return ok();
}

auto Persistence::mark_all_notifications_read(const UserId& owner)
    -> Result<std::size_t> {
  std::lock_guard lock(mu_);
  auto result = prepare(
      "UPDATE notifications SET is_read = 1 WHERE user_id = ? AND is_read = 0;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, owner.value());
  if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  return static_cast<std::size_t>(sqlite3_changes(db_.get()));
}

}  // namespace nudge
