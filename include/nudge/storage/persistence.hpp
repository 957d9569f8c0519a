#pragma once

#include "nudge/storage/store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace nudge {

// SQLite-backed Store. One connection, serialized by an internal mutex.
class Persistence final : public Store {
public:
  explicit Persistence(std::string_view db_path);
  ~Persistence() override;

  Persistence(const Persistence&) = delete;
  Persistence& operator=(const Persistence&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  [[nodiscard]] auto get_user(const UserId& id) -> Result<User> override;
  [[nodiscard]] auto save_user(const User& user) -> Result<void> override;
  [[nodiscard]] auto list_users(bool notifications_enabled_only)
      -> Result<std::vector<User>> override;

  [[nodiscard]] auto get_task(const TaskId& id) -> Result<Task> override;
  [[nodiscard]] auto save_task(const Task& task) -> Result<void> override;
  [[nodiscard]] auto delete_task(const TaskId& id) -> Result<void> override;
  [[nodiscard]] auto list_tasks(const TaskQuery& query)
      -> Result<std::vector<Task>> override;
  [[nodiscard]] auto update_task_status(
      const TaskId& id, TaskStatus to,
      std::optional<TaskStatus> expected = std::nullopt)
      -> Result<bool> override;

  [[nodiscard]] auto create_notification(const Notification& n)
      -> Result<void> override;
  [[nodiscard]] auto list_notifications(
      const UserId& owner, std::size_t limit = limits::kNotificationListLimit)
      -> Result<std::vector<Notification>> override;
  [[nodiscard]] auto mark_notification_read(const UserId& owner,
                                            const NotificationId& id)
      -> Result<void> override;
  [[nodiscard]] auto mark_all_notifications_read(const UserId& owner)
      -> Result<std::size_t> override;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::mutex mu_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace nudge
