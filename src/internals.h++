//
// Copyright (c) 2020-2022, Leonid Yuriev <leo@yuriev.ru>.
// SPDX-License-Identifier: Apache-2.0
//
// Internal definitions shared by the mapkv sources.
//

#pragma once

#include "../mapkv.h++"

#include <atomic>
#include <cinttypes>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#if defined(__GNUC__) || defined(__clang__)
#define __cold __attribute__((__cold__))
#else
#define __cold
#endif

#define LOG_AT(LEVEL, FMT, ...)                                                \
  do {                                                                         \
    if (MAPKV_UNLIKELY(::mapkv::logging::enabled(LEVEL)))                      \
      ::mapkv::logging::output(LEVEL, __func__, __LINE__, FMT, __VA_ARGS__);   \
  } while (0)

#define FATAL(FMT, ...) LOG_AT(::mapkv::logging::fatal, FMT, __VA_ARGS__)
#define ERROR(FMT, ...) LOG_AT(::mapkv::logging::error, FMT, __VA_ARGS__)
#define WARNING(FMT, ...) LOG_AT(::mapkv::logging::warning, FMT, __VA_ARGS__)
#define NOTICE(FMT, ...) LOG_AT(::mapkv::logging::notice, FMT, __VA_ARGS__)
#define VERBOSE(FMT, ...) LOG_AT(::mapkv::logging::verbose, FMT, __VA_ARGS__)
#define DEBUG(FMT, ...) LOG_AT(::mapkv::logging::debug, FMT, __VA_ARGS__)
#define TRACE(FMT, ...) LOG_AT(::mapkv::logging::trace, FMT, __VA_ARGS__)

namespace mapkv {
namespace detail {

/// \brief Liveness of a transaction, a cursor or a snapshot of data.
/// \details A token expires when its owner ends; a child token is alive
/// only while both of its parents are.
class lifetime_token {
  bool live_{true};
  const ::std::shared_ptr<const lifetime_token> parent_, second_;

public:
  explicit lifetime_token(
      ::std::shared_ptr<const lifetime_token> parent = nullptr,
      ::std::shared_ptr<const lifetime_token> second = nullptr) noexcept
      : parent_(::std::move(parent)), second_(::std::move(second)) {}
  lifetime_token(const lifetime_token &) = delete;
  lifetime_token &operator=(const lifetime_token &) = delete;

  bool alive() const noexcept {
    return live_ && (!parent_ || parent_->alive()) &&
           (!second_ || second_->alive());
  }
  void expire() noexcept { live_ = false; }
  void ensure_alive(const char *who) const {
    if (MAPKV_UNLIKELY(!alive()))
      error::throw_exception(errc::bad_lifetime, who);
  }
};

/// \brief A registered database.
struct db_entry {
  ::std::string name;
  bool is_default;
  db_flags flags;
  comparator_ptr key_cmp, dup_cmp;
  MDBX_cmp_func *key_thunk{nullptr}, *dup_thunk{nullptr};
  /// \brief The default database is known before its first registration.
  bool registered{true};
  /// \brief Set once the engine opened the table with the comparators above.
  bool engine_bound{false};
};

/// \brief Returns a C callback dispatching to the comparator.
/// \details The callback stays registered for the rest of the process.
MDBX_cmp_func *comparator_thunk(const comparator_ptr &cmp);

/// \brief The single-writer lock. It is not bound to a thread, so it can be
/// given up by a transaction left unfinished on another thread.
class writer_gate {
  ::std::mutex mutex_;
  ::std::condition_variable released_;
  bool taken_{false};

public:
  void acquire() {
    ::std::unique_lock<::std::mutex> guard(mutex_);
    released_.wait(guard, [this] { return !taken_; });
    taken_ = true;
  }
  bool try_acquire() {
    ::std::lock_guard<::std::mutex> guard(mutex_);
    if (taken_)
      return false;
    taken_ = true;
    return true;
  }
  void release() noexcept {
    {
      ::std::lock_guard<::std::mutex> guard(mutex_);
      taken_ = false;
    }
    released_.notify_one();
  }

  /// \brief Ownership of the gate, released on destruction.
  class hold {
    writer_gate *gate_{nullptr};

  public:
    hold() noexcept = default;
    explicit hold(writer_gate &gate) : gate_(&gate) { gate.acquire(); }
    hold(hold &&other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
    hold &operator=(hold &&other) noexcept {
      if (this != &other) {
        release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
      }
      return *this;
    }
    hold(const hold &) = delete;
    hold &operator=(const hold &) = delete;
    ~hold() noexcept { release(); }

    static hold try_take(writer_gate &gate) {
      hold result;
      if (gate.try_acquire())
        result.gate_ = &gate;
      return result;
    }
    bool owns() const noexcept { return gate_ != nullptr; }
    void release() noexcept {
      if (gate_) {
        gate_->release();
        gate_ = nullptr;
      }
    }
  };
};

/// \brief The shared part of an environment.
struct env_state {
  MDBX_env *handle{nullptr};
  environment::config config;
  path pathname;

  /// \brief The single-writer lock and the thread which took it.
  writer_gate writer;
  ::std::atomic<::std::thread::id> writer_owner{::std::thread::id()};

  ::std::atomic<unsigned> active_readers{0};
  ::std::atomic<unsigned> active_writers{0};

  mutable ::std::mutex registry_mutex;
  ::std::vector<db_entry> registry;

  env_state() = default;
  env_state(const env_state &) = delete;
  env_state &operator=(const env_state &) = delete;
  ~env_state() noexcept;

  db_entry entry(unsigned slot) const;
  /// \brief Looks a named database up, the registry lock must be held.
  /// \details Throws \ref db_flags_mismatch on a registration with other
  /// flags.
  bool find(const ::std::string &name, db_flags flags, unsigned &slot) const;
  void mark_engine_bound(unsigned slot);
  /// \brief Installs a comparator unless the engine already uses another.
  void set_comparator(unsigned slot, bool for_dups, const comparator_ptr &cmp);
};

/// \brief The shared part of a transaction, also held by its accessors.
struct txn_context {
  enum state { active, committed, aborted, failed, parked };

  ::std::shared_ptr<env_state> env;
  ::std::shared_ptr<txn_context> parent;
  /// \brief The running nested transaction, it blocks this one.
  txn_context *child{nullptr};
  MDBX_txn *handle{nullptr};
  writer_gate::hold writer_hold;
  const bool read_only;
  /// \brief The engine releases its writer lock on this thread only.
  const ::std::thread::id origin{::std::this_thread::get_id()};
  state status{active};
  ::std::shared_ptr<lifetime_token> lifetime;
  /// \brief Expires on every write, since pages of a write transaction
  /// may move under the views read before.
  ::std::shared_ptr<lifetime_token> data_epoch;
  ::std::vector<MDBX_dbi> dbi_cache;

  txn_context(::std::shared_ptr<env_state> env, bool read_only,
              ::std::shared_ptr<const lifetime_token> outer = nullptr)
      : env(::std::move(env)), read_only(read_only),
        lifetime(::std::make_shared<lifetime_token>(::std::move(outer))),
        data_epoch(::std::make_shared<lifetime_token>(lifetime)) {}
  txn_context(const txn_context &) = delete;
  txn_context &operator=(const txn_context &) = delete;
  ~txn_context() noexcept;

  bool is_running() const noexcept {
    return status == active || status == parked;
  }
  bool foreign_writer() const noexcept {
    return !read_only && origin != ::std::this_thread::get_id();
  }
  /// \brief Throws \ref bad_lifetime unless usable.
  MDBX_txn *ensure_active(const char *who) const;
  /// \brief Opens the database within this transaction once.
  /// \details A read-only transaction reports a table absent from its
  /// snapshot through `absent` when given, otherwise throws \ref not_found.
  MDBX_dbi resolve(const database &db, bool *absent = nullptr);
  /// \brief Invalidates the views read before a write.
  void touch() {
    data_epoch->expire();
    data_epoch = ::std::make_shared<lifetime_token>(lifetime);
  }
  /// \brief Aborts this and the nested transaction, if any.
  int abort_now() noexcept;
  /// \brief Releases the handle, the lock and the counters.
  void finish(state final_state) noexcept;
};

} // namespace detail
} // namespace mapkv
