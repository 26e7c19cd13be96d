//
// Copyright (c) 2020-2022, Leonid Yuriev <leo@yuriev.ru>.
// SPDX-License-Identifier: Apache-2.0
//
// Environment: the mapped file, its configuration, the writer lock and
// the registry of databases.
//

#include "internals.h++"

namespace mapkv {

namespace {

constexpr env_flags runtime_flags =
    env_flags::no_sync | env_flags::no_meta_sync | env_flags::no_mem_init;

constexpr env_flags known_flags =
    runtime_flags | env_flags::read_only | env_flags::no_sub_dir |
    env_flags::write_map | env_flags::exclusive | env_flags::no_readahead;

/// \brief Creates the table or checks the flags persisted for it.
/// \details A named table is closed afterwards, so that its first use may
/// still attach the custom comparators.
void create_table(detail::env_state &env, const char *name, db_flags flags) {
  MDBX_txn *txn = nullptr;
  error::success_or_throw(
      ::mdbx_txn_begin(env.handle, nullptr, MDBX_TXN_READWRITE, &txn));
  MDBX_dbi dbi = 0;
  int rc = ::mdbx_dbi_open(
      txn, name, MDBX_db_flags_t(unsigned(flags) | MDBX_CREATE), &dbi);
  if (MAPKV_LIKELY(rc == MDBX_SUCCESS))
    rc = ::mdbx_txn_commit(txn);
  else {
    const int err = ::mdbx_txn_abort(txn);
    if (MAPKV_UNLIKELY(err != MDBX_SUCCESS))
      ERROR("mdbx_txn_abort: %s (%d)", mdbx_strerror(err), err);
  }

  switch (rc) {
  case MDBX_SUCCESS:
    break;
  case MDBX_EINVAL:
  case MDBX_INCOMPATIBLE:
    DEBUG("database '%s': flags 0x%x rejected", name ? name : "",
          unsigned(flags));
    error::throw_exception(errc::db_flags_mismatch, rc);
  case MDBX_RESULT_TRUE:
    error::throw_exception(errc::txn_error, "table creation rolled back");
  default:
    error::from_native(rc).throw_exception();
  }

  if (name) {
    rc = ::mdbx_dbi_close(env.handle, dbi);
    if (MAPKV_UNLIKELY(rc != MDBX_SUCCESS))
      WARNING("mdbx_dbi_close('%s'): %s (%d)", name, mdbx_strerror(rc), rc);
  }
  DEBUG("database '%s' is present", name ? name : "");
}

/// \brief Whether a new registration should reach the file right away.
/// \details The thread running the write transaction leaves it to the first
/// use within that transaction.
bool creates_eagerly(const detail::env_state &env) {
  return !is_set(env.config.flags, env_flags::read_only) &&
         env.writer_owner.load() != std::this_thread::get_id();
}

} // namespace

namespace detail {

env_state::~env_state() noexcept {
  if (MAPKV_UNLIKELY(handle == nullptr))
    return;
  const int rc = ::mdbx_env_close(handle);
  if (MAPKV_UNLIKELY(rc != MDBX_SUCCESS))
    ERROR("mdbx_env_close(%s): %s (%d)", pathname.c_str(), mdbx_strerror(rc),
          rc);
  else
    VERBOSE("closed %s", pathname.c_str());
}

db_entry env_state::entry(unsigned slot) const {
  std::lock_guard<std::mutex> guard(registry_mutex);
  if (MAPKV_UNLIKELY(slot >= registry.size() || !registry[slot].registered))
    error::throw_exception(errc::invalid, "unregistered database");
  return registry[slot];
}

bool env_state::find(const std::string &name, db_flags flags,
                     unsigned &slot) const {
  for (slot = 1; slot < registry.size(); ++slot) {
    const db_entry &entry = registry[slot];
    if (entry.name != name)
      continue;
    if (MAPKV_UNLIKELY(entry.flags != flags))
      error::throw_exception(errc::db_flags_mismatch, name.c_str());
    return true;
  }
  return false;
}

void env_state::mark_engine_bound(unsigned slot) {
  std::lock_guard<std::mutex> guard(registry_mutex);
  registry.at(slot).engine_bound = true;
}

void env_state::set_comparator(unsigned slot, bool for_dups,
                               const comparator_ptr &cmp) {
  std::lock_guard<std::mutex> guard(registry_mutex);
  db_entry &entry = registry.at(slot);
  if (MAPKV_UNLIKELY(entry.is_default))
    error::throw_exception(errc::db_flags_mismatch,
                           "the default database uses the built-in ordering");
  if (MAPKV_UNLIKELY(for_dups && !is_set(entry.flags, db_flags::allow_dups)))
    error::throw_exception(errc::db_flags_mismatch,
                           "duplicates ordering of a unique-key database");

  comparator_ptr &target = for_dups ? entry.dup_cmp : entry.key_cmp;
  if (target == cmp)
    return;
  if (MAPKV_UNLIKELY(entry.engine_bound))
    error::throw_exception(errc::db_flags_mismatch,
                           "the ordering is fixed once the database was used");

  MDBX_cmp_func *const thunk = comparator_thunk(cmp);
  target = cmp;
  (for_dups ? entry.dup_thunk : entry.key_thunk) = thunk;
  DEBUG("database '%s': custom %s ordering", entry.name.c_str(),
        for_dups ? "duplicates" : "keys");
}

} // namespace detail

//------------------------------------------------------------------------------

void environment::config::validate() const {
  if (MAPKV_UNLIKELY(map_size == 0))
    error::throw_exception(errc::invalid_config, "zero map size");
  if (MAPKV_UNLIKELY(intptr_t(map_size) < 0 ||
                     intptr_t(map_size) > ::mdbx_limits_dbsize_max(-1)))
    error::throw_exception(errc::invalid_config, "map size beyond the limit");
  if (MAPKV_UNLIKELY(max_readers == 0))
    error::throw_exception(errc::invalid_config, "zero readers");
  if (MAPKV_UNLIKELY(max_dbs > MDBX_MAX_DBI))
    error::throw_exception(errc::invalid_config, "too many databases");
  if (MAPKV_UNLIKELY(unsigned(flags & ~known_flags) != 0))
    error::throw_exception(errc::invalid_config, "unknown flags");
  if (MAPKV_UNLIKELY(is_set(flags, env_flags::read_only) &&
                     is_set(flags, env_flags::write_map)))
    error::throw_exception(errc::invalid_config,
                           "read_only together with write_map");
}

__cold environment::environment(const path &pathname, permissions mode,
                                const config &config)
    : state_(std::make_shared<detail::env_state>()) {
  config.validate();
  detail::env_state &env = *state_;
  env.config = config;
  env.pathname = pathname;

  detail::db_entry main_db;
  main_db.is_default = true;
  main_db.flags = db_flags::defaults;
  main_db.registered = false;
  env.registry.push_back(std::move(main_db));

  error::success_or_throw(::mdbx_env_create(&env.handle));
  error::success_or_throw(
      ::mdbx_env_set_maxreaders(env.handle, config.max_readers));
  if (config.max_dbs > 0)
    error::success_or_throw(::mdbx_env_set_maxdbs(env.handle, config.max_dbs));

  const bool read_only = is_set(config.flags, env_flags::read_only);
  if (!read_only)
    error::success_or_throw(::mdbx_env_set_geometry(
        env.handle, 0, 0, intptr_t(config.map_size), -1, -1, -1));

  const MDBX_env_flags_t flags =
      MDBX_env_flags_t(unsigned(config.flags) | MDBX_NOSTICKYTHREADS);
  const int rc =
      ::mdbx_env_open(env.handle, pathname.c_str(), flags, mode);
  if (MAPKV_UNLIKELY(rc != MDBX_SUCCESS)) {
    const error trouble = error::from_native(rc);
    ERROR("mdbx_env_open(%s): %s", pathname.c_str(),
          trouble.message().c_str());
    switch (trouble.code()) {
    case errc::invalid:
      error::throw_exception(errc::invalid_config, rc);
    case errc::busy:
      trouble.throw_exception();
    default:
      error::throw_exception(errc::io_error, rc);
    }
  }

  NOTICE("opened %s, map size %zu, max dbs %u, max readers %u%s",
         pathname.c_str(), config.map_size, config.max_dbs,
         config.max_readers, read_only ? ", read-only" : "");
}

environment environment::open(const path &pathname, permissions mode,
                              const config &config) {
  return environment(pathname, mode, config);
}

environment::~environment() noexcept {}

void environment::close() noexcept { state_.reset(); }

detail::env_state &environment::state() const {
  if (MAPKV_UNLIKELY(!state_))
    error::throw_exception(errc::bad_lifetime, "the environment is closed");
  return *state_;
}

MDBX_env *environment::native_handle() const noexcept {
  return state_ ? state_->handle : nullptr;
}

const environment::config &environment::get_config() const {
  return state().config;
}

//------------------------------------------------------------------------------

transaction environment::new_transaction() {
  detail::env_state &env = state();
  if (MAPKV_UNLIKELY(is_set(env.config.flags, env_flags::read_only)))
    error::throw_exception(errc::read_only_environment,
                           "write transaction in a read-only environment");
  if (MAPKV_UNLIKELY(env.writer_owner.load() == std::this_thread::get_id()))
    error::throw_exception(errc::busy,
                           "this thread already runs the write transaction");

  auto ctx = std::make_shared<detail::txn_context>(state_, false);
  ctx->writer_hold = detail::writer_gate::hold(env.writer);
  env.writer_owner.store(std::this_thread::get_id());
  ++env.active_writers;

  const int rc =
      ::mdbx_txn_begin(env.handle, nullptr, MDBX_TXN_READWRITE, &ctx->handle);
  if (MAPKV_UNLIKELY(rc != MDBX_SUCCESS)) {
    ctx->finish(detail::txn_context::failed);
    error::success_or_throw(rc);
  }
  TRACE("write txn %" PRIu64 " started", ::mdbx_txn_id(ctx->handle));
  return transaction(std::move(ctx));
}

transaction environment::get_reader() {
  detail::env_state &env = state();
  unsigned active = env.active_readers.load();
  do
    if (MAPKV_UNLIKELY(active >= env.config.max_readers))
      error::throw_exception(errc::reader_slots_exhausted,
                             "all reader slots are taken");
  while (!env.active_readers.compare_exchange_weak(active, active + 1));

  auto ctx = std::make_shared<detail::txn_context>(state_, true);
  const int rc =
      ::mdbx_txn_begin(env.handle, nullptr, MDBX_TXN_RDONLY, &ctx->handle);
  if (MAPKV_UNLIKELY(rc != MDBX_SUCCESS)) {
    ctx->finish(detail::txn_context::failed);
    error::success_or_throw(rc);
  }
  TRACE("read txn %" PRIu64 " started", ::mdbx_txn_id(ctx->handle));
  return transaction(std::move(ctx));
}

//------------------------------------------------------------------------------

database environment::create_db(const std::string &name, db_flags flags) {
  if (name.empty())
    return get_default_db(flags);
  detail::env_state &env = state();
  unsigned slot;
  {
    std::lock_guard<std::mutex> guard(env.registry_mutex);
    if (env.find(name, flags, slot))
      return database(state_.get(), slot, flags);
  }

  const bool eager = creates_eagerly(env);
  detail::writer_gate::hold writer;
  if (eager)
    writer = detail::writer_gate::hold(env.writer);

  std::lock_guard<std::mutex> guard(env.registry_mutex);
  if (env.find(name, flags, slot))
    return database(state_.get(), slot, flags);
  if (MAPKV_UNLIKELY(env.registry.size() > env.config.max_dbs))
    error::throw_exception(errc::too_many_dbs, name.c_str());
  if (eager)
    create_table(env, name.c_str(), flags);

  detail::db_entry entry;
  entry.name = name;
  entry.is_default = false;
  entry.flags = flags;
  env.registry.push_back(std::move(entry));
  VERBOSE("registered database '%s', flags 0x%x", name.c_str(),
          unsigned(flags));
  return database(state_.get(), unsigned(env.registry.size() - 1), flags);
}

database environment::get_default_db(db_flags flags) {
  detail::env_state &env = state();
  {
    std::lock_guard<std::mutex> guard(env.registry_mutex);
    const detail::db_entry &entry = env.registry.front();
    if (entry.registered) {
      if (MAPKV_UNLIKELY(entry.flags != flags))
        error::throw_exception(errc::db_flags_mismatch, "default database");
      return database(state_.get(), 0, flags);
    }
  }

  const bool eager = creates_eagerly(env);
  detail::writer_gate::hold writer;
  if (eager)
    writer = detail::writer_gate::hold(env.writer);

  std::lock_guard<std::mutex> guard(env.registry_mutex);
  detail::db_entry &entry = env.registry.front();
  if (!entry.registered) {
    if (eager)
      create_table(env, nullptr, flags);
    entry.flags = flags;
    entry.registered = true;
  } else if (MAPKV_UNLIKELY(entry.flags != flags))
    error::throw_exception(errc::db_flags_mismatch, "default database");
  return database(state_.get(), 0, flags);
}

//------------------------------------------------------------------------------

void environment::set_mapsize(size_t new_size) {
  detail::env_state &env = state();
  if (MAPKV_UNLIKELY(new_size == 0 || intptr_t(new_size) < 0 ||
                     intptr_t(new_size) > ::mdbx_limits_dbsize_max(-1)))
    error::throw_exception(errc::invalid_config, "map size");
  if (MAPKV_UNLIKELY(is_set(env.config.flags, env_flags::read_only)))
    error::throw_exception(errc::read_only_environment, "resize");

  const detail::writer_gate::hold writer =
      detail::writer_gate::hold::try_take(env.writer);
  if (MAPKV_UNLIKELY(!writer.owns() || env.active_writers.load() != 0 ||
                     env.active_readers.load() != 0))
    error::throw_exception(errc::busy, "resize with active transactions");

  error::success_or_throw(::mdbx_env_set_geometry(
      env.handle, -1, -1, intptr_t(new_size), -1, -1, -1));
  env.config.map_size = new_size;
  NOTICE("%s: map size changed to %zu", env.pathname.c_str(), new_size);
}

size_t environment::get_mapsize() const {
  return size_t(get_info().mi_geo.upper);
}

stat environment::get_stat() const {
  ::mapkv::stat result;
  error::success_or_throw(
      ::mdbx_env_stat_ex(state().handle, nullptr, &result, sizeof(result)));
  return result;
}

info environment::get_info() const {
  ::mapkv::info result;
  error::success_or_throw(
      ::mdbx_env_info_ex(state().handle, nullptr, &result, sizeof(result)));
  return result;
}

env_flags environment::get_flags() const {
  unsigned flags;
  error::success_or_throw(::mdbx_env_get_flags(state().handle, &flags));
  return env_flags(flags) & known_flags;
}

void environment::set_flags(env_flags flags, bool on_off) {
  detail::env_state &env = state();
  if (MAPKV_UNLIKELY(unsigned(flags & ~runtime_flags) != 0))
    error::throw_exception(errc::invalid_config,
                           "only no_sync, no_meta_sync and no_mem_init");

  detail::writer_gate::hold writer;
  if (env.writer_owner.load() != std::this_thread::get_id())
    writer = detail::writer_gate::hold(env.writer);
  error::success_or_throw(
      ::mdbx_env_set_flags(env.handle, MDBX_env_flags_t(flags), on_off));
  DEBUG("flags 0x%x turned %s", unsigned(flags), on_off ? "on" : "off");
}

bool environment::sync(bool force) {
  return !error::boolean_or_throw(
      ::mdbx_env_sync_ex(state().handle, force, false));
}

path environment::get_path() const {
  const char *pathname;
  error::success_or_throw(::mdbx_env_get_path(state().handle, &pathname));
  return path(pathname);
}

size_t environment::max_key_size(db_flags flags) const {
  const int size = ::mdbx_env_get_maxkeysize_ex(state().handle,
                                                MDBX_db_flags_t(flags));
  if (MAPKV_UNLIKELY(size < 0))
    error::throw_exception(errc::invalid, "key size limit");
  return size_t(size);
}

unsigned environment::active_readers() const noexcept {
  return state_ ? state_->active_readers.load() : 0;
}

bool environment::has_active_writer() const noexcept {
  return state_ && state_->active_writers.load() != 0;
}

void environment::copy(const path &destination, bool compactify) {
  error::success_or_throw(
      ::mdbx_env_copy(state().handle, destination.c_str(),
                      compactify ? MDBX_CP_COMPACT : MDBX_CP_DEFAULTS));
  VERBOSE("copied to %s%s", destination.c_str(),
          compactify ? " compacting" : "");
}

bool environment::remove(const path &pathname) {
  return !error::boolean_or_throw(
      ::mdbx_env_delete(pathname.c_str(), MDBX_ENV_JUST_DELETE));
}

} // namespace mapkv
