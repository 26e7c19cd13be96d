//
// Copyright (c) 2020-2022, Leonid Yuriev <leo@yuriev.ru>.
// SPDX-License-Identifier: Apache-2.0
//
// Transactions and the databases bound to them.
//

#include "internals.h++"

namespace mapkv {
namespace detail {

txn_context::~txn_context() noexcept {
  if (MAPKV_UNLIKELY(is_running())) {
    const int rc = abort_now();
    if (MAPKV_UNLIKELY(rc != MDBX_SUCCESS))
      ERROR("mdbx_txn_abort: %s (%d)", mdbx_strerror(rc), rc);
  }
}

int txn_context::abort_now() noexcept {
  if (MAPKV_UNLIKELY(foreign_writer()))
    return MDBX_THREAD_MISMATCH;
  const int rc = ::mdbx_txn_abort(handle);
  if (MAPKV_UNLIKELY(rc == MDBX_THREAD_MISMATCH))
    return rc;
  // the engine has ended the nested transaction together with this one
  if (child)
    child->finish(aborted);
  finish(aborted);
  return rc;
}

MDBX_txn *txn_context::ensure_active(const char *who) const {
  if (MAPKV_UNLIKELY(status != active))
    error::throw_exception(errc::bad_lifetime, who);
  if (MAPKV_UNLIKELY(child != nullptr))
    error::throw_exception(errc::busy, "a nested transaction is running");
  return handle;
}

MDBX_dbi txn_context::resolve(const database &db, bool *absent) {
  MDBX_txn *const txn = ensure_active("transaction already ended");
  if (MAPKV_UNLIKELY(db.owner_ != env.get()))
    error::throw_exception(errc::invalid,
                           "database of another or no environment");
  if (db.slot_ < dbi_cache.size() && dbi_cache[db.slot_] != 0)
    return dbi_cache[db.slot_];

  const db_entry entry = env->entry(db.slot_);
  unsigned flags = unsigned(entry.flags);
  if (!read_only)
    flags |= MDBX_CREATE;

  MDBX_dbi dbi = 0;
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif
  const int rc = ::mdbx_dbi_open_ex(
      txn, entry.is_default ? nullptr : entry.name.c_str(),
      MDBX_db_flags_t(flags), &dbi, entry.key_thunk, entry.dup_thunk);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
  if (MAPKV_UNLIKELY(rc != MDBX_SUCCESS)) {
    const error trouble = error::from_native(rc);
    DEBUG("mdbx_dbi_open_ex('%s'): %s", entry.name.c_str(),
          trouble.message().c_str());
    if (absent && read_only && rc == MDBX_NOTFOUND) {
      *absent = true;
      return 0;
    }
    if (rc == MDBX_EINVAL)
      error::throw_exception(errc::db_flags_mismatch, rc);
    trouble.throw_exception();
  }

  env->mark_engine_bound(db.slot_);
  if (db.slot_ >= dbi_cache.size())
    dbi_cache.resize(db.slot_ + 1, 0);
  dbi_cache[db.slot_] = dbi;
  return dbi;
}

void txn_context::finish(state final_state) noexcept {
  if (MAPKV_UNLIKELY(!is_running()))
    return;
  status = final_state;
  handle = nullptr;
  lifetime->expire();
  dbi_cache.clear();

  if (parent) {
    parent->child = nullptr;
    parent.reset();
  } else if (read_only)
    --env->active_readers;
  else {
    env->writer_owner.store(std::thread::id());
    --env->active_writers;
    writer_hold.release();
  }
}

} // namespace detail

//------------------------------------------------------------------------------

transaction::transaction(std::shared_ptr<detail::txn_context> ctx) noexcept
    : ctx_(std::move(ctx)) {}

namespace {

void abandon(const std::shared_ptr<detail::txn_context> &ctx) noexcept {
  if (!ctx || !ctx->is_running())
    return;
  const int rc = ctx->abort_now();
  if (MAPKV_UNLIKELY(rc != MDBX_SUCCESS))
    ERROR("mdbx_txn_abort: %s (%d)", mdbx_strerror(rc), rc);
}

} // namespace

transaction &transaction::operator=(transaction &&other) noexcept {
  if (this != &other) {
    abandon(ctx_);
    ctx_ = std::move(other.ctx_);
  }
  return *this;
}

transaction::~transaction() noexcept { abandon(ctx_); }

bool transaction::is_active() const noexcept {
  return ctx_ && ctx_->status == detail::txn_context::active;
}

bool transaction::is_read_only() const {
  if (MAPKV_UNLIKELY(!ctx_))
    error::throw_exception(errc::bad_lifetime, "empty transaction");
  return ctx_->read_only;
}

uint64_t transaction::id() const {
  if (MAPKV_UNLIKELY(!ctx_))
    error::throw_exception(errc::bad_lifetime, "empty transaction");
  return ::mdbx_txn_id(ctx_->ensure_active("transaction already ended"));
}

MDBX_txn *transaction::native_handle() const noexcept {
  return ctx_ ? ctx_->handle : nullptr;
}

bound_db transaction::bind(const database &db) const noexcept {
  return bound_db(ctx_, db);
}

transaction transaction::start_nested() {
  if (MAPKV_UNLIKELY(!ctx_))
    error::throw_exception(errc::bad_lifetime, "empty transaction");
  MDBX_txn *const txn = ctx_->ensure_active("transaction already ended");
  if (MAPKV_UNLIKELY(ctx_->read_only))
    error::throw_exception(errc::txn_error, "nested read-only transaction");

  auto nested = std::make_shared<detail::txn_context>(ctx_->env, false,
                                                      ctx_->lifetime);
  nested->parent = ctx_;
  const int rc = ::mdbx_txn_begin(ctx_->env->handle, txn, MDBX_TXN_READWRITE,
                                  &nested->handle);
  if (MAPKV_UNLIKELY(rc != MDBX_SUCCESS)) {
    nested->finish(detail::txn_context::failed);
    error::success_or_throw(rc);
  }
  ctx_->child = nested.get();
  // the parent pages are shadowed by the nested transaction
  ctx_->touch();
  TRACE("nested txn %" PRIu64 " started", ::mdbx_txn_id(nested->handle));
  return transaction(std::move(nested));
}

void transaction::commit() {
  if (MAPKV_UNLIKELY(!ctx_))
    error::throw_exception(errc::bad_lifetime, "empty transaction");
  MDBX_txn *const txn = ctx_->ensure_active("commit of an ended transaction");
  if (MAPKV_UNLIKELY(ctx_->foreign_writer()))
    error::throw_exception(errc::busy, "commit from a foreign thread");
  const uint64_t txnid = ::mdbx_txn_id(txn);
  const int rc = ::mdbx_txn_commit(txn);
  if (MAPKV_UNLIKELY(rc == MDBX_THREAD_MISMATCH))
    error::throw_exception(errc::busy, "commit from a foreign thread");
  if (MAPKV_LIKELY(rc == MDBX_SUCCESS)) {
    ctx_->finish(detail::txn_context::committed);
    TRACE("txn %" PRIu64 " committed", txnid);
    return;
  }

  ctx_->finish(detail::txn_context::failed);
  if (rc == MDBX_RESULT_TRUE) {
    // the engine aborted it because of an earlier failed write
    WARNING("txn %" PRIu64 " rolled back instead of commit", txnid);
    error::throw_exception(errc::txn_error, "rolled back after a failure");
  }
  const error trouble = error::from_native(rc);
  WARNING("txn %" PRIu64 " commit failed: %s", txnid,
          trouble.message().c_str());
  switch (trouble.code()) {
  case errc::map_full:
  case errc::busy:
    trouble.throw_exception();
  default:
    error::throw_exception(errc::txn_error, rc);
  }
}

void transaction::abort() {
  if (MAPKV_UNLIKELY(!ctx_))
    error::throw_exception(errc::bad_lifetime, "empty transaction");
  switch (ctx_->status) {
  case detail::txn_context::failed:
    ctx_->status = detail::txn_context::aborted;
    return;
  case detail::txn_context::committed:
  case detail::txn_context::aborted:
    error::throw_exception(errc::bad_lifetime, "abort of an ended transaction");
  default:
    break;
  }
  const int rc = ctx_->abort_now();
  if (MAPKV_UNLIKELY(rc == MDBX_THREAD_MISMATCH))
    error::throw_exception(errc::busy, "abort from a foreign thread");
  error::success_or_throw(rc);
}

void transaction::reset() {
  if (MAPKV_UNLIKELY(!ctx_ || !ctx_->read_only))
    error::throw_exception(errc::invalid, "reset of a write transaction");
  MDBX_txn *const txn = ctx_->ensure_active("reset of an ended transaction");
  error::success_or_throw(::mdbx_txn_reset(txn));
  ctx_->status = detail::txn_context::parked;
  ctx_->lifetime->expire();
  ctx_->dbi_cache.clear();
}

void transaction::renew() {
  if (MAPKV_UNLIKELY(!ctx_ || ctx_->status != detail::txn_context::parked))
    error::throw_exception(errc::invalid, "renew of a non-parked transaction");
  error::success_or_throw(::mdbx_txn_renew(ctx_->handle));
  ctx_->lifetime = std::make_shared<detail::lifetime_token>();
  ctx_->data_epoch = std::make_shared<detail::lifetime_token>(ctx_->lifetime);
  ctx_->status = detail::txn_context::active;
}

//------------------------------------------------------------------------------

namespace {

detail::txn_context &context(const std::shared_ptr<detail::txn_context> &txn) {
  if (MAPKV_UNLIKELY(!txn))
    error::throw_exception(errc::bad_lifetime, "unbound database");
  return *txn;
}

} // namespace

value_view bound_db::get_view(const slice &key) const {
  detail::txn_context &txn = context(txn_);
  const MDBX_dbi dbi = txn.resolve(db_);
  slice value;
  error::success_or_throw(::mdbx_get(txn.handle, dbi, &key, &value));
  return value_view(value, txn.data_epoch);
}

bool bound_db::contains(const slice &key) const {
  detail::txn_context &txn = context(txn_);
  bool absent = false;
  const MDBX_dbi dbi = txn.resolve(db_, &absent);
  if (absent)
    return false;
  slice value;
  return error::found_or_throw(::mdbx_get(txn.handle, dbi, &key, &value));
}

void bound_db::set(const slice &key, const slice &value) {
  detail::txn_context &txn = context(txn_);
  const MDBX_dbi dbi = txn.resolve(db_);
  slice data(value);
  txn.touch();
  const int rc = ::mdbx_put(txn.handle, dbi, &key, &data, MDBX_UPSERT);
  if (rc == MDBX_KEYEXIST && db_.allows_dups())
    return;
  error::success_or_throw(rc);
}

void bound_db::insert(const slice &key, const slice &value) {
  detail::txn_context &txn = context(txn_);
  const MDBX_dbi dbi = txn.resolve(db_);
  slice data(value);
  txn.touch();
  error::success_or_throw(
      ::mdbx_put(txn.handle, dbi, &key, &data, MDBX_NOOVERWRITE));
}

void bound_db::append(const slice &key, const slice &value) {
  detail::txn_context &txn = context(txn_);
  const MDBX_dbi dbi = txn.resolve(db_);

  // The engine checks the order with its own comparator, so the check is
  // repeated here for custom orderings and for duplicates of the last key.
  cursor tail(txn_, db_);
  slice last_key, last_value;
  bool same_key = false;
  if (tail.move(MDBX_LAST, &last_key, &last_value, false)) {
    const int order = ::mdbx_cmp(txn.handle, dbi, &key, &last_key);
    if (MAPKV_UNLIKELY(order < 0 || (order == 0 && !db_.allows_dups())))
      error::throw_exception(errc::key_exists, "append out of order");
    if (order == 0) {
      tail.move(MDBX_LAST_DUP, &last_key, &last_value, true);
      if (MAPKV_UNLIKELY(::mdbx_dcmp(txn.handle, dbi, &value, &last_value) <=
                         0))
        error::throw_exception(errc::key_exists, "append out of order");
      same_key = true;
    }
  }
  tail.close();

  slice data(value);
  txn.touch();
  error::success_or_throw(::mdbx_put(txn.handle, dbi, &key, &data,
                                     same_key ? MDBX_APPENDDUP : MDBX_APPEND));
}

void bound_db::append_duplicate(const slice &key, const slice &value) {
  detail::txn_context &txn = context(txn_);
  const MDBX_dbi dbi = txn.resolve(db_);
  if (MAPKV_UNLIKELY(!db_.allows_dups()))
    error::throw_exception(errc::invalid, "duplicates are not allowed");

  cursor tail(txn_, db_);
  slice found_key(key), last_value;
  const bool present =
      tail.move(MDBX_SET_KEY, &found_key, &last_value, false);
  if (present) {
    tail.move(MDBX_LAST_DUP, &found_key, &last_value, true);
    if (MAPKV_UNLIKELY(::mdbx_dcmp(txn.handle, dbi, &value, &last_value) <= 0))
      error::throw_exception(errc::key_exists, "duplicate out of order");
  }
  tail.close();

  slice data(value);
  txn.touch();
  error::success_or_throw(::mdbx_put(txn.handle, dbi, &key, &data,
                                     present ? MDBX_APPENDDUP : MDBX_UPSERT));
}

void bound_db::del(const slice &key) {
  detail::txn_context &txn = context(txn_);
  const MDBX_dbi dbi = txn.resolve(db_);
  txn.touch();
  error::success_or_throw(::mdbx_del(txn.handle, dbi, &key, nullptr));
}

void bound_db::del_item(const slice &key, const slice &value) {
  detail::txn_context &txn = context(txn_);
  const MDBX_dbi dbi = txn.resolve(db_);
  txn.touch();
  error::success_or_throw(::mdbx_del(txn.handle, dbi, &key, &value));
}

void bound_db::clear() {
  detail::txn_context &txn = context(txn_);
  const MDBX_dbi dbi = txn.resolve(db_);
  txn.touch();
  error::success_or_throw(::mdbx_drop(txn.handle, dbi, false));
}

void bound_db::drop() {
  detail::txn_context &txn = context(txn_);
  if (MAPKV_UNLIKELY(db_.is_default()))
    error::throw_exception(errc::invalid, "drop of the default database");
  const MDBX_dbi dbi = txn.resolve(db_);
  txn.touch();
  error::success_or_throw(::mdbx_drop(txn.handle, dbi, true));
  txn.dbi_cache[db_.slot_] = 0;
}

stat bound_db::stat() const {
  detail::txn_context &txn = context(txn_);
  const MDBX_dbi dbi = txn.resolve(db_);
  ::mapkv::stat result;
  error::success_or_throw(
      ::mdbx_dbi_stat(txn.handle, dbi, &result, sizeof(result)));
  return result;
}

void bound_db::set_compare(comparator_ptr cmp) {
  context(txn_).ensure_active("transaction already ended");
  txn_->env->set_comparator(db_.slot_, false, cmp);
}

void bound_db::set_dupsort(comparator_ptr cmp) {
  context(txn_).ensure_active("transaction already ended");
  txn_->env->set_comparator(db_.slot_, true, cmp);
}

cursor bound_db::new_cursor() const { return cursor(txn_, db_); }

} // namespace mapkv
