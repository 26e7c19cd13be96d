//
// Copyright (c) 2020-2022, Leonid Yuriev <leo@yuriev.ru>.
// SPDX-License-Identifier: Apache-2.0
//
// Cursors and the lazy ranges built on them.
//

#include "internals.h++"

namespace mapkv {

cursor::cursor(std::shared_ptr<detail::txn_context> txn, const database &db)
    : txn_(std::move(txn)), db_(db) {
  if (MAPKV_UNLIKELY(!txn_))
    error::throw_exception(errc::bad_lifetime, "unbound database");
  const MDBX_dbi dbi = txn_->resolve(db_);
  error::success_or_throw(::mdbx_cursor_open(txn_->handle, dbi, &handle_));
  lifetime_ = std::make_shared<detail::lifetime_token>(txn_->lifetime);
}

cursor::cursor(cursor &&other) noexcept
    : txn_(std::move(other.txn_)), db_(other.db_), handle_(other.handle_),
      lifetime_(std::move(other.lifetime_)), positioned_(other.positioned_) {
  other.handle_ = nullptr;
  other.positioned_ = false;
}

cursor &cursor::operator=(cursor &&other) noexcept {
  if (this != &other) {
    close();
    txn_ = std::move(other.txn_);
    db_ = other.db_;
    handle_ = other.handle_;
    lifetime_ = std::move(other.lifetime_);
    positioned_ = other.positioned_;
    other.handle_ = nullptr;
    other.positioned_ = false;
  }
  return *this;
}

cursor::~cursor() noexcept { close(); }

void cursor::close() noexcept {
  if (handle_) {
    ::mdbx_cursor_close(handle_);
    handle_ = nullptr;
  }
  if (lifetime_)
    lifetime_->expire();
  positioned_ = false;
}

MDBX_cursor *cursor::handle(const char *who) const {
  if (MAPKV_UNLIKELY(!handle_ || !lifetime_))
    error::throw_exception(errc::bad_lifetime, who);
  lifetime_->ensure_alive(who);
  txn_->ensure_active(who);
  return handle_;
}

bool cursor::move(MDBX_cursor_op op, slice *key, slice *value,
                  bool throw_notfound) {
  MDBX_cursor *const c = handle("cursor used after its transaction or close");
  slice dummy_key, dummy_value;
  const int rc = ::mdbx_cursor_get(c, key ? key : &dummy_key,
                                   value ? value : &dummy_value, op);
  switch (rc) {
  case MDBX_SUCCESS:
    positioned_ = true;
    return true;
  case MDBX_NOTFOUND:
  case MDBX_ENODATA:
    switch (op) {
    case MDBX_SET:
    case MDBX_SET_KEY:
    case MDBX_SET_RANGE:
    case MDBX_GET_BOTH:
    case MDBX_GET_BOTH_RANGE:
    case MDBX_FIRST:
    case MDBX_LAST:
      // a missed seek leaves no meaningful position
      positioned_ = false;
      break;
    default:
      positioned_ = ::mdbx_cursor_eof(c) == MDBX_RESULT_FALSE;
    }
    if (throw_notfound)
      error::throw_exception(errc::not_found, rc);
    return false;
  default:
    error::from_native(rc).throw_exception();
  }
}

cursor_item cursor::make_item(const slice &key, const slice &value) const {
  // the pages outlive the cursor, but not the next write
  return cursor_item(value_view(key, txn_->data_epoch),
                     value_view(value, txn_->data_epoch));
}

int cursor::compare_keys(const slice &a, const slice &b) const {
  MDBX_cursor *const c = handle("cursor used after its transaction or close");
  return ::mdbx_cmp(::mdbx_cursor_txn(c), ::mdbx_cursor_dbi(c), &a, &b);
}

bool cursor::to_first(bool throw_notfound) {
  return move(MDBX_FIRST, nullptr, nullptr, throw_notfound);
}

bool cursor::to_last(bool throw_notfound) {
  return move(MDBX_LAST, nullptr, nullptr, throw_notfound);
}

bool cursor::to_key(const slice &key, bool throw_notfound) {
  slice found(key);
  return move(MDBX_SET_KEY, &found, nullptr, throw_notfound);
}

bool cursor::to_range(const slice &key, bool throw_notfound) {
  slice found(key);
  return move(MDBX_SET_RANGE, &found, nullptr, throw_notfound);
}

bool cursor::to_item(const slice &key, const slice &value,
                     bool throw_notfound) {
  slice found_key(key), found_value(value);
  return move(MDBX_GET_BOTH, &found_key, &found_value, throw_notfound);
}

bool cursor::next(bool throw_notfound) {
  return move(MDBX_NEXT, nullptr, nullptr, throw_notfound);
}

bool cursor::prev(bool throw_notfound) {
  return move(MDBX_PREV, nullptr, nullptr, throw_notfound);
}

bool cursor::next_item(bool throw_notfound) {
  return move(MDBX_NEXT_DUP, nullptr, nullptr, throw_notfound);
}

bool cursor::prev_item(bool throw_notfound) {
  return move(MDBX_PREV_DUP, nullptr, nullptr, throw_notfound);
}

bool cursor::to_first_item(bool throw_notfound) {
  return move(MDBX_FIRST_DUP, nullptr, nullptr, throw_notfound);
}

bool cursor::to_last_item(bool throw_notfound) {
  return move(MDBX_LAST_DUP, nullptr, nullptr, throw_notfound);
}

cursor_item cursor::current() const {
  MDBX_cursor *const c = handle("cursor used after its transaction or close");
  if (MAPKV_UNLIKELY(!positioned_))
    error::throw_exception(errc::invalid, "cursor is not positioned");
  slice key, value;
  const int rc = ::mdbx_cursor_get(c, &key, &value, MDBX_GET_CURRENT);
  if (MAPKV_UNLIKELY(rc == MDBX_NOTFOUND || rc == MDBX_ENODATA))
    error::throw_exception(errc::invalid, "cursor is not positioned");
  error::success_or_throw(rc);
  return make_item(key, value);
}

std::vector<byte> cursor::current_key() const {
  return current().key().bytes().as_bytes();
}

void cursor::add_item(const slice &value) {
  MDBX_cursor *const c = handle("cursor used after its transaction or close");
  if (MAPKV_UNLIKELY(!db_.allows_dups()))
    error::throw_exception(errc::invalid, "duplicates are not allowed");
  const std::vector<byte> copy = current_key();
  slice key(copy.data(), copy.size()), data(value);
  txn_->touch();
  error::success_or_throw(::mdbx_cursor_put(c, &key, &data, MDBX_NODUPDATA));
  positioned_ = true;
}

void cursor::replace(const slice &value) {
  MDBX_cursor *const c = handle("cursor used after its transaction or close");
  const std::vector<byte> copy = current_key();
  slice key(copy.data(), copy.size()), data(value);
  txn_->touch();
  if (!db_.allows_dups()) {
    error::success_or_throw(::mdbx_cursor_put(c, &key, &data, MDBX_CURRENT));
    return;
  }

  // a duplicate changes its place among the others
  error::success_or_throw(::mdbx_cursor_del(c, MDBX_CURRENT));
  const int rc = ::mdbx_cursor_put(c, &key, &data, MDBX_NODUPDATA);
  if (rc == MDBX_KEYEXIST) {
    slice found_key(key), found_value(value);
    error::success_or_throw(
        ::mdbx_cursor_get(c, &found_key, &found_value, MDBX_GET_BOTH));
  } else
    error::success_or_throw(rc);
  positioned_ = true;
}

void cursor::del_item() {
  MDBX_cursor *const c = handle("cursor used after its transaction or close");
  if (MAPKV_UNLIKELY(!positioned_))
    error::throw_exception(errc::invalid, "cursor is not positioned");
  txn_->touch();
  error::success_or_throw(::mdbx_cursor_del(c, MDBX_CURRENT));
  positioned_ = ::mdbx_cursor_eof(c) == MDBX_RESULT_FALSE;
}

void cursor::del_all() {
  MDBX_cursor *const c = handle("cursor used after its transaction or close");
  if (MAPKV_UNLIKELY(!positioned_))
    error::throw_exception(errc::invalid, "cursor is not positioned");
  txn_->touch();
  error::success_or_throw(::mdbx_cursor_del(c, MDBX_ALLDUPS));
  positioned_ = ::mdbx_cursor_eof(c) == MDBX_RESULT_FALSE;
}

size_t cursor::item_count() const {
  MDBX_cursor *const c = handle("cursor used after its transaction or close");
  if (MAPKV_UNLIKELY(!positioned_))
    error::throw_exception(errc::invalid, "cursor is not positioned");
  size_t count = 0;
  error::success_or_throw(::mdbx_cursor_count(c, &count));
  return count;
}

//------------------------------------------------------------------------------

item_range::item_range(cursor &&source, kind mode, const slice &lower,
                       const slice &upper)
    : walk_(new walk{std::move(source), mode, lower.as_bytes(),
                     upper.as_bytes(), cursor_item(), false, false}) {}

item_range::iterator item_range::begin() {
  if (MAPKV_UNLIKELY(!walk_))
    error::throw_exception(errc::bad_lifetime, "moved-from range");
  if (!walk_->started)
    start(*walk_);
  return walk_->finished ? end() : iterator(walk_.get());
}

void item_range::start(walk &state) {
  state.started = true;
  slice key, value;
  bool found;
  switch (state.mode) {
  case kind::all:
  case kind::to:
    found = state.source.move(MDBX_FIRST, &key, &value, false);
    break;
  case kind::duplicates:
    key = slice(state.lower.data(), state.lower.size());
    found = state.source.move(MDBX_SET_KEY, &key, &value, false);
    break;
  default:
    key = slice(state.lower.data(), state.lower.size());
    found = state.source.move(MDBX_SET_RANGE, &key, &value, false);
  }
  accept(state, found, key, value);
}

void item_range::advance(walk &state) {
  if (state.finished)
    return;
  slice key, value;
  const bool found = state.source.move(
      state.mode == kind::duplicates ? MDBX_NEXT_DUP : MDBX_NEXT, &key,
      &value, false);
  accept(state, found, key, value);
}

void item_range::accept(walk &state, bool found, const slice &key,
                        const slice &value) {
  if (found && in_range(state, key)) {
    state.current = state.source.make_item(key, value);
    return;
  }
  state.finished = true;
  state.current = cursor_item();
}

bool item_range::in_range(const walk &state, const slice &key) {
  const slice upper(state.upper.data(), state.upper.size());
  switch (state.mode) {
  case kind::to:
  case kind::half_open:
    return state.source.compare_keys(key, upper) < 0;
  case kind::inclusive:
    return state.source.compare_keys(key, upper) <= 0;
  default:
    return true;
  }
}

//------------------------------------------------------------------------------

item_range bound_db::make_range(item_range::kind kind, const slice &lower,
                                const slice &upper) const {
  bool absent = false;
  if (txn_)
    txn_->resolve(db_, &absent);
  if (absent) {
    // the table is not in this snapshot yet
    item_range empty(cursor(), kind, lower, upper);
    empty.walk_->started = empty.walk_->finished = true;
    return empty;
  }
  return item_range(new_cursor(), kind, lower, upper);
}

item_range bound_db::iter() const {
  return make_range(item_range::kind::all, slice(), slice());
}

item_range bound_db::item_iter(const slice &key) const {
  return make_range(item_range::kind::duplicates, key, slice());
}

item_range bound_db::keyrange_from(const slice &lower) const {
  return make_range(item_range::kind::from, lower, slice());
}

item_range bound_db::keyrange_to(const slice &upper) const {
  return make_range(item_range::kind::to, slice(), upper);
}

item_range bound_db::keyrange(const slice &lower, const slice &upper) const {
  return make_range(item_range::kind::inclusive, lower, upper);
}

item_range bound_db::keyrange_from_to(const slice &lower,
                                      const slice &upper) const {
  return make_range(item_range::kind::half_open, lower, upper);
}

} // namespace mapkv
