//
// Copyright (c) 2020-2022, Leonid Yuriev <leo@yuriev.ru>.
// SPDX-License-Identifier: Apache-2.0
//
// Non-inline part of the mapkv C++ API: errors, slices and printing.
//

#include "internals.h++"

#include <algorithm>
#include <iomanip>
#include <system_error>

namespace mapkv {

//------------------------------------------------------------------------------

__cold exception::exception(const ::mapkv::error &error) noexcept
    : base(error.message()), error_(error) {}

__cold exception::exception(const ::mapkv::error &error,
                            const char *context) noexcept
    : base(context ? error.message() + ": " + context : error.message()),
      error_(error) {}

__cold exception::~exception() noexcept {}

#define DEFINE_EXCEPTION(NAME)                                                 \
  __cold NAME::NAME(const ::mapkv::error &rc) : exception(rc) {}               \
  __cold NAME::NAME(const ::mapkv::error &rc, const char *context)             \
      : exception(rc, context) {}                                              \
  __cold NAME::~NAME() noexcept {}

DEFINE_EXCEPTION(not_found)
DEFINE_EXCEPTION(key_exists)
DEFINE_EXCEPTION(map_full)
DEFINE_EXCEPTION(busy)
DEFINE_EXCEPTION(reader_slots_exhausted)
DEFINE_EXCEPTION(read_only_environment)
DEFINE_EXCEPTION(db_flags_mismatch)
DEFINE_EXCEPTION(too_many_dbs)
DEFINE_EXCEPTION(invalid_config)
DEFINE_EXCEPTION(encoding_error)
DEFINE_EXCEPTION(io_error)
DEFINE_EXCEPTION(txn_error)
DEFINE_EXCEPTION(invalid_state)
DEFINE_EXCEPTION(bad_lifetime)

#undef DEFINE_EXCEPTION

__cold error error::from_native(int native) noexcept {
  switch (native) {
  case MDBX_SUCCESS:
    return error(errc::success);
  case MDBX_NOTFOUND:
  case MDBX_ENODATA:
    return error(errc::not_found, native);
  case MDBX_KEYEXIST:
  case MDBX_EKEYMISMATCH:
    return error(errc::key_exists, native);
  case MDBX_MAP_FULL:
  case MDBX_UNABLE_EXTEND_MAPSIZE:
    return error(errc::map_full, native);
  case MDBX_BUSY:
  case MDBX_TXN_OVERLAPPING:
  case MDBX_THREAD_MISMATCH:
    return error(errc::busy, native);
  case MDBX_READERS_FULL:
    return error(errc::reader_slots_exhausted, native);
  case MDBX_EACCESS:
  case MDBX_EROFS:
    return error(errc::read_only_environment, native);
  case MDBX_INCOMPATIBLE:
    return error(errc::db_flags_mismatch, native);
  case MDBX_DBS_FULL:
    return error(errc::too_many_dbs, native);
  case MDBX_EINVAL:
  case MDBX_BAD_DBI:
  case MDBX_BAD_VALSIZE:
  case MDBX_EMULTIVAL:
  case MDBX_EPERM:
  case MDBX_DANGLING_DBI:
    return error(errc::invalid, native);
  case MDBX_BAD_TXN:
  case MDBX_BAD_RSLOT:
  case MDBX_TXN_FULL:
  case MDBX_CURSOR_FULL:
  case MDBX_PAGE_FULL:
  case MDBX_PAGE_NOTFOUND:
  case MDBX_CORRUPTED:
  case MDBX_PANIC:
  case MDBX_PROBLEM:
  case MDBX_EBADSIGN:
  case MDBX_WANNA_RECOVERY:
  case MDBX_VERSION_MISMATCH:
  case MDBX_INVALID:
  case MDBX_TOO_LARGE:
  case MDBX_BACKLOG_DEPLETED:
  case MDBX_OUSTED:
  case MDBX_MVCC_RETARDED:
    return error(errc::txn_error, native);
  default:
    return error(errc::io_error, native);
  }
}

__cold const char *error::what() const noexcept {
  switch (code()) {
#define ERROR_CASE(CODE)                                                       \
  case errc::CODE:                                                             \
    return #CODE
    ERROR_CASE(success);
    ERROR_CASE(not_found);
    ERROR_CASE(key_exists);
    ERROR_CASE(map_full);
    ERROR_CASE(busy);
    ERROR_CASE(reader_slots_exhausted);
    ERROR_CASE(read_only_environment);
    ERROR_CASE(db_flags_mismatch);
    ERROR_CASE(too_many_dbs);
    ERROR_CASE(invalid_config);
    ERROR_CASE(encoding_error);
    ERROR_CASE(io_error);
    ERROR_CASE(txn_error);
    ERROR_CASE(invalid);
    ERROR_CASE(bad_lifetime);
#undef ERROR_CASE
  }
  return "unknown";
}

__cold std::string error::message() const {
  std::string result("mapkv::");
  result += what();
  if (native_code() != MDBX_SUCCESS) {
    char buf[1024];
    const char *msg = ::mdbx_strerror_r(native_code(), buf, sizeof(buf));
    result += " (";
    result += msg ? msg : "unknown";
    result += ")";
  }
  return result;
}

namespace {

[[noreturn]] __cold void raise_exception(const error &trouble,
                                        const char *context) {
  if (trouble.native_code() == MDBX_ENOMEM)
    throw std::bad_alloc();
  switch (trouble.code()) {
  case errc::success:
    throw std::logic_error("mapkv::success is not an error");
#define CASE_EXCEPTION(NAME, CODE)                                             \
  case errc::CODE:                                                             \
    throw NAME(trouble, context)
    CASE_EXCEPTION(not_found, not_found);
    CASE_EXCEPTION(key_exists, key_exists);
    CASE_EXCEPTION(map_full, map_full);
    CASE_EXCEPTION(busy, busy);
    CASE_EXCEPTION(reader_slots_exhausted, reader_slots_exhausted);
    CASE_EXCEPTION(read_only_environment, read_only_environment);
    CASE_EXCEPTION(db_flags_mismatch, db_flags_mismatch);
    CASE_EXCEPTION(too_many_dbs, too_many_dbs);
    CASE_EXCEPTION(invalid_config, invalid_config);
    CASE_EXCEPTION(encoding_error, encoding_error);
    CASE_EXCEPTION(io_error, io_error);
    CASE_EXCEPTION(txn_error, txn_error);
    CASE_EXCEPTION(invalid_state, invalid);
    CASE_EXCEPTION(bad_lifetime, bad_lifetime);
#undef CASE_EXCEPTION
  }
  throw exception(trouble, context);
}

} // namespace

__cold void error::throw_exception() const {
  raise_exception(*this, nullptr);
}

__cold void error::throw_exception(errc code, int native) {
  raise_exception(error(code, native), nullptr);
}

__cold void error::throw_exception(errc code, const char *context) {
  raise_exception(error(code), context);
}

__cold ::std::ostream &operator<<(::std::ostream &out, const errc &it) {
  return out << error(it).what();
}

__cold ::std::ostream &operator<<(::std::ostream &out, const error &it) {
  return out << it.message();
}

//------------------------------------------------------------------------------

bool slice::is_valid_utf8() const noexcept {
  // http://www.unicode.org/versions/Unicode6.0.0/ch03.pdf - page 94
  auto src = byte_ptr();
  const auto end = src + length();
  while (src < end) {
    const byte lead = *src;
    size_t tail;
    byte second_from = 0x80, second_to = 0xBF;
    if (lead < 0x80) {
      src += 1;
      continue;
    } else if (lead >= 0xC2 && lead <= 0xDF)
      tail = 1;
    else if (lead == 0xE0) {
      tail = 2;
      second_from = 0xA0;
    } else if (lead == 0xED) {
      tail = 2;
      second_to = 0x9F;
    } else if (lead >= 0xE1 && lead <= 0xEF)
      tail = 2;
    else if (lead == 0xF0) {
      tail = 3;
      second_from = 0x90;
    } else if (lead == 0xF4) {
      tail = 3;
      second_to = 0x8F;
    } else if (lead >= 0xF1 && lead <= 0xF3)
      tail = 3;
    else
      return false;

    if (MAPKV_UNLIKELY(size_t(end - src) <= tail))
      return false;
    if (MAPKV_UNLIKELY(src[1] < second_from || src[1] > second_to))
      return false;
    for (size_t i = 2; i <= tail; ++i)
      if (MAPKV_UNLIKELY(src[i] < 0x80 || src[i] > 0xBF))
        return false;
    src += tail + 1;
  }
  return true;
}

int slice::compare_lexicographically(const slice &a, const slice &b) noexcept {
  const size_t shortest = std::min(a.size(), b.size());
  const int diff = shortest ? std::memcmp(a.data(), b.data(), shortest) : 0;
  if (diff)
    return diff;
  return (a.size() > b.size()) - (a.size() < b.size());
}

__cold ::std::ostream &operator<<(::std::ostream &out, const slice &it) {
  out << "{";
  if (it.is_null())
    out << "NULL";
  else if (it.empty())
    out << "EMPTY";
  else {
    const size_t head = std::min(it.length(), size_t(64));
    const slice root(it.data(), head);
    out << it.length() << ".";
    bool printable = root.is_valid_utf8();
    for (size_t i = 0; printable && i < head; ++i)
      printable = root.byte_ptr()[i] >= 0x20 && root.byte_ptr()[i] != 0x7f;
    if (printable)
      (out << "\"").write(root.char_ptr(), root.length()) << "\"";
    else {
      const auto flags = out.flags();
      const auto fill = out.fill();
      out << std::hex << std::setfill('0');
      for (size_t i = 0; i < head; ++i)
        out << std::setw(2) << unsigned(root.byte_ptr()[i]);
      out.flags(flags);
      out.fill(fill);
    }
    if (head < it.length())
      out << "...";
  }
  return out << "}";
}

//------------------------------------------------------------------------------

value_view::value_view(
    const slice &bytes,
    ::std::shared_ptr<const detail::lifetime_token> owner) noexcept
    : bytes_(bytes), owner_(::std::move(owner)) {}

bool value_view::is_valid() const noexcept {
  return owner_ && owner_->alive();
}

const slice &value_view::bytes() const {
  if (MAPKV_UNLIKELY(!owner_))
    error::throw_exception(errc::bad_lifetime, "empty value view");
  owner_->ensure_alive("value view outlived its transaction or cursor");
  return bytes_;
}

//------------------------------------------------------------------------------

__cold ::std::ostream &operator<<(::std::ostream &out, const db_flags &it) {
  if (it == db_flags::defaults)
    return out << "defaults";

  const char *comma = "";
  const auto print = [&](db_flags flag, const char *name) {
    if (is_set(it, flag)) {
      out << comma << name;
      comma = "|";
    }
  };
  print(db_flags::allow_dups, "allow_dups");
  print(db_flags::integer_key, "integer_key");
  print(db_flags::integer_dups, "integer_dups");
  print(db_flags::dup_fixed, "dup_fixed");
  print(db_flags::reverse_key, "reverse_key");
  print(db_flags::reverse_dups, "reverse_dups");
  return out;
}

__cold ::std::ostream &operator<<(::std::ostream &out, const env_flags &it) {
  if (it == env_flags::defaults)
    return out << "sync_durable";

  const char *comma = "";
  const auto print = [&](env_flags flag, const char *name) {
    if (is_set(it, flag)) {
      out << comma << name;
      comma = "|";
    }
  };
  print(env_flags::no_sync, "no_sync");
  print(env_flags::no_meta_sync, "no_meta_sync");
  print(env_flags::no_mem_init, "no_mem_init");
  print(env_flags::read_only, "read_only");
  print(env_flags::no_sub_dir, "no_sub_dir");
  print(env_flags::write_map, "write_map");
  print(env_flags::exclusive, "exclusive");
  print(env_flags::no_readahead, "no_readahead");
  return out;
}

__cold ::std::ostream &operator<<(::std::ostream &out,
                                  const environment::config &it) {
  return out << "{map_size " << it.map_size << ", max_dbs " << it.max_dbs
             << ", max_readers " << it.max_readers << ", flags " << it.flags
             << "}";
}

} // namespace mapkv
