//
// Copyright (c) 2020-2022, Leonid Yuriev <leo@yuriev.ru>.
// SPDX-License-Identifier: Apache-2.0
//
// The mapkv C++ API: transactional access layer over libmdbx.
//
// Requires C++17 (GNU C++ >= 8, clang >= 7).

/// \file mapkv.h++
/// \brief The mapkv C++ API header file

#pragma once

#if !defined(__cplusplus) || __cplusplus < 201703L
#error "C++17 or better is required"
#endif

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iterator>
#include <memory>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <mdbx.h>

#if defined(__GNUC__) || defined(__clang__)
#define MAPKV_LIKELY(cond) __builtin_expect(!!(cond), 1)
#define MAPKV_UNLIKELY(cond) __builtin_expect(!!(cond), 0)
#define MAPKV_API __attribute__((__visibility__("default")))
#else
#define MAPKV_LIKELY(cond) (!!(cond))
#define MAPKV_UNLIKELY(cond) (!!(cond))
#define MAPKV_API
#endif

/// \brief The mapkv C++ API namespace
namespace mapkv {

/// \defgroup cxx_api C++ API
/// @{

/// \brief The byte-like type that does not alias the char-like types.
using byte = unsigned char;

/// \brief The native file-system path type.
using path = ::std::filesystem::path;

/// \brief Unix-style permission bits of created files.
using permissions = ::mdbx_mode_t;

class environment;
class transaction;
class bound_db;
class cursor;
class value_view;
class item_range;

namespace detail {
class lifetime_token;
struct env_state;
struct txn_context;
} // namespace detail

//------------------------------------------------------------------------------

/// \brief Categories of failures reported by this API.
/// \details Every fallible operation throws an exception derived from
/// \ref exception whose \ref error carries one of these codes together with
/// the native libmdbx or system code, when there is one.
enum class errc : int {
  success = 0,
  not_found,
  key_exists,
  map_full,
  busy,
  reader_slots_exhausted,
  read_only_environment,
  db_flags_mismatch,
  too_many_dbs,
  invalid_config,
  encoding_error,
  io_error,
  txn_error,
  invalid,
  bad_lifetime
};

/// \brief Implements error information and throwing corresponding exceptions.
class MAPKV_API error {
  errc code_;
  int native_;

public:
  constexpr error(errc code, int native = 0) noexcept
      : code_(code), native_(native) {}
  error(const error &) = default;
  error(error &&) = default;
  error &operator=(const error &) = default;
  error &operator=(error &&) = default;

  /// \brief Classifies a libmdbx return code.
  static error from_native(int native) noexcept;

  constexpr friend bool operator==(const error &a, const error &b) noexcept {
    return a.code_ == b.code_ && a.native_ == b.native_;
  }
  constexpr friend bool operator!=(const error &a, const error &b) noexcept {
    return !(a == b);
  }

  constexpr bool is_success() const noexcept { return code_ == errc::success; }
  constexpr bool is_failure() const noexcept { return code_ != errc::success; }

  /// \brief Returns error category.
  constexpr errc code() const noexcept { return code_; }

  /// \brief Returns the libmdbx or system error code, zero if none.
  constexpr int native_code() const noexcept { return native_; }

  /// \brief Returns the short name of the error category.
  const char *what() const noexcept;

  /// \brief Returns a message including the libmdbx explanation, if any.
  ::std::string message() const;

  [[noreturn]] void throw_exception() const;
  [[noreturn]] static void throw_exception(errc code, int native = 0);
  [[noreturn]] static void throw_exception(errc code, const char *context);

  static inline void success_or_throw(int native) {
    if (MAPKV_UNLIKELY(native != MDBX_SUCCESS))
      from_native(native).throw_exception();
  }

  /// \brief Returns `false` for MDBX_NOTFOUND and MDBX_ENODATA,
  /// `true` for success, throws otherwise.
  static inline bool found_or_throw(int native) {
    switch (native) {
    case MDBX_SUCCESS:
      return true;
    case MDBX_NOTFOUND:
    case MDBX_ENODATA:
      return false;
    default:
      from_native(native).throw_exception();
    }
  }

  static inline bool boolean_or_throw(int native) {
    switch (native) {
    case MDBX_RESULT_FALSE:
      return false;
    case MDBX_RESULT_TRUE:
      return true;
    default:
      from_native(native).throw_exception();
    }
  }
};

MAPKV_API ::std::ostream &operator<<(::std::ostream &, const errc &);
MAPKV_API ::std::ostream &operator<<(::std::ostream &, const error &);

/// \brief Base class for all mapkv exceptions.
class MAPKV_API exception : public ::std::runtime_error {
  using base = ::std::runtime_error;
  ::mapkv::error error_;

public:
  exception(const ::mapkv::error &) noexcept;
  exception(const ::mapkv::error &, const char *context) noexcept;
  exception(const exception &) = default;
  exception(exception &&) = default;
  exception &operator=(const exception &) = default;
  exception &operator=(exception &&) = default;
  virtual ~exception() noexcept;
  const ::mapkv::error error() const noexcept { return error_; }
  errc code() const noexcept { return error_.code(); }
};

#define MAPKV_DECLARE_EXCEPTION(NAME)                                          \
  struct MAPKV_API NAME : public exception {                                   \
    NAME(const ::mapkv::error &);                                              \
    NAME(const ::mapkv::error &, const char *context);                         \
    virtual ~NAME() noexcept;                                                  \
  }
MAPKV_DECLARE_EXCEPTION(not_found);
MAPKV_DECLARE_EXCEPTION(key_exists);
MAPKV_DECLARE_EXCEPTION(map_full);
MAPKV_DECLARE_EXCEPTION(busy);
MAPKV_DECLARE_EXCEPTION(reader_slots_exhausted);
MAPKV_DECLARE_EXCEPTION(read_only_environment);
MAPKV_DECLARE_EXCEPTION(db_flags_mismatch);
MAPKV_DECLARE_EXCEPTION(too_many_dbs);
MAPKV_DECLARE_EXCEPTION(invalid_config);
MAPKV_DECLARE_EXCEPTION(encoding_error);
MAPKV_DECLARE_EXCEPTION(io_error);
MAPKV_DECLARE_EXCEPTION(txn_error);
MAPKV_DECLARE_EXCEPTION(invalid_state);
MAPKV_DECLARE_EXCEPTION(bad_lifetime);
#undef MAPKV_DECLARE_EXCEPTION

//------------------------------------------------------------------------------

/// \brief Leveled diagnostics shared with the libmdbx engine.
namespace logging {

enum level : int {
  fatal = MDBX_LOG_FATAL,
  error = MDBX_LOG_ERROR,
  warning = MDBX_LOG_WARN,
  notice = MDBX_LOG_NOTICE,
  verbose = MDBX_LOG_VERBOSE,
  debug = MDBX_LOG_DEBUG,
  trace = MDBX_LOG_TRACE,
  extra = MDBX_LOG_EXTRA
};

/// \brief Receives one formatted message without trailing newline.
using logger = void (*)(level, const char *function, int line,
                        const char *message) noexcept;

/// \brief Sets the threshold and the output callback.
/// \param [in] threshold   Messages above this level are discarded.
/// \param [in] output      Callback, `nullptr` restores the stderr logger.
/// \param [in] engine_too  Also route libmdbx's own diagnostics.
MAPKV_API void setup(level threshold, logger output = nullptr,
                     bool engine_too = false);
MAPKV_API level get_level() noexcept;
MAPKV_API bool enabled(level) noexcept;
MAPKV_API const char *level2str(level) noexcept;

#if defined(__GNUC__) || defined(__clang__)
__attribute__((__format__(__printf__, 4, 5)))
#endif
MAPKV_API void
output(level, const char *function, int line, const char *fmt, ...) noexcept;

} // namespace logging

//------------------------------------------------------------------------------

/// \brief References a data located outside the slice.
/// \details The slice is a pointer and length, it never owns the bytes.
struct MAPKV_API slice : public ::MDBX_val {
  constexpr slice() noexcept : ::MDBX_val({nullptr, 0}) {}
  constexpr slice(const void *ptr, size_t bytes) noexcept
      : ::MDBX_val({const_cast<void *>(ptr), bytes}) {}
  constexpr slice(const ::MDBX_val &src) noexcept
      : ::MDBX_val({src.iov_base, src.iov_len}) {}
  constexpr slice(::std::string_view sv) noexcept
      : slice(sv.data(), sv.length()) {}
  slice(const char *c_str) noexcept
      : slice(c_str, c_str ? ::std::strlen(c_str) : 0) {}
  slice(const ::std::string &str) noexcept
      : slice(str.data(), str.length()) {}
  slice(::std::string &&) = delete;
  slice(const slice &) noexcept = default;
  slice &operator=(const slice &) noexcept = default;

  constexpr const void *data() const noexcept { return iov_base; }
  constexpr const byte *byte_ptr() const noexcept {
    return static_cast<const byte *>(iov_base);
  }
  constexpr const char *char_ptr() const noexcept {
    return static_cast<const char *>(iov_base);
  }
  constexpr size_t size() const noexcept { return iov_len; }
  constexpr size_t length() const noexcept { return iov_len; }
  constexpr bool empty() const noexcept { return iov_len == 0; }
  constexpr bool is_null() const noexcept { return iov_base == nullptr; }

  constexpr ::std::string_view string_view() const noexcept {
    return ::std::string_view(char_ptr(), length());
  }
  ::std::string as_string() const { return ::std::string(char_ptr(), size()); }
  ::std::vector<byte> as_bytes() const {
    return ::std::vector<byte>(byte_ptr(), byte_ptr() + size());
  }

  /// \brief Checks whether the content is a well-formed UTF-8 sequence.
  bool is_valid_utf8() const noexcept;

  /// \brief Three-way memcmp-like comparison, shorter first on a tie.
  static int compare_lexicographically(const slice &a,
                                       const slice &b) noexcept;
  friend bool operator==(const slice &a, const slice &b) noexcept {
    return a.size() == b.size() &&
           (a.size() == 0 || ::std::memcmp(a.data(), b.data(), a.size()) == 0);
  }
  friend bool operator!=(const slice &a, const slice &b) noexcept {
    return !(a == b);
  }
  friend bool operator<(const slice &a, const slice &b) noexcept {
    return compare_lexicographically(a, b) < 0;
  }
};

MAPKV_API ::std::ostream &operator<<(::std::ostream &, const slice &);

//------------------------------------------------------------------------------

/// \brief An unsigned or signed integer stored most-significant byte first,
/// so the byte-wise order of the store matches the numeric order of
/// non-negative values.
template <typename INTEGER> class big_endian {
  static_assert(::std::is_integral<INTEGER>::value, "Integers only");
  using unsigned_type = typename ::std::make_unsigned<INTEGER>::type;
  byte bytes_[sizeof(INTEGER)];

public:
  constexpr big_endian() noexcept : bytes_{} {}
  explicit big_endian(INTEGER value) noexcept {
    unsigned_type bits = static_cast<unsigned_type>(value);
    for (size_t i = sizeof(INTEGER); i > 0; --i) {
      bytes_[i - 1] = static_cast<byte>(bits & 0xff);
      bits = static_cast<unsigned_type>(bits >> 4 >> 4);
    }
  }

  INTEGER value() const noexcept {
    unsigned_type bits = 0;
    for (size_t i = 0; i < sizeof(INTEGER); ++i)
      bits = static_cast<unsigned_type>((bits << 4 << 4) | bytes_[i]);
    return static_cast<INTEGER>(bits);
  }

  slice bytes() const noexcept { return slice(bytes_, sizeof(bytes_)); }

  static big_endian from(const slice &src) {
    if (MAPKV_UNLIKELY(src.size() != sizeof(INTEGER)))
      error::throw_exception(errc::encoding_error,
                             "big_endian: length mismatch");
    big_endian result;
    ::std::memcpy(result.bytes_, src.data(), sizeof(INTEGER));
    return result;
  }
};

/// \brief The unit type for existence checks, converts from any view.
struct nothing {};

//------------------------------------------------------------------------------

/// \brief A slice guarded by the liveness of the transaction or cursor
/// which produced it.
/// \details Any access after the owner ended throws \ref bad_lifetime.
class MAPKV_API value_view {
  slice bytes_;
  ::std::shared_ptr<const detail::lifetime_token> owner_;

public:
  value_view() noexcept = default;
  value_view(const slice &bytes,
             ::std::shared_ptr<const detail::lifetime_token> owner) noexcept;
  value_view(const value_view &) = default;
  value_view(value_view &&) noexcept = default;
  value_view &operator=(const value_view &) = default;
  value_view &operator=(value_view &&) noexcept = default;

  /// \brief Returns `true` while the underlying memory may be dereferenced.
  bool is_valid() const noexcept;
  const slice &bytes() const;
  size_t size() const { return bytes().size(); }

  template <typename T> inline T as() const;
};

//------------------------------------------------------------------------------
// The conversion contract.
//
// `to_view<T>::make(value)` exposes a value as bytes without allocating.
// `from_view<T>::make(bytes)` reconstructs a value; `borrowed` tells whether
// the result still points into the store.

template <typename T, typename = void> struct to_view;
template <typename T, typename = void> struct from_view;

template <> struct to_view<slice> {
  static slice make(const slice &value) noexcept { return value; }
};

template <> struct to_view<::std::string> {
  static slice make(const ::std::string &value) noexcept {
    return slice(value.data(), value.size());
  }
};

template <> struct to_view<::std::string_view> {
  static slice make(::std::string_view value) noexcept { return slice(value); }
};

template <> struct to_view<const char *> {
  static slice make(const char *value) noexcept { return slice(value); }
};

template <> struct to_view<char *> {
  static slice make(const char *value) noexcept { return slice(value); }
};

template <size_t N> struct to_view<char[N]> {
  static slice make(const char (&value)[N]) noexcept { return slice(value); }
};

template <typename ALLOCATOR> struct to_view<::std::vector<byte, ALLOCATOR>> {
  static slice make(const ::std::vector<byte, ALLOCATOR> &value) noexcept {
    return slice(value.data(), value.size());
  }
};

template <typename ALLOCATOR> struct to_view<::std::vector<char, ALLOCATOR>> {
  static slice make(const ::std::vector<char, ALLOCATOR> &value) noexcept {
    return slice(value.data(), value.size());
  }
};

template <typename INTEGER> struct to_view<big_endian<INTEGER>> {
  static slice make(const big_endian<INTEGER> &value) noexcept {
    return value.bytes();
  }
};

namespace detail {
template <typename T>
using if_native_integer =
    typename ::std::enable_if<::std::is_same<T, uint32_t>::value ||
                              ::std::is_same<T, uint64_t>::value>::type;
} // namespace detail

/// \brief Native 32- and 64-bit unsigned integers, the format of the keys
/// of `integer_key` and the values of `integer_dups` databases.
template <typename T> struct to_view<T, detail::if_native_integer<T>> {
  static slice make(const T &value) noexcept {
    return slice(&value, sizeof(T));
  }
};

template <> struct to_view<value_view> {
  static slice make(const value_view &value) { return value.bytes(); }
};

template <typename T> inline slice as_view(const T &value) {
  return to_view<T>::make(value);
}

template <> struct from_view<slice> {
  static constexpr bool borrowed = true;
  static slice make(const slice &bytes) noexcept { return bytes; }
};

template <> struct from_view<::std::string_view> {
  static constexpr bool borrowed = true;
  static ::std::string_view make(const slice &bytes) {
    if (MAPKV_UNLIKELY(!bytes.is_valid_utf8()))
      error::throw_exception(errc::encoding_error, "invalid UTF-8");
    return bytes.string_view();
  }
};

template <> struct from_view<::std::string> {
  static constexpr bool borrowed = false;
  static ::std::string make(const slice &bytes) {
    if (MAPKV_UNLIKELY(!bytes.is_valid_utf8()))
      error::throw_exception(errc::encoding_error, "invalid UTF-8");
    return bytes.as_string();
  }
};

template <> struct from_view<::std::vector<byte>> {
  static constexpr bool borrowed = false;
  static ::std::vector<byte> make(const slice &bytes) {
    return bytes.as_bytes();
  }
};

template <> struct from_view<::std::vector<char>> {
  static constexpr bool borrowed = false;
  static ::std::vector<char> make(const slice &bytes) {
    return ::std::vector<char>(bytes.char_ptr(),
                               bytes.char_ptr() + bytes.size());
  }
};

template <> struct from_view<nothing> {
  static constexpr bool borrowed = false;
  static nothing make(const slice &) noexcept { return nothing(); }
};

template <typename INTEGER> struct from_view<big_endian<INTEGER>> {
  static constexpr bool borrowed = false;
  static big_endian<INTEGER> make(const slice &bytes) {
    return big_endian<INTEGER>::from(bytes);
  }
};

template <typename T> struct from_view<T, detail::if_native_integer<T>> {
  static constexpr bool borrowed = false;
  static T make(const slice &bytes) {
    if (MAPKV_UNLIKELY(bytes.size() != sizeof(T)))
      error::throw_exception(errc::encoding_error,
                             "native integer: length mismatch");
    T value;
    ::std::memcpy(&value, bytes.data(), sizeof(T));
    return value;
  }
};

/// \brief The identity conversion keeps the lifetime guard.
template <> struct from_view<value_view> {
  static constexpr bool borrowed = true;
};

template <typename T> inline T value_view::as() const {
  return from_view<T>::make(bytes());
}

namespace detail {
template <typename T> struct view_cast {
  static T apply(const value_view &view) { return view.as<T>(); }
};
template <> struct view_cast<value_view> {
  static value_view apply(const value_view &view) { return view; }
};
} // namespace detail

//------------------------------------------------------------------------------

/// \brief Flags of a database fixed at its first registration.
enum class db_flags : unsigned {
  defaults = MDBX_DB_DEFAULTS,
  /// \brief Multiple sorted values per key.
  allow_dups = MDBX_DUPSORT,
  /// \brief Keys are native 32- or 64-bit unsigned integers.
  integer_key = MDBX_INTEGERKEY,
  /// \brief Duplicates are native 32- or 64-bit unsigned integers.
  integer_dups = MDBX_DUPSORT | MDBX_DUPFIXED | MDBX_INTEGERDUP,
  /// \brief All duplicates of a key have the same length.
  dup_fixed = MDBX_DUPSORT | MDBX_DUPFIXED,
  /// \brief Keys compare from the last byte to the first.
  reverse_key = MDBX_REVERSEKEY,
  /// \brief Duplicates compare from the last byte to the first.
  reverse_dups = MDBX_DUPSORT | MDBX_REVERSEDUP
};

constexpr db_flags operator|(db_flags a, db_flags b) noexcept {
  return static_cast<db_flags>(static_cast<unsigned>(a) |
                               static_cast<unsigned>(b));
}
constexpr db_flags operator&(db_flags a, db_flags b) noexcept {
  return static_cast<db_flags>(static_cast<unsigned>(a) &
                               static_cast<unsigned>(b));
}
constexpr bool is_set(db_flags where, db_flags what) noexcept {
  return (where & what) == what && what != db_flags::defaults;
}

/// \brief Flags of an environment.
enum class env_flags : unsigned {
  defaults = MDBX_ENV_DEFAULTS,
  /// \brief Flush data and metadata on every commit.
  sync_durable = MDBX_SYNC_DURABLE,
  /// \brief Don't flush on commit, the last steady point survives a crash.
  no_sync = MDBX_SAFE_NOSYNC,
  /// \brief Flush data but defer the metadata.
  no_meta_sync = MDBX_NOMETASYNC,
  /// \brief Don't zero-initialize fresh pages.
  no_mem_init = MDBX_NOMEMINIT,
  read_only = MDBX_RDONLY,
  no_sub_dir = MDBX_NOSUBDIR,
  write_map = MDBX_WRITEMAP,
  exclusive = MDBX_EXCLUSIVE,
  no_readahead = MDBX_NORDAHEAD
};

constexpr env_flags operator|(env_flags a, env_flags b) noexcept {
  return static_cast<env_flags>(static_cast<unsigned>(a) |
                                static_cast<unsigned>(b));
}
constexpr env_flags operator&(env_flags a, env_flags b) noexcept {
  return static_cast<env_flags>(static_cast<unsigned>(a) &
                                static_cast<unsigned>(b));
}
constexpr env_flags operator~(env_flags a) noexcept {
  return static_cast<env_flags>(~static_cast<unsigned>(a));
}
constexpr bool is_set(env_flags where, env_flags what) noexcept {
  return (where & what) == what && what != env_flags::defaults;
}

MAPKV_API ::std::ostream &operator<<(::std::ostream &, const db_flags &);
MAPKV_API ::std::ostream &operator<<(::std::ostream &, const env_flags &);

/// \brief Tree statistics of an environment or a database.
using stat = ::MDBX_stat;
/// \brief Information about an environment.
using info = ::MDBX_envinfo;

//------------------------------------------------------------------------------

/// \brief A user-defined three-way ordering of keys or duplicates.
/// \details Must be a strict weak ordering, and must stay the same for the
/// whole life of a database file. Returns negative, zero or positive.
class MAPKV_API comparator {
public:
  virtual ~comparator() noexcept;
  virtual int compare(const slice &a, const slice &b) const noexcept = 0;
};

using comparator_ptr = ::std::shared_ptr<const comparator>;

namespace detail {
template <typename FUNC> class function_comparator : public comparator {
  FUNC func_;

public:
  explicit function_comparator(FUNC func) : func_(::std::move(func)) {}
  int compare(const slice &a, const slice &b) const noexcept override {
    return func_(a, b);
  }
};
} // namespace detail

/// \brief Wraps a callable `int(const slice &, const slice &)`.
template <typename FUNC> comparator_ptr make_comparator(FUNC &&func) {
  using target = detail::function_comparator<typename ::std::decay<FUNC>::type>;
  return ::std::make_shared<target>(::std::forward<FUNC>(func));
}

//------------------------------------------------------------------------------

/// \brief A registered database, meaningless until bound to a transaction.
class MAPKV_API database {
  friend class environment;
  friend class bound_db;
  friend struct detail::txn_context;
  const detail::env_state *owner_{nullptr};
  unsigned slot_{0};
  db_flags flags_{db_flags::defaults};

  constexpr database(const detail::env_state *owner, unsigned slot,
                     db_flags flags) noexcept
      : owner_(owner), slot_(slot), flags_(flags) {}

public:
  constexpr database() noexcept = default;
  constexpr database(const database &) noexcept = default;
  database &operator=(const database &) noexcept = default;

  constexpr db_flags flags() const noexcept { return flags_; }
  constexpr bool is_default() const noexcept { return slot_ == 0; }
  constexpr bool allows_dups() const noexcept {
    return is_set(flags_, db_flags::allow_dups);
  }
  constexpr explicit operator bool() const noexcept {
    return owner_ != nullptr;
  }

  friend constexpr bool operator==(const database &a,
                                   const database &b) noexcept {
    return a.owner_ == b.owner_ && a.slot_ == b.slot_;
  }
  friend constexpr bool operator!=(const database &a,
                                   const database &b) noexcept {
    return !(a == b);
  }
};

//------------------------------------------------------------------------------

/// \brief The single-writer, many-readers handle of one mapped store file.
/// \details Copies share one underlying environment, which is closed when
/// the last copy and the last transaction are gone. Safe to share between
/// threads.
class MAPKV_API environment {
  ::std::shared_ptr<detail::env_state> state_;
  detail::env_state &state() const;

public:
  static constexpr intptr_t KiB = intptr_t(1) << 10;
  static constexpr intptr_t MiB = intptr_t(1) << 20;
  static constexpr intptr_t GiB = intptr_t(1) << 30;

  /// \brief Settings fixed at open, except for the map size.
  struct MAPKV_API config {
    size_t map_size{10 * MiB};
    unsigned max_dbs{0};
    unsigned max_readers{126};
    env_flags flags{env_flags::defaults};

    config() noexcept = default;
    config(size_t map_size, unsigned max_dbs, unsigned max_readers,
           env_flags flags = env_flags::defaults) noexcept
        : map_size(map_size), max_dbs(max_dbs), max_readers(max_readers),
          flags(flags) {}

    /// \brief Throws \ref invalid_config for inconsistent settings.
    void validate() const;
  };

  environment() noexcept = default;
  environment(const environment &) noexcept = default;
  environment(environment &&) noexcept = default;
  environment &operator=(const environment &) noexcept = default;
  environment &operator=(environment &&) noexcept = default;
  ~environment() noexcept;

  /// \brief Creates or opens the store at the given path.
  environment(const path &pathname, permissions mode, const config &config);
  static environment open(const path &pathname, permissions mode,
                          const config &config);

  bool is_open() const noexcept { return state_ != nullptr; }
  explicit operator bool() const noexcept { return is_open(); }

  /// \brief Drops this handle's reference to the environment.
  void close() noexcept;

  /// \brief Starts the read-write transaction, waiting for the writer lock.
  transaction new_transaction();
  /// \brief Starts a read-only transaction on the latest committed snapshot.
  transaction get_reader();

  database create_db(const ::std::string &name,
                     db_flags flags = db_flags::defaults);
  database get_default_db(db_flags flags = db_flags::defaults);

  /// \brief Changes the capacity, only when no transactions are running.
  void set_mapsize(size_t new_size);
  size_t get_mapsize() const;

  stat get_stat() const;
  info get_info() const;
  env_flags get_flags() const;
  /// \brief Toggles `no_sync`, `no_meta_sync` or `no_mem_init` at runtime.
  void set_flags(env_flags flags, bool on_off);
  /// \brief Flushes buffered data, returns `false` if nothing to flush.
  bool sync(bool force = true);
  path get_path() const;
  const config &get_config() const;
  size_t max_key_size(db_flags flags = db_flags::defaults) const;
  unsigned active_readers() const noexcept;
  bool has_active_writer() const noexcept;

  /// \brief Copies the store to a new file, optionally compacting it.
  void copy(const path &destination, bool compactify = false);

  /// \brief Removes the store files, returns `false` if there were none.
  /// \details Fails with \ref busy when the store is in use.
  static bool remove(const path &pathname);

  MDBX_env *native_handle() const noexcept;

  friend bool operator==(const environment &a,
                         const environment &b) noexcept {
    return a.state_ == b.state_;
  }
  friend bool operator!=(const environment &a,
                         const environment &b) noexcept {
    return !(a == b);
  }
};

MAPKV_API ::std::ostream &operator<<(::std::ostream &,
                                     const environment::config &);

//------------------------------------------------------------------------------

/// \brief A read-write or read-only transaction.
/// \details Exactly one of commit() or abort() ends it, the destructor
/// aborts an unfinished one. Afterwards every \ref bound_db, \ref cursor and
/// \ref value_view derived from it throws \ref bad_lifetime.
class MAPKV_API transaction {
  friend class environment;
  ::std::shared_ptr<detail::txn_context> ctx_;
  explicit transaction(::std::shared_ptr<detail::txn_context> ctx) noexcept;

public:
  transaction() noexcept = default;
  transaction(transaction &&) noexcept = default;
  transaction &operator=(transaction &&other) noexcept;
  transaction(const transaction &) = delete;
  transaction &operator=(const transaction &) = delete;
  ~transaction() noexcept;

  bool is_active() const noexcept;
  bool is_read_only() const;
  uint64_t id() const;

  /// \brief Binds a database to this transaction, never fails.
  bound_db bind(const database &db) const noexcept;

  /// \brief Starts a nested read-write transaction.
  /// \details This transaction is unusable until the nested one ends.
  transaction start_nested();

  void commit();
  void abort();

  /// \brief Parks a read-only transaction keeping its reader slot.
  void reset();
  /// \brief Re-activates a parked read-only transaction on a fresh snapshot.
  void renew();

  MDBX_txn *native_handle() const noexcept;
};

//------------------------------------------------------------------------------

/// \brief One key and value yielded by ranges.
class MAPKV_API cursor_item {
  value_view key_, value_;

public:
  cursor_item() noexcept = default;
  cursor_item(value_view key, value_view value) noexcept
      : key_(::std::move(key)), value_(::std::move(value)) {}

  const value_view &key() const noexcept { return key_; }
  const value_view &value() const noexcept { return value_; }

  template <typename T = value_view> T get_key() const {
    return detail::view_cast<T>::apply(key_);
  }
  template <typename T = value_view> T get_value() const {
    return detail::view_cast<T>::apply(value_);
  }
  template <typename K = value_view, typename V = value_view>
  ::std::pair<K, V> get() const {
    return ::std::pair<K, V>(get_key<K>(), get_value<V>());
  }
};

/// \brief A position inside one bound database.
class MAPKV_API cursor {
  friend class bound_db;
  friend class item_range;
  ::std::shared_ptr<detail::txn_context> txn_;
  database db_;
  MDBX_cursor *handle_{nullptr};
  ::std::shared_ptr<detail::lifetime_token> lifetime_;
  bool positioned_{false};

  cursor(::std::shared_ptr<detail::txn_context> txn, const database &db);
  MDBX_cursor *handle(const char *who) const;
  bool move(MDBX_cursor_op op, slice *key, slice *value, bool throw_notfound);
  cursor_item make_item(const slice &key, const slice &value) const;
  int compare_keys(const slice &a, const slice &b) const;
  ::std::vector<byte> current_key() const;

public:
  cursor() noexcept = default;
  cursor(cursor &&other) noexcept;
  cursor &operator=(cursor &&other) noexcept;
  cursor(const cursor &) = delete;
  cursor &operator=(const cursor &) = delete;
  ~cursor() noexcept;

  /// \brief Releases the cursor, its views become invalid.
  void close() noexcept;
  bool is_positioned() const noexcept { return positioned_; }

  bool to_first(bool throw_notfound = true);
  bool to_last(bool throw_notfound = true);
  /// \brief Positions at the exact key, on its first duplicate.
  bool to_key(const slice &key, bool throw_notfound = true);
  /// \brief Positions at the first key greater than or equal to the given.
  bool to_range(const slice &key, bool throw_notfound = true);
  /// \brief Positions at the exact key and duplicate.
  bool to_item(const slice &key, const slice &value,
               bool throw_notfound = true);
  bool next(bool throw_notfound = true);
  bool prev(bool throw_notfound = true);
  /// \brief Moves among the duplicates of the current key.
  bool next_item(bool throw_notfound = true);
  bool prev_item(bool throw_notfound = true);
  bool to_first_item(bool throw_notfound = true);
  bool to_last_item(bool throw_notfound = true);

  template <typename K> bool to_key(const K &key, bool throw_notfound = true) {
    return to_key(as_view(key), throw_notfound);
  }
  template <typename K>
  bool to_range(const K &key, bool throw_notfound = true) {
    return to_range(as_view(key), throw_notfound);
  }
  template <typename K, typename V>
  bool to_item(const K &key, const V &value, bool throw_notfound = true) {
    return to_item(as_view(key), as_view(value), throw_notfound);
  }

  /// \brief Reads the current pair, \ref invalid_state if unpositioned.
  cursor_item current() const;
  template <typename K = value_view, typename V = value_view>
  ::std::pair<K, V> get() const {
    return current().get<K, V>();
  }
  template <typename T = value_view> T get_key() const {
    return current().get_key<T>();
  }
  template <typename T = value_view> T get_value() const {
    return current().get_value<T>();
  }

  /// \brief Adds a duplicate to the current key.
  void add_item(const slice &value);
  template <typename V> void add_item(const V &value) {
    add_item(as_view(value));
  }
  /// \brief Overwrites the current value, the cursor ends on the new pair.
  void replace(const slice &value);
  template <typename V> void replace(const V &value) {
    replace(as_view(value));
  }
  /// \brief Deletes the current duplicate.
  void del_item();
  /// \brief Deletes the current key with all of its duplicates.
  void del_all();
  size_t item_count() const;

  MDBX_cursor *native_handle() const noexcept { return handle_; }
};

/// \brief A lazy, finite, forward-only and non-restartable sequence of
/// pairs read by its own cursor.
/// \details The iteration state lives on the heap, so iterators taken from
/// a range stay valid when the range itself is moved.
class MAPKV_API item_range {
  friend class bound_db;

public:
  enum class kind { all, from, to, inclusive, half_open, duplicates };

private:
  struct walk {
    cursor source;
    kind mode;
    ::std::vector<byte> lower, upper;
    cursor_item current;
    bool started{false};
    bool finished{false};
  };

public:
  class MAPKV_API iterator {
    walk *walk_{nullptr};

  public:
    using iterator_category = ::std::input_iterator_tag;
    using value_type = cursor_item;
    using difference_type = ::std::ptrdiff_t;
    using pointer = const cursor_item *;
    using reference = const cursor_item &;

    iterator() noexcept = default;
    explicit iterator(walk *state) noexcept : walk_(state) {}
    reference operator*() const { return walk_->current; }
    pointer operator->() const { return &walk_->current; }
    iterator &operator++() {
      item_range::advance(*walk_);
      return *this;
    }
    void operator++(int) { item_range::advance(*walk_); }
    friend bool operator==(const iterator &a, const iterator &b) noexcept {
      return a.at_end() == b.at_end();
    }
    friend bool operator!=(const iterator &a, const iterator &b) noexcept {
      return !(a == b);
    }

  private:
    bool at_end() const noexcept { return !walk_ || walk_->finished; }
  };

  item_range(item_range &&) noexcept = default;
  item_range &operator=(item_range &&) noexcept = default;

  iterator begin();
  iterator end() noexcept { return iterator(); }

  /// \brief Drains the rest of the range into values of the given type.
  template <typename T = value_view> ::std::vector<T> values() {
    ::std::vector<T> result;
    for (const auto &item : *this)
      result.push_back(item.template get_value<T>());
    return result;
  }
  template <typename T = value_view> ::std::vector<T> keys() {
    ::std::vector<T> result;
    for (const auto &item : *this)
      result.push_back(item.template get_key<T>());
    return result;
  }

private:
  item_range(cursor &&source, kind mode, const slice &lower,
             const slice &upper);
  static void start(walk &state);
  static void advance(walk &state);
  static void accept(walk &state, bool found, const slice &key,
                     const slice &value);
  static bool in_range(const walk &state, const slice &key);

  ::std::unique_ptr<walk> walk_;
};

//------------------------------------------------------------------------------

/// \brief A database bound to one transaction.
class MAPKV_API bound_db {
  friend class transaction;
  ::std::shared_ptr<detail::txn_context> txn_;
  database db_;

  bound_db(::std::shared_ptr<detail::txn_context> txn,
           const database &db) noexcept
      : txn_(::std::move(txn)), db_(db) {}

  value_view get_view(const slice &key) const;
  item_range make_range(item_range::kind kind, const slice &lower,
                        const slice &upper) const;

public:
  bound_db() noexcept = default;

  const database &db() const noexcept { return db_; }

  /// \brief Returns the value of a key, the first duplicate for
  /// duplicate databases. Throws \ref not_found for absent keys.
  template <typename T = value_view, typename K> T get(const K &key) const {
    return detail::view_cast<T>::apply(get_view(as_view(key)));
  }
  template <typename K> bool contains(const K &key) const {
    return contains(as_view(key));
  }
  bool contains(const slice &key) const;

  /// \brief Inserts or replaces, adds a duplicate in duplicate databases.
  void set(const slice &key, const slice &value);
  /// \brief Like set(), throws \ref key_exists if the key is present.
  void insert(const slice &key, const slice &value);
  /// \brief Inserts a key sorting after every present key.
  void append(const slice &key, const slice &value);
  /// \brief Inserts a duplicate sorting after the present ones of its key.
  void append_duplicate(const slice &key, const slice &value);
  /// \brief Deletes a key with all of its duplicates.
  void del(const slice &key);
  /// \brief Deletes one pair.
  void del_item(const slice &key, const slice &value);

  template <typename K, typename V> void set(const K &key, const V &value) {
    set(as_view(key), as_view(value));
  }
  template <typename K, typename V> void insert(const K &key, const V &value) {
    insert(as_view(key), as_view(value));
  }
  template <typename K, typename V> void append(const K &key, const V &value) {
    append(as_view(key), as_view(value));
  }
  template <typename K, typename V>
  void append_duplicate(const K &key, const V &value) {
    append_duplicate(as_view(key), as_view(value));
  }
  template <typename K> void del(const K &key) { del(as_view(key)); }
  template <typename K, typename V>
  void del_item(const K &key, const V &value) {
    del_item(as_view(key), as_view(value));
  }

  /// \brief Deletes every pair keeping the database.
  void clear();
  /// \brief Deletes a named database.
  void drop();

  ::mapkv::stat stat() const;

  /// \brief Sets the key ordering of a named database.
  void set_compare(comparator_ptr cmp);
  /// \brief Sets the duplicate ordering of a named duplicate database.
  void set_dupsort(comparator_ptr cmp);

  cursor new_cursor() const;

  item_range iter() const;
  /// \brief Duplicates of one key, empty when the key is absent.
  /// \details On a unique-key database yields the single value.
  item_range item_iter(const slice &key) const;
  /// \brief Keys greater than or equal to `lower`.
  item_range keyrange_from(const slice &lower) const;
  /// \brief Keys less than `upper`.
  item_range keyrange_to(const slice &upper) const;
  /// \brief Keys from `lower` to `upper`, both inclusive.
  item_range keyrange(const slice &lower, const slice &upper) const;
  /// \brief Keys from `lower` inclusive to `upper` exclusive.
  item_range keyrange_from_to(const slice &lower, const slice &upper) const;

  template <typename K> item_range item_iter(const K &key) const {
    return item_iter(as_view(key));
  }
  template <typename K> item_range keyrange_from(const K &lower) const {
    return keyrange_from(as_view(lower));
  }
  template <typename K> item_range keyrange_to(const K &upper) const {
    return keyrange_to(as_view(upper));
  }
  template <typename K1, typename K2>
  item_range keyrange(const K1 &lower, const K2 &upper) const {
    return keyrange(as_view(lower), as_view(upper));
  }
  template <typename K1, typename K2>
  item_range keyrange_from_to(const K1 &lower, const K2 &upper) const {
    return keyrange_from_to(as_view(lower), as_view(upper));
  }
};

/// @} end of C++ API

} // namespace mapkv
