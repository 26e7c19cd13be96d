#include "mapkv.h++"

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <sstream>

static const mapkv::path db_path("test-encoding.mdbx");

template <typename EXCEPTION, typename FUNC>
static bool expect_throw(const char *what, FUNC &&func) {
  try {
    func();
  } catch (const EXCEPTION &) {
    return true;
  } catch (const std::exception &ex) {
    std::cerr << what << ": unexpected " << ex.what() << "\n";
    return false;
  }
  std::cerr << what << ": no exception\n";
  return false;
}

static bool check(bool condition, const char *what) {
  if (!condition)
    std::cerr << "check failed: " << what << "\n";
  return condition;
}

bool case0_utf8() {
  bool ok = check(mapkv::slice("plain ascii").is_valid_utf8(), "ascii");
  ok &= check(mapkv::slice("h\xc3\xa9llo").is_valid_utf8(), "two bytes");
  ok &= check(mapkv::slice("\xe2\x82\xac").is_valid_utf8(), "three bytes");
  ok &= check(mapkv::slice("\xf0\x9f\x98\x80").is_valid_utf8(), "four bytes");
  ok &= check(!mapkv::slice("\xc0\xaf").is_valid_utf8(), "overlong");
  ok &= check(!mapkv::slice("\xed\xa0\x80").is_valid_utf8(), "surrogate");
  ok &= check(!mapkv::slice("\xe2\x82").is_valid_utf8(), "truncated");
  ok &= check(!mapkv::slice("\xf4\x90\x80\x80").is_valid_utf8(),
              "beyond U+10FFFF");
  ok &= check(mapkv::slice().is_valid_utf8(), "empty");
  return ok;
}

bool case1_stored(mapkv::environment &env) {
  const mapkv::database db = env.get_default_db();
  const std::vector<mapkv::byte> binary = {0xff, 0xfe, 0x00, 0x01};
  const std::vector<char> chars = {'a', '\0', 'b'};
  {
    mapkv::transaction txn = env.new_transaction();
    mapkv::bound_db data = txn.bind(db);
    data.set("binary", binary);
    data.set("chars", chars);
    data.set("text", std::string("h\xc3\xa9llo"));
    data.set(std::string_view("view"), mapkv::big_endian<int16_t>(-2));
    txn.commit();
  }

  mapkv::transaction txn = env.get_reader();
  mapkv::bound_db data = txn.bind(db);
  bool ok = expect_throw<mapkv::encoding_error>(
      "binary as text", [&] { data.get<std::string>("binary"); });
  ok &= expect_throw<mapkv::encoding_error>(
      "binary as text view", [&] { data.get<std::string_view>("binary"); });
  ok &= check(data.get<std::vector<mapkv::byte>>("binary") == binary,
              "bytes kept");
  ok &= check(data.get<std::vector<char>>("chars") == chars,
              "embedded zero kept");
  ok &= check(data.get<std::string>("text") == "h\xc3\xa9llo", "text kept");
  ok &= check(data.get<mapkv::slice>("text").size() == 6, "raw slice");
  ok &= check(data.get<mapkv::big_endian<int16_t>>("view").value() == -2,
              "signed integer");
  ok &= expect_throw<mapkv::encoding_error>("integer of a wrong width", [&] {
    data.get<mapkv::big_endian<uint32_t>>("view");
  });
  ok &= check(mapkv::from_view<mapkv::slice>::borrowed &&
                  mapkv::from_view<std::string_view>::borrowed,
              "borrowed results");
  ok &= check(!mapkv::from_view<std::string>::borrowed, "owned string");
  return ok;
}

bool case2_printing() {
  std::ostringstream out;
  out << mapkv::slice("abc") << ' ' << mapkv::errc::not_found << ' '
      << mapkv::env_flags::no_sub_dir;
  bool ok = check(out.str().find("abc") != std::string::npos, "printable");
  ok &= check(out.str().find("not_found") != std::string::npos, "errc name");

  const mapkv::error trouble = mapkv::error::from_native(MDBX_MAP_FULL);
  ok &= check(trouble.code() == mapkv::errc::map_full, "native mapping");
  ok &= check(trouble.native_code() == MDBX_MAP_FULL, "native kept");
  try {
    trouble.throw_exception();
    ok = false;
  } catch (const mapkv::map_full &ex) {
    ok &= check(ex.code() == mapkv::errc::map_full, "exception code");
  }
  ok &= check(mapkv::error::from_native(MDBX_NOTFOUND).code() ==
                  mapkv::errc::not_found,
              "not found");
  ok &= check(mapkv::error::from_native(MDBX_READERS_FULL).code() ==
                  mapkv::errc::reader_slots_exhausted,
              "readers full");
  ok &= check(mapkv::error::from_native(MDBX_CORRUPTED).code() ==
                  mapkv::errc::txn_error,
              "corruption");
  ok &= check(mapkv::error::from_native(EIO).code() == mapkv::errc::io_error,
              "system error");
  return ok;
}

int main(int argc, const char *argv[]) {
  (void)argc;
  (void)argv;
  try {
    mapkv::environment::remove(db_path);
    mapkv::environment env(
        db_path, 0644,
        mapkv::environment::config(4 * mapkv::environment::MiB, 0, 16,
                                   mapkv::env_flags::no_sub_dir));
    bool ok = case0_utf8();
    ok &= case1_stored(env);
    ok &= case2_printing();
    env.close();
    mapkv::environment::remove(db_path);
    if (ok) {
      std::cout << "OK\n";
      return EXIT_SUCCESS;
    }
  } catch (const std::exception &ex) {
    std::cerr << "Exception: " << ex.what() << "\n";
  }
  std::cerr << "Fail\n";
  return EXIT_FAILURE;
}
