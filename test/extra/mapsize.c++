#include "mapkv.h++"

#include <cstdlib>
#include <iostream>

static const mapkv::path db_path("test-mapsize.mdbx");

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

/// Writes 64 KiB values until the map is full, returns how many fitted.
static unsigned fill_up(mapkv::environment &env, const mapkv::database &db,
                        unsigned limit) {
  const std::vector<mapkv::byte> blob(64 * 1024, 0x5a);
  mapkv::transaction txn = env.new_transaction();
  mapkv::bound_db data = txn.bind(db);
  for (unsigned i = 0; i < limit; ++i) {
    try {
      data.set(mapkv::big_endian<uint32_t>(i), blob);
    } catch (const mapkv::map_full &) {
      // the failed transaction is rolled back by its destructor
      return i;
    }
  }
  txn.commit();
  return limit;
}

bool case0_full_then_grow(mapkv::environment &env) {
  const mapkv::database db = env.get_default_db();
  const unsigned fitted = fill_up(env, db, 1000);
  bool ok = check(fitted < 1000, "map filled");
  ok &= check(!env.has_active_writer(), "writer released");

  env.set_mapsize(64 * mapkv::environment::MiB);
  ok &= check(env.get_mapsize() >= size_t(64 * mapkv::environment::MiB),
              "map grown");
  ok &= check(env.get_config().map_size ==
                  size_t(64 * mapkv::environment::MiB),
              "config follows");
  ok &= check(fill_up(env, db, fitted + 4) == fitted + 4, "more fits now");

  mapkv::transaction txn = env.get_reader();
  ok &= check(txn.bind(db).stat().ms_entries == fitted + 4, "all committed");
  return ok;
}

bool case1_busy_resize(mapkv::environment &env) {
  bool ok = true;
  {
    mapkv::transaction reader = env.get_reader();
    ok &= expect_throw<mapkv::busy>("resize with a reader", [&] {
      env.set_mapsize(128 * mapkv::environment::MiB);
    });
  }
  {
    mapkv::transaction writer = env.new_transaction();
    ok &= expect_throw<mapkv::busy>("resize with a writer", [&] {
      env.set_mapsize(128 * mapkv::environment::MiB);
    });
  }
  ok &= expect_throw<mapkv::invalid_config>("zero size",
                                            [&] { env.set_mapsize(0); });
  env.set_mapsize(128 * mapkv::environment::MiB);
  return ok;
}

int main(int argc, const char *argv[]) {
  (void)argc;
  (void)argv;
  try {
    mapkv::environment::remove(db_path);
    mapkv::environment env(
        db_path, 0644,
        mapkv::environment::config(mapkv::environment::MiB, 0, 16,
                                   mapkv::env_flags::no_sub_dir));
    bool ok = case0_full_then_grow(env);
    ok &= case1_busy_resize(env);
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
