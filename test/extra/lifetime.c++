#include "mapkv.h++"

#include <cstdlib>
#include <iostream>

static const mapkv::path db_path("test-lifetime.mdbx");

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

bool case0_after_end(mapkv::environment &env, const mapkv::database &db) {
  mapkv::value_view view;
  mapkv::bound_db data;
  mapkv::cursor c;
  bool ok = check(!view.is_valid(), "empty view");
  {
    mapkv::transaction txn = env.get_reader();
    data = txn.bind(db);
    view = data.get("a");
    c = data.new_cursor();
    ok &= check(view.is_valid() && view.as<std::string>() == "1", "alive");
    txn.commit();
    ok &= check(!view.is_valid(), "expired on commit");
    ok &= expect_throw<mapkv::bad_lifetime>("commit twice",
                                            [&] { txn.commit(); });
    ok &= expect_throw<mapkv::bad_lifetime>("abort after commit",
                                            [&] { txn.abort(); });
  }
  ok &= expect_throw<mapkv::bad_lifetime>("view", [&] { view.bytes(); });
  ok &= expect_throw<mapkv::bad_lifetime>(
      "converted view", [&] { view.as<std::string>(); });
  ok &= expect_throw<mapkv::bad_lifetime>("bound database",
                                          [&] { data.get("a"); });
  ok &= expect_throw<mapkv::bad_lifetime>("cursor", [&] { c.to_first(); });
  ok &= expect_throw<mapkv::bad_lifetime>("unbound database",
                                          [&] { mapkv::bound_db().get("a"); });
  return ok;
}

bool case1_write_moves_pages(mapkv::environment &env,
                             const mapkv::database &db) {
  mapkv::transaction txn = env.new_transaction();
  mapkv::bound_db data = txn.bind(db);
  mapkv::value_view before = data.get("a");
  mapkv::item_range range = data.iter();
  mapkv::cursor_item item = *range.begin();
  bool ok = check(before.is_valid() && item.value().is_valid(), "alive");
  data.set("b", "2");
  ok &= check(!before.is_valid(), "point read expired by a write");
  ok &= check(!item.key().is_valid(), "range item expired by a write");
  ok &= check(data.get("a").is_valid(), "a fresh read is fine");
  txn.abort();
  return ok;
}

bool case2_cursor_close(mapkv::environment &env, const mapkv::database &db) {
  mapkv::transaction txn = env.get_reader();
  mapkv::cursor c = txn.bind(db).new_cursor();
  c.to_first();
  const mapkv::cursor_item item = c.current();
  c.close();
  bool ok = check(item.value().is_valid(), "pages outlive the cursor");
  ok &= expect_throw<mapkv::bad_lifetime>("closed cursor",
                                          [&] { c.current(); });
  return ok;
}

bool case3_moved_and_parked(mapkv::environment &env,
                            const mapkv::database &db) {
  mapkv::transaction first = env.get_reader();
  mapkv::transaction second = std::move(first);
  bool ok = expect_throw<mapkv::bad_lifetime>("moved-from transaction",
                                              [&] { first.commit(); });
  ok &= check(!first.is_active() && second.is_active(), "moved state");

  mapkv::value_view view = second.bind(db).get("a");
  second.reset();
  ok &= check(!view.is_valid(), "parked reader views");
  ok &= expect_throw<mapkv::bad_lifetime>("parked reader",
                                          [&] { second.bind(db).get("a"); });
  second.renew();
  ok &= check(second.bind(db).get<std::string>("a") == "1", "renewed");
  ok &= expect_throw<mapkv::invalid_state>("renew of an active reader",
                                           [&] { second.renew(); });
  return ok;
}

bool case4_environment_outlived() {
  mapkv::environment env(
      db_path, 0644,
      mapkv::environment::config(4 * mapkv::environment::MiB, 0, 16,
                                 mapkv::env_flags::no_sub_dir));
  mapkv::database main_db = env.get_default_db();
  mapkv::transaction txn = env.get_reader();
  env.close();
  // the transaction keeps the mapping alive
  bool ok = check(txn.bind(main_db).get<std::string>("a") == "1",
                  "transaction outlives the handle");
  ok &= check(!env.is_open(), "handle closed");
  ok &= expect_throw<mapkv::bad_lifetime>("closed handle",
                                          [&] { env.get_reader(); });
  return ok;
}

int main(int argc, const char *argv[]) {
  (void)argc;
  (void)argv;
  try {
    mapkv::environment::remove(db_path);
    bool ok = true;
    mapkv::database db;
    {
      mapkv::environment env(
          db_path, 0644,
          mapkv::environment::config(4 * mapkv::environment::MiB, 0, 16,
                                     mapkv::env_flags::no_sub_dir));
      db = env.get_default_db();
      {
        mapkv::transaction txn = env.new_transaction();
        txn.bind(db).set("a", "1");
        txn.commit();
      }
      ok &= case0_after_end(env, db);
      ok &= case1_write_moves_pages(env, db);
      ok &= case2_cursor_close(env, db);
      ok &= case3_moved_and_parked(env, db);
    }
    ok &= case4_environment_outlived();
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
