#include "mapkv.h++"

#include <cstdlib>
#include <iostream>

static const mapkv::path db_path("test-basic.mdbx");

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

static mapkv::environment open_env(unsigned max_dbs) {
  return mapkv::environment(
      db_path, 0644,
      mapkv::environment::config(4 * mapkv::environment::MiB, max_dbs, 16,
                                 mapkv::env_flags::no_sub_dir));
}

bool case0_get_set_del(mapkv::environment &env) {
  mapkv::database db = env.create_db("plain");
  bool ok = true;
  {
    mapkv::transaction txn = env.new_transaction();
    mapkv::bound_db data = txn.bind(db);
    data.set("hello", "world");
    data.set(std::string("answer"), mapkv::big_endian<uint32_t>(42));
    data.insert("unique", "once");
    ok &= expect_throw<mapkv::key_exists>("insert twice",
                                          [&] { data.insert("unique", "x"); });
    // set replaces in a unique-key database
    data.set("hello", "again");
    txn.commit();
  }

  mapkv::transaction txn = env.get_reader();
  mapkv::bound_db data = txn.bind(db);
  ok &= check(data.get<std::string>("hello") == "again", "replaced");
  ok &= check(data.get<mapkv::big_endian<uint32_t>>("answer").value() == 42,
              "integer value");
  ok &= check(data.get("unique").as<std::string_view>() == "once",
              "borrowed view");
  ok &= check(data.contains("hello") && !data.contains("nothing-here"),
              "contains");
  ok &= expect_throw<mapkv::not_found>("absent key",
                                       [&] { data.get("nothing-here"); });
  data.get<mapkv::nothing>("hello");
  const mapkv::stat st = data.stat();
  ok &= check(st.ms_entries == 3, "three entries");
  ok &= expect_throw<mapkv::txn_error>(
      "nested reader", [&] { txn.start_nested(); });
  txn.abort();

  {
    mapkv::transaction writer = env.new_transaction();
    mapkv::bound_db data = writer.bind(db);
    data.del("hello");
    ok &= expect_throw<mapkv::not_found>("delete absent",
                                         [&] { data.del("hello"); });
    data.del_item("unique", "once");
    ok &= expect_throw<mapkv::not_found>(
        "delete absent pair", [&] { data.del_item("missing", "43"); });
    writer.commit();
  }
  {
    mapkv::transaction reader = env.get_reader();
    ok &= check(reader.bind(db).stat().ms_entries == 1, "one left");
  }
  return ok;
}

bool case1_abort_discards(mapkv::environment &env) {
  mapkv::database db = env.create_db("plain");
  {
    mapkv::transaction txn = env.new_transaction();
    txn.bind(db).set("ghost", "boo");
    txn.abort();
  }
  {
    // a dropped transaction is aborted as well
    mapkv::transaction txn = env.new_transaction();
    txn.bind(db).set("phantom", "boo");
  }
  mapkv::transaction txn = env.get_reader();
  return check(!txn.bind(db).contains("ghost") &&
                   !txn.bind(db).contains("phantom"),
               "aborted writes are invisible");
}

bool case2_registry(mapkv::environment &env) {
  bool ok = true;
  mapkv::database again = env.create_db("plain");
  ok &= check(again == env.create_db("plain"), "same database");
  ok &= expect_throw<mapkv::db_flags_mismatch>(
      "other flags", [&] { env.create_db("plain", mapkv::db_flags::allow_dups); });
  ok &= check(env.create_db("").is_default(), "empty name");
  env.create_db("second");
  ok &= expect_throw<mapkv::too_many_dbs>("third",
                                          [&] { env.create_db("third"); });

  mapkv::database main_db = env.get_default_db();
  ok &= check(main_db.is_default(), "default");
  ok &= expect_throw<mapkv::db_flags_mismatch>("default flags", [&] {
    env.get_default_db(mapkv::db_flags::reverse_key);
  });
  return ok;
}

bool case3_clear_drop(mapkv::environment &env) {
  mapkv::database db = env.create_db("second");
  bool ok = true;
  {
    mapkv::transaction txn = env.new_transaction();
    mapkv::bound_db data = txn.bind(db);
    data.set("k1", "v1");
    data.set("k2", "v2");
    data.clear();
    ok &= check(data.stat().ms_entries == 0, "cleared");
    data.set("k3", "v3");
    txn.commit();
  }
  {
    mapkv::transaction txn = env.new_transaction();
    txn.bind(db).drop();
    ok &= expect_throw<mapkv::invalid_state>(
        "drop the default", [&] { txn.bind(env.get_default_db()).drop(); });
    txn.commit();
  }
  {
    // the registry entry survives, the table is created anew on write
    mapkv::transaction txn = env.new_transaction();
    mapkv::bound_db data = txn.bind(db);
    ok &= check(!data.contains("k3"), "dropped");
    data.set("k4", "v4");
    txn.commit();
  }
  return ok;
}

bool case4_foreign_database(mapkv::environment &env) {
  mapkv::environment other(
      "test-basic-other.mdbx", 0644,
      mapkv::environment::config(mapkv::environment::MiB, 1, 4,
                                 mapkv::env_flags::no_sub_dir));
  mapkv::database foreign = other.create_db("plain");
  mapkv::transaction txn = env.get_reader();
  const bool ok = expect_throw<mapkv::invalid_state>(
      "database of another environment",
      [&] { txn.bind(foreign).contains("k"); });
  txn.abort();
  other.close();
  mapkv::environment::remove("test-basic-other.mdbx");
  return ok;
}

bool case5_fresh_and_persisted() {
  const mapkv::path pathname("test-basic-fresh.mdbx");
  const mapkv::environment::config config(
      mapkv::environment::MiB, 4, 4, mapkv::env_flags::no_sub_dir);
  mapkv::environment::remove(pathname);
  bool ok = true;
  {
    mapkv::environment env(pathname, 0644, config);
    const mapkv::database fresh = env.create_db("fresh");
    const mapkv::database pairs =
        env.create_db("pairs", mapkv::db_flags::allow_dups);
    mapkv::transaction txn = env.get_reader();
    mapkv::bound_db data = txn.bind(fresh);
    ok &= check(!data.contains("k"), "fresh database has no keys");
    ok &= check(data.iter().keys<std::string>().empty(), "fresh iter");
    ok &= check(data.keyrange_from("a").keys<std::string>().empty(),
                "fresh keyrange_from");
    ok &= check(txn.bind(pairs).item_iter("k").values<std::string>().empty(),
                "fresh item_iter");
    ok &= expect_throw<mapkv::not_found>("get from a fresh database",
                                         [&] { data.get("k"); });
    txn.abort();

    mapkv::transaction writer = env.new_transaction();
    writer.bind(pairs).set("k", "v");
    writer.commit();
  }
  {
    mapkv::environment env(pathname, 0644, config);
    ok &= expect_throw<mapkv::db_flags_mismatch>(
        "flags kept in the file", [&] { env.create_db("pairs"); });
    ok &= check(env.create_db("pairs", mapkv::db_flags::allow_dups)
                    .allows_dups(),
                "matching flags");
  }
  {
    mapkv::environment env(
        pathname, 0644,
        mapkv::environment::config(mapkv::environment::MiB, 4, 4,
                                   mapkv::env_flags::no_sub_dir |
                                       mapkv::env_flags::read_only));
    // nothing can create the table in a read-only environment
    const mapkv::database never = env.create_db("never");
    mapkv::transaction txn = env.get_reader();
    mapkv::bound_db data = txn.bind(never);
    ok &= check(!data.contains("k"), "absent table has no keys");
    ok &= check(data.iter().keys<std::string>().empty(), "absent iter");
    ok &= check(data.keyrange("a", "z").keys<std::string>().empty(),
                "absent keyrange");
    ok &= expect_throw<mapkv::not_found>("get from an absent table",
                                         [&] { data.get("k"); });
  }
  mapkv::environment::remove(pathname);
  return ok;
}

int main(int argc, const char *argv[]) {
  (void)argc;
  (void)argv;
  try {
    mapkv::environment::remove(db_path);
    mapkv::environment::remove("test-basic-other.mdbx");
    mapkv::environment env = open_env(2);
    bool ok = case0_get_set_del(env);
    ok &= case1_abort_discards(env);
    ok &= case2_registry(env);
    ok &= case3_clear_drop(env);
    ok &= case4_foreign_database(env);
    ok &= case5_fresh_and_persisted();
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
