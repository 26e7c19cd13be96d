#include "mapkv.h++"

#include <cstdlib>
#include <iostream>

static const mapkv::path db_path("test-comparator.mdbx");

typedef mapkv::big_endian<int32_t> be32;
typedef std::vector<int32_t> numbers;

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

/// Orders odd numbers negated, so odd ones come first in reverse.
static int odd_negated(const mapkv::slice &a, const mapkv::slice &b) noexcept {
  int32_t x = be32::from(a).value(), y = be32::from(b).value();
  x = (x & 1) ? -x : x;
  y = (y & 1) ? -y : y;
  return (x > y) - (x < y);
}

static numbers decode(const std::vector<be32> &values) {
  numbers result;
  for (const auto &value : values)
    result.push_back(value.value());
  return result;
}

bool case0_keys(mapkv::environment &env,
                const mapkv::comparator_ptr &ordering) {
  const mapkv::database db = env.create_db("keys");
  bool ok = true;
  {
    mapkv::transaction txn = env.new_transaction();
    mapkv::bound_db data = txn.bind(db);
    data.set_compare(ordering);
    for (int32_t i = 2; i <= 5; ++i)
      data.set(be32(i), be32(i));
    ok &= check(decode(data.iter().keys<be32>()) == numbers({5, 3, 2, 4}),
                "custom key order");
    ok &= check(decode(data.keyrange_to(be32(2)).keys<be32>()) ==
                    numbers({5, 3}),
                "ranges follow the ordering");
    ok &= expect_throw<mapkv::key_exists>(
        "append before the last key", [&] { data.append(be32(1), be32(1)); });
    data.append(be32(6), be32(6));
    // the same ordering again is accepted
    data.set_compare(ordering);
    ok &= expect_throw<mapkv::db_flags_mismatch>("ordering change in use", [&] {
      data.set_compare(mapkv::make_comparator(mapkv::slice::compare_lexicographically));
    });
    txn.commit();
  }

  mapkv::transaction txn = env.get_reader();
  ok &= check(decode(txn.bind(db).iter().values<be32>()) ==
                  numbers({5, 3, 2, 4, 6}),
              "persisted order");
  return ok;
}

bool case1_duplicates(mapkv::environment &env,
                      const mapkv::comparator_ptr &ordering) {
  const mapkv::database db = env.create_db("dups", mapkv::db_flags::allow_dups);
  bool ok = true;
  mapkv::transaction txn = env.new_transaction();
  mapkv::bound_db data = txn.bind(db);
  data.set_dupsort(ordering);
  for (int32_t i = 2; i <= 5; ++i)
    data.set("k", be32(i));
  ok &= check(decode(data.item_iter("k").values<be32>()) ==
                  numbers({5, 3, 2, 4}),
              "custom duplicate order");
  ok &= check(data.get<be32>("k").value() == 5, "first duplicate");
  ok &= expect_throw<mapkv::key_exists>("duplicate out of order", [&] {
    data.append_duplicate("k", be32(1));
  });
  data.append_duplicate("k", be32(8));
  txn.commit();
  return ok;
}

bool case2_misuse(mapkv::environment &env,
                  const mapkv::comparator_ptr &ordering) {
  const mapkv::database plain = env.create_db("plain");
  mapkv::transaction txn = env.new_transaction();
  bool ok = expect_throw<mapkv::db_flags_mismatch>(
      "duplicate ordering of a unique-key database",
      [&] { txn.bind(plain).set_dupsort(ordering); });
  ok &= expect_throw<mapkv::db_flags_mismatch>(
      "ordering of the default database",
      [&] { txn.bind(env.get_default_db()).set_compare(ordering); });
  txn.abort();
  ok &= expect_throw<mapkv::bad_lifetime>(
      "ordering via an ended transaction",
      [&] { txn.bind(plain).set_compare(ordering); });
  return ok;
}

int main(int argc, const char *argv[]) {
  (void)argc;
  (void)argv;
  try {
    mapkv::environment::remove(db_path);
    mapkv::environment env(
        db_path, 0644,
        mapkv::environment::config(4 * mapkv::environment::MiB, 4, 16,
                                   mapkv::env_flags::no_sub_dir));
    const mapkv::comparator_ptr ordering = mapkv::make_comparator(odd_negated);
    bool ok = case0_keys(env, ordering);
    ok &= case1_duplicates(env, ordering);
    ok &= case2_misuse(env, ordering);
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
