//
// Copyright (c) 2020-2022, Leonid Yuriev <leo@yuriev.ru>.
// SPDX-License-Identifier: Apache-2.0
//
// Bridges comparator objects to the context-free libmdbx callbacks.
//

#include "internals.h++"

#include <array>

namespace mapkv {

comparator::~comparator() noexcept {}

namespace detail {

namespace {

constexpr size_t thunk_slots = 64;

// Slots are filled once under the mutex and never cleared, the engine may
// call a registered callback at any time while a table is open.
std::array<comparator_ptr, thunk_slots> targets;
std::array<const comparator *, thunk_slots> raw_targets;
std::mutex targets_mutex;
size_t targets_used;

template <size_t SLOT>
int thunk(const MDBX_val *a, const MDBX_val *b) noexcept {
  return raw_targets[SLOT]->compare(slice(*a), slice(*b));
}

template <size_t... SLOTS>
constexpr std::array<MDBX_cmp_func *, sizeof...(SLOTS)>
make_thunks(std::index_sequence<SLOTS...>) noexcept {
  return {{&thunk<SLOTS>...}};
}

const std::array<MDBX_cmp_func *, thunk_slots> thunks =
    make_thunks(std::make_index_sequence<thunk_slots>());

} // namespace

MDBX_cmp_func *comparator_thunk(const comparator_ptr &cmp) {
  if (!cmp)
    return nullptr;

  std::lock_guard<std::mutex> guard(targets_mutex);
  for (size_t i = 0; i < targets_used; ++i)
    if (targets[i] == cmp)
      return thunks[i];

  if (MAPKV_UNLIKELY(targets_used == thunk_slots))
    error::throw_exception(errc::invalid_config,
                           "too many distinct comparators");
  targets[targets_used] = cmp;
  raw_targets[targets_used] = cmp.get();
  DEBUG("comparator %p bound to slot %zu", static_cast<const void *>(cmp.get()),
        targets_used);
  return thunks[targets_used++];
}

} // namespace detail
} // namespace mapkv
