#pragma once

#include <string>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace booking::core {

// Attempts per unit before a commit race is reported as StoreUnavailable.
inline constexpr int kMaxUnitAttempts = 3;

// Maps a repository result onto the domain error taxonomy.
void ThrowIfDbError(const db::Result& result, const std::string& context);

/*
  Runs fn(tx) inside one transaction and commits it.

  The transaction rolls back when fn throws. A commit that loses an
  optimistic race (db::TransactionConflict) reruns the whole unit, so fn
  must not have effects outside the transaction.
*/
template <typename Fn>
auto RunUnit(db::Repository& repository, bool read_only, Fn&& fn) {
  using R = std::invoke_result_t<Fn&, db::Transaction&>;

  for (int attempt = 1;; ++attempt) {
    try {
      auto tx = read_only ? repository.BeginReadOnly() : repository.Begin();
      if constexpr (std::is_void_v<R>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        R out = fn(*tx);
        tx->Commit();
        return out;
      }
    } catch (const db::TransactionConflict& e) {
      if (attempt >= kMaxUnitAttempts) {
        throw util::StoreUnavailable(std::string("transaction kept conflicting: ") + e.what());
      }
    }
  }
}

} // namespace booking::core
