#include "test_util.h"

#include "heal/reveal_store.h"

using namespace heal_test;

TEST_CASE("RevealStoreOpensUnrevealed") {
    RevealStore store;
    store.open(1);

    const RevealRecord& r = store.get(1);
    CHECK(!r.revealed);
    CHECK(r.usage == 0);
    CHECK(r.load == 0);
    CHECK(store.size() == 1);
    CHECK(store.revealed_count() == 0);

    CHECK(error_kind_of([&] { store.open(1); }) == HEALErrorKind::INVALID_ARGUMENT);
    CHECK(error_kind_of([&] { store.get(2); }) == HEALErrorKind::NOT_FOUND);
}

TEST_CASE("RevealStoreWritesOnce") {
    RevealStore store;
    store.open(1);
    store.open(2);

    store.reveal(1, 5, 7, 1700000000, 2000);
    CHECK(store.is_revealed(1));
    CHECK(!store.is_revealed(2));
    CHECK(store.revealed_count() == 1);

    const RevealRecord& r = store.get(1);
    CHECK(r.usage == 5);
    CHECK(r.load == 7);
    CHECK(r.reading_timestamp == 1700000000);
    CHECK(r.revealed_at == 2000);

    // A second write is refused and leaves the first intact.
    CHECK(error_kind_of([&] { store.reveal(1, 50, 70, 1, 3000); }) ==
          HEALErrorKind::ALREADY_REVEALED);
    CHECK(store.get(1).usage == 5);
    CHECK(store.get(1).load == 7);
    CHECK(store.get(1).revealed_at == 2000);
    CHECK(store.revealed_count() == 1);

    CHECK(error_kind_of([&] { store.reveal(9, 1, 1, 1, 1); }) == HEALErrorKind::NOT_FOUND);
}

TEST_CASE("RevealStoreRejectIsFinal") {
    RevealStore store;
    store.open(1);
    store.open(2);

    store.reject(1, 1500);
    CHECK(store.is_rejected(1));
    CHECK(!store.is_revealed(1));
    CHECK(store.get(1).rejected_at == 1500);
    CHECK(store.rejected_count() == 1);

    CHECK(error_kind_of([&] { store.reveal(1, 5, 7, 1, 2000); }) ==
          HEALErrorKind::ALREADY_REJECTED);
    CHECK(error_kind_of([&] { store.reject(1, 1600); }) == HEALErrorKind::ALREADY_REJECTED);
    CHECK(store.get(1).rejected_at == 1500);

    store.reveal(2, 5, 7, 1, 2000);
    CHECK(error_kind_of([&] { store.reject(2, 2100); }) == HEALErrorKind::ALREADY_REVEALED);
    CHECK(!store.is_rejected(2));
    CHECK(store.rejected_count() == 1);
    CHECK(error_kind_of([&] { store.reject(3, 1); }) == HEALErrorKind::NOT_FOUND);
}
