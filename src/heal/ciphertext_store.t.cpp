#include "test_util.h"

#include "heal/ciphertext_store.h"

using namespace heal_test;

TEST_CASE("CiphertextStoreIdsStartAtOne") {
    const HEALSystem& system = test_system();
    CiphertextStore store;
    CHECK(store.size() == 0);
    CHECK(!store.contains(0));
    CHECK(!store.contains(1));

    uint64_t a = store.submit(system.encrypt_reading(1, 2, 3), 1000, "alice", "grid");
    uint64_t b = store.submit(system.encrypt_reading(4, 5, 6), 1001, "bob", "grid");
    uint64_t c = store.submit(system.encrypt_reading(7, 8, 9), 1002, "", "other");

    CHECK(a == 1);
    CHECK(b == 2);
    CHECK(c == 3);
    CHECK(store.size() == 3);
    CHECK(store.ids() == std::vector<uint64_t>{1, 2, 3});
}

TEST_CASE("CiphertextStoreGet") {
    const HEALSystem& system = test_system();
    CiphertextStore store;
    EncryptedReading reading = system.encrypt_reading(5, 1700000000, 7);
    uint64_t id = store.submit(reading, 1234, "alice", "grid");

    const Submission& s = store.get(id);
    CHECK(s.id == id);
    CHECK(s.accepted_at == 1234);
    CHECK(s.tenant == "alice");
    CHECK(s.system_key == "grid");
    // Handles are stored as given.
    CHECK(s.reading.usage == reading.usage);
    CHECK(s.reading.load == reading.load);
    CHECK(system.decrypt(s.reading.load) == 7);
}

TEST_CASE("CiphertextStoreNotFound") {
    const HEALSystem& system = test_system();
    CiphertextStore store;
    store.submit(system.encrypt_reading(1, 2, 3), 0, "", "grid");

    CHECK(error_kind_of([&] { store.get(0); }) == HEALErrorKind::NOT_FOUND);
    CHECK(error_kind_of([&] { store.get(2); }) == HEALErrorKind::NOT_FOUND);
    CHECK(error_kind_of([&] { store.get(UINT64_MAX); }) == HEALErrorKind::NOT_FOUND);
}

TEST_CASE("CiphertextStoreRejectsMissingCiphertext") {
    const HEALSystem& system = test_system();
    CiphertextStore store;

    EncryptedReading reading = system.encrypt_reading(1, 2, 3);
    reading.timestamp = nullptr;
    CHECK(error_kind_of([&] { store.submit(reading, 0, "", "grid"); }) ==
          HEALErrorKind::INVALID_ARGUMENT);
    // No id was consumed.
    CHECK(store.size() == 0);
    CHECK(store.submit(system.encrypt_reading(1, 2, 3), 0, "", "grid") == 1);
}
