// client.cpp
//
// Tenant side: encrypts one energy reading under the ledger's public key and
// writes the ciphertext triple (usage, timestamp, load) to a file that the
// ledger daemon accepts with SUBMIT_CT.
//
// Usage: heal_client [--data-dir D] <usage> <load> <out_file> [timestamp]

#include "heal/heal.h"
#include "heal/config.h"
#include "heal/ledger.h"
#include "common/key_files.h"
#include "common/metrics_stats_csv.h"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include <omp.h>

using namespace std;

int main(int argc, char* argv[]) {
    HEALConfig cfg = HEALConfig::from_env();

    int first = 1;
    try {
        first = cfg.apply_args(argc, argv);
        cfg.validate();
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    const int n_pos = argc - first;
    if (n_pos != 3 && n_pos != 4) {
        cerr << "Usage: " << argv[0] << " [--data-dir D] <usage> <load> <out_file> [timestamp]" << endl;
        return 1;
    }

    omp_set_num_threads(cfg.threads);

    try {
        uint64_t usage = stoull(argv[first]);
        uint64_t load = stoull(argv[first + 1]);
        string out_file = argv[first + 2];
        uint64_t timestamp = (n_pos == 4) ? stoull(argv[first + 3]) : unix_time_s();

        HEALParams params = HEALParams::load(cfg.params_path());
        HEALSystem system(params);
        system.load_context(cfg.context_path());
        system.load_public_key(cfg.public_key_path());

        ensure_dir_exists(cfg.results_dir());
        StatsCsvSink timings(cfg.results_dir() + "/client_metrics.csv");

        EncryptedReading reading;
        {
            StatsScopeTimer t(timings, "client", "encrypt_reading");
            reading = system.encrypt_reading(usage, timestamp, load);
        }
        {
            StatsScopeTimer t(timings, "client", "save_reading");
            ensure_parent_exists(out_file);
            system.save_reading(reading, out_file);
        }

        cout << "Encrypted reading written to " << out_file << endl;
    } catch (const exception& e) {
        cerr << "ERROR: " << e.what() << endl;
        return 1;
    }

    return 0;
}
