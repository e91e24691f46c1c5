// setup.cpp
//
// Trusted setup for the ledger: BFV parameters, crypto context, key pair and
// the oracle's proof-signing key, all written under the data directory.
//
// Usage: heal_setup [--data-dir D] [--threads T] [--ring-dim N] [--plain-modulus t] [--insecure]
//
// Summary timings go to <data-dir>/results/setup_metrics.csv.

#include "heal/heal.h"
#include "heal/config.h"
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

    uint32_t ring_dim = 8192;
    uint64_t plain_modulus = 786433;
    SecurityLevel sec = HEStd_128_classic;

    try {
        int i = cfg.apply_args(argc, argv);
        for (; i < argc; i++) {
            if (arg_eq(argv[i], "--ring-dim")) {
                ring_dim = (uint32_t)read_u64_flag(argc, argv, i);
            } else if (arg_eq(argv[i], "--plain-modulus")) {
                plain_modulus = read_u64_flag(argc, argv, i);
            } else if (arg_eq(argv[i], "--insecure")) {
                sec = HEStd_NotSet;
            } else {
                throw runtime_error(string("unknown argument ") + argv[i]);
            }
        }
        cfg.validate();
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        cerr << "Usage: " << argv[0]
             << " [--data-dir D] [--threads T] [--ring-dim N] [--plain-modulus t] [--insecure]" << endl;
        return 1;
    }

    omp_set_num_threads(cfg.threads);

    ensure_dir_exists(cfg.data_dir);
    ensure_dir_exists(cfg.results_dir());
    StatsCsvSink timings(cfg.results_dir() + "/setup_metrics.csv");

    cout << "=== HEAL Trusted Setup ===" << endl;
    cout << "Data dir: " << cfg.data_dir << endl;
    cout << "Ring dimension: " << ring_dim << endl;
    cout << "Plaintext modulus: " << plain_modulus << endl;

    try {
        HEALParams params(ring_dim, plain_modulus, 1, sec);
        params.validate_parameters();
        params.save(cfg.params_path());

        HEALSystem system(params);
        {
            StatsScopeTimer t(timings, "setup", "keygen");
            system.generate_keys();
        }
        {
            StatsScopeTimer t(timings, "setup", "save_keys");
            system.save_context(cfg.context_path());
            system.save_public_key(cfg.public_key_path());
            system.save_secret_key(cfg.secret_key_path());
        }
        cout << "Crypto context and keys saved to " << cfg.data_dir << endl;

        if (file_exists_nonempty(cfg.oracle_key_path())) {
            cout << "Oracle signing key already present, keeping it" << endl;
        } else {
            create_key_file_if_missing<32>(cfg.oracle_key_path());
            cout << "Oracle signing key saved to " << cfg.oracle_key_path() << endl;
        }
    } catch (const exception& e) {
        cerr << "ERROR: " << e.what() << endl;
        return 1;
    }

    timings.flush();

    cout << "\nTrusted setup complete." << endl;
    cout << "Keep " << cfg.secret_key_path() << " and " << cfg.oracle_key_path()
         << " with the decryption oracle only." << endl;
    return 0;
}
