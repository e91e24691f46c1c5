// ledgerd.cpp
//
// Ledger service with an in-process decryption oracle. Load keys once, then
// serve commands on stdin (see service.h); responses go to stdout, logs to
// stderr.
//
// Usage: heal_ledgerd [--data-dir D] [--system-key K] [--ttl S] [--threads T] [--log-events]
//
// Writes:
//   <data-dir>/results/ledger_audit.csv    one row per ledger event
//   <data-dir>/results/ledger_metrics.csv  per-operation latency summary

#include "heal/audit.h"
#include "heal/config.h"
#include "heal/heal.h"
#include "heal/ledger.h"
#include "heal/oracle.h"
#include "heal/service.h"
#include "common/key_files.h"
#include "common/metrics_stats_csv.h"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <omp.h>

using namespace std;

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    HEALConfig cfg = HEALConfig::from_env();
    try {
        int first = cfg.apply_args(argc, argv);
        if (first != argc) {
            throw runtime_error(string("unknown argument ") + argv[first]);
        }
        cfg.validate();
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        cerr << "Usage: " << argv[0]
             << " [--data-dir D] [--system-key K] [--ttl S] [--threads T] [--log-events]" << endl;
        return 1;
    }

    omp_set_num_threads(cfg.threads);

    // Load once per process lifetime.
    unique_ptr<HEALSystem> system;
    SigningKey signing_key;
    try {
        HEALParams params = HEALParams::load(cfg.params_path());
        system = make_unique<HEALSystem>(params);
        system->load_context(cfg.context_path());
        system->load_public_key(cfg.public_key_path());
        system->load_secret_key(cfg.secret_key_path());
        signing_key = load_key_file<32>(cfg.oracle_key_path());
    } catch (const exception& e) {
        cerr << "Error loading ledger material from " << cfg.data_dir << ": " << e.what() << endl;
        cerr << "Run heal_setup first." << endl;
        return 1;
    }

    ensure_dir_exists(cfg.results_dir());

    LocalDecryptionOracle oracle(*system, signing_key);
    HEALLedger ledger(*system, oracle, cfg);

    AuditCsvSink audit(cfg.audit_path());
    ledger.add_sink(&audit);

    unique_ptr<ConsoleEventSink> console;
    if (cfg.log_events) {
        console = make_unique<ConsoleEventSink>(cerr);
        ledger.add_sink(console.get());
    }

    StatsCsvSink metrics(cfg.metrics_path());
    ledger.set_metrics(&metrics);

    cerr << "heal_ledgerd ready (data dir " << cfg.data_dir
         << ", default system " << cfg.system_key
         << ", request ttl " << cfg.request_ttl << "s)" << endl;

    LedgerService service(ledger, oracle, *system);
    string line;
    while (!service.quit_requested() && getline(cin, line)) {
        if (line.empty()) continue;
        cout << service.handle(line) << "\n" << std::flush;

        if (!audit.flush()) {
            cerr << "warning: cannot write " << cfg.audit_path() << ", events kept in memory" << endl;
        }
    }

    metrics.flush();
    LedgerSummary s = ledger.summary();
    cerr << "heal_ledgerd exiting: " << s.submissions << " submissions, "
         << s.revealed << " revealed, " << s.pending_requests << " pending" << endl;
    return 0;
}
