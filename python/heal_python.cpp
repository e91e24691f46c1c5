#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include "heal/config.h"
#include "heal/errors.h"
#include "heal/heal.h"
#include "heal/ledger.h"
#include "heal/oracle.h"
#include "heal/service.h"
#include "common/key_files.h"

namespace py = pybind11;

// Ledger plus in-process oracle, loaded from a heal_setup data directory.
class HEALLedgerWrapper {
private:
    std::unique_ptr<HEALSystem> system;
    std::unique_ptr<LocalDecryptionOracle> oracle;
    std::unique_ptr<HEALLedger> ledger;

public:
    explicit HEALLedgerWrapper(const std::string& data_dir) {
        HEALConfig cfg = HEALConfig::from_env();
        cfg.data_dir = data_dir;
        cfg.validate();

        HEALParams params = HEALParams::load(cfg.params_path());
        system = std::make_unique<HEALSystem>(params);
        system->load_context(cfg.context_path());
        system->load_public_key(cfg.public_key_path());
        system->load_secret_key(cfg.secret_key_path());

        oracle = std::make_unique<LocalDecryptionOracle>(
            *system, load_key_file<32>(cfg.oracle_key_path()));
        ledger = std::make_unique<HEALLedger>(*system, *oracle, cfg);
    }

    uint64_t submit(uint64_t usage, uint64_t timestamp, uint64_t load,
                    const std::string& tenant, const std::string& system_key) {
        return ledger->submit_plain(usage, timestamp, load, tenant, system_key);
    }

    uint64_t submit_file(const std::string& path, const std::string& tenant,
                         const std::string& system_key) {
        return ledger->submit(system->load_reading(path), tenant, system_key);
    }

    uint64_t request_reveal(uint64_t id) { return ledger->request_reveal(id); }

    uint64_t request_sum_reveal(const std::string& system_key) {
        return ledger->request_sum_reveal(system_key);
    }

    void reject(uint64_t id, const std::string& tenant) { ledger->reject(id, tenant); }

    std::vector<uint64_t> submissions_of(const std::string& tenant) const {
        return ledger->submissions_of(tenant);
    }

    std::tuple<size_t, size_t> fulfill() {
        FulfillReport report = oracle->fulfill();
        return std::make_tuple(report.delivered, report.rejected);
    }

    size_t expire(uint64_t max_age) { return ledger->expire_requests(max_age); }

    py::dict get(uint64_t id) const {
        RevealRecord r = ledger->get(id);
        py::dict d;
        d["revealed"] = r.revealed;
        d["usage"] = r.usage;
        d["load"] = r.load;
        d["reading_timestamp"] = r.reading_timestamp;
        d["revealed_at"] = r.revealed_at;
        return d;
    }

    std::string state(uint64_t id) const { return to_string(ledger->reveal_state(id)); }

    py::dict sum(const std::string& system_key) const {
        AggregateState st = ledger->get_aggregate(system_key);
        py::dict d;
        d["state"] = std::string(to_string(st.state));
        d["contributions"] = st.contributions;
        d["revealed_sum"] = st.revealed_sum;
        d["revealed_contributions"] = st.revealed_contributions;
        return d;
    }

    std::vector<std::string> system_keys() const { return ledger->system_keys(); }

    py::dict summary() const {
        LedgerSummary s = ledger->summary();
        py::dict d;
        d["submissions"] = s.submissions;
        d["revealed"] = s.revealed;
        d["rejected"] = s.rejected;
        d["pending_requests"] = s.pending_requests;
        d["system_keys"] = s.system_keys;
        d["total_revealed_usage"] = s.total_revealed_usage;
        d["total_revealed_load"] = s.total_revealed_load;
        return d;
    }

    bool is_available() const { return ledger->is_available(); }
};

PYBIND11_MODULE(heal_py, m) {
    m.doc() = "HEAL encrypted energy ledger Python bindings";

    py::register_exception<HEALError>(m, "HEALError");

    py::class_<HEALLedgerWrapper>(m, "Ledger")
        .def(py::init<const std::string&>(), py::arg("data_dir") = "data")
        .def("submit", &HEALLedgerWrapper::submit,
             py::arg("usage"), py::arg("timestamp"), py::arg("load"),
             py::arg("tenant") = "", py::arg("system_key") = "")
        .def("submit_file", &HEALLedgerWrapper::submit_file,
             py::arg("path"), py::arg("tenant") = "", py::arg("system_key") = "")
        .def("request_reveal", &HEALLedgerWrapper::request_reveal, py::arg("id"))
        .def("request_sum_reveal", &HEALLedgerWrapper::request_sum_reveal, py::arg("system_key"))
        .def("reject", &HEALLedgerWrapper::reject, py::arg("id"), py::arg("tenant") = "")
        .def("submissions_of", &HEALLedgerWrapper::submissions_of, py::arg("tenant") = "")
        .def("fulfill", &HEALLedgerWrapper::fulfill)
        .def("expire", &HEALLedgerWrapper::expire, py::arg("max_age"))
        .def("get", &HEALLedgerWrapper::get, py::arg("id"))
        .def("state", &HEALLedgerWrapper::state, py::arg("id"))
        .def("sum", &HEALLedgerWrapper::sum, py::arg("system_key"))
        .def("system_keys", &HEALLedgerWrapper::system_keys)
        .def("summary", &HEALLedgerWrapper::summary)
        .def("is_available", &HEALLedgerWrapper::is_available);
}
