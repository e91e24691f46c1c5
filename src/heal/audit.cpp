// audit.cpp
#include "heal/audit.h"
#include "common/key_files.h"

#include <fstream>
#include <utility>

AuditCsvSink::AuditCsvSink(std::string path) : path_(std::move(path)) {}

AuditCsvSink::~AuditCsvSink() {
    if (!flush()) {
        std::cerr << "audit: dropped " << buf_.size() << " events, cannot write " << path_ << std::endl;
    }
}

void AuditCsvSink::on_event(const LedgerEvent& event) {
    std::lock_guard<std::mutex> lk(mu_);
    buf_.push_back(event);
}

size_t AuditCsvSink::buffered() const {
    std::lock_guard<std::mutex> lk(mu_);
    return buf_.size();
}

bool AuditCsvSink::file_exists_nonempty_() const {
    return file_exists_nonempty(path_);
}

bool AuditCsvSink::flush() {
    std::lock_guard<std::mutex> lk(mu_);
    if (buf_.empty()) return true;

    const bool need_header = !file_exists_nonempty_();
    std::ofstream out(path_, std::ios::app);
    if (!out) return false;

    if (need_header) {
        out << "timestamp,event,id,system_key,request_id\n";
    }
    for (const auto& e : buf_) {
        out << e.timestamp << ","
            << to_string(e.type) << ","
            << e.id << ","
            << e.system_key << ","
            << e.request_id
            << "\n";
    }
    buf_.clear();
    return true;
}

void ConsoleEventSink::on_event(const LedgerEvent& event) {
    out_ << "[event] " << to_string(event.type);
    if (event.id != 0) out_ << " id=" << event.id;
    if (!event.system_key.empty()) out_ << " system=" << event.system_key;
    if (event.request_id != 0) out_ << " request=" << event.request_id;
    out_ << " at=" << event.timestamp << "\n";
}
