// audit.h
#ifndef HEAL_AUDIT_H
#define HEAL_AUDIT_H

#include "heal/events.h"

#include <iostream>
#include <mutex>
#include <string>
#include <vector>

/**
   AuditCsvSink. Buffers ledger events and appends them to a CSV file on
   flush() or destruction:

     timestamp,event,id,system_key,request_id
**/
class AuditCsvSink : public EventSink {
public:
    explicit AuditCsvSink(std::string path);
    ~AuditCsvSink() override;

    void on_event(const LedgerEvent& event) override;

    // Returns false if the file could not be opened; events stay buffered.
    bool flush();

    size_t buffered() const;

private:
    bool file_exists_nonempty_() const;

    std::string path_;
    mutable std::mutex mu_;
    std::vector<LedgerEvent> buf_;
};

// One line per event on the given stream.
class ConsoleEventSink : public EventSink {
public:
    explicit ConsoleEventSink(std::ostream& out = std::cout) : out_(out) {}

    void on_event(const LedgerEvent& event) override;

private:
    std::ostream& out_;
};

#endif
