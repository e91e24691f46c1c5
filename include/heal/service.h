// service.h
#ifndef HEAL_SERVICE_H
#define HEAL_SERVICE_H

#include "heal/ledger.h"
#include "heal/oracle.h"

#include <iostream>
#include <sstream>
#include <string>

/**
   LedgerService. Line protocol over a pair of streams, one command per line:

     SUBMIT <usage> <timestamp> <load> [tenant] [system_key]   -> OK <id>
     SUBMIT_CT <file> [tenant] [system_key]                    -> OK <id>
     REVEAL <id>                                               -> OK <request_id>
     REJECT <id> [tenant]                                      -> OK
     LIST [tenant]                                             -> OK <id>...
     REVEAL_SUM <system_key>                                   -> OK <request_id>
     FULFILL                                                   -> OK <delivered> <rejected>
     EXPIRE [max_age_seconds]                                  -> OK <expired>
     GET <id>              -> OK <revealed> <usage> <load> <reading_timestamp>
     STATE <id>            -> OK SEALED|REQUESTED|REVEALED|REJECTED
     SUM <system_key>      -> OK <state> <contributions> <revealed_sum> <ciphertext_bytes>
     KEYS                  -> OK <key>...
     STATS                 -> OK submissions=.. revealed=.. rejected=.. pending=.. systems=.. usage=.. load=..
     QUIT                  -> OK

   Omitted tenants mean the anonymous tenant, as for SUBMIT. Failures answer
   ERR <kind> <message> and the loop keeps going.
**/
class LedgerService {
public:
    LedgerService(HEALLedger& ledger, LocalDecryptionOracle& oracle, const HEALSystem& system);

    // Returns the response line without the trailing newline.
    std::string handle(const std::string& line);

    // Reads until QUIT or end of input.
    void run(std::istream& in, std::ostream& out);

    bool quit_requested() const { return quit; }

private:
    std::string dispatch(const std::string& cmd, std::istringstream& args);

    HEALLedger& ledger;
    LocalDecryptionOracle& oracle;
    const HEALSystem& system;
    bool quit = false;
};

const char* to_string(RevealState state);
const char* to_string(SumState state);

#endif
