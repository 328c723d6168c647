#include "sentinel/audit/AuditStore.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: sentinel_audit_verify <audit.jsonl>\n";
        return 2;
    }

    std::ifstream in(argv[1]);
    if (!in.is_open()) {
        std::cerr << "cannot open " << argv[1] << "\n";
        return 2;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }

    sentinel::audit::IntegrityReport r = sentinel::audit::verifyJournal(lines);

    std::cout << "journal:      " << argv[1] << "\n";
    std::cout << "records:      " << r.records << "\n";
    std::cout << "bad lines:    " << r.bad_lines << "\n";
    std::cout << "chain breaks: " << r.chain_breaks << "\n";
    std::cout << "last hash:    " << (r.last_hash.empty() ? "-" : r.last_hash) << "\n";
    if (!r.intact) {
        std::cout << "first error:  " << r.first_error << "\n";
        std::cout << "RESULT: CHAIN BROKEN\n";
        return 1;
    }
    std::cout << "RESULT: INTACT\n";
    return 0;
}
