#include "sentinel/audit/AuditJournal.hpp"

#include "sentinel/core/Errors.hpp"

#include <cerrno>
#include <cstring>

namespace sentinel::audit {

FileAuditJournal::FileAuditJournal(
    const std::string& path
) : path(path) {
    out.open(
        path,
        std::ios::out |
        std::ios::app
    );
    if (!out.is_open()) {
        throw StoreError(
            "cannot open journal " + path + ": " +
            std::strerror(errno)
        );
    }
}

FileAuditJournal::~FileAuditJournal() {
    if (out.is_open()) {
        out.close();
    }
}

void FileAuditJournal::append(const std::string& line) {
    out << line << '\n';
    out.flush();
    if (!out) {
        out.clear();
        throw StoreError("append failed on " + path);
    }
}

std::vector<std::string> FileAuditJournal::readAll() {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw StoreError("cannot read journal " + path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    if (in.bad()) {
        throw StoreError("read failed on " + path);
    }
    return lines;
}

void MemoryAuditJournal::append(const std::string& line) {
    lines.push_back(line);
}

std::vector<std::string> MemoryAuditJournal::readAll() {
    return lines;
}

}
