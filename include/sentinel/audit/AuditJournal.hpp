#pragma once

#include <fstream>
#include <string>
#include <vector>

namespace sentinel::audit {

// Append-only line storage behind the Audit Store.
// Implementations throw StoreError on I/O failure.
class IAuditJournal {
public:
    virtual ~IAuditJournal() = default;

    virtual void append(const std::string& line) = 0;
    virtual std::vector<std::string> readAll() = 0;
    virtual std::string location() const = 0;
};

// JSON-lines file opened for append only. There is no truncate,
// seek or rewrite path.
class FileAuditJournal : public IAuditJournal {
public:
    explicit FileAuditJournal(const std::string& path);
    ~FileAuditJournal() override;

    void append(const std::string& line) override;
    std::vector<std::string> readAll() override;
    std::string location() const override { return path; }

private:
    std::string path;
    std::ofstream out;
};

// Volatile journal for tests and dry runs.
class MemoryAuditJournal : public IAuditJournal {
public:
    void append(const std::string& line) override;
    std::vector<std::string> readAll() override;
    std::string location() const override { return "memory"; }

    std::vector<std::string> lines;
};

}
