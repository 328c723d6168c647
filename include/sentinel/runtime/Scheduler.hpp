#pragma once

#include <boost/asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sentinel::runtime {

namespace asio = boost::asio;

// Periodic tasks on one io_context. Tasks run serially on the thread
// that calls run(); a task that throws is logged and re-armed.
class Scheduler {
public:
    using Task = std::function<void()>;

    explicit Scheduler(asio::io_context& ioc);

    void every(
        const std::string& name,
        std::chrono::milliseconds period,
        Task task
    );

    // Cancels every timer. run() returns once pending handlers drain.
    void stop();

    bool stopped() const { return halted; }
    uint64_t failures() const { return failed; }

private:
    struct Periodic {
        std::string name;
        std::chrono::milliseconds period;
        Task task;
        asio::steady_timer timer;

        Periodic(asio::io_context& ioc, std::string n, std::chrono::milliseconds p, Task t)
            : name(std::move(n)), period(p), task(std::move(t)), timer(ioc) {}
    };

    void arm(Periodic& p);

    asio::io_context& ioc;
    std::vector<std::unique_ptr<Periodic>> tasks;
    bool halted = false;
    uint64_t failed = 0;
};

}
