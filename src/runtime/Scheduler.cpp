#include "sentinel/runtime/Scheduler.hpp"

#include <iostream>
#include <stdexcept>

namespace sentinel::runtime {

Scheduler::Scheduler(asio::io_context& ioc) : ioc(ioc) {}

void Scheduler::every(
    const std::string& name,
    std::chrono::milliseconds period,
    Task task
) {
    if (period.count() <= 0) {
        throw std::invalid_argument("scheduler period must be positive: " + name);
    }
    tasks.push_back(std::make_unique<Periodic>(ioc, name, period, std::move(task)));
    arm(*tasks.back());
    std::cout << "[SCHED] " << name << " every " << period.count() << "ms" << std::endl;
}

void Scheduler::arm(Periodic& p) {
    if (halted) return;

    p.timer.expires_after(p.period);
    p.timer.async_wait([this, &p](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted || halted) return;

        try {
            p.task();
        } catch (const std::exception& e) {
            ++failed;
            std::cerr << "[SCHED] task " << p.name << " failed: " << e.what() << std::endl;
        }
        arm(p);
    });
}

void Scheduler::stop() {
    if (halted) return;
    halted = true;
    for (auto& p : tasks) {
        p->timer.cancel();
    }
    std::cout << "[SCHED] stopped" << std::endl;
}

}
