//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include <iostream>
#include <string>
#include <deque>
#include <gsd.hpp>

// a unit of work which runs until the shutdown is triggered
gsd::co<int> worker(gsd::shutdown<std::string> sd, int id) {
    std::string reason = co_await sd.wait_shutdown_triggered();

    // cleanup runs while this worker still delays completion
    std::cout << "worker " << id << " stopping: " << reason << std::endl;
    co_return id;
}

// an operation which outlives the trigger, its cancel adapter destroys it
gsd::co<void> listener(gsd::shutdown<std::string> sd) {
    co_await sd.wait_shutdown_complete();
}

gsd::co<int> square(int i) {
    co_return i * i;
}

// the process can't keep running once this returns
gsd::co<void> supervisor(int rounds) {
    int total = 0;

    for(int i=0; i<rounds; ++i) {
        total += co_await gsd::scheduler::local().schedule(square(i));
    }

    std::cout << "supervisor computed " << total << std::endl;
}

int main() {
    // start the framework and stash RAII management object on stack
    auto lifecycle = gsd::initialize();
    gsd::shutdown<std::string> sd;
    std::deque<gsd::awt<int>> workers;

    for(int i=0; i<3; ++i) {
        auto w = sd.wrap_delay_shutdown(worker(sd, i));

        if(w) {
            workers.push_back(gsd::schedule(std::move(*w)));
        }
    }

    auto listening = gsd::schedule(sd.wrap_cancel(listener(sd)));
    gsd::schedule(sd.wrap_vital(supervisor(100), std::string("supervisor exited")));

    std::string reason = sd.wait_shutdown_complete();
    std::cout << "shutdown complete: " << reason << std::endl;

    gsd::result<void,std::string> r = listening;

    if(!r) {
        std::cout << "listener cancelled: " << r.error() << std::endl;
    }

    while(workers.size()) {
        int id = workers.front();
        workers.pop_front();
        std::cout << "worker " << id << " joined" << std::endl;
    }

    return 0;
}
