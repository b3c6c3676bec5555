#include "RoomSweeper.h"
#include <iostream>

RoomSweeper::RoomSweeper(RoomRegistry& rooms, std::chrono::seconds sweepInterval,
                         std::chrono::seconds roomRetention)
    : registry(rooms), interval(sweepInterval), retention(roomRetention), stopping(false) {}

RoomSweeper::~RoomSweeper() {
    stop();
}

void RoomSweeper::start() {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (worker.joinable()) {
        return;
    }
    stopping = false;
    worker = std::thread(&RoomSweeper::run, this);
}

void RoomSweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        stopping = true;
    }
    wake.notify_all();

    if (worker.joinable()) {
        worker.join();
    }
}

size_t RoomSweeper::sweepOnce() {
    size_t removed = registry.expireRooms(Room::Clock::now(), retention);
    if (removed > 0) {
        std::cout << "[sweeper] Removed " << removed << " expired room(s), "
                  << registry.roomCount() << " remaining" << std::endl;
    }
    return removed;
}

void RoomSweeper::run() {
    std::unique_lock<std::mutex> lock(stateMutex);
    while (!stopping) {
        if (wake.wait_for(lock, interval, [this] { return stopping; })) {
            break;
        }

        lock.unlock();
        sweepOnce();
        lock.lock();
    }
}
