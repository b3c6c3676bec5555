#ifndef ROOM_SWEEPER_H
#define ROOM_SWEEPER_H

#include "RoomRegistry.h"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

/**
 * Background thread that periodically drops rooms older than the retention window.
 * Stops and joins on destruction.
 */
class RoomSweeper {
private:
    RoomRegistry& registry;
    std::chrono::seconds interval;
    std::chrono::seconds retention;

    std::mutex stateMutex;
    std::condition_variable wake;
    bool stopping;
    std::thread worker;

    void run();

public:
    RoomSweeper(RoomRegistry& rooms, std::chrono::seconds sweepInterval, std::chrono::seconds roomRetention);
    ~RoomSweeper();

    RoomSweeper(const RoomSweeper&) = delete;
    RoomSweeper& operator=(const RoomSweeper&) = delete;

    void start();
    void stop();

    /**
     * One sweep against the current time
     * @return Number of rooms removed
     */
    size_t sweepOnce();
};

#endif // ROOM_SWEEPER_H
