#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>

namespace TS {

struct RuntimeOptions {
    std::size_t               inputQueueCapacity = 256;
    std::chrono::milliseconds inputPushTimeout{10};
    std::chrono::milliseconds inputPollTimeout{100};
    std::chrono::milliseconds frameInterval{16};
    std::size_t               historyCapacity     = 100;
    std::size_t               layoutCacheCapacity = 1000;
    // Workers backing asynchronous composite actions; 0 disables the pool.
    std::size_t               workerCount = 2;
    std::filesystem::path     panicLogPath;
    bool                      rethrowPanics = false;
};

} // namespace TS
