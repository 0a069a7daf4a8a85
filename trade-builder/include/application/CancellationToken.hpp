#pragma once

#include <atomic>

namespace tradebook::application {

/**
 * @brief Флаг отмены, который можно взвести из обработчика сигнала
 */
class CancellationToken {
public:
    void cancel() noexcept {
        cancelled_.store(true);
    }

    bool isCancelled() const noexcept {
        return cancelled_.load();
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace tradebook::application
