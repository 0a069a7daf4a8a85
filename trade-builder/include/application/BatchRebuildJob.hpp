#pragma once

#include "application/CancellationToken.hpp"
#include "ports/input/ITradeRebuildService.hpp"
#include "settings/RebuildSettings.hpp"
#include "domain/RebuildResult.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tradebook::application {

/**
 * @brief Итог пакетной пересборки
 */
struct BatchReport {
    std::vector<domain::RebuildResult> results;          ///< В порядке входного списка
    std::map<std::string, std::string> failedUsers;      ///< userId -> текст исключения
    std::vector<std::string> usersSkipped;               ///< Не запускались из-за отмены
    bool cancelled = false;

    /**
     * @brief Нужна ли реакция оператора (упавшие пользователи, сверка, откат записи)
     */
    bool requiresAttention() const {
        if (!failedUsers.empty()) {
            return true;
        }
        return std::any_of(results.begin(), results.end(),
            [](const domain::RebuildResult& r) { return r.requiresAttention(); });
    }

    size_t tradesWritten() const {
        size_t count = 0;
        for (const auto& result : results) {
            count += result.trades.size();
        }
        return count;
    }
};

/**
 * @brief Пересборка многих пользователей пачками по userWorkers
 *
 * Пользователи независимы и обрабатываются параллельно на отдельном
 * пуле (не на пуле групп контроллера). Отмена проверяется только
 * между пачками: запущенные пользователи всегда доводятся до конца.
 * Исключение одного пользователя не прерывает пакет.
 */
class BatchRebuildJob {
public:
    BatchRebuildJob(
        std::shared_ptr<ports::input::ITradeRebuildService> rebuildService,
        std::shared_ptr<settings::RebuildSettings> settings
    ) : rebuildService_(std::move(rebuildService))
      , settings_(std::move(settings))
    {}

    BatchReport run(const std::vector<std::string>& userIds,
                    domain::RebuildScope scope,
                    const CancellationToken& token) {
        BatchReport report;
        const size_t batchSize = static_cast<size_t>(std::max(1, settings_->getUserWorkers()));
        boost::asio::thread_pool pool(batchSize);

        std::cout << "[BatchRebuildJob] " << domain::toString(scope) << " rebuild of "
                  << userIds.size() << " users, " << batchSize << " at a time" << std::endl;

        for (size_t start = 0; start < userIds.size(); start += batchSize) {
            if (token.isCancelled()) {
                report.cancelled = true;
                report.usersSkipped.assign(userIds.begin() + static_cast<std::ptrdiff_t>(start), userIds.end());
                std::cout << "[BatchRebuildJob] Cancelled, " << report.usersSkipped.size()
                          << " users not started" << std::endl;
                break;
            }

            const size_t end = std::min(start + batchSize, userIds.size());
            std::vector<std::future<domain::RebuildResult>> futures;
            for (size_t i = start; i < end; ++i) {
                auto task = std::make_shared<std::packaged_task<domain::RebuildResult()>>(
                    [this, userId = userIds[i], scope]() {
                        return rebuildService_->rebuild(userId, scope);
                    });
                futures.push_back(task->get_future());
                boost::asio::post(pool, [task]() { (*task)(); });
            }

            for (size_t i = start; i < end; ++i) {
                const std::string& userId = userIds[i];
                try {
                    report.results.push_back(futures[i - start].get());
                } catch (const std::exception& e) {
                    std::cerr << "[BatchRebuildJob] User " << userId << " failed: " << e.what() << std::endl;
                    report.failedUsers[userId] = e.what();
                }
            }
        }

        pool.join();

        std::cout << "[BatchRebuildJob] Done: " << report.results.size() << " users rebuilt, "
                  << report.failedUsers.size() << " failed, "
                  << report.tradesWritten() << " trades written" << std::endl;
        return report;
    }

    BatchReport run(const std::vector<std::string>& userIds, domain::RebuildScope scope) {
        CancellationToken never;
        return run(userIds, scope, never);
    }

private:
    std::shared_ptr<ports::input::ITradeRebuildService> rebuildService_;
    std::shared_ptr<settings::RebuildSettings> settings_;
};

} // namespace tradebook::application
