#pragma once

#include "ports/input/ITradeRebuildService.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/ITradeRepository.hpp"
#include "settings/RebuildSettings.hpp"
#include "domain/GroupCommit.hpp"
#include "domain/exceptions/TradeBookException.hpp"
#include "domain/matching/OrderSequencer.hpp"
#include "domain/matching/GroupPipeline.hpp"
#include "utils/UuidGenerator.hpp"
#include <ThreadSafeMap.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace tradebook::application {

/**
 * @brief Оркестратор пересборки сделок пользователя
 *
 * Реализует ITradeRebuildService, координирует работу между:
 * - IOrderRepository (чтение исполнений)
 * - OrderSequencer и GroupPipeline (чистое построение сделок по группам)
 * - ITradeRepository (атомарная запись сделок и привязок ордеров)
 *
 * Группы одного пользователя считаются параллельно на собственном пуле,
 * после барьера записываются по одной в порядке ключа. Сбой записи
 * группы не мешает записи остальных. Две пересборки одного пользователя
 * одновременно не выполняются: вторая получает RebuildInProgressException.
 */
class RebuildController : public ports::input::ITradeRebuildService {
public:
    RebuildController(
        std::shared_ptr<ports::output::IOrderRepository> orderRepository,
        std::shared_ptr<ports::output::ITradeRepository> tradeRepository,
        std::shared_ptr<settings::RebuildSettings> settings
    ) : orderRepository_(std::move(orderRepository))
      , tradeRepository_(std::move(tradeRepository))
      , settings_(std::move(settings))
      , pool_(static_cast<size_t>(settings_->getGroupWorkers()))
      , idGenerator_(&utils::UuidGenerator::generate)
    {}

    ~RebuildController() override {
        pool_.join();
    }

    RebuildController(const RebuildController&) = delete;
    RebuildController& operator=(const RebuildController&) = delete;

    /**
     * @brief Подменить генератор id сделок (по умолчанию UUID v4)
     */
    void setIdGenerator(std::function<std::string()> generator) {
        idGenerator_ = std::move(generator);
    }

    domain::RebuildResult processUserOrders(const std::string& userId) override {
        return rebuild(userId, domain::RebuildScope::INCREMENTAL);
    }

    domain::RebuildResult rebuildAllTrades(const std::string& userId) override {
        return rebuild(userId, domain::RebuildScope::FULL);
    }

    domain::RebuildResult rebuild(const std::string& userId, domain::RebuildScope scope) override {
        UserLease lease(activeUsers_, userId);

        domain::RebuildResult result;
        result.userId = userId;
        result.scope = scope;
        result.startedAt = domain::Timestamp::now();

        std::cout << "[RebuildController] " << domain::toString(scope)
                  << " rebuild started for user " << userId << std::endl;

        std::vector<domain::Order> orders;
        if (scope == domain::RebuildScope::FULL) {
            orders = orderRepository_->fetchAllOrders(userId);
            tradeRepository_->resetUser(userId);
        } else {
            orders = orderRepository_->fetchUnconsumedOrders(userId);
        }

        auto sequenced = domain::matching::OrderSequencer::sequence(orders);
        result.skippedOrders = sequenced.skipped;

        std::map<domain::GroupKey, domain::Trade> continuations;
        if (scope == domain::RebuildScope::INCREMENTAL && !sequenced.groups.empty()) {
            rejectLateOrders(userId, sequenced, result.problems);
            continuations = loadContinuations(userId, sequenced, result.problems);
        }

        auto outcomes = computeGroups(userId, sequenced, continuations, result.problems);

        for (auto& outcome : outcomes) {
            commitOutcome(userId, outcome, result);
        }

        std::stable_sort(result.problems.begin(), result.problems.end(),
            [](const domain::GroupProblem& a, const domain::GroupProblem& b) {
                return std::tie(a.accountId, a.symbol) < std::tie(b.accountId, b.symbol);
            });

        result.finishedAt = domain::Timestamp::now();
        std::cout << "[RebuildController] User " << userId << ": "
                  << orders.size() << " orders, "
                  << result.skippedOrders.size() << " skipped, "
                  << result.trades.size() << " trades written, "
                  << result.problems.size() << " group problems" << std::endl;
        return result;
    }

private:
    /**
     * @brief RAII-захват пользователя на время пересборки
     */
    class UserLease {
    public:
        UserLease(ThreadSafeMap<std::string, domain::Timestamp>& registry, const std::string& userId)
            : registry_(registry), userId_(userId)
        {
            if (!registry_.tryInsert(userId_, std::make_shared<domain::Timestamp>())) {
                std::cerr << "[RebuildController] Rejected concurrent rebuild for user "
                          << userId_ << std::endl;
                throw domain::RebuildInProgressException(userId_);
            }
        }

        ~UserLease() {
            registry_.remove(userId_);
        }

        UserLease(const UserLease&) = delete;
        UserLease& operator=(const UserLease&) = delete;

    private:
        ThreadSafeMap<std::string, domain::Timestamp>& registry_;
        std::string userId_;
    };

    /**
     * @brief Снять группы, где новый ордер исполнен раньше уже записанных
     *
     * Инкрементальный режим только дописывает историю. Ордер, попавший
     * между записанными исполнениями (даже если все сделки группы закрыты),
     * меняет уже посчитанные сделки, поэтому группа уходит в problems как
     * RECONCILIATION_REQUIRED до полной пересборки.
     */
    void rejectLateOrders(
        const std::string& userId,
        domain::matching::SequencedOrders& sequenced,
        std::vector<domain::GroupProblem>& problems)
    {
        std::map<domain::GroupKey, domain::Timestamp> lastFillByKey;
        for (const auto& trade : tradeRepository_->findByUserId(userId)) {
            auto key = trade.key();
            if (sequenced.groups.count(key) == 0) {
                continue;
            }
            for (const auto& allocation : trade.allocations) {
                auto it = lastFillByKey.find(key);
                if (it == lastFillByKey.end()) {
                    lastFillByKey.emplace(key, allocation.executedAt);
                } else if (it->second < allocation.executedAt) {
                    it->second = allocation.executedAt;
                }
            }
        }

        for (const auto& [key, lastFill] : lastFillByKey) {
            const domain::Order& earliest = sequenced.groups.at(key).front();
            if (!(*earliest.executedAt < lastFill)) {
                continue;
            }
            std::string reason = "order " + earliest.id + " executed at " + earliest.executedAt->toString()
                               + ", before the last recorded fill at " + lastFill.toString()
                               + ", a full rebuild is required";
            std::cerr << "[RebuildController] " << key.toString() << ": " << reason << std::endl;
            problems.emplace_back(key, domain::ProblemKind::RECONCILIATION_REQUIRED,
                                  "Reconciliation required: " + reason);
            sequenced.groups.erase(key);
        }
    }

    /**
     * @brief Открытые сделки групп, в которых появились новые ордера
     *
     * Группа с несколькими открытыми сделками или с открытой сделкой,
     * ссылающейся на ордера, которых у пользователя больше нет, не
     * обрабатывается и попадает в problems как RECONCILIATION_REQUIRED.
     */
    std::map<domain::GroupKey, domain::Trade> loadContinuations(
        const std::string& userId,
        domain::matching::SequencedOrders& sequenced,
        std::vector<domain::GroupProblem>& problems)
    {
        std::map<domain::GroupKey, std::vector<domain::Trade>> openByKey;
        for (auto& trade : tradeRepository_->findOpenTrades(userId)) {
            auto key = trade.key();
            if (sequenced.groups.count(key) > 0) {
                openByKey[key].push_back(std::move(trade));
            }
        }

        std::map<domain::GroupKey, domain::Trade> continuations;
        for (auto& [key, trades] : openByKey) {
            std::optional<std::string> reason;
            if (trades.size() > 1) {
                reason = std::to_string(trades.size()) + " open trades in one group";
            } else {
                const auto& trade = trades.front();
                std::set<std::string> expected(trade.ordersInTrade.begin(), trade.ordersInTrade.end());
                auto found = orderRepository_->findByIds(userId, trade.ordersInTrade);
                std::set<std::string> present;
                for (const auto& order : found) {
                    present.insert(order.id);
                }
                if (present != expected) {
                    reason = "open trade " + trade.id + " references orders this user no longer has";
                }
            }

            if (reason) {
                std::cerr << "[RebuildController] " << key.toString() << ": " << *reason << std::endl;
                problems.emplace_back(key, domain::ProblemKind::RECONCILIATION_REQUIRED,
                                      "Reconciliation required: " + *reason);
                sequenced.groups.erase(key);
                continue;
            }
            continuations.emplace(key, std::move(trades.front()));
        }
        return continuations;
    }

    /**
     * @brief Посчитать все группы параллельно и дождаться всех (барьер)
     */
    std::vector<domain::matching::GroupOutcome> computeGroups(
        const std::string& userId,
        domain::matching::SequencedOrders& sequenced,
        const std::map<domain::GroupKey, domain::Trade>& continuations,
        std::vector<domain::GroupProblem>& problems)
    {
        domain::matching::PipelineContext context;
        context.userId = userId;
        context.calendar = settings_->calendar();
        context.matcherOptions.allowShortFromFlat = settings_->isShortFromFlatAllowed();
        context.idGenerator = idGenerator_;

        std::vector<std::pair<domain::GroupKey, std::future<domain::matching::GroupOutcome>>> pending;
        for (auto& [key, groupOrders] : sequenced.groups) {
            std::optional<domain::Trade> continuation;
            auto it = continuations.find(key);
            if (it != continuations.end()) {
                continuation = it->second;
            }

            auto task = std::make_shared<std::packaged_task<domain::matching::GroupOutcome()>>(
                [key = key, orders = std::move(groupOrders), continuation = std::move(continuation), context]() {
                    return domain::matching::GroupPipeline::run(key, orders, continuation, context);
                });
            pending.emplace_back(key, task->get_future());
            boost::asio::post(pool_, [task]() { (*task)(); });
        }

        std::vector<domain::matching::GroupOutcome> outcomes;
        outcomes.reserve(pending.size());
        for (auto& [key, future] : pending) {
            try {
                outcomes.push_back(future.get());
            } catch (const std::exception& e) {
                std::cerr << "[RebuildController] " << key.toString() << " failed: " << e.what() << std::endl;
                problems.emplace_back(key, domain::ProblemKind::GROUP_FAILURE, e.what());
            }
        }
        return outcomes;
    }

    void commitOutcome(const std::string& userId,
                       domain::matching::GroupOutcome& outcome,
                       domain::RebuildResult& result)
    {
        if (!outcome.ok()) {
            result.problems.push_back(*outcome.problem);
            return;
        }
        if (outcome.trades.empty()) {
            return;
        }

        auto commit = domain::GroupCommit::fromTrades(userId, outcome.key, std::move(outcome.trades));
        try {
            tradeRepository_->commitGroup(commit);
        } catch (const domain::AtomicityFailureException& e) {
            std::cerr << "[RebuildController] " << outcome.key.toString() << ": " << e.what() << std::endl;
            result.problems.emplace_back(outcome.key, domain::ProblemKind::ATOMICITY_FAILURE, e.what());
            return;
        } catch (const std::exception& e) {
            std::cerr << "[RebuildController] " << outcome.key.toString()
                      << ": group write failed: " << e.what() << std::endl;
            result.problems.emplace_back(outcome.key, domain::ProblemKind::ATOMICITY_FAILURE,
                                         std::string("Atomicity failure: ") + e.what());
            return;
        }

        for (auto& trade : commit.trades) {
            result.trades.push_back(std::move(trade));
        }
    }

    std::shared_ptr<ports::output::IOrderRepository> orderRepository_;
    std::shared_ptr<ports::output::ITradeRepository> tradeRepository_;
    std::shared_ptr<settings::RebuildSettings> settings_;
    boost::asio::thread_pool pool_;
    std::function<std::string()> idGenerator_;
    ThreadSafeMap<std::string, domain::Timestamp> activeUsers_;
};

} // namespace tradebook::application
