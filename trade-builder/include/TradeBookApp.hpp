#pragma once

#include "application/CancellationToken.hpp"
#include <memory>
#include <string>
#include <vector>

// Forward declarations - Ports
namespace tradebook::ports::input {
    class ITradeRebuildService;
}

namespace tradebook::ports::output {
    class IOrderRepository;
}

namespace tradebook::settings {
    class DbSettings;
    class RebuildSettings;
}

namespace tradebook::application {
    struct BatchReport;
}

/**
 * @class TradeBookApp
 * @brief Консольное приложение пересборки сделок
 *
 * Template Method:
 * 1. loadEnvironment() - настройки из переменных окружения и аргументы CLI
 * 2. configureInjection() - Boost.DI: порты -> PostgreSQL адаптеры и RebuildController
 * 3. execute() - BatchRebuildJob по выбранным пользователям
 *
 * Коды возврата run(): 0 - успех, 2 - есть пользователи, требующие
 * внимания (сверка, откат записи, ошибка, отмена).
 * Фатальные ошибки пробрасываются в main.
 *
 * tradebook-rebuild [--full] [--json] (--all | userId...)
 */
class TradeBookApp
{
public:
    TradeBookApp();
    ~TradeBookApp();

    int run(int argc, char* argv[]);

    /**
     * @brief Запросить отмену: уже начатые пользователи доработают
     */
    void stop();

    static std::string usage();

protected:
    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();
    int execute();

private:
    struct CommandLine {
        bool full = false;
        bool json = false;
        bool all = false;
        bool help = false;
        std::vector<std::string> userIds;
    };

    static CommandLine parseArguments(int argc, char* argv[]);
    void printStartupBanner() const;
    void printReport(const tradebook::application::BatchReport& report) const;
    std::vector<std::string> selectUsers() const;

    CommandLine options_;
    std::shared_ptr<tradebook::settings::DbSettings> dbSettings_;
    std::shared_ptr<tradebook::settings::RebuildSettings> rebuildSettings_;
    std::shared_ptr<tradebook::ports::output::IOrderRepository> orderRepository_;
    std::shared_ptr<tradebook::ports::input::ITradeRebuildService> rebuildService_;
    tradebook::application::CancellationToken cancellation_;
};
