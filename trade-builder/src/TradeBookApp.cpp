#include "TradeBookApp.hpp"

// Application Services
#include "application/RebuildController.hpp"
#include "application/BatchRebuildJob.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/PostgresOrderRepository.hpp"
#include "adapters/secondary/persistence/PostgresTradeRepository.hpp"
#include "adapters/secondary/serialization/TradeJsonMapper.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/RebuildSettings.hpp"

#include <boost/di.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <set>
#include <stdexcept>

namespace di = boost::di;

using namespace tradebook;

// ============================================================================
// TradeBookApp Implementation
// ============================================================================

TradeBookApp::TradeBookApp()
{
    std::cout << "[TradeBookApp] Application created" << std::endl;
}

TradeBookApp::~TradeBookApp()
{
    std::cout << "[TradeBookApp] Application destroyed" << std::endl;
}

int TradeBookApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    if (options_.help)
    {
        std::cout << usage();
        return 0;
    }
    configureInjection();
    return execute();
}

void TradeBookApp::stop()
{
    cancellation_.cancel();
}

std::string TradeBookApp::usage()
{
    return "Usage: tradebook-rebuild [--full] [--json] (--all | userId...)\n"
           "  --full   rebuild all trades from scratch (default: incremental)\n"
           "  --json   print written trades and problems as JSON\n"
           "  --all    rebuild every user that owns orders\n";
}

TradeBookApp::CommandLine TradeBookApp::parseArguments(int argc, char* argv[])
{
    CommandLine options;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--full")
            options.full = true;
        else if (arg == "--json")
            options.json = true;
        else if (arg == "--all")
            options.all = true;
        else if (arg == "--help" || arg == "-h")
            options.help = true;
        else if (!arg.empty() && arg[0] == '-')
            throw std::invalid_argument("Unknown option: " + arg + "\n" + usage());
        else
            options.userIds.push_back(arg);
    }

    if (!options.help && options.all == !options.userIds.empty())
    {
        throw std::invalid_argument("Specify either --all or at least one userId\n" + usage());
    }
    return options;
}

void TradeBookApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[TradeBookApp] Loading environment..." << std::endl;

    options_ = parseArguments(argc, argv);
    if (options_.help)
    {
        return;
    }

    rebuildSettings_ = std::make_shared<settings::RebuildSettings>();
    dbSettings_ = std::make_shared<settings::DbSettings>();

    std::cout << "[TradeBookApp] Environment loaded: "
              << rebuildSettings_->getGroupWorkers() << " group workers, "
              << rebuildSettings_->getUserWorkers() << " user workers, holding period "
              << domain::toString(rebuildSettings_->getHoldingPeriodMode()) << std::endl;
}

void TradeBookApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[TradeBookApp] Configuring Boost.DI injection..." << std::endl;

    auto injector = di::make_injector(

        // Settings
        di::bind<settings::DbSettings>().to(dbSettings_),
        di::bind<settings::RebuildSettings>().to(rebuildSettings_),

        // Output Ports <- Secondary Adapters
        di::bind<ports::output::IOrderRepository>()
            .to<adapters::secondary::PostgresOrderRepository>()
            .in(di::singleton),

        di::bind<ports::output::ITradeRepository>()
            .to<adapters::secondary::PostgresTradeRepository>()
            .in(di::singleton),

        // Input Ports <- Application Services
        di::bind<ports::input::ITradeRebuildService>()
            .to<application::RebuildController>()
            .in(di::singleton));

    orderRepository_ = injector.create<std::shared_ptr<ports::output::IOrderRepository>>();
    rebuildService_ = injector.create<std::shared_ptr<ports::input::ITradeRebuildService>>();

    std::cout << "[TradeBookApp] Injector configured (2 repositories, 1 service)" << std::endl;
}

std::vector<std::string> TradeBookApp::selectUsers() const
{
    std::vector<std::string> candidates = options_.all ? orderRepository_->findUserIds() : options_.userIds;

    std::vector<std::string> users;
    std::set<std::string> seen;
    for (const auto& userId : candidates)
    {
        if (seen.insert(userId).second)
        {
            users.push_back(userId);
        }
    }
    return users;
}

int TradeBookApp::execute()
{
    auto users = selectUsers();
    auto scope = options_.full ? domain::RebuildScope::FULL : domain::RebuildScope::INCREMENTAL;

    application::BatchRebuildJob job(rebuildService_, rebuildSettings_);
    auto report = job.run(users, scope, cancellation_);

    printReport(report);
    return (report.requiresAttention() || report.cancelled) ? 2 : 0;
}

void TradeBookApp::printReport(const application::BatchReport& report) const
{
    for (const auto& result : report.results)
    {
        std::cout << "  " << result.userId << ": "
                  << result.trades.size() << " trades ("
                  << result.openTradesCount() << " open), "
                  << result.skippedOrders.size() << " skipped orders" << std::endl;
        for (const auto& problem : result.problems)
        {
            std::cout << "    ! " << problem.accountId << "/" << problem.symbol << " "
                      << domain::toString(problem.kind) << ": " << problem.message << std::endl;
        }
    }
    for (const auto& [userId, message] : report.failedUsers)
    {
        std::cout << "  " << userId << ": FAILED " << message << std::endl;
    }
    if (report.cancelled)
    {
        std::cout << "  cancelled, not started: " << report.usersSkipped.size() << " users" << std::endl;
    }

    if (options_.json)
    {
        nlohmann::json results = nlohmann::json::array();
        for (const auto& result : report.results)
        {
            results.push_back(adapters::secondary::TradeJsonMapper::toJson(result));
        }
        nlohmann::json output = {
            {"results", results},
            {"failed_users", report.failedUsers},
            {"users_skipped", report.usersSkipped},
            {"cancelled", report.cancelled}
        };
        std::cout << output.dump(2) << std::endl;
    }
}

void TradeBookApp::printStartupBanner() const
{
    std::cout << "========================================" << std::endl;
    std::cout << "  TradeBook rebuild" << std::endl;
    std::cout << "  Mode:  " << (options_.full ? "FULL" : "INCREMENTAL") << std::endl;
    std::cout << "  Users: " << (options_.all ? std::string("all") : std::to_string(options_.userIds.size())) << std::endl;
    std::cout << "  Database: " << dbSettings_->getHost() << ":" << dbSettings_->getPort()
              << "/" << dbSettings_->getName() << std::endl;
    std::cout << "========================================" << std::endl;
}
