#include "TradeBookApp.hpp"
#include "utils/SignalBinding.hpp"
#include <iostream>

int main(int argc, char* argv[])
{
    try
    {
        TradeBookApp app;

        // Отмена между пачками пользователей, начатые доработают
        tradebook::utils::SignalBinding<TradeBookApp> signals(app);

        return app.run(argc, argv);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
