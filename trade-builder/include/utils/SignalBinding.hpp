#pragma once

#include <csignal>

namespace tradebook::utils {

/**
 * @brief Привязка SIGINT/SIGTERM к app.stop() на время жизни объекта
 *
 * Деструктор возвращает обработчики по умолчанию и забывает приложение,
 * в том числе когда run() вышел по исключению.
 */
template <typename App>
class SignalBinding {
public:
    explicit SignalBinding(App& app) {
        current_ = &app;
        std::signal(SIGINT, &SignalBinding::handle);
        std::signal(SIGTERM, &SignalBinding::handle);
    }

    ~SignalBinding() {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        current_ = nullptr;
    }

    SignalBinding(const SignalBinding&) = delete;
    SignalBinding& operator=(const SignalBinding&) = delete;

    static App* current() {
        return current_;
    }

private:
    static void handle(int /*signal*/) {
        App* app = current_;
        if (app) {
            app->stop();
        }
    }

    static inline App* current_ = nullptr;
};

} // namespace tradebook::utils
