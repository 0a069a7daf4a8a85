// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace tradebook::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения. Пароль обязателен:
     * без него хранилище не поднимается.
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("TRADEBOOK_DB_HOST", "localhost");
            port_ = std::stoi(getEnvOrDefault("TRADEBOOK_DB_PORT", "5432"));
            name_ = getEnvOrDefault("TRADEBOOK_DB_NAME", "tradebook");
            user_ = getEnvOrDefault("TRADEBOOK_DB_USER", "tradebook");
            password_ = getEnvOrThrow("TRADEBOOK_DB_PASSWORD");
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }

        static std::string getEnvOrThrow(const char *name)
        {
            const char *value = std::getenv(name);
            if (!value)
            {
                throw std::runtime_error(std::string("Required environment variable is not set: ") + name);
            }
            return std::string(value);
        }
    };

} // namespace tradebook::settings
