#pragma once

#include "settings/Environment.hpp"
#include <string>

namespace corebank::settings {

/**
 * @brief Настройки подключения к PostgreSQL
 *
 * COREBANK_DB_HOST, COREBANK_DB_PORT, COREBANK_DB_NAME, COREBANK_DB_USER,
 * COREBANK_DB_PASSWORD.
 *
 * @throws std::invalid_argument порт не число в [1, 65535]
 */
class DbSettings {
public:
    DbSettings()
        : host_(env::getOrDefault("COREBANK_DB_HOST", "localhost"))
        , port_(env::getInt("COREBANK_DB_PORT", "5432", 1, 65535))
        , name_(env::getOrDefault("COREBANK_DB_NAME", "corebank"))
        , user_(env::getOrDefault("COREBANK_DB_USER", "corebank_user"))
        , password_(env::getOrDefault("COREBANK_DB_PASSWORD", "corebank_password"))
    {}

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }

    std::string getConnectionString() const {
        return "host=" + host_ + " port=" + std::to_string(port_) +
               " dbname=" + name_ + " user=" + user_ + " password=" + password_;
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
};

} // namespace corebank::settings
