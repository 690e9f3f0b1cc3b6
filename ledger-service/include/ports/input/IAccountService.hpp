#pragma once

#include "domain/Account.hpp"
#include "domain/AccountReports.hpp"
#include "domain/Decimal.hpp"
#include "domain/enums/AccountType.hpp"
#include <optional>
#include <string>
#include <vector>

namespace corebank::ports::input {

/**
 * @brief Интерфейс сервиса счетов
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @brief Открыть счёт, при необходимости с первым пополнением
     *
     * Первое пополнение проходит через журнал как обычный deposit.
     */
    virtual domain::Account openAccount(
        const std::string& userId,
        domain::AccountType type,
        const std::optional<domain::Decimal>& initialDeposit
    ) = 0;

    /**
     * @throws NotFoundException если счёта нет
     */
    virtual domain::Account getAccount(const std::string& accountId) = 0;

    virtual std::vector<domain::Account> getUserAccounts(const std::string& userId) = 0;

    virtual domain::AccountSummary getAccountSummary(const std::string& userId) = 0;
};

} // namespace corebank::ports::input
