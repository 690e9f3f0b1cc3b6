#pragma once

#include "application/LedgerAuditor.hpp"
#include "ports/input/IAccountService.hpp"
#include "ports/input/IInvestmentService.hpp"
#include "ports/input/ILedgerService.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace corebank::adapters::primary {

/**
 * @brief Primary adapter: команды CLI -> вызовы сервисов -> JSON
 *
 * Каждая команда печатает ровно один JSON документ. Ошибки печатаются как
 * {"error": <код>, "message": <текст>}.
 *
 * Коды возврата: 0 успех, 2 повторяемая ошибка хранилища, 1 прочие ошибки.
 */
class LedgerCommandHandler {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_FAILURE_CODE = 1;
    static constexpr int EXIT_RETRYABLE = 2;

    LedgerCommandHandler(
        std::shared_ptr<ports::input::ILedgerService> ledgerService,
        std::shared_ptr<ports::input::IAccountService> accountService,
        std::shared_ptr<ports::input::IInvestmentService> investmentService,
        std::shared_ptr<application::LedgerAuditor> auditor
    );

    /**
     * @brief Выполнить одну команду
     * @param args Имя команды и её аргументы
     */
    int handle(const std::vector<std::string>& args, std::ostream& out);

    /**
     * @brief Выполнять команды построчно до конца потока
     *
     * Пустые строки и строки, начинающиеся с '#', пропускаются.
     * @return Код последней неудачной команды или 0
     */
    int runSession(std::istream& in, std::ostream& out);

    /**
     * @brief Разбить строку на аргументы, "в кавычках" = один аргумент
     */
    static std::vector<std::string> tokenize(const std::string& line);

private:
    using Args = std::vector<std::string>;
    using Command = std::function<nlohmann::json(const Args&)>;

    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    std::shared_ptr<ports::input::IAccountService> accountService_;
    std::shared_ptr<ports::input::IInvestmentService> investmentService_;
    std::shared_ptr<application::LedgerAuditor> auditor_;
    std::map<std::string, Command> commands_;

    void registerCommands();

    std::string resolveProductId(const std::string& reference);

    static nlohmann::json errorJson(const std::string& code, const std::string& message);

    static std::string render(const nlohmann::json& document);
};

} // namespace corebank::adapters::primary
