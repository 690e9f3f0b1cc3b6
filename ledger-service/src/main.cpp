#include "LedgerApp.hpp"
#include "domain/LedgerErrors.hpp"
#include <iostream>

int main(int argc, char* argv[])
{
    try
    {
        LedgerApp app;
        return app.run(argc, argv);
    }
    catch (const corebank::domain::LedgerException& e)
    {
        // Например, хранилище недоступно при старте
        std::cerr << "[main] Fatal error (" << corebank::domain::toString(e.kind()) << "): "
                  << e.what() << std::endl;
        return corebank::domain::isRetryable(e.kind()) ? 2 : 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
