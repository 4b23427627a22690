#include "ctxhost/cli/run_guarded.hpp"

#include "ctxhost/exceptions.hpp"
#include "ctxhost/util/log.hpp"

#include <exception>
#include <string>

namespace ctxhost::cli
{

int run_guarded(const std::function<int()>& body)
{
    try
    {
        return body();
    }
    catch (const TransportError& e)
    {
        log::error(std::string("transport failure: ") + e.what());
    }
    catch (const Error& e)
    {
        log::error(std::string("startup failed: ") + e.what());
    }
    catch (const std::exception& e)
    {
        log::error(std::string("fatal: ") + e.what());
    }
    return 1;
}

} // namespace ctxhost::cli
