#include <tandem/gl_loader.hpp>
#include <tandem/logger.hpp>

namespace tandem::gl
{

bool load_runtime_functions(RuntimeFunctions& out, const Resolver& resolve)
{
    out.viewport = load<PFNGLVIEWPORTPROC>(resolve, "glViewport");
    if (!out.viewport)
    {
        TANDEM_LOG_ERROR("gl", "Could not resolve glViewport");
        return false;
    }
    return true;
}

}   // namespace tandem::gl
