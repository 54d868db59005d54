#pragma once

#include <GL/glcorearb.h>
#include <functional>
#include <tandem/window.hpp>

namespace tandem::gl
{

using Resolver = std::function<ProcAddress(const char* name)>;

// Resolve one entry point by name.  nullptr when the driver lacks it.
template <typename Fn>
Fn load(const Resolver& resolve, const char* name)
{
    return reinterpret_cast<Fn>(resolve(name));
}

// Entry points the runtime itself calls on the render thread.
struct RuntimeFunctions
{
    PFNGLVIEWPORTPROC viewport = nullptr;
};

// Returns false (and logs which entry point) when something is missing.
bool load_runtime_functions(RuntimeFunctions& out, const Resolver& resolve);

}   // namespace tandem::gl
