#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tandem/registry.hpp>
#include <unordered_map>

namespace tandem
{

// Process-unique thread identity.  Unlike std::thread::id it is never handed
// to a later thread, so a name cannot outlive the thread that set it.
using ThreadToken = std::uint64_t;

// Token of the calling thread, assigned on first use (starting at 1).
ThreadToken current_thread_token();

// Thread token -> human readable label, stored under keys::THREAD_NAMES.
using ThreadNameTable = std::unordered_map<ThreadToken, std::string>;

// Name (or rename) the calling thread.  False if the name table slot is
// occupied by a value of another type.
bool set_current_thread_name(std::string_view name, Registry& registry = Registry::instance());

// Drop the calling thread's entry.  Returns false when it had none.
bool clear_current_thread_name(Registry& registry = Registry::instance());

// Label of the calling thread, or "Thread-<token>" when it was never named.
std::string current_thread_name(Registry& registry = Registry::instance());

std::optional<std::string> thread_name(ThreadToken token,
                                       Registry&   registry = Registry::instance());

}   // namespace tandem
