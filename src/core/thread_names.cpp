#include <atomic>
#include <tandem/resource_keys.hpp>
#include <tandem/thread_names.hpp>

namespace tandem
{

namespace
{

std::atomic<ThreadToken> g_next_token{1};

void ensure_name_table(Registry& registry)
{
    if (registry.holds<ThreadNameTable>(keys::THREAD_NAMES))
    {
        return;
    }
    // Losing a first-use race to another thread leaves the table in place,
    // which is all that is needed here.
    [[maybe_unused]] auto result =
        registry.register_resource(keys::THREAD_NAMES, ThreadNameTable{});
}

}   // namespace

ThreadToken current_thread_token()
{
    thread_local const ThreadToken token = g_next_token.fetch_add(1, std::memory_order_relaxed);
    return token;
}

bool set_current_thread_name(std::string_view name, Registry& registry)
{
    ensure_name_table(registry);
    const auto token = current_thread_token();
    return registry.with_mutate<ThreadNameTable>(keys::THREAD_NAMES,
                                                 [&](ThreadNameTable& table)
                                                 { table[token] = std::string(name); });
}

bool clear_current_thread_name(Registry& registry)
{
    const auto token = current_thread_token();
    return registry
        .with_mutate<ThreadNameTable>(keys::THREAD_NAMES,
                                      [token](ThreadNameTable& table)
                                      { return table.erase(token) > 0; })
        .value_or(false);
}

std::optional<std::string> thread_name(ThreadToken token, Registry& registry)
{
    auto found = registry.with_read<ThreadNameTable>(
        keys::THREAD_NAMES,
        [token](const ThreadNameTable& table) -> std::optional<std::string>
        {
            auto it = table.find(token);
            if (it == table.end())
            {
                return std::nullopt;
            }
            return it->second;
        });
    return found.value_or(std::nullopt);
}

std::string current_thread_name(Registry& registry)
{
    const auto token = current_thread_token();
    if (auto name = thread_name(token, registry))
    {
        return *name;
    }
    return "Thread-" + std::to_string(token);
}

}   // namespace tandem
