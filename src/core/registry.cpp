#include <tandem/registry.hpp>

namespace tandem
{

Registry& Registry::instance()
{
    static Registry registry;
    return registry;
}

std::shared_ptr<Registry::Slot> Registry::find(std::string_view key) const
{
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto                                it = slots_.find(key);
    if (it == slots_.end())
    {
        return nullptr;
    }
    return it->second;
}

InsertResult Registry::insert_slot(std::string_view key, std::shared_ptr<Slot> slot)
{
    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    if (slots_.find(key) != slots_.end())
    {
        return InsertResult::AlreadyExists;
    }
    slots_.emplace(std::string(key), std::move(slot));
    return InsertResult::Inserted;
}

bool Registry::exists(std::string_view key) const
{
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return slots_.find(key) != slots_.end();
}

bool Registry::remove(std::string_view key)
{
    std::shared_ptr<Slot> released;
    {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        auto                                it = slots_.find(key);
        if (it == slots_.end())
        {
            return false;
        }
        released = std::move(it->second);
        slots_.erase(it);
    }
    // The value is destroyed here, outside the table lock, unless a closure
    // on another thread still holds the slot.
    return true;
}

size_t Registry::size() const
{
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return slots_.size();
}

std::vector<std::string> Registry::keys() const
{
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    std::vector<std::string>            result;
    result.reserve(slots_.size());
    for (const auto& [key, slot] : slots_)
    {
        result.push_back(key);
    }
    return result;
}

}   // namespace tandem
