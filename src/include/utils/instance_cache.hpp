#pragma once
/**
 * @file instance_cache.hpp
 * @brief Keyed, weakly-owning singleton factory.
 *
 * `InstanceCache<T>` hands out one shared instance of `T` per construction key.
 * The key is the textual form of each positional constructor argument followed by
 * the name of each keyword argument, concatenated with no separator, so two argument
 * tuples that stringify identically share an instance.
 *
 * The cache only holds `std::weak_ptr`s: once the last real owner releases an
 * instance its entry expires and the next request with that key constructs anew.
 * Each `T` has its own cache, so keys never collide across types.
 *
 * @code
 *   auto a = InstanceCache<Session>::instance().get("db", 5432);
 *   auto b = InstanceCache<Session>::instance().get("db", 5432);   // a == b
 * @endcode
 */
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace calltrace::utils
{

template <typename T> class InstanceCache
{
  public:
    /** @brief Returns the process-wide cache for `T`. */
    static InstanceCache &instance()
    {
        static InstanceCache cache;
        return cache;
    }

    /**
     * @brief Builds a cache key from positional argument texts and keyword argument names.
     */
    static std::string make_key(const std::vector<std::string> &positional,
                                const std::vector<std::string> &keyword_names = {})
    {
        std::string key;
        for (const auto &p : positional)
            key += p;
        for (const auto &k : keyword_names)
            key += k;
        return key;
    }

    /**
     * @brief Returns the live instance for @p key or constructs one with @p make.
     *
     * Lookup, construction and insertion happen under one lock, so concurrent
     * misses on the same key construct exactly once. @p make must return a
     * `std::shared_ptr<T>`; if it throws nothing is cached.
     */
    template <typename Factory> std::shared_ptr<T> get_or_create(const std::string &key, Factory &&make)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        purge_expired_locked();
        if (auto it = entries_.find(key); it != entries_.end())
        {
            if (auto existing = it->second.lock())
                return existing;
        }
        std::shared_ptr<T> created = std::forward<Factory>(make)();
        entries_[key] = created;
        return created;
    }

    /**
     * @brief Convenience form: keys on `fmt::format("{}", arg)` of every argument and
     *        constructs with `std::make_shared<T>(args...)`.
     */
    template <typename... Args> std::shared_ptr<T> get(const Args &...args)
    {
        std::string key;
        ((key += fmt::format("{}", args)), ...);
        return get_or_create(key, [&]() { return std::make_shared<T>(args...); });
    }

    /** @brief Number of entries whose instance is still alive. */
    [[nodiscard]] size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t live = 0;
        for (const auto &[key, weak] : entries_)
        {
            if (!weak.expired())
                ++live;
        }
        return live;
    }

    [[nodiscard]] bool contains(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        return it != entries_.end() && !it->second.expired();
    }

  private:
    InstanceCache() = default;

    void purge_expired_locked()
    {
        for (auto it = entries_.begin(); it != entries_.end();)
        {
            if (it->second.expired())
                it = entries_.erase(it);
            else
                ++it;
        }
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::weak_ptr<T>> entries_;
};

} // namespace calltrace::utils
