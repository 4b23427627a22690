#pragma once
#include "ctxhost/exceptions.hpp"
#include "ctxhost/prompts/prompt.hpp"
#include "ctxhost/resources/resource.hpp"
#include "ctxhost/tools/tool.hpp"
#include "ctxhost/types.hpp"
#include "ctxhost/util/log.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctxhost
{

/// Name-indexed store of capabilities of a single kind.
///
/// Registration captures the executor's descriptor once, so entries are immutable
/// after insertion. Lookups and listings take a shared lock and may run from any
/// number of threads; registration takes an exclusive lock, so a reader never sees
/// a half-inserted entry.
///
/// Absence is not an error here: lookup() returns std::nullopt and the caller decides
/// how to report it.
template <typename Executor>
class Registry
{
  public:
    using Descriptor = typename Executor::Descriptor;

    struct Entry
    {
        Descriptor descriptor;
        std::shared_ptr<const Executor> executor;
    };

    explicit Registry(DuplicateBehavior on_duplicate = DuplicateBehavior::Error)
        : on_duplicate_(on_duplicate)
    {
    }

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /// Register an executor under the key of its descriptor.
    /// @throws ValidationError if executor is null or, under DuplicateBehavior::Error,
    ///         if the key is already taken.
    void register_capability(std::shared_ptr<const Executor> executor)
    {
        if (!executor)
            throw ValidationError("cannot register a null " + to_string(Executor::kind));

        Entry entry{executor->describe(), std::move(executor)};
        const std::string key = registry_key(entry.descriptor);
        if (key.empty())
            throw ValidationError("cannot register a " + to_string(Executor::kind) +
                                  " with an empty name");

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end())
        {
            if (!handle_duplicate(key))
                return;
            entries_[it->second] = std::move(entry);
            return;
        }

        index_.emplace(key, entries_.size());
        entries_.push_back(std::move(entry));
    }

    std::optional<Entry> lookup(const std::string& key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end())
            return std::nullopt;
        return entries_[it->second];
    }

    bool contains(const std::string& key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return index_.count(key) > 0;
    }

    /// Descriptors in registration order.
    std::vector<Descriptor> list() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<Descriptor> result;
        result.reserve(entries_.size());
        for (const auto& entry : entries_)
            result.push_back(entry.descriptor);
        return result;
    }

    std::size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

    DuplicateBehavior on_duplicate() const
    {
        return on_duplicate_;
    }

  private:
    // Returns true when the existing entry should be replaced.
    bool handle_duplicate(const std::string& key) const
    {
        const std::string what = to_string(Executor::kind) + ":" + key;
        switch (on_duplicate_)
        {
        case DuplicateBehavior::Error:
            throw ValidationError("capability already registered: " + what);
        case DuplicateBehavior::Warn:
            log::warning("replacing duplicate capability: " + what);
            return true;
        case DuplicateBehavior::Replace:
            return true;
        case DuplicateBehavior::Ignore:
            return false;
        }
        return false;
    }

    DuplicateBehavior on_duplicate_;
    mutable std::shared_mutex mutex_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

using ToolRegistry = Registry<tools::ToolExecutor>;
using PromptRegistry = Registry<prompts::PromptExecutor>;
using ResourceRegistry = Registry<resources::ResourceExecutor>;

} // namespace ctxhost
