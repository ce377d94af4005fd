#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "sdzarr_result.h"

namespace SDZarr
{
/**
 * @brief Single-assignment lazy value: Unloaded -> Loading -> Loaded | Failed
 *
 * The first Get() runs the loader on the calling thread. Callers arriving
 * while the load is in flight wait on the same shared future. A failed
 * load is reported to the callers of that load and the next Get() starts a
 * new one. Standard exceptions thrown by the loader become failures, any
 * other exception is rethrown to the loading caller and stored in the
 * shared future.
 */
template <typename T>
class LazyValue
{
  public:
    using ValueResult = Result<T, std::string>;
    using Loader = std::function<ValueResult()>;

    enum class State
    {
        Unloaded,
        Loading,
        Loaded,
        Failed
    };

    explicit LazyValue(Loader fnLoader) : mLoader(std::move(fnLoader)) {}

    LazyValue(const LazyValue&) = delete;
    LazyValue& operator=(const LazyValue&) = delete;

    std::shared_future<ValueResult> Get() const
    {
        std::promise<ValueResult> oPromise;
        std::shared_future<ValueResult> oFuture;
        {
            std::lock_guard<std::mutex> oLock(mMutex);
            if (mState == State::Loading || mState == State::Loaded)
                return mFuture;

            oFuture = oPromise.get_future().share();
            mFuture = oFuture;
            mState = State::Loading;
            ++mLoadCount;
        }

        ValueResult oResult = Err(std::string("value was not loaded"));
        try
        {
            oResult = mLoader();
        }
        catch (const std::exception& e)
        {
            oResult = Err(std::string(e.what()));
        }
        catch (...)
        {
            SetState(State::Failed);
            oPromise.set_exception(std::current_exception());
            throw;
        }

        SetState(oResult.IsOk() ? State::Loaded : State::Failed);
        oPromise.set_value(std::move(oResult));
        return oFuture;
    }

    /**
     * @brief Blocking form of Get()
     */
    ValueResult Load() const { return Get().get(); }

    State GetState() const
    {
        std::lock_guard<std::mutex> oLock(mMutex);
        return mState;
    }

    /**
     * @brief Number of loads started so far
     */
    int GetLoadCount() const
    {
        std::lock_guard<std::mutex> oLock(mMutex);
        return mLoadCount;
    }

  private:
    void SetState(State eState) const
    {
        std::lock_guard<std::mutex> oLock(mMutex);
        mState = eState;
    }

    Loader mLoader;
    mutable std::mutex mMutex;
    mutable State mState = State::Unloaded;
    mutable int mLoadCount = 0;
    mutable std::shared_future<ValueResult> mFuture;
};

/**
 * @brief Instance-owned cache of keyed loads with evict-on-failure
 *
 * GetOrLoad() runs the loader once per key on the calling thread; concurrent
 * callers for the same key wait on the same shared future. A loader that
 * throws removes its own entry before the exception reaches any caller, so a
 * later call retries instead of replaying the failure.
 */
template <typename K, typename V>
class LoadCache
{
  public:
    using Loader = std::function<V()>;

    LoadCache() = default;
    LoadCache(const LoadCache&) = delete;
    LoadCache& operator=(const LoadCache&) = delete;

    std::shared_future<V> GetOrLoad(const K& key, const Loader& fnLoader)
    {
        std::promise<V> oPromise;
        std::shared_future<V> oFuture;
        uint64_t nGeneration = 0;
        {
            std::lock_guard<std::mutex> oLock(mMutex);
            auto it = mEntries.find(key);
            if (it != mEntries.end())
                return it->second.oFuture;

            nGeneration = ++mGeneration;
            oFuture = oPromise.get_future().share();
            mEntries[key] = Entry{oFuture, nGeneration};
        }

        try
        {
            oPromise.set_value(fnLoader());
        }
        catch (...)
        {
            {
                std::lock_guard<std::mutex> oLock(mMutex);
                auto it = mEntries.find(key);
                if (it != mEntries.end() && it->second.nGeneration == nGeneration)
                    mEntries.erase(it);
            }
            oPromise.set_exception(std::current_exception());
        }
        return oFuture;
    }

    bool Contains(const K& key) const
    {
        std::lock_guard<std::mutex> oLock(mMutex);
        return mEntries.find(key) != mEntries.end();
    }

    void Evict(const K& key)
    {
        std::lock_guard<std::mutex> oLock(mMutex);
        mEntries.erase(key);
    }

    void Clear()
    {
        std::lock_guard<std::mutex> oLock(mMutex);
        mEntries.clear();
    }

    size_t Size() const
    {
        std::lock_guard<std::mutex> oLock(mMutex);
        return mEntries.size();
    }

  private:
    struct Entry
    {
        std::shared_future<V> oFuture;
        uint64_t nGeneration = 0;
    };

    mutable std::mutex mMutex;
    std::map<K, Entry> mEntries;
    uint64_t mGeneration = 0;
};
}  // namespace SDZarr
