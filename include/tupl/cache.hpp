// cache.hpp - memoized index / assignability results keyed by interned ids
#pragma once
#include "tupl/assign.hpp"
#include "tupl/index.hpp"
#include "tupl/options.hpp"
#include <atomic>
#include <future>
#include <mutex>
#include <unordered_map>
#include <utility>

#include <llvm/ADT/Hashing.h>

namespace tupl {

// Concurrent callers asking for the same key compute it at most once: the first caller
// publishes a shared future, later callers wait on it. If the computation throws, the
// entry is dropped and the exception propagates to every waiter.
class ShapeCache {
public:
    explicit ShapeCache(bool enabled = true): enabled_(enabled){}
    ShapeCache(const ShapeCache&) = delete;
    ShapeCache& operator=(const ShapeCache&) = delete;

    bool enabled() const { return enabled_; }
    size_t hits() const { return hits_.load(); }
    size_t misses() const { return misses_.load(); }

    template<class F>
    IndexResult index(TypeId subject, int64_t index, IndexPolicy policy, F&& compute){
        return lookup(index_, IndexKey{subject, index, policy}, std::forward<F>(compute));
    }

    template<class F>
    AssignResult assign(TypeId source, TypeId target, F&& compute){
        return lookup(assign_, std::make_pair(source, target), std::forward<F>(compute));
    }

    void clear(){
        std::lock_guard<std::mutex> lk(mu_);
        index_.clear(); assign_.clear();
        hits_ = 0; misses_ = 0;
    }

private:
    struct IndexKey {
        TypeId subject; int64_t index; IndexPolicy policy;
        bool operator==(const IndexKey& o) const { return subject==o.subject && index==o.index && policy==o.policy; }
    };
    struct IndexKeyHash {
        size_t operator()(const IndexKey& k) const noexcept { return (size_t)llvm::hash_combine(k.subject, k.index, static_cast<int>(k.policy)); }
    };
    struct PairHash {
        size_t operator()(const std::pair<TypeId,TypeId>& p) const noexcept { return (size_t)llvm::hash_combine(p.first, p.second); }
    };

    template<class Map, class Key, class F>
    auto lookup(Map& map, const Key& key, F&& compute) -> decltype(compute()) {
        using R = decltype(compute());
        if(!enabled_){ ++misses_; return compute(); }
        std::promise<R> promise;
        std::shared_future<R> fut;
        bool owner = false;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = map.find(key);
            if(it != map.end()){ fut = it->second; ++hits_; }
            else { fut = promise.get_future().share(); map.emplace(key, fut); owner = true; ++misses_; }
        }
        if(!owner) return fut.get();
        try {
            R r = compute();
            promise.set_value(r);
            return r;
        } catch(...) {
            promise.set_exception(std::current_exception());
            std::lock_guard<std::mutex> lk(mu_);
            map.erase(key);
            throw;
        }
    }

    bool enabled_;
    std::mutex mu_;
    std::unordered_map<IndexKey, std::shared_future<IndexResult>, IndexKeyHash> index_;
    std::unordered_map<std::pair<TypeId,TypeId>, std::shared_future<AssignResult>, PairHash> assign_;
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
};

} // namespace tupl
