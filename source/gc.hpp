#pragma once

#include <concepts>
#include <cstddef>
#include <cstdlib>
#include <mutex>
#include <utility>
#include <vector>

struct object;

/// Process-wide store of heap allocated runtime objects, released at exit.
/// Evaluation results are plain pointers into this store, so they stay valid
/// for the lifetime of the process and never need to be freed by callers.
template<typename T>
class gc
{
    using store = std::vector<T*>;

  public:
    static void track(T* obj)
    {
        const std::lock_guard lock {get_mutex()};
        get_store().push_back(obj);
    }

  private:
    static void cleanup()
    {
        for (T* obj : get_store()) {
            delete obj;
        }
        get_store().clear();
    }

    static auto get_mutex() -> std::mutex&
    {
        static std::mutex mutex;
        return mutex;
    }

    static auto get_store() -> store&
    {
        static store allocations;
        static const bool registered = []()
        {
            constexpr auto reserve = static_cast<std::size_t>(1024);
            allocations.reserve(reserve);
            return std::atexit(cleanup) == 0;
        }();
        (void)registered;
        return allocations;
    }
};

template<typename T, typename... Args>
    requires std::derived_from<T, object>
auto make(Args&&... args) -> T*
{
    T* p = new T(std::forward<Args>(args)...);
    gc<object>::track(p);
    return p;
}
