#pragma once
///@file

#include <memory>
#include <stdexcept>

namespace chunkcache {

/**
 * A shared pointer that is never null, so holders of a chunk store or
 * a sink need no null checks.
 */
template<typename T>
class ref
{
    std::shared_ptr<T> p;

public:

    explicit ref(std::shared_ptr<T> p)
        : p(std::move(p))
    {
        if (!this->p)
            throw std::invalid_argument("null pointer cast to ref");
    }

    T * operator->() const
    {
        return p.get();
    }

    T & operator*() const
    {
        return *p;
    }

    operator std::shared_ptr<T>() const
    {
        return p;
    }

    /**
     * Upcast, e.g. from `ref<MemoryChunkStore>` to `ref<ChunkStore>`.
     */
    template<typename T2>
    operator ref<T2>() const
    {
        return ref<T2>(std::shared_ptr<T2>(p));
    }
};

template<typename T, typename... Args>
inline ref<T> make_ref(Args &&... args)
{
    return ref<T>(std::make_shared<T>(std::forward<Args>(args)...));
}

} // namespace chunkcache
