/*
** $Id: skyallocator.h $
** Standard C++ Allocator for Sky Memory Management
** See Copyright Notice in sky.h
*/

#ifndef skyallocator_h
#define skyallocator_h

#include <cstddef>
#include <limits>
#include <type_traits>

#include "smem.h"

/*
** SkyAllocator - Standard C++ allocator that uses the state's allocator
**
** Memory obtained through it is counted in the state's 'totalbytes'
** and allocation failures are raised as SKY_ERRMEM errors, exactly as
** with the skyM_* functions. It can be used with standard containers
** like std::vector:
**
**   std::vector<int, SkyAllocator<int>> vec(SkyAllocator<int>(L));
**   vec.push_back(42);
*/
template<typename T>
class SkyAllocator {
public:
    using value_type = T;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using propagate_on_container_move_assignment = std::true_type;
    using is_always_equal = std::false_type;

    explicit SkyAllocator(sky_State* L) noexcept : L_(L) {
        sky_assert(L != nullptr);
    }

    SkyAllocator(const SkyAllocator& other) noexcept = default;

    // Rebinding
    template<typename U>
    SkyAllocator(const SkyAllocator<U>& other) noexcept : L_(other.getState()) {}

    [[nodiscard]] T* allocate(std::size_t n) {
        if (n == 0) return nullptr;

        if (n > std::numeric_limits<std::size_t>::max() / sizeof(T)) {
            skyM_toobig(L_);
        }

        // skyM_malloc_ raises SKY_ERRMEM itself when the allocator fails
        return static_cast<T*>(skyM_malloc_(L_, n * sizeof(T)));
    }

    void deallocate(T* p, std::size_t n) noexcept {
        if (p == nullptr) return;
        skyM_free_(L_, p, n * sizeof(T));
    }

    sky_State* getState() const noexcept { return L_; }

    // Allocators are equal if they use the same state
    template<typename U>
    bool operator==(const SkyAllocator<U>& other) const noexcept {
        return L_ == other.getState();
    }

    template<typename U>
    bool operator!=(const SkyAllocator<U>& other) const noexcept {
        return !(*this == other);
    }

private:
    sky_State* L_;

    template<typename U> friend class SkyAllocator;
};

#endif
