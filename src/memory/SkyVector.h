/*
** $Id: SkyVector.h $
** Type alias for std::vector with SkyAllocator
** See Copyright Notice in sky.h
*/

#ifndef skyvector_h
#define skyvector_h

#include <utility>
#include <vector>
#include "skyallocator.h"

/*
** SkyVector<T> - std::vector that allocates through the state.
**
** Used for temporary arrays of the core (sorted field lists, key lists
** handed back to the host). Memory is freed when the vector goes out
** of scope, also when an error unwinds through it.
**
**   SkyVector<TString*> names(L);
**   names.push_back(key);
*/
template<typename T>
class SkyVector {
public:
    using VectorType = std::vector<T, SkyAllocator<T>>;
    using iterator = typename VectorType::iterator;
    using const_iterator = typename VectorType::const_iterator;
    using size_type = typename VectorType::size_type;
    using value_type = T;

    explicit SkyVector(sky_State* L) : vec_(SkyAllocator<T>(L)) {}

    void push_back(const T& value) { vec_.push_back(value); }
    void push_back(T&& value) { vec_.push_back(std::move(value)); }

    template<typename... Args>
    void emplace_back(Args&&... args) { vec_.emplace_back(std::forward<Args>(args)...); }

    void pop_back() { vec_.pop_back(); }
    void clear() noexcept { vec_.clear(); }
    void reserve(size_type n) { vec_.reserve(n); }
    void resize(size_type n) { vec_.resize(n); }

    T& operator[](size_type pos) { return vec_[pos]; }
    const T& operator[](size_type pos) const { return vec_[pos]; }

    T& front() { return vec_.front(); }
    const T& front() const { return vec_.front(); }
    T& back() { return vec_.back(); }
    const T& back() const { return vec_.back(); }

    T* data() noexcept { return vec_.data(); }
    const T* data() const noexcept { return vec_.data(); }

    bool empty() const noexcept { return vec_.empty(); }
    size_type size() const noexcept { return vec_.size(); }
    size_type capacity() const noexcept { return vec_.capacity(); }

    iterator begin() noexcept { return vec_.begin(); }
    const_iterator begin() const noexcept { return vec_.begin(); }

    iterator end() noexcept { return vec_.end(); }
    const_iterator end() const noexcept { return vec_.end(); }

private:
    VectorType vec_;
};

#endif
