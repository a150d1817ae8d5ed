/*
** $Id: smem.h $
** Interface to Memory Manager
** See Copyright Notice in sky.h
*/

#ifndef smem_h
#define smem_h


#include <cstddef>

#include "slimits.h"
#include "sky.h"


/* Forward declarations of underlying memory functions */
SKYI_FUNC l_noret skyM_error (sky_State *L);
SKYI_FUNC l_noret skyM_toobig (sky_State *L);
SKYI_FUNC void *skyM_realloc_ (sky_State *L, void *block, size_t oldsize,
                                                          size_t size);
SKYI_FUNC void *skyM_saferealloc_ (sky_State *L, void *block, size_t oldsize,
                                                              size_t size);
SKYI_FUNC void skyM_free_ (sky_State *L, void *block, size_t osize);
SKYI_FUNC void *skyM_malloc_ (sky_State *L, size_t size);


/*
** This function tests whether it is safe to multiply 'n' by the size of
** type 't' without overflows. Because 'e' is always constant, it avoids
** the runtime division MAX_SIZET/(e).
*/
template<typename T>
inline constexpr bool skyM_testsize(T n, size_t e) noexcept {
	return sizeof(n) >= sizeof(size_t) && cast_sizet(n) + 1 > MAX_SIZET / e;
}

template<typename T>
inline void skyM_checksize(sky_State* L, T n, size_t e) {
	if (skyM_testsize(n, e))
		skyM_toobig(L);
}


/*
** Template-based memory management functions for type safety.
*/

/* Free a single object of type T */
template<typename T>
inline void skyM_free(sky_State* L, T* b) noexcept {
	skyM_free_(L, static_cast<void*>(b), sizeof(T));
}

/* Free an array of n objects of type T */
template<typename T>
inline void skyM_freearray(sky_State* L, T* b, size_t n) noexcept {
	skyM_free_(L, static_cast<void*>(b), n * sizeof(T));
}

/* Allocate an array of n objects of type T */
template<typename T>
inline T* skyM_newvector(sky_State* L, size_t n) {
	return static_cast<T*>(skyM_malloc_(L, cast_sizet(n) * sizeof(T)));
}

/* Allocate an array with size check */
template<typename T>
inline T* skyM_newvectorchecked(sky_State* L, size_t n) {
	skyM_checksize(L, n, sizeof(T));
	return skyM_newvector<T>(L, n);
}

/* Reallocate an array from oldn to n elements; raises an error on failure */
template<typename T>
inline T* skyM_reallocvector(sky_State* L, T* v, size_t oldn, size_t n) {
	skyM_checksize(L, n, sizeof(T));
	return static_cast<T*>(skyM_saferealloc_(L, v, cast_sizet(oldn) * sizeof(T),
	                                                cast_sizet(n) * sizeof(T)));
}


#endif
