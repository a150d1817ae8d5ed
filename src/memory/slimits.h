/*
** $Id: slimits.h $
** Limits, basic types, and some other 'installation-dependent' definitions
** See Copyright Notice in sky.h
*/

#ifndef slimits_h
#define slimits_h


#include <limits.h>
#include <stddef.h>
#include <cstdint>


#include "sky.h"


#define l_numbits(t)	cast_int(sizeof(t) * CHAR_BIT)

/*
** 'l_mem' is a signed integer big enough to count the total memory
** used by Sky. 'lu_mem' is a corresponding unsigned type.
*/
typedef ptrdiff_t l_mem;
typedef size_t lu_mem;


/* chars used as small naturals (so that 'char' is reserved for characters) */
typedef unsigned char lu_byte;
typedef signed char ls_byte;


/* 32-bit hash values of keys and values */
typedef uint32_t l_hash;


/* maximum value for size_t */
inline constexpr size_t MAX_SIZET = ((size_t)(~(size_t)0));


/*
** test whether an unsigned value is a power of 2 (or zero)
*/
template<typename T>
inline constexpr bool ispow2(T x) noexcept {
	return ((x) & ((x) - 1)) == 0;
}


/* number of chars of a literal string without the ending \0 */
template<size_t N>
inline constexpr size_t LL(const char (&)[N]) noexcept {
	return N - 1;
}


/*
** Internal assertions for in-house debugging
*/
#if defined SKYI_ASSERT
#undef NDEBUG
#include <assert.h>
#define sky_assert(c)           assert(c)
#endif

#if defined(sky_assert)
#else
#define sky_assert(c)		((void)0)
#endif

#define check_exp(c,e)		(sky_assert(c), (e))


/* macro to avoid warnings about unused variables */
#if !defined(UNUSED)
#define UNUSED(x)	((void)(x))
#endif


/*
** type casts
*/
#define cast(t, exp)	((t)(exp))

#define cast_void(i)	static_cast<void>(i)

constexpr inline sky_Number cast_num(auto i) noexcept {
    return static_cast<sky_Number>(i);
}

constexpr inline int cast_int(auto i) noexcept {
    return static_cast<int>(i);
}

constexpr inline unsigned int cast_uint(auto i) noexcept {
    return static_cast<unsigned int>(i);
}

constexpr inline unsigned char cast_uchar(auto i) noexcept {
    return static_cast<unsigned char>(i);
}

constexpr inline sky_Integer cast_Integer(auto i) noexcept {
    return static_cast<sky_Integer>(i);
}

constexpr inline l_hash cast_hash(auto i) noexcept {
    return static_cast<l_hash>(i);
}

#define cast_sizet(i)	cast(size_t, (i))


/*
** non-return type
*/
#if !defined(l_noret)

#if defined(__GNUC__)
#define l_noret		void __attribute__((noreturn))
#elif defined(_MSC_VER) && _MSC_VER >= 1200
#define l_noret		void __declspec(noreturn)
#else
#define l_noret		void
#endif

#endif


/*
** branch-prediction hints
*/
#if defined(__GNUC__)
#define l_likely(x)	(__builtin_expect(((x) != 0), 1))
#define l_unlikely(x)	(__builtin_expect(((x) != 0), 0))
#else
#define l_likely(x)	(x)
#define l_unlikely(x)	(x)
#endif


#endif
