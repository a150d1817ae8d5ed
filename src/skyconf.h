/*
** $Id: skyconf.h $
** Configuration file for Sky
** See Copyright Notice in sky.h
*/


#ifndef skyconf_h
#define skyconf_h

#include <limits.h>
#include <stddef.h>


/*
** ===================================================================
** General Configuration File for Sky
**
** Some definitions here can be changed externally, through the compiler
** (e.g., with '-D' options): They are commented out or protected
** by '#if !defined' guards. However, several other definitions
** should be changed directly here, either because they affect the
** Sky ABI (by making the changes here, you ensure that all software
** connected to Sky, such as host libraries, will be compiled with the
** same configuration); or because they are seldom changed.
**
** Search for "@@" to find all configurable definitions.
** ===================================================================
*/


/*
** {==================================================================
** Configuration for Numbers.
** ===================================================================
*/

/*
@@ SKY_INTEGER is the integer type used by Sky.
@@ SKY_NUMBER is the floating-point type used by Sky.
@@ SKY_INTEGER_FMT / SKY_NUMBER_FMT are the formats for writing them.
*/
#if !defined(SKY_INTEGER)
#define SKY_INTEGER		long long
#define SKY_INTEGER_FMT		"%lld"
#define SKY_MAXINTEGER		LLONG_MAX
#define SKY_MININTEGER		LLONG_MIN
#endif

#if !defined(SKY_NUMBER)
#define SKY_NUMBER	double
#define SKY_NUMBER_FMT		"%.17g"
#endif

/* }================================================================== */


/*
** {==================================================================
** Limits
** ===================================================================
*/

/*
@@ SKYI_MAXDEPTH is the default depth budget of value comparisons.
** Each level of nested containers consumes one unit; exhausting the
** budget is an error, not a verdict.
*/
#if !defined(SKYI_MAXDEPTH)
#define SKYI_MAXDEPTH		10
#endif


/*
@@ SKYI_MAXERRMSG is the maximum length of a formatted error message.
*/
#if !defined(SKYI_MAXERRMSG)
#define SKYI_MAXERRMSG		512
#endif

/* }================================================================== */


/*
** {==================================================================
** Output hooks (used by the diagnostic dumps)
** ===================================================================
*/

/*
@@ sky_writestring defines how to print a string.
@@ sky_writeline defines how to print a newline.
@@ sky_writestringerror defines how to print diagnostic messages.
*/
#if !defined(sky_writestring)
#include <stdio.h>
#define sky_writestring(s,l)   fwrite((s), sizeof(char), (l), stdout)
#endif

#if !defined(sky_writeline)
#define sky_writeline()        (sky_writestring("\n", 1), fflush(stdout))
#endif

#if !defined(sky_writestringerror)
#define sky_writestringerror(s,p) \
        (fprintf(stderr, (s), (p)), fflush(stderr))
#endif

/* }================================================================== */


/*
** {==================================================================
** Visibility
** ===================================================================
*/

/*
@@ SKY_API is a mark for all core API functions.
@@ SKYI_FUNC is a mark for all extern functions that are not to be
** exported to outside modules.
*/
#if !defined(SKY_API)
#define SKY_API		extern
#endif

#if defined(__GNUC__) && ((__GNUC__*100 + __GNUC_MINOR__) >= 302) && \
    defined(__ELF__)		/* { */
#define SKYI_FUNC	__attribute__((visibility("internal"))) extern
#else				/* }{ */
#define SKYI_FUNC	extern
#endif				/* } */

/* }================================================================== */


/*
@@ SKYI_ASSERT turns on internal consistency checks. Define it when
** building the test drivers or when debugging the core.
*/
/* #define SKYI_ASSERT */


#endif
