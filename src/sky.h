/*
** $Id: sky.h $
** Sky - value core of an embeddable configuration language
** See Copyright Notice at the end of this file
*/


#ifndef sky_h
#define sky_h

#include <stddef.h>


#include "skyconf.h"


#define SKY_VERSION_MAJOR	"1"
#define SKY_VERSION_MINOR	"0"
#define SKY_VERSION_RELEASE	"0"

#define SKY_VERSION	"Sky " SKY_VERSION_MAJOR "." SKY_VERSION_MINOR
#define SKY_RELEASE	SKY_VERSION "." SKY_VERSION_RELEASE
#define SKY_COPYRIGHT	SKY_RELEASE "  Copyright (C) 2026 The Sky Authors"


/*
** thread status; 0 is OK
*/
#define SKY_OK		0
#define SKY_ERRRUN	1	/* generic runtime error */
#define SKY_ERRMEM	2	/* memory allocation failure */
#define SKY_ERRUNHASHABLE	3	/* key or value does not support hashing */
#define SKY_ERRFROZEN	4	/* mutation of a frozen table */
#define SKY_ERRITER	5	/* mutation of a table during iteration */
#define SKY_ERRATTR	6	/* no such struct field */
#define SKY_ERRCTOR	7	/* struct constructors do not match */
#define SKY_ERRDUPKEY	8	/* duplicate key appended to a view */
#define SKY_ERRDEPTH	9	/* comparison exceeded its depth budget */


class sky_State;


/*
** basic types
*/
#define SKY_TNONE	0
#define SKY_TBOOL	1
#define SKY_TINT	2
#define SKY_TFLOAT	3
#define SKY_TSTRING	4
#define SKY_TDICT	5
#define SKY_TSTRUCT	6
#define SKY_TUSERDATA	7

#define SKY_NUMTYPES	8


/* type of numbers in Sky */
typedef SKY_NUMBER sky_Number;


/* type for integer values */
typedef SKY_INTEGER sky_Integer;


/*
** Type for memory-allocation functions
*/
typedef void * (*sky_Alloc) (void *ud, void *ptr, size_t osize, size_t nsize);


/*
** state manipulation
*/
SKY_API sky_State *(sky_newstate) (sky_Alloc f, void *ud);
SKY_API sky_State *(skyL_newstate) (void);
SKY_API void       (sky_close) (sky_State *L);

SKY_API sky_Alloc (sky_getallocf) (sky_State *L, void **ud);
SKY_API const char *(sky_typename) (int tp);
SKY_API const char *(sky_statusname) (int status);


/******************************************************************************
* Copyright (C) 2026 The Sky Authors.
*
* Permission is hereby granted, free of charge, to any person obtaining
* a copy of this software and associated documentation files (the
* "Software"), to deal in the Software without restriction, including
* without limitation the rights to use, copy, modify, merge, publish,
* distribute, sublicense, and/or sell copies of the Software, and to
* permit persons to whom the Software is furnished to do so, subject to
* the following conditions:
*
* The above copyright notice and this permission notice shall be
* included in all copies or substantial portions of the Software.
*
* THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
* EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
* MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
* IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY
* CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
* TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE
* SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
******************************************************************************/


#endif
