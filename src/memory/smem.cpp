/*
** $Id: smem.c $
** Interface to Memory Manager
** See Copyright Notice in sky.h
*/

#define smem_c
#define SKY_CORE


#include "sky.h"

#include "sdebug.h"
#include "smem.h"
#include "sstate.h"


/*
** About the realloc function:
** void *frealloc (void *ud, void *ptr, size_t osize, size_t nsize);
** ('osize' is the old size, 'nsize' is the new size)
**
** - frealloc(ud, p, x, 0) frees the block 'p' and returns NULL.
** Particularly, frealloc(ud, NULL, 0, 0) does nothing,
** which is equivalent to free(NULL) in ISO C.
**
** - frealloc(ud, NULL, x, s) creates a new block of size 's'
** (no matter 'x'). Returns NULL if it cannot create the new block.
**
** - otherwise, frealloc(ud, b, x, y) reallocates the block 'b' from
** size 'x' to size 'y'. Returns NULL if it cannot reallocate the
** block to the new size.
*/


l_noret skyM_error (sky_State *L) {
  L->memoryError();
}


l_noret skyM_toobig (sky_State *L) {
  skyG_runerror(L, SKY_ERRMEM, "memory allocation error: block too big");
}


/*
** Free memory
*/
void skyM_free_ (sky_State *L, void *block, size_t osize) {
  sky_assert((osize == 0) == (block == NULL));
  if (block == NULL)
    return;
  L->callAllocator(block, osize, 0);
  L->addTotalBytes(-cast(l_mem, osize));
}


/*
** Generic allocation routine. Returns NULL when the allocator cannot
** fulfill the request; the accounting is only updated on success.
*/
void *skyM_realloc_ (sky_State *L, void *block, size_t osize, size_t nsize) {
  void *newblock;
  sky_assert((osize == 0) == (block == NULL));
  newblock = L->callAllocator(block, osize, nsize);
  if (l_unlikely(newblock == NULL && nsize > 0))  /* allocation failed? */
    return NULL;  /* do not update 'totalbytes' */
  sky_assert((nsize == 0) == (newblock == NULL));
  L->addTotalBytes(cast(l_mem, nsize) - cast(l_mem, osize));
  return newblock;
}


void *skyM_saferealloc_ (sky_State *L, void *block, size_t osize,
                                                    size_t nsize) {
  void *newblock = skyM_realloc_(L, block, osize, nsize);
  if (l_unlikely(newblock == NULL && nsize > 0))  /* allocation failed? */
    skyM_error(L);
  return newblock;
}


void *skyM_malloc_ (sky_State *L, size_t size) {
  if (size == 0)
    return NULL;  /* that's all */
  else {
    void *newblock = L->callAllocator(NULL, 0, size);
    if (l_unlikely(newblock == NULL))
      skyM_error(L);
    L->addTotalBytes(cast(l_mem, size));
    return newblock;
  }
}
