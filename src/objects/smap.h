/*
** $Id: smap.h $
** Insertion-ordered hash tables
** See Copyright Notice in sky.h
*/

#ifndef smap_h
#define smap_h

#include <string>
#include <type_traits>
#include <utility>

#include "slimits.h"
#include "sstate.h"
#include "sstring.h"
#include "stvalue.h"
#include "SkyVector.h"


/*
** Tables are open-chaining hash tables whose buckets hold BUCKETSIZE
** entries each. Live entries also form a doubly-linked list in the
** order their keys were first inserted, which is the iteration order.
**
** Buckets live in one array: the first 'nheads' buckets (a power of 2)
** are the heads of the chains; overflow buckets are appended after
** them. An entry is named by its index 'bucket * BUCKETSIZE + slot',
** which stays valid when the array is reallocated. The list links,
** 'head' and 'tail' are such indices, with -1 for "none".
*/

inline constexpr int BUCKETSIZE = 8;

inline constexpr double LOADFACTOR = 6.5;

/* limit for the number of chain heads */
inline constexpr int MAXHEADS = (1 << 24);


/* does a table with 'elems' entries need more than 'nbuckets' chains? */
inline constexpr bool overloaded (size_t elems, size_t nbuckets) noexcept {
  return elems >= BUCKETSIZE &&
         static_cast<double>(elems) >= LOADFACTOR * static_cast<double>(nbuckets);
}


template<typename K>
struct HashEntry {
  l_hash hash = 0;  /* nonzero => in use */
  int prev = -1;    /* insertion-order links */
  int next = -1;
  K key{};
  TValue value;
};


template<typename K>
struct HashBucket {
  HashEntry<K> entries[BUCKETSIZE];
  int next = -1;    /* overflow bucket of this chain */
};


/*
** Key policies. 'ValueKeys' admits any hashable value as a key, with
** the language's equality; a failing hash or comparison raises an
** error. 'StringKeys' is for tables whose keys are always strings and
** never fails.
*/
struct ValueKeys {
  using Key = TValue;
  static l_hash hash (sky_State *L, const TValue& k);
  static bool equal (sky_State *L, const TValue& a, const TValue& b);
  static void freeze (sky_State *L, TValue& k);
  static std::string display (sky_State *L, const TValue& k);
};


struct StringKeys {
  using Key = TString *;
  static l_hash hash (sky_State *L, TString *k) noexcept {
    UNUSED(L);
    return k->getHash();
  }
  static bool equal (sky_State *L, TString *a, TString *b) noexcept {
    UNUSED(L);
    return a->equals(b);
  }
  static void freeze (sky_State *L, TString *&k) noexcept {
    UNUSED(L); UNUSED(k);  /* strings are immutable */
  }
  static std::string display (sky_State *L, TString *k);
};


template<typename Policy>
class HashTable {
public:
  using Key = typename Policy::Key;
  using Entry = HashEntry<Key>;
  using Bucket = HashBucket<Key>;

  static_assert(std::is_trivially_copyable_v<Bucket>,
                "buckets are moved with realloc");

  /*
  ** Cursor over the keys (and values) in insertion order. While it is
  ** active, the table rejects insertions, deletions and clears; it is
  ** released by 'done' or by its destructor.
  */
  class Iterator {
  private:
    const HashTable *t;
    int cur;
    bool counted;   /* holds one unit of the table's 'itercount' */

  public:
    explicit Iterator(const HashTable *ht) noexcept
      : t(ht), cur(ht->head), counted(!ht->frozen) {
      if (counted)
        t->itercount++;
    }
    Iterator(Iterator&& o) noexcept : t(o.t), cur(o.cur), counted(o.counted) {
      o.counted = false;
    }
    Iterator(const Iterator&) = delete;
    Iterator& operator=(const Iterator&) = delete;
    Iterator& operator=(Iterator&&) = delete;
    ~Iterator() { done(); }

    bool next(Key *k, TValue *v = nullptr) noexcept {
      if (cur < 0)
        return false;
      const Entry& e = t->entry(cur);
      *k = e.key;
      if (v != nullptr)
        *v = e.value;
      cur = e.next;
      return true;
    }

    void done() noexcept {
      if (counted) {
        counted = false;
        t->itercount--;
      }
    }
  };

private:
  sky_State *L;
  Bucket *buckets;      /* chain heads followed by overflow buckets */
  int nheads;           /* number of chain heads (a power of 2) */
  int nused;            /* buckets in use */
  int ncap;             /* size of the 'buckets' array */
  unsigned length;      /* number of entries */
  mutable unsigned itercount;  /* active iterators and key scans */
  int head;             /* first entry in insertion order */
  int tail;             /* last entry in insertion order */
  bool frozen;
  Bucket bucket0;       /* storage for single-chain tables */

  /*
  ** Keeps the table immutable while keys are being compared. A frozen
  ** table is immutable already and is not touched, so that it can be
  ** read from several threads at once.
  */
  class ScanGuard {
    const HashTable *t;
  public:
    explicit ScanGuard(const HashTable *ht) noexcept
      : t(ht->frozen ? nullptr : ht) {
      if (t)
        t->itercount++;
    }
    ~ScanGuard() {
      if (t)
        t->itercount--;
    }
    ScanGuard(const ScanGuard&) = delete;
    ScanGuard& operator=(const ScanGuard&) = delete;
  };

  l_hash hashKey (const Key& k) const {
    l_hash h = Policy::hash(L, k);
    return (h == 0) ? 1 : h;  /* zero is reserved */
  }
  /* link to be written when appending an entry to the list */
  int& tailLink () noexcept { return (tail < 0) ? head : entry(tail).next; }
  void checkMutable (const char *what) const;
  int find (const Key& k, l_hash h, int *freeslot, int *lastb) const;
  int newBucket (int lastb);
  void grow ();
  void freeBuckets () noexcept;

public:
  explicit HashTable(sky_State *L, unsigned sizehint = 0);
  ~HashTable();

  HashTable(const HashTable&) = delete;
  HashTable& operator=(const HashTable&) = delete;
  HashTable(HashTable&&) = delete;
  HashTable& operator=(HashTable&&) = delete;

  /* size an empty table so that 'sizehint' insertions need no growth */
  void init (unsigned sizehint);

  void insert (const Key& k, const TValue& v);
  [[nodiscard]] bool lookup (const Key& k, TValue *v) const;
  bool erase (const Key& k, TValue *removed = nullptr);
  void clear ();
  void freeze ();

  bool isFrozen () const noexcept { return frozen; }
  unsigned len () const noexcept { return length; }
  sky_State *getState () const noexcept { return L; }

  [[nodiscard]] Iterator iterate () const { return Iterator(this); }
  SkyVector<Key> keys () const;
  SkyVector<std::pair<Key, TValue>> items () const;
  bool first (Key *k) const noexcept;
  void dump () const;

  /* raw access to the storage, for diagnostics and tests */
  int headIndex () const noexcept { return head; }
  int tailIndex () const noexcept { return tail; }
  int numHeads () const noexcept { return nheads; }
  int numBuckets () const noexcept { return nused; }
  Entry& entry (int idx) noexcept {
    return buckets[idx / BUCKETSIZE].entries[idx % BUCKETSIZE];
  }
  const Entry& entry (int idx) const noexcept {
    return buckets[idx / BUCKETSIZE].entries[idx % BUCKETSIZE];
  }
};


extern template class HashTable<ValueKeys>;
extern template class HashTable<StringKeys>;

/* table with arbitrary hashable keys, backing dict values */
using OrderedMap = HashTable<ValueKeys>;

/* table with string keys, backing struct fields */
using StringMap = HashTable<StringKeys>;


#endif
