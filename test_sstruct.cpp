/*
** Test program for struct values
*/

#include <initializer_list>
#include <iostream>
#include <span>
#include <string>

#include "sky.h"
#include "sdebug.h"
#include "sobject.h"
#include "sstate.h"
#include "sstruct.h"
#include "test_helpers.h"


/* a value whose comparisons always fail */
class Faulty : public Udata {
public:
    const char* typeName() const noexcept override { return "faulty"; }
    void tostring(sky_State* L, std::string& out) const override {
        UNUSED(L);
        out.append("faulty");
    }
    bool equals(sky_State* L, const Udata* other, int depth) const override {
        UNUSED(other); UNUSED(depth);
        skyG_runerror(L, SKY_ERRRUN, "cannot compare");
    }
};


static Struct* mk(sky_State* L, std::initializer_list<Field> fs) {
    return Struct::make(L, {}, std::span<const Field>(fs.begin(), fs.size()));
}

static Struct* branded(sky_State* L, Udata* ctor, std::initializer_list<Field> fs) {
    return Struct::create(L, TValue::ofUserdata(ctor),
                          std::span<const Field>(fs.begin(), fs.size()));
}

static std::string display(sky_State* L, Struct* s) {
    TValue v = TValue::ofStruct(s);
    return skyV_tostring(L, &v);
}


static void test_construction(sky_State* L) {
    Struct* s = mk(L, {{str(L, "c"), intv(3)}, {str(L, "a"), intv(1)}, {str(L, "b"), intv(2)}});
    CHECK(s->len() == 3);

    // fields are kept in name order
    SkyVector<TString*> names = s->attrNames();
    CHECK(names.size() == 3);
    CHECK(names[0]->view() == "a" && names[1]->view() == "b" && names[2]->view() == "c");

    CHECK(s->attr(L, str(L, "b")).intValue() == 2);
    CHECK(s->hasAttr(str(L, "c")));
    CHECK(!s->hasAttr(str(L, "d")));
    CHECK(s->hasDefaultConstructor(L));
    CHECK(s->constructor().isString());
    CHECK(s->truth());
    CHECK(std::string(Struct::typeName()) == "struct");

    // an empty struct is still true
    Struct* e = mk(L, {});
    CHECK(e->len() == 0 && e->truth());
    CHECK(display(L, e) == "struct()");
}


static void test_repeated_names(sky_State* L) {
    Struct* s = mk(L, {{str(L, "x"), intv(1)}, {str(L, "y"), intv(2)}, {str(L, "x"), intv(3)}});
    CHECK(s->len() == 2);
    CHECK(s->attr(L, str(L, "x")).intValue() == 3);
}


static void test_make_positional(sky_State* L) {
    TValue args[] = {intv(1)};
    Field kw[] = {{str(L, "a"), intv(1)}};
    CHECK(raises(L, SKY_ERRRUN, "struct: unexpected positional arguments",
                 [&] { Struct::make(L, args, kw); }));
}


static void test_missing_attr(sky_State* L) {
    Struct* s = mk(L, {{str(L, "a"), intv(1)}});
    CHECK(raises(L, SKY_ERRATTR, "struct has no .z attribute",
                 [&] { s->attr(L, str(L, "z")); }));

    Symbol* point = skyU_new<Symbol>(L, "point");
    Struct* p = branded(L, point, {{str(L, "x"), intv(1)}});
    CHECK(raises(L, SKY_ERRATTR, "point struct has no .z attribute",
                 [&] { p->attr(L, str(L, "z")); }));
}


static void test_merge(sky_State* L) {
    Struct* x = mk(L, {{str(L, "a"), intv(1)}, {str(L, "b"), intv(2)}});
    Struct* y = mk(L, {{str(L, "b"), intv(3)}, {str(L, "c"), intv(4)}});
    Struct* s = Struct::merge(L, x, y);

    CHECK(s->len() == 3);
    SkyVector<TString*> names = s->attrNames();
    CHECK(names[0]->view() == "a" && names[1]->view() == "b" && names[2]->view() == "c");
    CHECK(s->attr(L, str(L, "a")).intValue() == 1);
    CHECK(s->attr(L, str(L, "b")).intValue() == 3);  // right operand wins
    CHECK(s->attr(L, str(L, "c")).intValue() == 4);
    CHECK(display(L, s) == "struct(a = 1, b = 3, c = 4)");

    // the operands are unchanged
    CHECK(x->attr(L, str(L, "b")).intValue() == 2);
    CHECK(y->len() == 2);

    // the result is sorted, so it merges again
    Struct* z = mk(L, {{str(L, "aa"), intv(5)}, {str(L, "d"), intv(6)}});
    Struct* t = Struct::merge(L, s, z);
    SkyVector<TString*> tn = t->attrNames();
    const char* expected[] = {"a", "aa", "b", "c", "d"};
    CHECK(tn.size() == 5);
    for (int i = 0; i < 5; i++)
        CHECK(tn[i]->view() == expected[i]);

    // branded structs merge with structs of an equal brand
    Symbol* p1 = skyU_new<Symbol>(L, "point");
    Symbol* p2 = skyU_new<Symbol>(L, "point");
    Struct* u = Struct::merge(L, branded(L, p1, {{str(L, "x"), intv(1)}}),
                                 branded(L, p2, {{str(L, "y"), intv(2)}}));
    CHECK(display(L, u) == "point(x = 1, y = 2)");
}


static void test_merge_mismatch(sky_State* L) {
    Symbol* point = skyU_new<Symbol>(L, "point");
    Struct* p = branded(L, point, {{str(L, "x"), intv(1)}});
    Struct* s = mk(L, {{str(L, "y"), intv(2)}});
    CHECK(raises(L, SKY_ERRCTOR,
                 "cannot add structs of different constructors: point + \"struct\"",
                 [&] { Struct::merge(L, p, s); }));

    // a failing constructor comparison keeps its own status
    Faulty* f1 = skyU_new<Faulty>(L);
    Faulty* f2 = skyU_new<Faulty>(L);
    Struct* a = branded(L, f1, {});
    Struct* b = branded(L, f2, {});
    CHECK(raises(L, SKY_ERRRUN,
                 "in faulty + faulty: error comparing constructors: cannot compare",
                 [&] { Struct::merge(L, a, b); }));
}


static void test_equality(sky_State* L) {
    Struct* x = mk(L, {{str(L, "a"), intv(1)}, {str(L, "b"), strv(L, "s")}});
    Struct* y = mk(L, {{str(L, "b"), strv(L, "s")}, {str(L, "a"), TValue::ofFloat(1.0)}});
    TValue xv = TValue::ofStruct(x);
    TValue yv = TValue::ofStruct(y);
    CHECK(skyV_equal(L, &xv, &yv));
    CHECK(Struct::compareSameType(L, CmpOp::EQ, x, y, SKYI_MAXDEPTH));
    CHECK(!Struct::compareSameType(L, CmpOp::NE, x, y, SKYI_MAXDEPTH));

    Struct* z = mk(L, {{str(L, "a"), intv(2)}, {str(L, "b"), strv(L, "s")}});
    TValue zv = TValue::ofStruct(z);
    CHECK(!skyV_equal(L, &xv, &zv));
    CHECK(Struct::compareSameType(L, CmpOp::NE, x, z, SKYI_MAXDEPTH));

    Struct* w = mk(L, {{str(L, "a"), intv(1)}, {str(L, "c"), strv(L, "s")}});
    TValue wv = TValue::ofStruct(w);
    CHECK(!skyV_equal(L, &xv, &wv));

    // same fields, different constructor
    Symbol* point = skyU_new<Symbol>(L, "point");
    Struct* p = branded(L, point, {{str(L, "a"), intv(1)}, {str(L, "b"), strv(L, "s")}});
    TValue pv = TValue::ofStruct(p);
    CHECK(!skyV_equal(L, &xv, &pv));

    CHECK(raises(L, SKY_ERRRUN, "struct < struct not implemented",
                 [&] { Struct::compareSameType(L, CmpOp::LT, x, y, SKYI_MAXDEPTH); }));
}


static void test_equality_lengths(sky_State* L) {
    // different field counts decide before any value is compared
    Faulty* f1 = skyU_new<Faulty>(L);
    Faulty* f2 = skyU_new<Faulty>(L);
    Struct* x = mk(L, {{str(L, "a"), TValue::ofUserdata(f1)}});
    Struct* y = mk(L, {{str(L, "a"), TValue::ofUserdata(f2)}, {str(L, "b"), intv(1)}});
    CHECK(!Struct::equals(L, x, y, SKYI_MAXDEPTH));

    // with equal counts, the value comparison error propagates
    Struct* z = mk(L, {{str(L, "a"), TValue::ofUserdata(f2)}});
    CHECK(raises(L, SKY_ERRRUN, "cannot compare",
                 [&] { (void)Struct::equals(L, x, z, SKYI_MAXDEPTH); }));

    // and so does a failing constructor comparison
    Struct* a = branded(L, f1, {});
    Struct* b = branded(L, f2, {});
    CHECK(raises(L, SKY_ERRRUN,
                 "error comparing struct constructors faulty and faulty: cannot compare",
                 [&] { (void)Struct::equals(L, a, b, SKYI_MAXDEPTH); }));
}


static void test_depth(sky_State* L) {
    Struct* x = mk(L, {{str(L, "p"), TValue::ofStruct(mk(L, {{str(L, "q"), intv(1)}}))}});
    Struct* y = mk(L, {{str(L, "p"), TValue::ofStruct(mk(L, {{str(L, "q"), intv(1)}}))}});
    TValue xv = TValue::ofStruct(x);
    TValue yv = TValue::ofStruct(y);

    CHECK(skyV_equal(L, &xv, &yv));
    CHECK(raises(L, SKY_ERRDEPTH, "comparison exceeded maximum recursion depth",
                 [&] { (void)skyV_equalDepth(L, &xv, &yv, 0); }));
    CHECK(raises(L, SKY_ERRDEPTH, "comparison exceeded maximum recursion depth",
                 [&] { (void)Struct::equals(L, x, y, 2); }));
    CHECK(Struct::equals(L, x, y, 3));
}


static void test_hash(sky_State* L) {
    Struct* x = mk(L, {{str(L, "a"), intv(1)}, {str(L, "b"), strv(L, "s")}});
    Struct* y = mk(L, {{str(L, "b"), strv(L, "s")}, {str(L, "a"), intv(1)}});
    Struct* z = mk(L, {{str(L, "a"), intv(2)}, {str(L, "b"), strv(L, "s")}});
    CHECK(x->hash(L) == y->hash(L));
    CHECK(x->hash(L) != z->hash(L));

    // structs are usable as keys
    OrderedMap m(L);
    m.insert(TValue::ofStruct(x), intv(1));
    TValue v;
    CHECK(m.lookup(TValue::ofStruct(y), &v) && v.intValue() == 1);
    CHECK(!m.lookup(TValue::ofStruct(z), &v));

    // the first failing field is reported
    Struct* bad = mk(L, {{str(L, "b"), TValue::ofUserdata(skyU_new<Faulty>(L))},
                         {str(L, "a"), TValue::ofDict(Dict::create(L))}});
    CHECK(raises(L, SKY_ERRUNHASHABLE, "unhashable type: dict",
                 [&] { (void)bad->hash(L); }));
    Struct* bad2 = mk(L, {{str(L, "b"), TValue::ofUserdata(skyU_new<Faulty>(L))}});
    CHECK(raises(L, SKY_ERRUNHASHABLE, "unhashable type: faulty",
                 [&] { (void)bad2->hash(L); }));
}


static void test_display(sky_State* L) {
    Struct* s = mk(L, {{str(L, "b"), strv(L, "x")}, {str(L, "a"), intv(1)}});
    CHECK(display(L, s) == "struct(a = 1, b = \"x\")");
    CHECK(s->tostring(L) == "struct(a = 1, b = \"x\")");

    Symbol* point = skyU_new<Symbol>(L, "point");
    Struct* p = branded(L, point, {{str(L, "x"), TValue::ofFloat(0.5)}});
    Struct* n = mk(L, {{str(L, "p"), TValue::ofStruct(p)}, {str(L, "none"), TValue()}});
    CHECK(display(L, n) == "struct(none = None, p = point(x = 0.5))");

    // a constructor that is some other string shows quoted
    Struct* q = Struct::create(L, strv(L, "thing"), std::span<const Field>());
    CHECK(display(L, q) == "\"thing\"()");
}


static void test_freeze(sky_State* L) {
    Dict* d = Dict::create(L);
    d->set(intv(1), intv(1));
    Struct* s = mk(L, {{str(L, "d"), TValue::ofDict(d)}});
    CHECK(!s->isFrozen());

    TValue sv = TValue::ofStruct(s);
    skyV_freeze(L, &sv);
    CHECK(s->isFrozen());
    CHECK(d->isFrozen());
    CHECK(raises(L, SKY_ERRFROZEN, nullptr, [&] { d->set(intv(2), intv(2)); }));

    // reads are unaffected
    CHECK(s->attr(L, str(L, "d")).isDict());
    skyV_freeze(L, &sv);
    CHECK(s->isFrozen());
}


static void test_conversions(sky_State* L) {
    Struct* s = mk(L, {{str(L, "y"), intv(2)}, {str(L, "x"), intv(1)}});

    Dict* d = Dict::create(L);
    s->toDict(d);
    CHECK(d->len() == 2);
    TValue v;
    CHECK(d->get(strv(L, "x"), &v) && v.intValue() == 1);
    CHECK(d->get(strv(L, "y"), &v) && v.intValue() == 2);

    OrderedView view = s->toView(L);
    CHECK(view.len() == 2);
    CHECK(view.keyIndex(0)->view() == "x");
    CHECK(view.index(1).intValue() == 2);
    CHECK(view.get("y", &v) && v.intValue() == 2);
}


int main() {
    std::cout << "=== Struct Test Suite ===" << std::endl;
    std::cout << std::endl;

    sky_State* L = skyL_newstate();
    if (!L) {
        std::cerr << "Failed to create Sky state" << std::endl;
        return 1;
    }

    run_test(L, "Construction", test_construction);
    run_test(L, "Repeated names", test_repeated_names);
    run_test(L, "Positional arguments", test_make_positional);
    run_test(L, "Missing attributes", test_missing_attr);
    run_test(L, "Merge", test_merge);
    run_test(L, "Merge with different constructors", test_merge_mismatch);
    run_test(L, "Equality", test_equality);
    run_test(L, "Equality of different lengths", test_equality_lengths);
    run_test(L, "Depth-bounded equality", test_depth);
    run_test(L, "Hash", test_hash);
    run_test(L, "Display", test_display);
    run_test(L, "Freeze", test_freeze);
    run_test(L, "Conversions", test_conversions);

    int res = finish("Struct Test Suite");
    sky_close(L);
    return res;
}
