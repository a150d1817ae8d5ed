/*
** Helpers shared by the test programs
*/

#ifndef test_helpers_h
#define test_helpers_h

#include <iostream>
#include <string>
#include <utility>

#include "sky.h"
#include "sdo.h"
#include "sobject.h"
#include "sstate.h"

static int failures = 0;
static int ntests = 0;

/* stop the current test when 'c' does not hold */
#define CHECK(c) do { \
    if (!(c)) { \
        std::cout << "FAILED: " #c " (line " << __LINE__ << ")" << std::endl; \
        failures++; \
        return; \
    } \
} while (0)

/* run one test in protected mode; an error escaping it is a failure */
template<typename F>
static void run_test(sky_State* L, const char* name, F test) {
    std::cout << "Test " << ++ntests << ": " << name << "... ";
    int before = failures;
    int status = L->protect([&] { test(L); });
    if (status != SKY_OK) {
        std::cout << "FAILED: unexpected error (" << sky_statusname(status)
                  << "): " << L->getErrorMessage() << std::endl;
        failures++;
    }
    else if (failures == before) {
        std::cout << "PASSED" << std::endl;
    }
}

/* does 'f' raise an error with the given status (and message)? */
template<typename F>
static bool raises(sky_State* L, int status, const char* msg, F f) {
    int st = L->protect(f);
    if (st != status) {
        std::cout << "[got " << sky_statusname(st) << ": "
                  << L->getErrorMessage() << "] ";
        return false;
    }
    if (msg != nullptr && std::string(L->getErrorMessage()) != msg) {
        std::cout << "[message: " << L->getErrorMessage() << "] ";
        return false;
    }
    return true;
}

static TString* str(sky_State* L, const char* s) {
    return TString::create(L, s);
}

static TValue strv(sky_State* L, const char* s) {
    return TValue::ofString(TString::create(L, s));
}

static TValue intv(sky_Integer i) {
    return TValue::ofInt(i);
}

/* a branded constructor for structs: a named symbol */
class Symbol : public Udata {
private:
    std::string name;

public:
    explicit Symbol(std::string n) : name(std::move(n)) {}

    const char* typeName() const noexcept override { return "symbol"; }
    void tostring(sky_State* L, std::string& out) const override {
        UNUSED(L);
        out.append(name);
    }
    l_hash hash(sky_State* L) const override {
        UNUSED(L);
        return TString::computeHash(name.data(), name.size());
    }
    bool equals(sky_State* L, const Udata* other, int depth) const override {
        UNUSED(L); UNUSED(depth);
        return name == static_cast<const Symbol*>(other)->name;
    }
};

static int finish(const char* suite) {
    std::cout << std::endl;
    std::cout << "=== " << suite << ": " << ntests << " tests, "
              << failures << " failed ===" << std::endl;
    return failures == 0 ? 0 : 1;
}

#endif
