#include <stdio.h>

#include <functional>

#include "unity.h"
#include "TestRegistry.h"

static std::function<void(void)> setup_fnc;
void setUp(void)
{
    if(setup_fnc)
        setup_fnc();
}

static std::function<void(void)> teardown_fnc;
void tearDown(void)
{
    if(teardown_fnc)
        teardown_fnc();
}

static std::function<void(void)> test_wrapper_fnc;
static void test_wrapper(void)
{
    test_wrapper_fnc();
}

static int test_runner(void)
{
    auto& tests = TestRegistry::instance().get_tests();
    printf("There are %d registered tests...\n", (int)tests.size());
    for(auto& i : tests) {
        printf("  %s\n", i.name);
    }

    UnityBegin("TestUnits");

    for(auto& i : tests) {
        TestBase *fnc = i.test;
        Unity.TestFile = i.file;
        test_wrapper_fnc = std::bind(&TestBase::test, fnc);
        if(i.setup_teardown) {
            setup_fnc = std::bind(&TestBase::setUp, fnc);
            teardown_fnc = std::bind(&TestBase::tearDown, fnc);
        } else {
            setup_fnc = nullptr;
            teardown_fnc = nullptr;
        }

        UnityDefaultTestRun(test_wrapper, i.name, i.line);
    }

    return UnityEnd();
}

int main(int argc, char *argv[])
{
    int ret = test_runner();
    printf("Tests done, %s\n", ret == 0 ? "all passed" : "FAILED");
    return ret;
}
