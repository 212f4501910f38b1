#pragma once

#include "unity.h"

#include <vector>

class TestBase;

// every test registers itself here from its static constructor
class TestRegistry
{
public:
    struct test_t {
        TestBase *test;
        const char *name;
        const char *file;
        int line;
        bool setup_teardown;
    };

    static TestRegistry& instance()
    {
        static TestRegistry instance;
        return instance;
    }

    void add_test(TestBase *t, const char *name, const char *file, int line, bool setup_teardown)
    {
        tests.push_back({t, name, file, line, setup_teardown});
    }

    const std::vector<test_t>& get_tests() const { return tests; }

private:
    TestRegistry(){};
    std::vector<test_t> tests;
};

class TestBase
{
public:
    TestBase(const char *name, const char *file, int line, bool setup_teardown)
    {
        TestRegistry::instance().add_test(this, name, file, line, setup_teardown);
    }
    virtual ~TestBase() {};

    virtual void test() = 0;
    virtual void setUp() {};
    virtual void tearDown() {};
};

/**
 * Register a single test with no fixture
 */
#define REGISTER_TEST(testCaseName, testName)\
  class testCaseName##testName##Test : public TestBase \
    { public: testCaseName##testName##Test() : TestBase(#testCaseName "-" #testName, __FILE__, __LINE__, false) {} \
    void test(void); } \
    testCaseName##testName##Instance; \
    void testCaseName##testName##Test::test(void)

/**
 * Fixtures, used in this order:
 *
 * TEST_DECLARE(Name)
 *     members the tests use, not initialized here
 * TEST_END_DECLARE
 *
 * TEST_SETUP(Name) { runs before each REGISTER_TESTF(Name, ...) }
 * TEST_TEARDOWN(Name) { runs after each one }
 */
#define TEST_DECLARE(testCaseName)\
        class testCaseName##Declare##Test : public TestBase \
        { public: testCaseName##Declare##Test(const char *name, const char *file, int line) : TestBase (name, file, line, true) {} \
        virtual void test() = 0; virtual void setUp(); virtual void tearDown(); \
        protected:

#define TEST_END_DECLARE \
        };

#define TEST_SETUP(testCaseName)\
        void testCaseName##Declare##Test::setUp ()

#define TEST_TEARDOWN(testCaseName)\
        void testCaseName##Declare##Test::tearDown ()

#define REGISTER_TESTF(testCaseName, testName)\
  class testCaseName##testName##Test : public testCaseName##Declare##Test \
        { public: testCaseName##testName##Test() : testCaseName##Declare##Test (#testCaseName "-" #testName, __FILE__, __LINE__) {} \
            void test(); } \
    testCaseName##testName##Instance; \
        void testCaseName##testName##Test::test ()
