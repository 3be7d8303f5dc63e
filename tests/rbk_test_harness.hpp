#ifndef RBK_TESTS_HARNESS__
#define RBK_TESTS_HARNESS__

#include <algorithm>
#include <cctype>
#include <iostream>
#include <vector>
#include <string>

namespace rbk::tests
{

    struct test_result
    {
        std::string name;
        bool passed;
    };

    extern std::vector<test_result> results;
    extern char const * last_error;

    inline size_t failure_count()
    {
        return static_cast<size_t>(std::count_if(results.begin(), results.end(),
            [](test_result const & r) { return !r.passed; }));
    }

    #define EXPECT(cond, false_msg)                        \
        do                                                 \
        {                                                  \
            last_error = "";                               \
            if (!(cond)) {                                 \
                last_error = false_msg;                    \
                return false;                              \
            }                                              \
        } while (0)

    #define EXPECT_THROWS(expr, exc_type, false_msg)       \
        do                                                 \
        {                                                  \
            last_error = "";                               \
            bool thrown = false;                           \
            try { expr; }                                  \
            catch (exc_type const &) { thrown = true; }    \
            if (!thrown) {                                 \
                last_error = false_msg;                    \
                return false;                              \
            }                                              \
        } while (0)

    #define RUN_TEST(fn)                                 \
        do                                                 \
        {                                                  \
            bool ok = fn();                                \
            results.push_back({ #fn, ok });                \
            std::cout << (ok ? "[ ok ] " : "[FAIL] ")      \
                    << #fn;                                \
            if (!ok) std::cout << " FAILED: " << last_error;       \
            std::cout << "\n";                             \
        } while (0)

    #define SUBCAT(msg)                                                     \
        do                                                                  \
        {                                                                   \
            std::string str(msg);                                           \
            std::transform(str.begin(), str.end(), str.begin(), ::toupper); \
            std::cout << "-------" << str << "--------------\n";            \
        }                                                                   \
        while (0)
}

#endif
