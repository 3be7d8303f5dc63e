#ifndef RBK_TESTS_STEPS__
#define RBK_TESTS_STEPS__

#include "rbk_test_harness.hpp"
#include "../include/rbk_document.hpp"
#include "../include/rbk_steps.hpp"

namespace rbk::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    inline code_block code(std::string lang, std::string content, size_t line = 0)
    {
        return code_block{ std::move(lang), std::move(content), line };
    }

    inline text_block text(std::string content)
    {
        return text_block{ std::move(content) };
    }

    // # Prepare / text, bash / ## Apply / python, text, sh / (no header) / text
    inline document sample_document()
    {
        section a = section::with_header("Prepare", 1);
        a.blocks = { text("Read this first.\n"), code("bash", "echo prepare", 3) };

        section b = section::with_header("Apply", 2);
        b.blocks = { code("python", "print(1)", 9), text("Between.\n"), code("sh", "ls\npwd", 14) };

        section c;
        c.blocks = { text("Trailing notes.\n") };

        return document({ a, b, c });
    }

//------------------------------------------
// TESTS
//------------------------------------------

static bool test_document_drops_contentless_sections()
{
    section empty;
    section headed = section::with_header("", 1);

    document doc({ empty, headed, empty });
    EXPECT(doc.section_count() == 1, "scaffolding section kept");
    EXPECT(doc.sections()[0].header == "", "headed section lost");

    EXPECT(document{}.empty(), "default document not empty");

    return true;
}

static bool test_steps_follow_document_order()
{
    auto doc = sample_document();
    auto s   = steps(doc);

    EXPECT(s.size() == 3, "wrong step count");
    EXPECT(step_count(doc) == s.size(), "count disagrees with list");
    EXPECT(s[0].get().language == "bash", "first step wrong");
    EXPECT(s[1].get().language == "python", "second step wrong");
    EXPECT(s[2].get().content == "ls\npwd", "third step wrong");

    return true;
}

static bool test_steps_reference_document_blocks()
{
    auto doc = sample_document();
    auto s   = steps(doc);

    auto const & stored = std::get<code_block>(doc.sections()[1].blocks[0]);
    EXPECT(&s[1].get() == &stored, "step is a copy, not a reference");

    return true;
}

static bool test_step_at_is_one_based()
{
    auto doc = sample_document();

    EXPECT(!step_at(doc, 0), "step 0 exists");
    EXPECT(step_at(doc, 1)->get().content == "echo prepare", "step 1 wrong");
    EXPECT(step_at(doc, 3)->get().language == "sh", "step 3 wrong");
    EXPECT(!step_at(doc, 4), "step past the end exists");

    return true;
}

static bool test_step_locations()
{
    auto doc = sample_document();
    auto loc = step_locations(doc);

    EXPECT(loc.size() == 3, "wrong location count");
    EXPECT(loc[0].number == 1 && loc[0].section == 0 && loc[0].block == 1, "first location wrong");
    EXPECT(loc[2].number == 3 && loc[2].section == 1 && loc[2].block == 2, "third location wrong");

    return true;
}

static bool test_steps_of_text_only_document()
{
    section s;
    s.blocks = { text("just prose\n") };
    document doc({ s });

    EXPECT(steps(doc).empty(), "steps from prose");
    EXPECT(step_count(doc) == 0, "nonzero count");
    EXPECT(!step_at(doc, 1), "step 1 exists");

    return true;
}

static bool test_document_step_members()
{
    auto doc    = sample_document();
    auto blocks = doc.code_blocks();

    EXPECT(doc.step_count() == 3, "member count wrong");
    EXPECT(blocks.size() == steps(doc).size(), "member list disagrees with the index");
    EXPECT(&blocks[2].get() == &steps(doc)[2].get(), "member list is a copy");
    EXPECT(document{}.step_count() == 0, "empty document has steps");

    return true;
}

static bool test_code_block_interpreter()
{
    EXPECT(code("python", "").interpreter() == "python3", "python interpreter wrong");
    EXPECT(code("sh", "").interpreter() == "sh", "sh interpreter wrong");
    EXPECT(code("sql", "").interpreter() == "bash", "fallback interpreter wrong");
    EXPECT(code("zsh", "").is_shell(), "zsh not a shell");
    EXPECT(!code("python", "").is_shell(), "python is a shell");

    return true;
}

//------------------------------------------

inline void run_steps_tests()
{
    RUN_TEST(test_document_drops_contentless_sections);
    RUN_TEST(test_steps_follow_document_order);
    RUN_TEST(test_steps_reference_document_blocks);
    RUN_TEST(test_step_at_is_one_based);
    RUN_TEST(test_step_locations);
    RUN_TEST(test_steps_of_text_only_document);
    RUN_TEST(test_document_step_members);
    RUN_TEST(test_code_block_interpreter);
}

}

#endif
