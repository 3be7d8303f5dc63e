#ifndef RBK_TESTS_LAYOUT__
#define RBK_TESTS_LAYOUT__

#include "rbk_test_harness.hpp"
#include "rbk_steps_tests.hpp"
#include "../include/rbk_layout.hpp"

namespace rbk::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    inline size_t step_header_index(std::vector<layout_line> const & lines, size_t step)
    {
        for (size_t i = 0; i < lines.size(); ++i)
        {
            if (lines[i].kind == line_kind::step_header && lines[i].step == step)
                return i;
        }
        return npos();
    }

//------------------------------------------
// TESTS
//------------------------------------------

static bool test_layout_line_count_matches_rendering()
{
    auto doc = sample_document();

    EXPECT(layout_line_count(doc) == 22, "replayed line count wrong");
    EXPECT(render_lines(doc, 0).size() == layout_line_count(doc), "rendering and replay disagree");
    EXPECT(layout_line_count(document{}) == 0, "empty document has lines");

    return true;
}

static bool test_layout_block_rules()
{
    EXPECT(block_layout_lines(text("one\ntwo\n")) == 3, "text block rule wrong");
    EXPECT(block_layout_lines(code("bash", "a\nb\nc")) == 5, "code block rule wrong");
    EXPECT(block_layout_lines(code("bash", "")) == 2, "empty code block rule wrong");
    EXPECT(header_layout_lines(section::with_header("H", 1)) == 3, "header rule wrong");
    EXPECT(header_layout_lines(section{}) == 0, "headerless section has header lines");

    return true;
}

static bool test_scroll_offset_keeps_lookback_context()
{
    auto doc = sample_document();

    EXPECT(scroll_offset_for_step(doc, 1, 5) == 0, "step 1 offset not clamped at 0");
    EXPECT(scroll_offset_for_step(doc, 2, 5) == 6, "step 2 offset wrong");
    EXPECT(scroll_offset_for_step(doc, 3, 5) == 11, "step 3 offset wrong");
    EXPECT(scroll_offset_for_step(doc, 1, 0) == 5, "zero lookback wrong");

    return true;
}

static bool test_scroll_offset_out_of_range_is_top()
{
    auto doc = sample_document();

    EXPECT(scroll_offset_for_step(doc, 0, 5) == 0, "step 0 not at the top");
    EXPECT(scroll_offset_for_step(doc, 4, 5) == 0, "unknown step not at the top");
    EXPECT(scroll_offset_for_step(document{}, 1, 5) == 0, "empty document not at the top");

    return true;
}

static bool test_scroll_offset_matches_rendered_position()
{
    auto doc   = sample_document();
    auto lines = render_lines(doc, 0);

    for (size_t step = 1; step <= step_count(doc); ++step)
    {
        for (size_t lookback : { size_t(0), size_t(3), size_t(5), size_t(40) })
        {
            size_t at       = step_header_index(lines, step);
            size_t expected = at > lookback ? at - lookback : 0;
            EXPECT(at != npos(), "step header not rendered");
            EXPECT(scroll_offset_for_step(doc, step, lookback) == expected, "offset off the rendered step");
        }
    }

    return true;
}

static bool test_render_lines_kinds_and_status()
{
    auto lines = render_lines(sample_document(), 2);

    EXPECT(lines[0].kind == line_kind::blank, "header not preceded by blank");
    EXPECT(lines[1].kind == line_kind::header && lines[1].text == "# Prepare", "level 1 header wrong");
    EXPECT(lines[9].kind == line_kind::header && lines[9].text == "## Apply", "level 2 header wrong");
    EXPECT(lines[9].header_level == 2, "header level lost");
    EXPECT(lines[3].kind == line_kind::text && lines[3].text == "Read this first.", "text line wrong");

    EXPECT(lines[5].kind == line_kind::step_header, "step header missing");
    EXPECT(lines[5].text == "Step 1 [bash]:", "step header text wrong");
    EXPECT(lines[5].status == step_status::done, "earlier step not done");
    EXPECT(lines[11].status == step_status::current, "current step not current");
    EXPECT(lines[16].status == step_status::pending, "later step not pending");
    EXPECT(lines[17].kind == line_kind::code && lines[17].text == "ls", "code line wrong");
    EXPECT(lines[18].language == "sh" && lines[18].step == 3, "code line metadata wrong");

    return true;
}

static bool test_render_lines_callouts_and_danger()
{
    section s = section::with_header("Cleanup", 1);
    s.blocks = {
        text("WARNING: this deletes data\nnote the backup\nplain\n"),
        code("bash", "rm -rf /tmp/cache"),
        code("bash", "ls"),
    };
    auto lines = render_lines(document({ s }), 0);

    EXPECT(lines[3].note == callout::warning, "warning not classified");
    EXPECT(lines[4].note == callout::info, "note not classified");
    EXPECT(lines[5].note == callout::none, "plain line classified");
    EXPECT(lines[7].kind == line_kind::step_header && lines[7].dangerous, "destructive step not flagged");
    EXPECT(lines[10].kind == line_kind::step_header && !lines[10].dangerous, "harmless step flagged");

    return true;
}

//------------------------------------------

inline void run_layout_tests()
{
    RUN_TEST(test_layout_line_count_matches_rendering);
    RUN_TEST(test_layout_block_rules);
    RUN_TEST(test_scroll_offset_keeps_lookback_context);
    RUN_TEST(test_scroll_offset_out_of_range_is_top);
    RUN_TEST(test_scroll_offset_matches_rendered_position);
    RUN_TEST(test_render_lines_kinds_and_status);
    RUN_TEST(test_render_lines_callouts_and_danger);
}

}

#endif
