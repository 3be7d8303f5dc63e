#ifndef RBK_TESTS_INTEGRATION__
#define RBK_TESTS_INTEGRATION__

#include "rbk_test_harness.hpp"
#include "rbk_walker_tests.hpp"
#include "../include/rbk.hpp"
#include "../include/rbk_serializer.hpp"
#include "../include/rbk_layout.hpp"
#include "../src/file_io.hpp"

#include <sstream>

namespace rbk::tests
{
using namespace rbk;

// The test binary runs from the source root, next to examples/.

bool workflow_load_basic_runbook()
{
    auto ctx = load(read_text_file("examples/basic.md"));
    auto s   = steps(ctx.document);

    EXPECT(ctx.document.section_count() == 4, "wrong section count");
    EXPECT(s.size() == 5, "wrong step count");
    EXPECT(s[0].get().language == "bash" && s[0].get().content == "uname -a", "first step wrong");
    EXPECT(s[2].get().content == "mkdir -p /tmp/rbk-demo\ncd /tmp/rbk-demo", "multi-line step wrong");
    EXPECT(s[3].get().language == "python", "python step lost");

    bool folded = false;
    for (auto const & e : ctx.errors)
    {
        if (is_compile_error(e) && get_compile_error(e) == compile_error_kind::untagged_fence_folded)
            folded = true;
    }
    EXPECT(folded, "untagged fence not reported");
    EXPECT(serialize_markdown(ctx.document).find("this is not a step") != std::string::npos,
           "untagged fence content lost");

    return true;
}

bool workflow_dry_run_database_migration()
{
    auto ctx = load(read_text_file("examples/database-migration.md"));
    EXPECT(!ctx.has_errors(), "well-formed runbook reported notices");
    EXPECT(ctx.document.section_count() == 7, "wrong section count");

    auto out = serialize_dry_run(ctx.document);
    EXPECT(out.find("Dry run - 6 steps found:\n\n") == 0, "dry-run heading wrong");
    EXPECT(out.find("Step 3 [sql]:\n"
                    "  CREATE TABLE orders_v2 (LIKE orders INCLUDING ALL);\n"
                    "  ALTER TABLE orders_v2 ADD COLUMN region text;\n") != std::string::npos,
           "sql step wrong");
    EXPECT(out.find("Step 6 [sql]:\n  DROP TABLE orders_old;\n") != std::string::npos, "last step wrong");

    return true;
}

bool workflow_view_flags_destructive_steps()
{
    auto ctx   = load(read_text_file("examples/database-migration.md"));
    auto lines = render_lines(ctx.document, 1);

    size_t dangerous = 0;
    bool   critical  = false;
    for (auto const & l : lines)
    {
        if (l.kind == line_kind::step_header && l.dangerous)
            ++dangerous;
        if (l.note == callout::danger)
            critical = true;
    }
    EXPECT(dangerous == 1, "DROP TABLE step not the only flagged step");
    EXPECT(critical, "critical callout not classified");
    EXPECT(lines.size() == layout_line_count(ctx.document), "view and scroll model disagree");

    return true;
}

bool workflow_walk_basic_runbook()
{
    auto ctx = load(read_text_file("examples/basic.md"));
    scripted_key_source keys{ press(key::enter), press('s'), press(key::enter) };
    std::ostringstream out;

    size_t shells = 0;
    auto opts = plain_walker();
    opts.drop_to_shell = [&](code_block const &) { ++shells; };

    EXPECT(run_walker(ctx.document, keys, out, opts) == 5, "walk did not finish");
    EXPECT(shells == 1, "shell hook not called once");
    EXPECT(out.str().find("Step 5/5 [bash]:\n  rm -rf /tmp/rbk-demo\n") != std::string::npos, "last step wrong");
    EXPECT(out.str().find("this is not a step") != std::string::npos, "folded fence not printed as prose");

    return true;
}

//------------------------------------------

inline void run_integration_tests()
{
    RUN_TEST(workflow_load_basic_runbook);
    RUN_TEST(workflow_dry_run_database_migration);
    RUN_TEST(workflow_view_flags_destructive_steps);
    RUN_TEST(workflow_walk_basic_runbook);
}

}

#endif
