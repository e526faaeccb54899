#include <gtest/gtest.h>
#include "../include/TaskRegistry.hpp"

using namespace ordo;

namespace
{
    Task make_task(const std::string &name, const std::string &doc = "")
    {
        Task t;
        t.name = name;
        if (!doc.empty()) t.doc = doc;
        return t;
    }
} // namespace

TEST(TaskRegistry, LookupReturnsDefinedTask)
{
    TaskRegistry r;
    r.define(make_task("build", "compile"));

    const Task *t = r.lookup("build");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->name, "build");
    EXPECT_EQ(t->doc.value_or(""), "compile");
    EXPECT_TRUE(r.contains("build"));
}

TEST(TaskRegistry, LookupUnknownReturnsNull)
{
    TaskRegistry r;
    r.define(make_task("build"));
    EXPECT_EQ(r.lookup("test"), nullptr);
    EXPECT_FALSE(r.contains("test"));
}

TEST(TaskRegistry, RedefinitionOverwritesInPlace)
{
    TaskRegistry r;
    r.define(make_task("a", "first"));
    r.define(make_task("b"));
    r.define(make_task("a", "second"));

    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(r.all()[0].name, "a");
    EXPECT_EQ(r.all()[0].doc.value_or(""), "second");
    EXPECT_EQ(r.all()[1].name, "b");
}

TEST(TaskRegistry, AllKeepsDeclarationOrder)
{
    TaskRegistry r;
    for (const char *n: {"zeta", "alpha", "mid"}) r.define(make_task(n));
    ASSERT_EQ(r.all().size(), 3u);
    EXPECT_EQ(r.all()[0].name, "zeta");
    EXPECT_EQ(r.all()[1].name, "alpha");
    EXPECT_EQ(r.all()[2].name, "mid");
}

TEST(TaskRegistry, DefaultTargetIsFirstUnlessSet)
{
    TaskRegistry r;
    EXPECT_EQ(r.default_target(), "");
    r.define(make_task("first"));
    r.define(make_task("second"));
    EXPECT_EQ(r.default_target(), "first");
    r.set_default_target("second");
    EXPECT_EQ(r.default_target(), "second");
}

TEST(TaskRegistry, EmptyNameThrows)
{
    TaskRegistry r;
    EXPECT_THROW(r.define(make_task("")), std::invalid_argument);
}

TEST(Task, OutputPathDefaultsToName)
{
    Task t = make_task("out/lib.a");
    EXPECT_FALSE(t.output_path().has_value()); // no action yet
    t.action = Action{{Command::shell("true")}, {}};
    ASSERT_TRUE(t.output_path().has_value());
    EXPECT_EQ(*t.output_path(), std::filesystem::path("out/lib.a"));

    t.output = "elsewhere.bin";
    EXPECT_EQ(*t.output_path(), std::filesystem::path("elsewhere.bin"));

    t.phony = true;
    EXPECT_FALSE(t.output_path().has_value());
}

TEST(Task, CommandDisplay)
{
    EXPECT_EQ(Command::shell("echo hi > x").display(), "echo hi > x");
    const Command c{{"cmake", "--build", "my dir"}};
    EXPECT_EQ(c.display(), "cmake --build 'my dir'");
}
