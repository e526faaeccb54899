#include "../include/Taskfile.hpp"
#include "../include/I18n.hpp"
#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>

using namespace ordo;
namespace fs = std::filesystem;

std::vector<std::string> Taskfile::sources(const fs::path &root) {
    std::vector<std::string> out;
    const fs::path base = root.empty() ? fs::path(".") : root;
    for (const char *dir: {"src", "include", "tests"}) {
        std::error_code ec;
        if (!fs::is_directory(base / dir, ec)) continue;
        for (fs::recursive_directory_iterator it(base / dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file(ec)) continue;
            const auto ext = it->path().extension();
            if (ext == ".cpp" || ext == ".hpp") {
                out.push_back(fs::relative(it->path(), base, ec).generic_string());
            }
        }
    }
    std::ranges::sort(out);
    return out;
}

void Taskfile::declare(TaskRegistry &registry, const fs::path &root) {
    const std::string build = build_dir;

    std::vector<Prerequisite> inputs;
    inputs.push_back(Prerequisite::file("CMakeLists.txt"));
    for (auto &s: sources(root)) inputs.push_back(Prerequisite::file(std::move(s)));

    Task all;
    all.name = "all";
    all.prerequisites = {Prerequisite::task("build"), Prerequisite::task("test"), Prerequisite::task("doc")};
    all.doc = _("run test, doc and build target");
    registry.define(std::move(all));

    // Undocumented: invocable by name, hidden from the help listing.
    Task venv;
    venv.name = ".venv/bin/activate";
    venv.prerequisites = {Prerequisite::file("requirements.txt")};
    venv.action = Action{
        {
            Command::shell("python3 -m venv .venv"),
            Command::shell(". .venv/bin/activate; .venv/bin/python -m pip install --upgrade pip"),
            Command::shell(". .venv/bin/activate; .venv/bin/pip install -r requirements.txt"),
        },
        {}
    };
    registry.define(std::move(venv));

    Task clean;
    clean.name = "clean";
    clean.phony = true;
    clean.action = Action{{Command{{"rm", "-rf", build}}}, {}};
    clean.doc = _("remove all build files.");
    registry.define(std::move(clean));

    Task compile;
    compile.name = "build";
    compile.prerequisites = inputs;
    compile.output = fs::path(build) / "ordo";
    compile.action = Action{
        {
            Command{{"cmake", "-S", ".", "-B", build}},
            Command{{"cmake", "--build", build}},
        },
        {}
    };
    compile.doc = _("build the c++ code.");
    registry.define(std::move(compile));

    Task test;
    test.name = "test";
    test.phony = true;
    test.prerequisites = {Prerequisite::task("build")};
    test.action = Action{{Command{{"ctest", "--test-dir", build, "--output-on-failure"}}}, {{"ORDO_VERBOSE", "1"}}};
    test.doc = _("run all the test cases.");
    registry.define(std::move(test));

    Task doc;
    doc.name = "doc";
    doc.prerequisites = inputs;
    doc.output = fs::path(build) / "doc" / "html" / "index.html";
    doc.action = Action{
        {
            Command{{"mkdir", "-p", build + "/doc"}, true},
            Command::shell("( cat Doxyfile 2>/dev/null; echo 'OUTPUT_DIRECTORY=" + build +
                           "/doc'; echo 'INPUT=include src'; echo 'QUIET=YES' ) | doxygen -"),
        },
        {}
    };
    doc.doc = _("create the c++ documentation.");
    registry.define(std::move(doc));

    registry.set_default_target("all");
}
