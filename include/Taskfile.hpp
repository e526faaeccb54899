#pragma once
#include "TaskRegistry.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace ordo {
    // The project's own task graph: build, test, doc, clean and the tool environment.
    class Taskfile {
    public:
        static constexpr const char *build_dir = "build";

        // Declare every built-in task into the registry; "all" is the default target.
        static void declare(TaskRegistry &registry, const std::filesystem::path &root);

        // C++ sources and headers under src/, include/ and tests/, relative to root and sorted.
        static std::vector<std::string> sources(const std::filesystem::path &root);
    };
} // namespace ordo
