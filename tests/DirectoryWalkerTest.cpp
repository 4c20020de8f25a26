// =================================================================
// tests/DirectoryWalkerTest.cpp
// =================================================================
// Unit tests for DirectoryWalker component.

#include "Distill/DirectoryWalker.hpp"
#include "Distill/Errors.hpp"
#include "Distill/IgnorePattern.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <algorithm>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

class DirectoryWalkerTest {
private:
    std::string test_dir;

    void setupTestFiles() {
        cleanupTestFiles();
        fs::create_directories(test_dir + "/a");
        fs::create_directories(test_dir + "/c/d");
        fs::create_directories(test_dir + "/build/obj");

        std::ofstream(test_dir + "/b.txt") << "notes";
        std::ofstream(test_dir + "/a/z.cpp") << "int z;";
        std::ofstream(test_dir + "/a/b.cpp") << "int b;";
        std::ofstream(test_dir + "/a/main.o") << "object";
        std::ofstream(test_dir + "/c/d/e.py") << "print('e')";
        std::ofstream(test_dir + "/build/obj/out.cpp") << "generated";
    }

    void cleanupTestFiles() {
        std::error_code ec;
        fs::permissions(test_dir + "/locked", fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(test_dir, ec);
    }

    static std::vector<std::string> relativePaths(const std::vector<Distill::CandidatePath>& candidates) {
        std::vector<std::string> paths;
        for (const auto& candidate : candidates) {
            paths.push_back(candidate.relative_path);
        }
        return paths;
    }

public:
    DirectoryWalkerTest() : test_dir((fs::temp_directory_path() / "distill_walker_test").string()) {}

    void testSortedTraversal() {
        std::cout << "Testing sorted traversal..." << std::endl;

        setupTestFiles();

        Distill::IgnoreRuleSet rules;
        Distill::DirectoryWalker walker(test_dir, rules);
        auto paths = relativePaths(walker.walk());

        std::vector<std::string> expected = {
            "a/b.cpp", "a/main.o", "a/z.cpp", "b.txt", "build/obj/out.cpp", "c/d/e.py"
        };
        assert(paths == expected && "Children are visited in sorted name order");
        assert(walker.discoveryErrors().empty());

        Distill::DirectoryWalker second(test_dir, rules);
        auto first_candidate = second.walk(1);
        assert(first_candidate.size() == 1);
        assert(first_candidate[0].size_bytes == 6);
        assert(fs::path(first_candidate[0].absolute_path).is_absolute());

        cleanupTestFiles();
        std::cout << "✓ Sorted traversal test passed" << std::endl;
    }

    void testIgnoreRulesPruneDirectories() {
        std::cout << "Testing ignore rules..." << std::endl;

        setupTestFiles();

        auto rules = Distill::IgnoreRuleSet::compile({"build/", "*.o"}, {});
        Distill::DirectoryWalker walker(test_dir, rules);
        auto paths = relativePaths(walker.walk());

        std::vector<std::string> expected = {"a/b.cpp", "a/z.cpp", "b.txt", "c/d/e.py"};
        assert(paths == expected && "Ignored directories are not entered");

        cleanupTestFiles();
        std::cout << "✓ Ignore rules test passed" << std::endl;
    }

    void testExtensionAllowList() {
        std::cout << "Testing extension allow-list..." << std::endl;

        setupTestFiles();

        Distill::IgnoreRuleSet rules;
        Distill::WalkerOptions options;
        options.include_extensions = {"cpp", ".PY"};
        Distill::DirectoryWalker walker(test_dir, rules, options);
        auto paths = relativePaths(walker.walk());

        std::vector<std::string> expected = {"a/b.cpp", "a/z.cpp", "build/obj/out.cpp", "c/d/e.py"};
        assert(paths == expected);

        cleanupTestFiles();
        std::cout << "✓ Extension allow-list test passed" << std::endl;
    }

    void testExcludedOutputPath() {
        std::cout << "Testing output file exclusion..." << std::endl;

        setupTestFiles();
        std::ofstream(test_dir + "/project.distill.md") << "# previous run";

        Distill::IgnoreRuleSet rules;
        Distill::WalkerOptions options;
        options.excluded_paths = {test_dir + "/./project.distill.md"};
        Distill::DirectoryWalker walker(test_dir, rules, options);
        auto paths = relativePaths(walker.walk());

        assert(std::find(paths.begin(), paths.end(), "project.distill.md") == paths.end() &&
               "The output document is never read back");
        assert(std::find(paths.begin(), paths.end(), "b.txt") != paths.end());

        cleanupTestFiles();
        std::cout << "✓ Output file exclusion test passed" << std::endl;
    }

    void testResetAndLimit() {
        std::cout << "Testing reset and limit..." << std::endl;

        setupTestFiles();

        Distill::IgnoreRuleSet rules;
        Distill::DirectoryWalker walker(test_dir, rules);

        auto first_two = walker.walk(2);
        assert(first_two.size() == 2);
        auto rest = walker.walk();
        assert(rest.size() == 4 && "The walk resumes where it stopped");

        walker.reset();
        auto again = walker.walk();
        assert(again.size() == 6 && "reset() restarts from the root");

        cleanupTestFiles();
        std::cout << "✓ Reset and limit test passed" << std::endl;
    }

    void testSymlinks() {
        std::cout << "Testing symlink handling..." << std::endl;

        setupTestFiles();
        std::error_code ec;
        fs::create_directory_symlink(test_dir + "/a", test_dir + "/c/link_to_a", ec);
        fs::create_directory_symlink(test_dir, test_dir + "/a/loop", ec);
        fs::create_symlink(test_dir + "/missing.txt", test_dir + "/dangling.txt", ec);
        if (ec) {
            std::cout << "Symlinks not supported here, skipping" << std::endl;
            cleanupTestFiles();
            return;
        }

        Distill::IgnoreRuleSet rules;
        Distill::DirectoryWalker plain(test_dir, rules);
        auto plain_paths = relativePaths(plain.walk());
        assert(plain_paths.size() == 6 && "Symlinked directories are not followed by default");
        assert(plain.discoveryErrors().size() == 1 && "A dangling link is a discovery error");
        assert(plain.discoveryErrors()[0].relative_path == "dangling.txt");
        assert(plain.discoveryErrors()[0].stage == Distill::PipelineStage::Discovered);

        Distill::WalkerOptions options;
        options.follow_symlinks = true;
        Distill::DirectoryWalker following(test_dir, rules, options);
        auto followed = relativePaths(following.walk());

        // a/loop points back at the root and c/link_to_a at a, both already visited
        assert(followed.size() == 6 && "Cycles and duplicate directories are visited once");

        cleanupTestFiles();
        std::cout << "✓ Symlink handling test passed" << std::endl;
    }

    void testUnreadableDirectory() {
        std::cout << "Testing unreadable directory..." << std::endl;

        if (geteuid() == 0) {
            std::cout << "Running as root, permissions are not enforced, skipping" << std::endl;
            return;
        }

        setupTestFiles();
        fs::create_directories(test_dir + "/locked");
        std::ofstream(test_dir + "/locked/secret.txt") << "hidden";
        fs::permissions(test_dir + "/locked", fs::perms::none);

        Distill::IgnoreRuleSet rules;
        Distill::DirectoryWalker walker(test_dir, rules);
        auto paths = relativePaths(walker.walk());

        assert(paths.size() == 6 && "Traversal continues past the unreadable directory");
        assert(walker.discoveryErrors().size() == 1);
        assert(walker.discoveryErrors()[0].relative_path == "locked");

        cleanupTestFiles();
        std::cout << "✓ Unreadable directory test passed" << std::endl;
    }

    void testBadRoot() {
        std::cout << "Testing bad root..." << std::endl;

        Distill::IgnoreRuleSet rules;
        bool threw = false;
        try {
            Distill::DirectoryWalker walker(test_dir + "/does/not/exist", rules);
        } catch (const Distill::SetupError&) {
            threw = true;
        }
        assert(threw && "A missing root is a setup error");

        setupTestFiles();
        threw = false;
        try {
            Distill::DirectoryWalker walker(test_dir + "/b.txt", rules);
        } catch (const Distill::SetupError&) {
            threw = true;
        }
        assert(threw && "A file is not a valid root");

        cleanupTestFiles();
        std::cout << "✓ Bad root test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running DirectoryWalker unit tests..." << std::endl;

        testSortedTraversal();
        testIgnoreRulesPruneDirectories();
        testExtensionAllowList();
        testExcludedOutputPath();
        testResetAndLimit();
        testSymlinks();
        testUnreadableDirectory();
        testBadRoot();

        std::cout << "All DirectoryWalker tests passed!" << std::endl;
    }
};

int main() {
    try {
        DirectoryWalkerTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All DirectoryWalker component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
