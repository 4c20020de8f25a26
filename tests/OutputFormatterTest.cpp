// =================================================================
// tests/OutputFormatterTest.cpp
// =================================================================
// Unit tests for the Markdown, JSON and YAML renderers.

#include "Distill/Errors.hpp"
#include "Distill/OutputFormatter.hpp"
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cassert>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

Distill::FileRecord makeRecord(const std::string& path, const std::string& language, const std::string& content) {
    Distill::FileRecord record;
    record.relative_path = path;
    record.name = fs::path(path).filename().string();
    record.absolute_path = "/work/demo/" + path;
    record.language = language;
    record.encoding = "UTF-8";
    record.original_size = content.size();
    record.token_count = content.size() / 4;
    record.content = content;
    return record;
}

Distill::RunResult makeResult() {
    Distill::RunResult result;

    result.records.push_back(makeRecord("README.md", "Markdown", "# Demo\n\nRun it:\n\n```bash\nmake\n```\n"));
    result.records.push_back(makeRecord("src/main.cpp", "C++", "int main() {\n    return 0;\n}\n"));
    result.records.back().truncated = true;
    result.records.push_back(makeRecord("src/util.py", "Python", "def f():\n    return 1\n"));
    result.records.back().overflow = true;

    result.skipped.push_back({"assets/logo.png", Distill::PipelineStage::Decoded, "binary: contains NUL bytes"});
    result.failures.push_back({"locked.txt", Distill::PipelineStage::Read, "cannot open file: Permission denied"});
    result.omitted.push_back({"zz_big.txt", Distill::PipelineStage::Done, "9000 tokens would exceed the context ceiling"});

    Distill::RunSummary& summary = result.summary;
    summary.root = "/work/demo";
    summary.model = "gpt-4o";
    summary.context_ceiling = 128000;
    summary.processed = 4;
    summary.skipped_binary = 1;
    summary.failed = 1;
    summary.discovered = 6;
    summary.truncated = 1;
    summary.overflowed = 2;
    summary.omitted = 1;
    summary.total_tokens = 1234;
    summary.total_bytes = 2048;
    summary.languages = {{"C++", 1}, {"Markdown", 1}, {"Python", 1}, {"Text", 1}};
    summary.encodings = {{"UTF-8", 4}};
    return result;
}

} // namespace

class OutputFormatterTest {
private:
    std::string test_dir;

public:
    OutputFormatterTest() : test_dir((fs::temp_directory_path() / "distill_formatter_test").string()) {}

    void testFenceSelection() {
        std::cout << "Testing code fence selection..." << std::endl;

        assert(Distill::MarkdownFormatter::fenceFor("plain") == "```");
        assert(Distill::MarkdownFormatter::fenceFor("a `b` c") == "```");
        assert(Distill::MarkdownFormatter::fenceFor("```cpp\n```") == "````");
        assert(Distill::MarkdownFormatter::fenceFor("`````") == "``````");

        std::cout << "✓ Fence selection test passed" << std::endl;
    }

    void testMarkdownLayout() {
        std::cout << "Testing Markdown layout..." << std::endl;

        auto result = makeResult();
        Distill::MarkdownFormatter formatter;
        std::string document = formatter.render(result, Distill::RenderOptions());

        assert(document.rfind("# Project: demo\n", 0) == 0);
        assert(document.find("- **Model**: gpt-4o\n") != std::string::npos);
        assert(document.find("- **Files**: 4 processed of 6 discovered\n") != std::string::npos);
        assert(document.find("- **Total size**: 2.0 KB\n") != std::string::npos);
        assert(document.find("Generated at") == std::string::npos && "No timestamp unless requested");

        assert(document.find("### README.md\n") < document.find("### src/main.cpp\n"));
        assert(document.find("### src/main.cpp\n") < document.find("### src/util.py\n"));

        assert(document.find("````markdown\n# Demo") != std::string::npos &&
               "Content with a fence gets a longer fence");
        assert(document.find("```cpp\nint main()") != std::string::npos);
        assert(document.find("- **Truncated**: yes\n") != std::string::npos);
        assert(document.find("- **Over ceiling**: yes\n") != std::string::npos);

        assert(document.find("## Skipped files\n\n- `assets/logo.png`: binary") != std::string::npos);
        assert(document.find("## Failed files\n\n- `locked.txt` (Read): cannot open") != std::string::npos);
        assert(document.find("## Omitted files\n\n- `zz_big.txt`: 9000 tokens") != std::string::npos);

        std::cout << "✓ Markdown layout test passed" << std::endl;
    }

    void testMarkdownOptions() {
        std::cout << "Testing Markdown options..." << std::endl;

        auto result = makeResult();
        result.summary.cancelled = true;

        Distill::RenderOptions options;
        options.include_metadata = false;
        options.generated_at = "2024-05-01T12:00:00Z";

        std::string document = Distill::MarkdownFormatter().render(result, options);
        assert(document.find("- **Language**") == std::string::npos);
        assert(document.find("- **Tokens**") == std::string::npos);
        assert(document.find("- **Generated at**: 2024-05-01T12:00:00Z\n") != std::string::npos);
        assert(document.find("- **Cancelled**: yes") != std::string::npos);

        Distill::RunResult empty;
        empty.summary.root = "/tmp/empty";
        std::string empty_document = Distill::MarkdownFormatter().render(empty, Distill::RenderOptions());
        assert(empty_document.find("## Files\n") != std::string::npos);
        assert(empty_document.find("## Failed files") == std::string::npos && "Empty lists are left out");

        std::cout << "✓ Markdown options test passed" << std::endl;
    }

    void testJsonDocument() {
        std::cout << "Testing JSON document..." << std::endl;

        auto result = makeResult();
        std::string text = Distill::JsonFormatter().render(result, Distill::RenderOptions());
        nlohmann::json document = nlohmann::json::parse(text);

        assert(document["summary"]["project"] == "demo");
        assert(document["summary"]["processed"] == 4);
        assert(document["summary"]["discovered"] == 6);
        assert(document["summary"]["languages"]["Python"] == 1);
        assert(document["summary"]["cancelled"] == false);

        assert(document["files"].size() == 3);
        assert(document["files"][0]["path"] == "README.md");
        assert(document["files"][0]["content"] == result.records[0].content);
        assert(document["files"][1]["truncated"] == true);
        assert(document["files"][2]["overflow"] == true);

        assert(document["skipped"][0]["path"] == "assets/logo.png");
        assert(document["failed"][0]["stage"] == "Read");
        assert(document["omitted"][0]["path"] == "zz_big.txt");
        assert(!document.contains("generated_at"));

        Distill::RenderOptions options;
        options.include_metadata = false;
        options.generated_at = "2024-05-01T12:00:00Z";
        nlohmann::json bare = nlohmann::json::parse(Distill::JsonFormatter().render(result, options));
        assert(!bare["files"][0].contains("language"));
        assert(bare["files"][0].contains("content"));
        assert(bare["generated_at"] == "2024-05-01T12:00:00Z");

        std::cout << "✓ JSON document test passed" << std::endl;
    }

    void testJsonInvalidUtf8Path() {
        std::cout << "Testing JSON with a non UTF-8 path..." << std::endl;

        Distill::RunResult result;
        result.summary.root = "/work/demo";
        result.records.push_back(makeRecord("caf\xE9.txt", "Text", "hello\n"));

        std::string text = Distill::JsonFormatter().render(result, Distill::RenderOptions());
        nlohmann::json document = nlohmann::json::parse(text);
        assert(document["files"][0]["content"] == "hello\n" && "Invalid bytes are replaced, not fatal");

        std::cout << "✓ JSON non UTF-8 path test passed" << std::endl;
    }

    void testYamlDocument() {
        std::cout << "Testing YAML document..." << std::endl;

        auto result = makeResult();
        result.records.push_back(makeRecord("src/indented.py", "Python", "    leading indent\nsecond\n"));
        result.records.push_back(makeRecord("src/empty.py", "Python", ""));
        result.records.push_back(makeRecord("src/cut.py", "Python", "x = 1\n\n"));
        result.records.push_back(makeRecord("src/open.py", "Python", "x = 1"));

        std::string text = Distill::YamlFormatter().render(result, Distill::RenderOptions());
        YAML::Node document = YAML::Load(text);

        assert(document["summary"]["project"].as<std::string>() == "demo");
        assert(document["summary"]["total_tokens"].as<size_t>() == 1234);
        assert(document["summary"]["encodings"]["UTF-8"].as<size_t>() == 4);

        const YAML::Node files = document["files"];
        assert(files.size() == 7);
        for (size_t i = 0; i < files.size(); ++i) {
            assert(files[i]["path"].as<std::string>() == result.records[i].relative_path);
            assert(files[i]["content"].as<std::string>() == result.records[i].content &&
                   "Content survives the round trip");
        }
        assert(files[1]["truncated"].as<bool>());

        assert(document["failed"][0]["stage"].as<std::string>() == "Read");
        assert(document["skipped"][0]["reason"].as<std::string>().find("binary") == 0);
        assert(!document["generated_at"]);

        std::cout << "✓ YAML document test passed" << std::endl;
    }

    void testFormatterFactory() {
        std::cout << "Testing formatter factory..." << std::endl;

        assert(Distill::createFormatter(Distill::OutputFormat::Markdown)->extension() == "md");
        assert(Distill::createFormatter(Distill::OutputFormat::Json)->extension() == "json");
        assert(Distill::createFormatter(Distill::OutputFormat::Yaml)->extension() == "yaml");

        std::string timestamp = Distill::currentTimestamp();
        assert(timestamp.size() == 20);
        assert(timestamp[10] == 'T' && timestamp.back() == 'Z');

        std::cout << "✓ Formatter factory test passed" << std::endl;
    }

    void testAtomicWrite() {
        std::cout << "Testing atomic document write..." << std::endl;

        std::error_code ec;
        fs::remove_all(test_dir, ec);
        fs::create_directories(test_dir);
        std::string path = test_dir + "/demo.distill.md";

        Distill::writeDocumentAtomically(path, "first\n");
        Distill::writeDocumentAtomically(path, "second\n");

        std::ifstream file(path, std::ios::binary);
        std::stringstream buffer;
        buffer << file.rdbuf();
        assert(buffer.str() == "second\n" && "An existing document is replaced");

        size_t entries = 0;
        for (const auto& entry : fs::directory_iterator(test_dir)) {
            (void)entry;
            ++entries;
        }
        assert(entries == 1 && "No temporary file is left behind");

        bool threw = false;
        try {
            Distill::writeDocumentAtomically(test_dir + "/missing/dir/out.md", "x");
        } catch (const Distill::SetupError&) {
            threw = true;
        }
        assert(threw);

        fs::remove_all(test_dir, ec);
        std::cout << "✓ Atomic write test passed" << std::endl;
    }

    void testOutputWritableCheck() {
        std::cout << "Testing output writability check..." << std::endl;

        std::error_code ec;
        fs::remove_all(test_dir, ec);
        fs::create_directories(test_dir + "/taken.md");

        Distill::checkOutputWritable(test_dir + "/demo.distill.md");
        assert(fs::is_empty(test_dir + "/taken.md") && !fs::exists(test_dir + "/demo.distill.md"));
        size_t entries = 0;
        for (const auto& entry : fs::directory_iterator(test_dir)) {
            (void)entry;
            ++entries;
        }
        assert(entries == 1 && "The trial file is removed again");

        auto throwsSetupError = [](const std::string& path) {
            try {
                Distill::checkOutputWritable(path);
            } catch (const Distill::SetupError&) {
                return true;
            }
            return false;
        };
        assert(throwsSetupError(test_dir + "/missing/out.md"));
        assert(throwsSetupError(test_dir + "/taken.md") && "A directory cannot be replaced by the document");

        // Permission bits do not stop root
        if (::geteuid() != 0) {
            fs::create_directories(test_dir + "/readonly");
            fs::permissions(test_dir + "/readonly", fs::perms::owner_read | fs::perms::owner_exec);
            assert(throwsSetupError(test_dir + "/readonly/out.md"));
            fs::permissions(test_dir + "/readonly", fs::perms::owner_all);
        }

        fs::remove_all(test_dir, ec);
        std::cout << "✓ Output writability check test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running OutputFormatter unit tests..." << std::endl;

        testFenceSelection();
        testMarkdownLayout();
        testMarkdownOptions();
        testJsonDocument();
        testJsonInvalidUtf8Path();
        testYamlDocument();
        testFormatterFactory();
        testAtomicWrite();
        testOutputWritableCheck();

        std::cout << "All OutputFormatter tests passed!" << std::endl;
    }
};

int main() {
    try {
        OutputFormatterTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All OutputFormatter component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
