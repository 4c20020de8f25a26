// =================================================================
// tests/EncodingDetectorTest.cpp
// =================================================================
// Unit tests for EncodingDetector component.

#include "Distill/EncodingDetector.hpp"
#include <iostream>
#include <cassert>
#include <string>

class EncodingDetectorTest {
public:
    void testPlainUtf8() {
        std::cout << "Testing plain UTF-8 detection..." << std::endl;

        Distill::EncodingDetector detector;
        auto result = detector.detect("int main() { return 0; }\n");

        assert(result.decoded());
        assert(result.encoding == "UTF-8");
        assert(result.text == "int main() { return 0; }\n");

        auto multibyte = detector.detect("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80\n");
        assert(multibyte.encoding == "UTF-8" && "Valid multi-byte sequences stay UTF-8");

        std::cout << "✓ Plain UTF-8 test passed" << std::endl;
    }

    void testEmptyInput() {
        std::cout << "Testing empty input..." << std::endl;

        Distill::EncodingDetector detector;
        auto result = detector.detect("");

        assert(result.decoded() && "An empty file is valid text");
        assert(result.text.empty());

        std::cout << "✓ Empty input test passed" << std::endl;
    }

    void testByteOrderMarks() {
        std::cout << "Testing byte order marks..." << std::endl;

        Distill::EncodingDetector detector;

        auto utf8 = detector.detect(std::string("\xEF\xBB\xBFhello\n"));
        assert(utf8.encoding == "UTF-8-BOM");
        assert(utf8.text == "hello\n" && "The mark is not part of the text");

        std::string utf16le("\xFF\xFE" "h\0i\0\n\0", 8);
        auto le = detector.detect(utf16le);
        assert(le.decoded() && "UTF-16 with a mark is text despite the NUL bytes");
        assert(le.encoding == "UTF-16LE");
        assert(le.text == "hi\n");

        std::string utf16be("\xFE\xFF" "\0h\0i", 6);
        auto be = detector.detect(utf16be);
        assert(be.encoding == "UTF-16BE");
        assert(be.text == "hi");

        std::cout << "✓ Byte order marks test passed" << std::endl;
    }

    void testBinaryDetection() {
        std::cout << "Testing binary detection..." << std::endl;

        Distill::EncodingDetector detector;

        std::string with_nul("ELF\0\0\0binary", 12);
        auto nul = detector.detect(with_nul);
        assert(nul.is_binary && "A NUL byte marks the file as binary");
        assert(!nul.decoded());
        assert(nul.reason.find("NUL") != std::string::npos);

        std::string controls;
        for (int i = 0; i < 100; ++i) {
            controls += (i % 3 == 0) ? '\x01' : 'a';
        }
        auto noisy = detector.detect(controls);
        assert(noisy.is_binary && "Too many control characters mark the file as binary");

        auto text_with_tabs = detector.detect("a\tb\r\nc\fd\x1B[0m\n");
        assert(!text_with_tabs.is_binary && "Tabs, CR, form feeds and escapes are text");

        std::cout << "✓ Binary detection test passed" << std::endl;
    }

    void testSizeCeiling() {
        std::cout << "Testing size ceiling..." << std::endl;

        Distill::EncodingOptions options;
        options.max_file_size_bytes = 16;
        Distill::EncodingDetector detector(options);

        auto small = detector.detect("short text\n");
        assert(small.decoded());

        auto large = detector.detect(std::string(17, 'x'));
        assert(large.is_binary && "Files over the ceiling are skipped");
        assert(large.reason.find("exceeds") != std::string::npos);

        std::cout << "✓ Size ceiling test passed" << std::endl;
    }

    void testFallbackEncodings() {
        std::cout << "Testing fallback encodings..." << std::endl;

        Distill::EncodingDetector detector;

        auto latin = detector.detect("caf\xE9 cr\xE8me\n");
        assert(latin.decoded());
        assert(latin.encoding == "windows-1252");
        assert(latin.text == "caf\xC3\xA9 cr\xC3\xA8me\n");

        // 0x81 is unassigned in windows-1252, so ISO-8859-1 takes it
        auto undefined = detector.detect("a\x81z\n");
        assert(undefined.decoded());
        assert(undefined.encoding == "iso-8859-1");

        std::cout << "✓ Fallback encodings test passed" << std::endl;
    }

    void testUndecodable() {
        std::cout << "Testing undecodable input..." << std::endl;

        Distill::EncodingOptions options;
        options.fallback_encodings.clear();
        Distill::EncodingDetector detector(options);

        auto result = detector.detect("caf\xE9\n");
        assert(!result.decoded());
        assert(!result.is_binary && "Undecodable text is a failure, not a binary skip");
        assert(result.reason.find("not valid") != std::string::npos);

        std::cout << "✓ Undecodable input test passed" << std::endl;
    }

    void testUtf8Validation() {
        std::cout << "Testing strict UTF-8 validation..." << std::endl;

        assert(Distill::EncodingDetector::isValidUtf8("plain ascii"));
        assert(Distill::EncodingDetector::isValidUtf8("\xC3\xA9"));
        assert(!Distill::EncodingDetector::isValidUtf8("\xC3") && "Truncated sequence");
        assert(!Distill::EncodingDetector::isValidUtf8("\xC0\xAF") && "Overlong encoding");
        assert(!Distill::EncodingDetector::isValidUtf8("\xED\xA0\x80") && "Surrogate code point");
        assert(!Distill::EncodingDetector::isValidUtf8("\xF5\x80\x80\x80") && "Beyond U+10FFFF");
        assert(!Distill::EncodingDetector::isValidUtf8("\x80") && "Stray continuation byte");

        std::cout << "✓ UTF-8 validation test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running EncodingDetector unit tests..." << std::endl;

        testPlainUtf8();
        testEmptyInput();
        testByteOrderMarks();
        testBinaryDetection();
        testSizeCeiling();
        testFallbackEncodings();
        testUndecodable();
        testUtf8Validation();

        std::cout << "All EncodingDetector tests passed!" << std::endl;
    }
};

int main() {
    try {
        EncodingDetectorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All EncodingDetector component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
