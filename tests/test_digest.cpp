#include "test_common.h"
#include "scriptgate/digest.h"

#include <filesystem>
#include <fstream>

int main() {
    namespace fs = std::filesystem;
    using namespace scriptgate;

    // Test 1: known vectors
    {
        expect_eq_str(digest::of("print(1)"),
                      "d287bb7f9d15abdc5b6e98536263815744b6ef21c8f3c839fc434ca70d8efe99",
                      "digest of print(1)");
        expect_eq_str(digest::of(""),
                      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
                      "digest of empty content");
        expect_eq_str(digest::sha256_hex("ABCD"),
                      "e12e115acf4552b2568b55e93cbd39394c4ef81c82447fafc997882a02d23677",
                      "digest of ABCD");
    }

    // Test 2: byte exact, no normalization of the content
    {
        expect_true(digest::of("print(1)") != digest::of("print(1)\n"), "trailing newline changes digest");
        expect_true(digest::of("print(1)") != digest::of(" print(1)"), "leading space changes digest");
        expect_eq_ll((long long)digest::of("x").size(), 64, "digest is 64 hex chars");
    }

    // Test 3: streaming update matches one-shot, across block boundaries
    {
        std::string big(1000, 'a');
        digest::Sha256 h;
        h.update(big.substr(0, 63));
        h.update(big.substr(63, 2));
        h.update(big.substr(65));
        auto raw = h.finish();
        expect_eq_str(digest::to_hex(raw.data(), raw.size()), digest::sha256_hex(big),
                      "chunked update should match one-shot");
    }

    // Test 4: file hashing
    {
        fs::path dir = make_scratch_dir("digest");
        fs::path p = dir / "script.js";
        {
            std::ofstream f(p, std::ios::binary);
            f << "print(1)";
        }
        expect_eq_str(digest::sha256_hex_file(p), digest::of("print(1)"), "file digest matches content digest");
        expect_true(digest::sha256_hex_file(dir / "missing.js").empty(), "missing file gives empty digest");
        fs::remove_all(dir);
    }

    // Test 5: normalization and shape check
    {
        expect_eq_str(digest::normalize("  ABCD \r"), "abcd", "normalize trims and lowercases");
        expect_true(digest::is_sha256_hex(digest::of("a")), "real digest is sha256 hex");
        expect_true(!digest::is_sha256_hex("abcd"), "short string is not sha256 hex");
        expect_true(!digest::is_sha256_hex(std::string(64, 'g')), "non-hex is not sha256 hex");
    }

    std::cerr << "test_digest: ALL PASSED" << std::endl;
    return 0;
}
