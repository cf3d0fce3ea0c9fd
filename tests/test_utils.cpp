#include <sandcell/core/utils.hpp>

#include <cassert>
#include <cstdlib>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

static void testStringHelpers() {
    assert(sandcell::trim("  a b \n") == "a b");
    assert(sandcell::to_lower("NumPy") == "numpy");
    assert(sandcell::starts_with("numpy.linalg", "numpy."));
    assert(!sandcell::starts_with("np", "numpy"));
    assert(sandcell::ends_with("figure.png", ".png"));

    std::vector<std::string> parts = sandcell::split("a\n\nb", '\n');
    assert(parts.size() == 3);
    assert(parts[1].empty());

    assert(sandcell::clamp(5, 1, 3) == 3);
    assert(sandcell::clamp(-1, 0, 3) == 0);
}

static void testUtf8Handling() {
    assert(sandcell::sanitize_utf8("ok \xC3\xA9") == "ok \xC3\xA9");
    assert(sandcell::sanitize_utf8("bad \xFF!") == "bad \xEF\xBF\xBD!");
    // Lone continuation byte and truncated sequence
    assert(sandcell::sanitize_utf8("\x80") == "\xEF\xBF\xBD");
    assert(sandcell::sanitize_utf8("x\xE2\x82") == "x\xEF\xBF\xBD\xEF\xBF\xBD");
}

static void testBase64() {
    assert(sandcell::base64_encode(std::string("")) == "");
    assert(sandcell::base64_encode(std::string("f")) == "Zg==");
    assert(sandcell::base64_encode(std::string("foobar")) == "Zm9vYmFy");

    std::string out;
    assert(sandcell::base64_decode("Zm9vYg==", out));
    assert(out == "foob");

    std::string binary("\x89PNG\r\n\x1a\n\0\x01", 10);
    assert(sandcell::base64_decode(sandcell::base64_encode(binary), out));
    assert(out == binary);

    assert(!sandcell::base64_decode("abc", out));
}

static void testUuid() {
    std::string a = sandcell::generate_uuid();
    std::string b = sandcell::generate_uuid();
    assert(a.size() == 36);
    assert(a[8] == '-' && a[13] == '-' && a[18] == '-' && a[23] == '-');
    assert(a[14] == '4');
    assert(a != b);
}

static void testPathsAndRemoval() {
    assert(sandcell::join_path("/tmp", "x") == "/tmp/x");
    assert(sandcell::join_path("/tmp/", "/x") == "/tmp/x");
    assert(sandcell::join_path("", "x") == "x");

    char tmpl[] = "/tmp/sandcell-test-XXXXXX";
    assert(mkdtemp(tmpl) != NULL);
    std::string root(tmpl);
    assert(mkdir((root + "/sub").c_str(), 0700) == 0);
    {
        std::ofstream f((root + "/sub/file.txt").c_str());
        f << "data";
    }
    assert(sandcell::remove_directory_tree(root));
    struct stat st;
    assert(stat(root.c_str(), &st) != 0);

    // Missing path counts as removed; the root is refused
    assert(sandcell::remove_directory_tree(root));
    assert(!sandcell::remove_directory_tree("/"));
}

static void testMonotonicClock() {
    int64_t a = sandcell::monotonic_ms();
    sandcell::sleep_ms(5);
    int64_t b = sandcell::monotonic_ms();
    assert(b >= a + 4);
}

int main() {
    testStringHelpers();
    testUtf8Handling();
    testBase64();
    testUuid();
    testPathsAndRemoval();
    testMonotonicClock();
    return 0;
}
