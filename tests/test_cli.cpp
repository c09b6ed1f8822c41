#include "test_common.h"
#include "cmd_check.h"
#include "cmd_trust.h"

#include "scriptgate/config.h"
#include "scriptgate/digest.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace scriptgate;

namespace {

int run(const std::function<int(int, char**)>& cmd, std::vector<std::string> args) {
    args.insert(args.begin(), "scriptgate_cli");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);
    return cmd((int)args.size(), argv.data());
}

void write_file(const fs::path& p, const std::string& body) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << body;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

int main() {
    fs::path dir = make_scratch_dir("cli");
    fs::path vault = dir / "vault";
    const std::string cfg_path = (dir / "gate.json").string();

    const std::string trusted = "console.log('hello')\n";
    const std::string untrusted = "fetch('https://example.invalid')\n";
    write_file(vault / "Trust" / "Hashes.md", "# trusted\n" + digest::of(trusted) + "\n");
    write_file(dir / "trusted.js", trusted);
    write_file(dir / "untrusted.js", untrusted);

    GateConfig cfg;
    cfg.trusted_hash_notes.push_back("Trust/Hashes");
    std::string err;
    expect_true(save_config(cfg, cfg_path, &err), "seed config: " + err);

    // Test 1: check exit codes
    {
        expect_eq_ll(run(cmd_check, {"check", cfg_path, vault.string(), "dataviewjs", (dir / "trusted.js").string()}),
                     0, "trusted script allowed");
        expect_eq_ll(run(cmd_check, {"check", cfg_path, vault.string(), "dataviewjs", (dir / "untrusted.js").string()}),
                     3, "untrusted script denied");
        expect_eq_ll(run(cmd_check, {"check", cfg_path, vault.string()}), 2, "missing arguments");
        expect_eq_ll(run(cmd_check, {"check", cfg_path, vault.string(), "dataviewjs", (dir / "nope.js").string()}),
                     1, "unreadable script is a runtime failure");
    }

    // Test 2: trust list reports an unavailable source with exit 4
    {
        expect_eq_ll(run(cmd_trust, {"trust", "list", cfg_path, vault.string()}), 0, "all sources readable");

        expect_eq_ll(run(cmd_notes, {"notes", "add", cfg_path, "Trust/Missing.md"}), 0, "note added");
        GateConfig c = load_config(cfg_path);
        expect_true(contains(c.trusted_hash_notes, "Trust/Missing"), "note stored without .md");
        expect_eq_ll(run(cmd_trust, {"trust", "list", cfg_path, vault.string()}), 4, "missing note source");
        expect_eq_ll(run(cmd_check, {"check", cfg_path, vault.string(), "dataviewjs", (dir / "trusted.js").string()}),
                     0, "readable sources still trust");

        expect_eq_ll(run(cmd_notes, {"notes", "remove", cfg_path, "Trust/Missing"}), 0, "note removed");
        expect_eq_ll(run(cmd_trust, {"trust", "list", cfg_path, vault.string()}), 0, "sources readable again");
        expect_eq_ll(run(cmd_trust, {"trust", "list", cfg_path}), 2, "trust list usage");
    }

    // Test 3: trust add and remove edit the config; a manual digest allows the script
    {
        const std::string d = digest::of(untrusted);
        expect_eq_ll(run(cmd_trust, {"trust", "add", cfg_path, d}), 0, "add digest");
        expect_true(contains(load_config(cfg_path).trusted_hashes, d), "digest saved");
        expect_eq_ll(run(cmd_check, {"check", cfg_path, vault.string(), "dataviewjs", (dir / "untrusted.js").string()}),
                     0, "manually trusted script allowed");

        expect_eq_ll(run(cmd_trust, {"trust", "add", cfg_path, d}), 0, "duplicate add is a no-op");
        expect_eq_ll((long long)load_config(cfg_path).trusted_hashes.size(), 1, "no duplicate stored");

        expect_eq_ll(run(cmd_trust, {"trust", "remove", cfg_path, d}), 0, "remove digest");
        expect_true(!contains(load_config(cfg_path).trusted_hashes, d), "digest removed");
        expect_eq_ll(run(cmd_check, {"check", cfg_path, vault.string(), "dataviewjs", (dir / "untrusted.js").string()}),
                     3, "denied again after removal");
        expect_eq_ll(run(cmd_trust, {"trust", "drop", cfg_path, d}), 2, "unknown trust operation");
    }

    // Test 4: flags and the hash command
    {
        expect_eq_ll(run(cmd_flags, {"flags", cfg_path, "dataviewjs", "on"}), 0, "bypass on");
        expect_eq_ll(run(cmd_check, {"check", cfg_path, vault.string(), "dataviewjs", (dir / "untrusted.js").string()}),
                     0, "bypassed integration allows");
        expect_eq_ll(run(cmd_check, {"check", cfg_path, vault.string(), "meta-bind", (dir / "untrusted.js").string()}),
                     3, "other integration still gated");
        expect_eq_ll(run(cmd_flags, {"flags", cfg_path, "dataviewjs", "maybe"}), 2, "bad on/off word");
        expect_eq_ll(run(cmd_flags, {"flags", cfg_path, "dataviewjs", "off"}), 0, "bypass off");

        expect_eq_ll(run(cmd_hash, {"hash", (dir / "trusted.js").string()}), 0, "hash a file");
        expect_eq_ll(run(cmd_hash, {"hash", (dir / "nope.js").string()}), 1, "hash of a missing file");
        expect_eq_ll(run(cmd_hash, {"hash"}), 2, "hash usage");
    }

    // Test 5: a malformed config is a runtime failure
    {
        const std::string bad = (dir / "bad.json").string();
        write_file(bad, "{ not json");
        expect_eq_ll(run(cmd_check, {"check", bad, vault.string(), "dataviewjs", (dir / "trusted.js").string()}),
                     1, "malformed config");
        expect_eq_ll(run(cmd_trust, {"trust", "list", bad, vault.string()}), 1, "malformed config on list");
    }

    fs::remove_all(dir);
    std::cerr << "test_cli: ALL PASSED" << std::endl;
    return 0;
}
