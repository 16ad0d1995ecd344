// Reconciler tests: the change-detection state machine

#include <catch2/catch.hpp>
#include "lib/errors.hpp"
#include "lib/fingerprint.hpp"
#include "lib/reconciler.hpp"
#include "temp_dir.hpp"

#include <limits>

namespace {

struct Fixture {
    TempDir dir;
    StorePair stores{dir / "version.sha1", dir / "version.tex"};
    ObservedSet observed{{dir / "a.tex", dir / "b.tex"}};

    Fixture() {
        write_text(dir / "a.tex", "x");
        write_text(dir / "b.tex", "y");
    }

    ReconcileResult run() const { return Reconciler{stores, observed}.run(); }
    std::string hash_store() const { return read_text(dir / "version.sha1"); }
    std::string version_store() const { return read_text(dir / "version.tex"); }
};

} // namespace

// =============================================================================
// Scenario
// =============================================================================

TEST_CASE("Two-file scenario", "[reconciler]") {
    Fixture f;

    ReconcileResult first = f.run();
    REQUIRE(first.state == ReconcileState::Advanced);
    REQUIRE(first.bootstrap.created_hash_store);
    REQUIRE(first.bootstrap.created_version_store);
    REQUIRE(first.old_version == 0u);
    REQUIRE(first.new_version == 1u);
    REQUIRE(f.hash_store() == Fingerprint::of_bytes("xy").to_hex());
    REQUIRE(f.version_store() == "Version: 1");

    ReconcileResult second = f.run();
    REQUIRE(second.state == ReconcileState::Unchanged);
    REQUIRE_FALSE(second.bootstrap.created_any());
    REQUIRE_FALSE(second.new_version.has_value());
    REQUIRE(f.version_store() == "Version: 1");

    write_text(f.dir / "b.tex", "z");
    ReconcileResult third = f.run();
    REQUIRE(third.state == ReconcileState::Advanced);
    REQUIRE(f.hash_store() == Fingerprint::of_bytes("xz").to_hex());
    REQUIRE(f.version_store() == "Version: 2");
}

// =============================================================================
// Properties
// =============================================================================

TEST_CASE("Idempotent without changes", "[reconciler]") {
    Fixture f;
    f.run();
    const std::string hash = f.hash_store();
    const std::string version = f.version_store();

    f.run();
    f.run();
    REQUIRE(f.hash_store() == hash);
    REQUIRE(f.version_store() == version);
}

TEST_CASE("Exact increment regardless of change size", "[reconciler]") {
    Fixture f;
    write_text(f.dir / "version.tex", "Version: 41");
    f.run();
    REQUIRE(f.version_store() == "Version: 42");

    write_text(f.dir / "a.tex", std::string(4096, 'q'));
    write_text(f.dir / "b.tex", "entirely different");
    f.run();
    REQUIRE(f.version_store() == "Version: 43");
}

TEST_CASE("Version never decreases", "[reconciler]") {
    Fixture f;
    std::uint64_t last = 0;
    const char* contents[] = {"1", "2", "2", "3", "1", "1", "4"};
    for (const char* c : contents) {
        write_text(f.dir / "a.tex", c);
        ReconcileResult r = f.run();
        const std::uint64_t now = f.stores.read_version();
        REQUIRE(now >= last);
        if (r.state == ReconcileState::Advanced) REQUIRE(now == last + 1);
        else REQUIRE(now == last);
        last = now;
    }
}

TEST_CASE("Existing version store is honoured on first run", "[reconciler]") {
    Fixture f;
    write_text(f.dir / "version.tex", "% generated, do not edit\nVersion: 7\n");
    ReconcileResult r = f.run();
    REQUIRE(r.bootstrap.created_hash_store);
    REQUIRE_FALSE(r.bootstrap.created_version_store);
    REQUIRE(f.version_store() == "Version: 8");
}

TEST_CASE("Malformed stored fingerprint counts as a change", "[reconciler]") {
    Fixture f;
    write_text(f.dir / "version.sha1", "not-a-hash\n");
    write_text(f.dir / "version.tex", "Version: 2");
    REQUIRE(f.run().state == ReconcileState::Advanced);
    REQUIRE(f.version_store() == "Version: 3");
}

// =============================================================================
// Fatal paths leave the stores untouched
// =============================================================================

TEST_CASE("Corrupted version store aborts without writes", "[reconciler]") {
    Fixture f;
    f.run();
    const std::string hash = f.hash_store();
    write_text(f.dir / "version.tex", "Revision three\n");
    write_text(f.dir / "a.tex", "changed");

    REQUIRE_THROWS_AS(f.run(), ParseError);
    REQUIRE(f.version_store() == "Revision three\n");
    REQUIRE(f.hash_store() == hash);
}

TEST_CASE("Corrupted version store is ignored when nothing changed", "[reconciler]") {
    Fixture f;
    f.run();
    write_text(f.dir / "version.tex", "Revision three\n");
    REQUIRE(f.run().state == ReconcileState::Unchanged);
    REQUIRE(f.version_store() == "Revision three\n");
}

TEST_CASE("Version overflow aborts without writes", "[reconciler]") {
    Fixture f;
    const std::string max = "Version: " + std::to_string(std::numeric_limits<std::uint64_t>::max());
    write_text(f.dir / "version.sha1", "");
    write_text(f.dir / "version.tex", max);

    REQUIRE_THROWS_AS(f.run(), ArithmeticError);
    REQUIRE(f.version_store() == max);
    REQUIRE(f.hash_store().empty());
}

TEST_CASE("Unreadable observed file aborts without writes", "[reconciler]") {
    Fixture f;
    f.run();
    fs::remove(f.dir / "b.tex");

    REQUIRE_THROWS_AS(f.run(), IOError);
    REQUIRE(f.version_store() == "Version: 1");
    REQUIRE(f.hash_store() == Fingerprint::of_bytes("xy").to_hex());
}

TEST_CASE("Reconciler owns its store pair", "[reconciler]") {
    Fixture f;
    Reconciler reconciler{StorePair{f.dir / "version.sha1", f.dir / "version.tex"},
                          f.observed};
    REQUIRE(reconciler.run().state == ReconcileState::Advanced);
    REQUIRE(reconciler.run().state == ReconcileState::Unchanged);
    REQUIRE(f.version_store() == "Version: 1");
}

// =============================================================================
// inspect()
// =============================================================================

TEST_CASE("inspect reports without writing", "[reconciler]") {
    Fixture f;
    Reconciler reconciler{f.stores, f.observed};

    SECTION("before any run") {
        StatusReport s = reconciler.inspect();
        REQUIRE_FALSE(s.stored_fingerprint.has_value());
        REQUIRE_FALSE(s.stored_version.has_value());
        REQUIRE(s.current_fingerprint == Fingerprint::of_bytes("xy").to_hex());
        REQUIRE(s.would_advance);
        REQUIRE_FALSE(fs::exists(f.dir / "version.sha1"));
        REQUIRE_FALSE(fs::exists(f.dir / "version.tex"));
    }

    SECTION("after a run") {
        reconciler.run();
        StatusReport s = reconciler.inspect();
        REQUIRE(s.stored_fingerprint == s.current_fingerprint);
        REQUIRE(s.stored_version == 1u);
        REQUIRE_FALSE(s.would_advance);

        write_text(f.dir / "a.tex", "changed");
        REQUIRE(reconciler.inspect().would_advance);
        REQUIRE(f.version_store() == "Version: 1");
    }
}

TEST_CASE("State names", "[reconciler]") {
    REQUIRE(std::string(to_string(ReconcileState::Bootstrapped)) == "bootstrapped");
    REQUIRE(std::string(to_string(ReconcileState::Unchanged)) == "unchanged");
    REQUIRE(std::string(to_string(ReconcileState::Advanced)) == "advanced");
}
