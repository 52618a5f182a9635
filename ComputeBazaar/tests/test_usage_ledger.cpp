#include "market/usage_ledger.h"
#include <cassert>
#include <cmath>
#include <limits>
#include <string>

using bazaar::ErrorCode;
using bazaar::market::UsageLedger;

static bool near(double a, double b) { return std::fabs(a - b) < 1e-12; }

static void testNeutralDefault() {
    UsageLedger ledger;
    assert(near(ledger.getFactor("nobody"), 1.0));
    assert(!ledger.hasFactor("nobody"));
    assert(ledger.size() == 0);
}

static void testReplaceWithLatest() {
    UsageLedger ledger;
    auto r = ledger.recordUsage("alice", 5.0, 1.0);
    assert(r.ok());
    assert(near(r.value(), 5.0));
    assert(near(ledger.getFactor("alice"), 5.0));

    r = ledger.recordUsage("alice", 1.0, 4.0);
    assert(r.ok());
    assert(near(ledger.getFactor("alice"), 0.25));
    assert(ledger.size() == 1);
}

static void testDegenerateInputLeavesFactor() {
    UsageLedger ledger;
    assert(ledger.recordUsage("alice", 2.0, 1.0).ok());

    auto zeroRef = ledger.recordUsage("alice", 3.0, 0.0);
    assert(zeroRef.failed());
    assert(zeroRef.error().code == ErrorCode::INVALID_USAGE);

    assert(ledger.recordUsage("alice", -1.0, 1.0).failed());
    assert(ledger.recordUsage("alice", 0.0, 1.0).failed());
    assert(ledger.recordUsage("alice", std::numeric_limits<double>::quiet_NaN(), 1.0).failed());
    assert(ledger.recordUsage("alice", 1.0, std::numeric_limits<double>::infinity()).failed());
    assert(ledger.recordUsage("", 1.0, 1.0).failed());

    assert(near(ledger.getFactor("alice"), 2.0));
}

static void testSubtaskReportedOnce() {
    UsageLedger ledger;
    auto first = ledger.recordSubtaskUsage("task", "sub-1", "bob", 8.0, 1.0);
    assert(first.ok());
    assert(ledger.isReported("task", "sub-1"));

    auto dup = ledger.recordSubtaskUsage("task", "sub-1", "bob", 2.0, 1.0);
    assert(dup.failed());
    assert(dup.error().code == ErrorCode::DUPLICATE_REPORT);
    assert(near(ledger.getFactor("bob"), 8.0));

    // Same subtask id under another task is a different report.
    assert(ledger.recordSubtaskUsage("other", "sub-1", "bob", 2.0, 1.0).ok());
    assert(near(ledger.getFactor("bob"), 2.0));
}

static void testRejectedReportCanBeRetried() {
    UsageLedger ledger;
    assert(ledger.recordSubtaskUsage("task", "sub", "carol", 0.0, 1.0).failed());
    assert(!ledger.isReported("task", "sub"));
    assert(ledger.recordSubtaskUsage("task", "sub", "carol", 3.0, 1.0).ok());
    assert(near(ledger.getFactor("carol"), 3.0));
    assert(ledger.recordSubtaskUsage("task", "", "carol", 3.0, 1.0).failed());
}

static void testForgetTaskReleasesReports() {
    UsageLedger ledger;
    assert(ledger.recordSubtaskUsage("task", "s1", "bob", 4.0, 1.0).ok());
    assert(ledger.recordSubtaskUsage("task", "s2", "bob", 6.0, 1.0).ok());
    assert(ledger.recordSubtaskUsage("task-2", "s1", "bob", 3.0, 1.0).ok());

    assert(ledger.forgetTask("task") == 2);
    assert(!ledger.isReported("task", "s1"));
    assert(!ledger.isReported("task", "s2"));
    assert(ledger.isReported("task-2", "s1"));
    // Factors survive; only the once-per-subtask bookkeeping goes.
    assert(near(ledger.getFactor("bob"), 3.0));

    assert(ledger.forgetTask("task") == 0);
    assert(ledger.forgetTask("missing") == 0);

    assert(ledger.recordSubtaskUsage("task", "s1", "bob", 5.0, 1.0).ok());
    assert(near(ledger.getFactor("bob"), 5.0));
}

static void testForgottenTasksDoNotAccumulate() {
    UsageLedger ledger;
    for (int i = 0; i < 5000; i++) {
        std::string task = "task-" + std::to_string(i);
        assert(ledger.recordSubtaskUsage(task, "s", "p", 2.0, 1.0).ok());
        assert(ledger.forgetTask(task) == 1);
        assert(!ledger.isReported(task, "s"));
    }
    assert(ledger.size() == 1);
}

static void testDirtyTrackingAndLoad() {
    UsageLedger ledger;
    ledger.load({{"a", 2.0}, {"b", -1.0}, {"", 3.0}});
    assert(ledger.size() == 1);
    assert(ledger.takeDirty().empty());

    assert(ledger.recordUsage("a", 4.0, 1.0).ok());
    assert(ledger.recordUsage("c", 0.5, 1.0).ok());
    auto dirty = ledger.takeDirty();
    assert(dirty.size() == 2);
    assert(near(dirty["a"], 4.0));
    assert(ledger.takeDirty().empty());

    // A newer pending value wins over a requeued one.
    assert(ledger.recordUsage("a", 6.0, 1.0).ok());
    ledger.requeueDirty(dirty);
    auto again = ledger.takeDirty();
    assert(again.size() == 2);
    assert(near(again["a"], 6.0));
    assert(near(again["c"], 0.5));

    auto snap = ledger.snapshot();
    assert(snap.size() == 2);
}

static void testResetIdempotent() {
    UsageLedger ledger;
    assert(ledger.recordSubtaskUsage("t", "s", "p", 2.0, 1.0).ok());
    ledger.reset();
    ledger.reset();
    assert(ledger.size() == 0);
    assert(!ledger.isReported("t", "s"));
    assert(near(ledger.getFactor("p"), 1.0));
}

int main() {
    testNeutralDefault();
    testReplaceWithLatest();
    testDegenerateInputLeavesFactor();
    testSubtaskReportedOnce();
    testRejectedReportCanBeRetried();
    testForgetTaskReleasesReports();
    testForgottenTasksDoNotAccumulate();
    testDirtyTrackingAndLoad();
    testResetIdempotent();
    return 0;
}
