#include "unit/test_support.hpp"

#include "turn/turn_buffer.hpp"

using Clock = TurnBuffer::Clock;
using std::chrono::milliseconds;
using std::chrono::seconds;

static void test_append_and_peek() {
    TurnBuffer b;
    EXPECT_TRUE(!b.isActive());
    EXPECT_EQ(b.peek(), std::string());

    const auto t0 = Clock::now();
    EXPECT_TRUE(b.append("I can't seem to, um...", t0));
    EXPECT_TRUE(b.append("find my keys", t0 + milliseconds(400)));

    EXPECT_TRUE(b.isActive());
    EXPECT_EQ(b.fragmentCount(), (size_t)2);
    EXPECT_EQ(b.peek(), std::string("I can't seem to, um... find my keys"));
    EXPECT_TRUE(b.lastUpdate() == t0 + milliseconds(400));
}

static void test_blank_append_keeps_timestamp() {
    TurnBuffer b;
    const auto t0 = Clock::now();
    b.append("I need...", t0);

    EXPECT_TRUE(!b.append("", t0 + seconds(1)));
    EXPECT_TRUE(!b.append("   \t", t0 + seconds(1)));
    EXPECT_EQ(b.fragmentCount(), (size_t)1);
    EXPECT_TRUE(b.lastUpdate() == t0);

    // Silence must not postpone the forced flush.
    EXPECT_TRUE(b.isStale(t0 + milliseconds(2100), seconds(2)));
}

static void test_blank_append_on_empty_buffer() {
    TurnBuffer b;
    EXPECT_TRUE(!b.append("", Clock::now()));
    EXPECT_TRUE(!b.isActive());
    EXPECT_EQ(b.fragmentCount(), (size_t)0);
}

static void test_staleness() {
    TurnBuffer b;
    const auto t0 = Clock::now();
    EXPECT_TRUE(!b.isStale(t0 + seconds(60), seconds(2)));   // inactive is never stale

    b.append("hello", t0);
    EXPECT_TRUE(!b.isStale(t0 + seconds(1), seconds(2)));
    EXPECT_TRUE(!b.isStale(t0 + seconds(2), seconds(2)));    // strictly greater
    EXPECT_TRUE(b.isStale(t0 + milliseconds(2001), seconds(2)));
    EXPECT_TRUE(b.staleAt(seconds(2)) == t0 + seconds(2));
}

static void test_clear_resets_everything() {
    TurnBuffer b;
    const auto t0 = Clock::now();
    for (int i = 0; i < 5; ++i) b.append("fragment " + std::to_string(i), t0);
    b.clear();

    EXPECT_TRUE(!b.isActive());
    EXPECT_EQ(b.fragmentCount(), (size_t)0);
    EXPECT_EQ(b.peek(), std::string());
    EXPECT_TRUE(!b.isStale(t0 + seconds(10), seconds(2)));
}

int main() {
    runTest("append and peek joins with spaces", test_append_and_peek);
    runTest("blank append keeps timestamp", test_blank_append_keeps_timestamp);
    runTest("blank append on empty buffer", test_blank_append_on_empty_buffer);
    runTest("staleness", test_staleness);
    runTest("clear resets everything", test_clear_resets_everything);
    return testSummary();
}
